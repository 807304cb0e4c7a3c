/**
 * @file resume_transfer.cpp
 * @brief Pause, interruption and resume across coordinator restarts
 *
 * This example demonstrates:
 * - Pausing and resuming an upload in flight
 * - Cancelling mid-transfer to simulate an interruption
 * - Listing resumable uploads after a restart
 * - Continuing from the committed offset
 */

#include <resumable/upload/resumable_upload.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

using namespace resumable::upload;

namespace {

constexpr const char* task_id = "resume-demo";
constexpr const char* remote_path = "/demo/payload.bin";

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void create_test_file(const std::filesystem::path& path, size_t size) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path.string());
    }

    std::vector<char> buffer(64 * 1024);
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>((i * 31) % 251);
    }

    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }
}

auto make_coordinator(const std::filesystem::path& workdir) -> result<upload_coordinator> {
    return upload_coordinator::builder()
        .with_metadata_directory(workdir / "resume")
        .with_chunk_size(min_chunk_size * 16)
        .with_max_concurrent(1)
        .with_remote_access(std::make_shared<local_remote_access>(workdir / "remote"))
        .build();
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path workdir =
        argc > 1 ? std::filesystem::path(argv[1])
                 : std::filesystem::temp_directory_path() / "resumable_upload_demo";
    auto source = workdir / "payload.bin";

    try {
        create_test_file(source, 32 * 1024 * 1024);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "Created " << source << std::endl;

    // ------------------------------------------------------------------------
    // First run: pause at 25%, resume, then interrupt at 60%
    // ------------------------------------------------------------------------
    {
        auto coordinator_result = make_coordinator(workdir);
        if (!coordinator_result) {
            std::cerr << "Failed to create coordinator: "
                      << coordinator_result.error().message << std::endl;
            return 1;
        }
        auto& coordinator = coordinator_result.value();

        std::atomic<bool> paused_once{false};
        std::atomic<bool> interrupted{false};

        auto observer = std::make_shared<callback_observer>();
        observer->on_progress_callback([&](const progress_event& e) {
            if (e.percent >= 25 && !paused_once.exchange(true)) {
                std::cout << "  " << e.percent << "% reached, pausing" << std::endl;
                (void)coordinator.pause_upload(e.task_id);
            } else if (e.percent >= 60 && !interrupted.exchange(true)) {
                std::cout << "  " << e.percent << "% reached, interrupting" << std::endl;
                (void)coordinator.cancel_upload(e.task_id);
            }
        })
        .on_cancelled_callback([](const cancellation_event& e) {
            std::cout << "  Interrupted with " << format_bytes(e.bytes_transferred)
                      << " committed" << std::endl;
        });
        coordinator.events().subscribe(observer);

        auto submitted = coordinator.upload_file(task_id, source, remote_path);
        if (!submitted) {
            std::cerr << "Upload rejected: " << submitted.error().message << std::endl;
            return 1;
        }
        auto handle = submitted.value();

        while (!paused_once.load() && coordinator.is_active(task_id)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (auto task = coordinator.get_task(task_id)) {
            std::cout << "  Paused at " << format_bytes(task->bytes_transferred)
                      << ", resuming" << std::endl;
        }
        if (auto resumed = coordinator.resume_upload(task_id); !resumed) {
            std::cout << "  Upload already finished: " << resumed.error().message << std::endl;
        }

        auto outcome = handle.wait();
        std::cout << "First run ended as " << to_string(outcome.status) << std::endl;
    }

    // ------------------------------------------------------------------------
    // Second run: a fresh coordinator finds the record and continues
    // ------------------------------------------------------------------------
    auto coordinator_result = make_coordinator(workdir);
    if (!coordinator_result) {
        std::cerr << "Failed to create coordinator: "
                  << coordinator_result.error().message << std::endl;
        return 1;
    }
    auto& coordinator = coordinator_result.value();

    std::cout << std::endl << "Resumable uploads after restart:" << std::endl;
    for (const auto& record : coordinator.list_resumable()) {
        std::cout << "  " << record.id << ": " << format_bytes(record.bytes_transferred)
                  << " of " << format_bytes(record.file_size) << " -> " << record.remote_path
                  << std::endl;
    }

    auto handle = coordinator.upload_file(task_id, source, remote_path);
    if (!handle) {
        std::cerr << "Upload rejected: " << handle.error().message << std::endl;
        return 1;
    }
    auto outcome = handle.value().wait();

    std::cout << "Second run: " << to_string(outcome.status) << ", started at "
              << format_bytes(outcome.resume_offset) << ", sent "
              << format_bytes(outcome.bytes_sent) << std::endl;

    std::error_code ec;
    auto uploaded = std::filesystem::file_size(workdir / "remote" / "demo" / "payload.bin", ec);
    if (!ec) {
        std::cout << "Remote file size: " << format_bytes(uploaded) << std::endl;
    }
    return outcome.succeeded() ? 0 : 1;
}
