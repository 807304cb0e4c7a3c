/**
 * @file batch_upload_example.cpp
 * @brief Upload every file of a directory as one batch
 *
 * This example demonstrates:
 * - Submitting a batch with a concurrency limit
 * - Tracking per-file state with progress_tracker
 * - Reading the aggregated batch_result
 */

#include <resumable/upload/resumable_upload.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

using namespace resumable::upload;

namespace {

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

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Resumable Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source_dir> <remote_dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --remote-root <dir>  Directory acting as the remote (default: ./remote)" << std::endl;
    std::cout << "  -m, --metadata <dir>     Resume record directory (default: ./.resume)" << std::endl;
    std::cout << "  -j, --jobs <n>           Simultaneous uploads (default: 4)" << std::endl;
    std::cout << "  --serialized             Force one remote call at a time" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path remote_root = "remote";
    std::filesystem::path metadata_dir = ".resume";
    std::size_t max_concurrent = 4;
    remote_io_mode io_mode = remote_io_mode::automatic;
    std::string source_dir;
    std::string remote_dir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-r" || arg == "--remote-root") {
            if (++i >= argc) {
                std::cerr << "Error: --remote-root requires an argument" << std::endl;
                return 1;
            }
            remote_root = argv[i];
        } else if (arg == "-m" || arg == "--metadata") {
            if (++i >= argc) {
                std::cerr << "Error: --metadata requires an argument" << std::endl;
                return 1;
            }
            metadata_dir = argv[i];
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            max_concurrent = static_cast<std::size_t>(std::stoi(argv[i]));
        } else if (arg == "--serialized") {
            io_mode = remote_io_mode::serialized;
        } else if (source_dir.empty()) {
            source_dir = arg;
        } else if (remote_dir.empty()) {
            remote_dir = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (source_dir.empty() || remote_dir.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(source_dir, ec)) {
        std::cerr << "Error: " << source_dir << " is not a directory" << std::endl;
        return 1;
    }

    std::map<std::string, upload_target> targets;
    for (const auto& entry : std::filesystem::directory_iterator(source_dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto name = entry.path().filename().string();
        targets["batch:" + name] = upload_target{entry.path(), remote_dir + "/" + name};
    }
    if (ec) {
        std::cerr << "Error: cannot list " << source_dir << ": " << ec.message() << std::endl;
        return 1;
    }
    if (targets.empty()) {
        std::cout << "Nothing to upload in " << source_dir << std::endl;
        return 0;
    }

    auto coordinator_result = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir)
        .with_max_concurrent(max_concurrent)
        .with_remote_io_mode(io_mode)
        .with_remote_access(std::make_shared<local_remote_access>(remote_root))
        .build();
    if (!coordinator_result) {
        std::cerr << "Failed to create coordinator: "
                  << coordinator_result.error().message << std::endl;
        return 1;
    }
    auto& coordinator = coordinator_result.value();

    auto tracker = std::make_shared<progress_tracker>();
    coordinator.events().subscribe(tracker);
    coordinator.events().subscribe(std::make_shared<logging_observer>());

    std::cout << "Uploading " << targets.size() << " files with up to " << max_concurrent
              << " in flight" << std::endl;

    auto batch = coordinator.batch_upload(targets);
    if (!batch) {
        std::cerr << "Batch rejected: " << batch.error().message << std::endl;
        return 1;
    }

    // Periodic status line until the batch settles
    while (!batch.value().wait_for(std::chrono::milliseconds(500))) {
        std::size_t done = 0;
        for (const auto& upload : tracker->snapshot()) {
            if (is_terminal_status(upload.status)) {
                ++done;
            }
        }
        std::cout << "  " << done << "/" << targets.size() << " finished, "
                  << coordinator.active_count() << " active" << std::endl;
    }

    auto summary = batch.value().wait();

    std::cout << std::endl << "=== Batch Summary ===" << std::endl;
    for (const auto& file : summary.file_results) {
        std::cout << "  " << std::left << std::setw(32) << file.task_id
                  << std::setw(12) << (file.rejected ? "rejected" : to_string(file.status))
                  << format_bytes(file.bytes_transferred);
        if (file.last_error) {
            std::cout << "  (" << file.last_error->message << ")";
        }
        std::cout << std::endl;
    }
    std::cout << std::endl;
    std::cout << "Succeeded: " << summary.succeeded << "/" << summary.total_files << std::endl;
    std::cout << "Failed:    " << summary.failed << std::endl;
    std::cout << "Cancelled: " << summary.cancelled << std::endl;
    std::cout << "Rejected:  " << summary.rejected << std::endl;
    std::cout << "Sent:      " << format_bytes(summary.total_bytes) << " in "
              << summary.elapsed.count() << " ms" << std::endl;

    return summary.all_succeeded() ? 0 : 1;
}
