/**
 * @file upload_example.cpp
 * @brief Single file upload with progress events and error reporting
 *
 * This example demonstrates:
 * - Building an upload_coordinator against a directory-backed remote
 * - Subscribing to progress events with callback_observer
 * - Waiting on an upload handle and inspecting the outcome
 */

#include <resumable/upload/core/logging.h>
#include <resumable/upload/resumable_upload.h>

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace resumable::upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_size(const std::string& size_str) -> size_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<size_t>(value * 1024);
            case 'M': return static_cast<size_t>(value * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<size_t>(value);
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Resumable Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <remote_path>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --remote-root <dir>  Directory acting as the remote (default: ./remote)" << std::endl;
    std::cout << "  -m, --metadata <dir>     Resume record directory (default: ./.resume)" << std::endl;
    std::cout << "  -c, --chunk <size>       Chunk size, e.g. 1M, 4M (default: 4M)" << std::endl;
    std::cout << "  --hash                   Fingerprint by SHA-256 of the content" << std::endl;
    std::cout << "  --verbose                Log engine activity to stderr" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " data.bin /backups/data.bin" << std::endl;
    std::cout << "  " << program << " -r /mnt/nas -c 8M video.mp4 /media/video.mp4" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path remote_root = "remote";
    std::filesystem::path metadata_dir = ".resume";
    std::size_t chunk_size = default_chunk_size;
    fingerprint_mode fingerprint = fingerprint_mode::size_and_mtime;
    std::string local_file;
    std::string remote_path;

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
        } else if (arg == "-c" || arg == "--chunk") {
            if (++i >= argc) {
                std::cerr << "Error: --chunk requires an argument" << std::endl;
                return 1;
            }
            chunk_size = parse_size(argv[i]);
        } else if (arg == "--hash") {
            fingerprint = fingerprint_mode::content_hash;
        } else if (arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else if (local_file.empty()) {
            local_file = arg;
        } else if (remote_path.empty()) {
            remote_path = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (local_file.empty() || remote_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "=== Resumable Upload ===" << std::endl;
    std::cout << "Source:      " << local_file << std::endl;
    std::cout << "Destination: " << remote_root.string() << remote_path << std::endl;
    std::cout << "Chunk size:  " << format_bytes(chunk_size) << std::endl;
    std::cout << std::endl;

    auto coordinator_result = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir)
        .with_chunk_size(chunk_size)
        .with_max_concurrent(1)
        .with_fingerprint_mode(fingerprint)
        .with_remote_access(std::make_shared<local_remote_access>(remote_root))
        .build();

    if (!coordinator_result) {
        std::cerr << "Failed to create coordinator: "
                  << coordinator_result.error().message << std::endl;
        return 1;
    }
    auto& coordinator = coordinator_result.value();

    auto observer = std::make_shared<callback_observer>();
    observer->on_started_callback([](const started_event& e) {
        std::cout << "Started " << e.filename << " (" << format_bytes(e.total_size) << ")";
        if (e.resume_offset > 0) {
            std::cout << ", resuming at " << format_bytes(e.resume_offset);
        }
        std::cout << std::endl;
    })
    .on_progress_callback([](const progress_event& e) {
        std::cout << "\r  " << e.filename << ": " << std::setw(3) << e.percent << "%"
                  << std::flush;
    })
    .on_completed_callback([](const completion_event& e) {
        std::cout << std::endl << "Completed " << e.filename << std::endl;
    })
    .on_failed_callback([](const failure_event& e) {
        std::cout << std::endl << "Failed " << e.filename << " [" << to_string(e.kind)
                  << "]: " << e.detail << std::endl;
    });
    coordinator.events().subscribe(observer);

    auto handle = coordinator.upload_file("upload:" + remote_path, local_file, remote_path);
    if (!handle) {
        std::cerr << "Upload rejected: " << handle.error().message << std::endl;
        return 1;
    }

    auto outcome = handle.value().wait();

    std::cout << std::endl;
    std::cout << "Status:        " << to_string(outcome.status) << std::endl;
    std::cout << "Transferred:   " << format_bytes(outcome.bytes_transferred) << " of "
              << format_bytes(outcome.total_size) << std::endl;
    std::cout << "Sent this run: " << format_bytes(outcome.bytes_sent) << " in "
              << outcome.chunks_sent << " chunks" << std::endl;

    if (!outcome.succeeded()) {
        if (outcome.last_error) {
            std::cerr << "Error: " << outcome.last_error->message << std::endl;
        }
        std::cerr << "Run the same command again to resume." << std::endl;
        return 1;
    }
    return 0;
}
