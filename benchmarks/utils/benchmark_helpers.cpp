/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>

namespace resumable::upload::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

bench_workspace::bench_workspace(const std::string& name)
    : root_(std::filesystem::temp_directory_path() /
            ("resumable_upload_bench_" + name + "_" + std::to_string(std::random_device{}()))) {
    std::error_code ec;
    std::filesystem::create_directories(source_dir(), ec);
    std::filesystem::create_directories(remote_dir(), ec);
    std::filesystem::create_directories(metadata_dir(), ec);
}

bench_workspace::~bench_workspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto bench_workspace::create_random_file(const std::string& name, std::size_t size,
                                         uint32_t seed) -> std::filesystem::path {
    auto path = source_dir() / name;
    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

void bench_workspace::reset_remote() {
    std::error_code ec;
    std::filesystem::remove_all(remote_dir(), ec);
    std::filesystem::remove_all(metadata_dir(), ec);
    std::filesystem::create_directories(remote_dir(), ec);
    std::filesystem::create_directories(metadata_dir(), ec);
}

}  // namespace resumable::upload::benchmark
