/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for upload benchmarks
 */

#ifndef RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace resumable::upload::benchmark {

/**
 * @brief Scratch directory holding a local source tree and a remote root
 *
 * Everything under the directory is removed on destruction.
 */
class bench_workspace {
public:
    explicit bench_workspace(const std::string& name);
    ~bench_workspace();

    bench_workspace(const bench_workspace&) = delete;
    auto operator=(const bench_workspace&) -> bench_workspace& = delete;

    /**
     * @brief Create a file of pseudo-random bytes under the source tree
     * @param name File name
     * @param size File size
     * @param seed Random seed (0 for random)
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Empty the remote root and the metadata directory between iterations
     */
    void reset_remote();

    [[nodiscard]] auto source_dir() const -> std::filesystem::path { return root_ / "source"; }
    [[nodiscard]] auto remote_dir() const -> std::filesystem::path { return root_ / "remote"; }
    [[nodiscard]] auto metadata_dir() const -> std::filesystem::path { return root_ / "resume"; }

private:
    std::filesystem::path root_;
};

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 256 * KB;
constexpr std::size_t medium_file = 16 * MB;
constexpr std::size_t large_file = 64 * MB;
}  // namespace sizes

}  // namespace resumable::upload::benchmark

#endif  // RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
