/**
 * @file bench_chunk_upload.cpp
 * @brief Throughput benchmarks for chunked uploads to a local remote root
 */

#include <benchmark/benchmark.h>

#include <resumable/upload/core/fingerprint.h>
#include <resumable/upload/engine/chunk_transfer_engine.h>
#include <resumable/upload/remote/local_remote_access.h>
#include <resumable/upload/uploader/upload_coordinator.h>

#include "utils/benchmark_helpers.h"

#include <map>
#include <memory>
#include <string>

namespace resumable::upload::benchmark {

/**
 * @brief Single file through chunk_transfer_engine with various chunk sizes
 */
static void BM_ChunkTransferEngine_Upload(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    bench_workspace workspace("engine");
    auto source = workspace.create_random_file("engine.bin", file_size, 42);
    auto remote = std::make_shared<local_remote_access>(workspace.remote_dir());
    progress_event_bus events;

    for (auto _ : state) {
        state.PauseTiming();
        workspace.reset_remote();
        resume_store store(resume_store_config(workspace.metadata_dir()));
        chunk_transfer_engine engine(remote, store, events);
        upload_task task("bench", source, "/bench/engine.bin", chunk_size);
        upload_control control;
        state.ResumeTiming();

        auto outcome = engine.run(task, control);
        if (!outcome.succeeded()) {
            state.SkipWithError("Upload failed");
            return;
        }
        ::benchmark::DoNotOptimize(outcome);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((file_size + chunk_size - 1) / chunk_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Batch of files through upload_coordinator at several concurrency limits
 */
static void BM_Coordinator_Batch(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto max_concurrent = static_cast<std::size_t>(state.range(1));
    const auto file_size = sizes::small_file * 4;

    bench_workspace workspace("batch");
    std::map<std::string, upload_target> targets;
    for (std::size_t i = 0; i < file_count; ++i) {
        auto name = "file_" + std::to_string(i) + ".bin";
        targets["file_" + std::to_string(i)] = {
            workspace.create_random_file(name, file_size, static_cast<uint32_t>(i + 1)),
            "/batch/" + name};
    }
    auto remote = std::make_shared<local_remote_access>(workspace.remote_dir());

    for (auto _ : state) {
        state.PauseTiming();
        workspace.reset_remote();
        auto coordinator = upload_coordinator::builder()
            .with_metadata_directory(workspace.metadata_dir())
            .with_chunk_size(256 * sizes::KB)
            .with_max_concurrent(max_concurrent)
            .with_remote_access(remote)
            .build();
        if (!coordinator) {
            state.SkipWithError("Failed to create coordinator");
            return;
        }
        state.ResumeTiming();

        auto batch = coordinator.value().batch_upload(targets);
        if (!batch) {
            state.SkipWithError("Batch rejected");
            return;
        }
        auto summary = batch.value().wait();
        if (!summary.all_succeeded()) {
            state.SkipWithError("Batch had failures");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size * file_count) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Fingerprint cost by mode
 */
static void BM_Fingerprint(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto mode = state.range(1) == 0 ? fingerprint_mode::size_and_mtime
                                          : fingerprint_mode::content_hash;

    bench_workspace workspace("fingerprint");
    auto source = workspace.create_random_file("fp.bin", file_size, 7);

    for (auto _ : state) {
        auto fp = compute_fingerprint(source, mode);
        if (!fp) {
            state.SkipWithError("Fingerprint failed");
            return;
        }
        ::benchmark::DoNotOptimize(fp.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
}

// Register benchmarks with various sizes

BENCHMARK(BM_ChunkTransferEngine_Upload)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(1 * sizes::MB)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(4 * sizes::MB)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(16 * sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Coordinator_Batch)
    ->Args({16, 1})
    ->Args({16, 4})
    ->Args({16, 8})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Fingerprint)
    ->Args({static_cast<int64_t>(sizes::medium_file), 0})
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Unit(::benchmark::kMicrosecond);

}  // namespace resumable::upload::benchmark
