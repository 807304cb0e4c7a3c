/**
 * @file bench_resume_store.cpp
 * @brief Benchmarks for resume record persistence
 */

#include <benchmark/benchmark.h>

#include <resumable/upload/core/resume_store.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace resumable::upload::benchmark {

namespace {

auto make_record(const std::string& id) -> resume_record {
    resume_record record;
    record.id = id;
    record.remote_path = "/uploads/archive/" + id + ".bin";
    record.local_path = "/data/outgoing/" + id + ".bin";
    record.file_size = 512 * sizes::MB;
    record.file_fingerprint = "size:536870912;mtime:1700000000000000000";
    record.bytes_transferred = 128 * sizes::MB;
    record.updated_at = std::chrono::system_clock::now();
    return record;
}

}  // namespace

/**
 * @brief Atomic save of one record (write temp file, then rename)
 */
static void BM_ResumeStore_Save(::benchmark::State& state) {
    bench_workspace workspace("store_save");
    resume_store store(resume_store_config(workspace.metadata_dir()));
    auto record = make_record("save-target");

    for (auto _ : state) {
        record.bytes_transferred += 4 * sizes::MB;
        auto saved = store.save(record);
        if (!saved) {
            state.SkipWithError("Save failed");
            return;
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_ResumeStore_Load(::benchmark::State& state) {
    bench_workspace workspace("store_load");
    resume_store store(resume_store_config(workspace.metadata_dir()));
    if (!store.save(make_record("load-target"))) {
        state.SkipWithError("Seed save failed");
        return;
    }

    for (auto _ : state) {
        auto loaded = store.load("load-target");
        if (!loaded) {
            state.SkipWithError("Load failed");
            return;
        }
        ::benchmark::DoNotOptimize(loaded.value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Directory scan with N records on disk
 */
static void BM_ResumeStore_List(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    bench_workspace workspace("store_list");
    resume_store store(resume_store_config(workspace.metadata_dir()));
    for (std::size_t i = 0; i < count; ++i) {
        if (!store.save(make_record("task-" + std::to_string(i)))) {
            state.SkipWithError("Seed save failed");
            return;
        }
    }

    for (auto _ : state) {
        auto records = store.list();
        ::benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(static_cast<int64_t>(count) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_ResumeRecord_Serialize(::benchmark::State& state) {
    auto record = make_record("serialize target / with \"odd\" chars");

    for (auto _ : state) {
        auto json = serialize_record(record);
        auto parsed = deserialize_record(json);
        ::benchmark::DoNotOptimize(parsed);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ResumeStore_Save)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ResumeStore_Load)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ResumeStore_List)->Arg(10)->Arg(100)->Arg(1000)->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_ResumeRecord_Serialize)->Unit(::benchmark::kMicrosecond);

}  // namespace resumable::upload::benchmark
