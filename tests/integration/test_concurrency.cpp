/**
 * @file test_concurrency.cpp
 * @brief Concurrency and load tests for the upload coordinator
 *
 * This file contains tests for:
 * - Many simultaneous uploads against a parallel remote
 * - Submission from several caller threads
 * - Cancellation racing with in-flight chunks
 * - Observers attaching and detaching during delivery
 */

#include "test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <latch>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace resumable::upload::test {

using namespace std::chrono_literals;

// =============================================================================
// Concurrency Test Fixtures
// =============================================================================

/**
 * @brief Coordinator over a remote that accepts concurrent channels
 */
class ConcurrentUploadTest : public CoordinatorFixture {
protected:
    static constexpr std::size_t chunk = 64 * 1024;

    void SetUp() override {
        CoordinatorFixture::SetUp();
        remote_ = std::make_shared<memory_remote_access>(true);
        build_coordinator(chunk, 4);
    }

    auto make_targets(std::size_t count, std::size_t size)
        -> std::map<std::string, upload_target> {
        std::map<std::string, upload_target> targets;
        for (std::size_t i = 0; i < count; ++i) {
            auto id = "file_" + std::to_string(i);
            targets[id] = {create_test_file(id + ".bin", size + i * 1000,
                                            static_cast<unsigned>(i + 1)),
                           "/load/" + id + ".bin"};
        }
        return targets;
    }
};

// =============================================================================
// Load
// =============================================================================

TEST_F(ConcurrentUploadTest, TwentyFilesKeepDataIntact) {
    remote_->set_write_delay(1ms);
    auto targets = make_targets(20, 300 * 1024);

    auto batch = coordinator_->batch_upload(targets);
    ASSERT_TRUE(batch.has_value());
    auto summary = batch.value().wait();

    EXPECT_TRUE(summary.all_succeeded());
    EXPECT_EQ(summary.succeeded, 20u);
    EXPECT_LE(remote_->max_in_flight(), 4u);

    for (const auto& [id, target] : targets) {
        EXPECT_EQ(remote_->file(target.remote_path), read_file(target.local_path))
            << "content mismatch for " << id;
        EXPECT_EQ(observer_->completed_count(id), 1u);
        auto percents = observer_->percents_for(id);
        ASSERT_FALSE(percents.empty());
        EXPECT_TRUE(std::is_sorted(percents.begin(), percents.end()));
        EXPECT_EQ(percents.back(), 100);
    }
    EXPECT_EQ(coordinator_->active_count(), 0u);
}

TEST_F(ConcurrentUploadTest, SubmissionFromManyThreads) {
    constexpr int threads = 8;
    constexpr int per_thread = 3;

    std::vector<std::filesystem::path> files;
    for (int i = 0; i < threads * per_thread; ++i) {
        files.push_back(create_test_file("t" + std::to_string(i) + ".bin", 100 * 1024,
                                         static_cast<unsigned>(i)));
    }

    std::latch start(threads);
    std::mutex handles_mutex;
    std::vector<upload_handle> handles;
    std::atomic<int> rejected{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            start.arrive_and_wait();
            for (int j = 0; j < per_thread; ++j) {
                auto index = t * per_thread + j;
                auto id = "t" + std::to_string(index);
                auto handle = coordinator_->upload_file(id, files[index], "/mt/" + id);
                if (!handle) {
                    ++rejected;
                    continue;
                }
                std::lock_guard lock(handles_mutex);
                handles.push_back(handle.value());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(rejected.load(), 0);
    ASSERT_EQ(handles.size(), static_cast<std::size_t>(threads * per_thread));
    for (const auto& handle : handles) {
        EXPECT_TRUE(handle.wait().succeeded()) << handle.id();
    }
    EXPECT_TRUE(coordinator_->wait_all_for(1000ms));
}

TEST_F(ConcurrentUploadTest, RacingDuplicateSubmissionsAcceptExactlyOne) {
    remote_->set_write_delay(5ms);
    auto path = create_test_file("race.bin", 512 * 1024);

    constexpr int racers = 6;
    std::latch start(racers);
    std::atomic<int> accepted{0};
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < racers; ++i) {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            auto handle = coordinator_->upload_file("race", path, "/race.bin");
            if (handle) {
                ++accepted;
            } else if (handle.error().code == error_code::upload_already_active) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(duplicates.load(), racers - 1);
    coordinator_->wait_all();
    EXPECT_EQ(remote_->file("/race.bin"), read_file(path));
}

// =============================================================================
// Cancellation under load
// =============================================================================

TEST_F(ConcurrentUploadTest, CancelHalfOfRunningBatch) {
    remote_->set_write_delay(3ms);
    auto targets = make_targets(10, 1024 * 1024);

    auto batch = coordinator_->batch_upload(targets);
    ASSERT_TRUE(batch.has_value());

    std::this_thread::sleep_for(20ms);
    std::size_t signalled = 0;
    for (std::size_t i = 0; i < 10; i += 2) {
        if (coordinator_->cancel_upload("file_" + std::to_string(i))) {
            ++signalled;
        }
    }

    auto summary = batch.value().wait();
    EXPECT_EQ(summary.total_files, 10u);
    // A cancel that lands after the final chunk lets the task complete
    EXPECT_LE(summary.cancelled, signalled);
    EXPECT_GT(summary.cancelled, 0u);
    EXPECT_EQ(summary.succeeded + summary.cancelled, 10u);
    EXPECT_EQ(summary.failed, 0u);

    // Every task ends with exactly one terminal event
    for (const auto& [id, target] : targets) {
        auto terminal = observer_->completed_count(id) + observer_->cancelled_count(id) +
                        observer_->failures_for(id).size();
        EXPECT_EQ(terminal, 1u) << id;
    }

    // Cancelled tasks are resumable
    auto resumable = coordinator_->list_resumable();
    EXPECT_EQ(resumable.size(), summary.cancelled);
}

TEST_F(ConcurrentUploadTest, DestroyingCoordinatorCancelsActiveUploads) {
    remote_->set_write_delay(5ms);
    auto targets = make_targets(6, 1024 * 1024);

    auto batch = coordinator_->batch_upload(targets);
    ASSERT_TRUE(batch.has_value());
    std::this_thread::sleep_for(20ms);

    coordinator_.reset();

    auto summary = batch.value().wait_for(5000ms);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->succeeded + summary->cancelled, 6u);
    EXPECT_GT(summary->cancelled, 0u);
}

// =============================================================================
// Observers during delivery
// =============================================================================

TEST_F(ConcurrentUploadTest, ObserversChurnWhileUploading) {
    remote_->set_write_delay(1ms);
    auto targets = make_targets(8, 256 * 1024);

    std::atomic<bool> done{false};
    std::thread churn([this, &done] {
        while (!done.load()) {
            auto extra = std::make_shared<recording_observer>();
            auto token = coordinator_->events().subscribe(extra);
            std::this_thread::sleep_for(1ms);
            coordinator_->events().unsubscribe(token);
        }
    });

    auto batch = coordinator_->batch_upload(targets);
    std::optional<batch_result> summary;
    if (batch) {
        summary = batch.value().wait();
    }
    done = true;
    churn.join();

    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary->all_succeeded());
    for (const auto& [id, target] : targets) {
        EXPECT_EQ(observer_->completed_count(id), 1u);
    }
}

}  // namespace resumable::upload::test
