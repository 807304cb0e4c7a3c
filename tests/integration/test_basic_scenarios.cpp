/**
 * @file test_basic_scenarios.cpp
 * @brief End-to-end upload scenarios through upload_coordinator
 */

#include "test_fixtures.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>

namespace resumable::upload::test {

// =============================================================================
// Single file uploads
// =============================================================================

class BasicUploadTest : public CoordinatorFixture {};

TEST_F(BasicUploadTest, TenMegabyteFileInFourMegabyteChunks) {
    auto path = create_test_file("ten.bin", 10 * MiB);

    auto handle = coordinator_->upload_file("ten", path, "/uploads/2024/ten.bin");
    ASSERT_TRUE(handle.has_value());
    auto outcome = handle.value().wait();

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.total_size, 10 * MiB);
    EXPECT_EQ(outcome.resume_offset, 0u);
    EXPECT_EQ(outcome.chunks_sent, 3u);

    EXPECT_EQ(remote_->write_sizes("/uploads/2024/ten.bin"),
              (std::vector<std::size_t>{4 * MiB, 4 * MiB, 2 * MiB}));
    EXPECT_EQ(remote_->file("/uploads/2024/ten.bin"), read_file(path));
    EXPECT_TRUE(remote_->has_directory("/uploads/2024"));

    EXPECT_EQ(observer_->percents_for("ten"), (std::vector<int>{40, 80, 100}));
    EXPECT_EQ(observer_->completed_count("ten"), 1u);

    auto started = observer_->started_for("ten");
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].filename, "ten.bin");
    EXPECT_EQ(started[0].total_size, 10 * MiB);
    EXPECT_EQ(started[0].resume_offset, 0u);

    // Completed uploads leave nothing to resume
    EXPECT_TRUE(coordinator_->list_resumable().empty());
}

TEST_F(BasicUploadTest, EmptyFileCompletes) {
    auto path = create_test_file("empty.bin", 0);

    auto handle = coordinator_->upload_file("empty", path, "/uploads/empty.bin");
    ASSERT_TRUE(handle.has_value());
    auto outcome = handle.value().wait();

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_TRUE(remote_->has_file("/uploads/empty.bin"));
    EXPECT_TRUE(remote_->file("/uploads/empty.bin").empty());
    EXPECT_EQ(observer_->percents_for("empty"), (std::vector<int>{100}));
    EXPECT_EQ(observer_->completed_count("empty"), 1u);
}

TEST_F(BasicUploadTest, HandleReportsTaskSnapshot) {
    auto path = create_test_file("snap.bin", 5 * MiB);

    auto handle = coordinator_->upload_file("snap", path, "/uploads/snap.bin");
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().succeeded());

    auto task = handle.value().task();
    EXPECT_EQ(task.id, "snap");
    EXPECT_EQ(task.status, upload_status::completed);
    EXPECT_EQ(task.total_size, 5 * MiB);
    EXPECT_EQ(task.bytes_transferred, 5 * MiB);
    EXPECT_EQ(task.percent(), 100);
}

// =============================================================================
// Resume across coordinator restarts
// =============================================================================

class ResumeScenarioTest : public CoordinatorFixture {};

TEST_F(ResumeScenarioTest, ResumesAfterRestartFromCommittedOffset) {
    auto path = create_test_file("resume.bin", 10 * MiB);
    const std::string dest = "/uploads/resume.bin";

    // Third chunk never makes it
    remote_->fail_writes_after(2, error_code::connection_lost);
    auto first = coordinator_->upload_file("resume", path, dest);
    ASSERT_TRUE(first.has_value());
    auto failed = first.value().wait();
    EXPECT_EQ(failed.status, upload_status::failed);
    EXPECT_EQ(failed.kind, error_kind::connectivity);
    EXPECT_EQ(failed.bytes_transferred, 8 * MiB);

    auto pending = coordinator_->list_resumable();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, "resume");
    EXPECT_EQ(pending[0].bytes_transferred, 8 * MiB);

    // Simulated process restart
    remote_->clear_faults();
    build_coordinator();
    observer_->clear();
    auto writes_before = remote_->write_sizes(dest).size();

    auto second = coordinator_->upload_file("resume", path, dest);
    ASSERT_TRUE(second.has_value());
    auto outcome = second.value().wait();

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.resume_offset, 8 * MiB);
    EXPECT_EQ(outcome.bytes_sent, 2 * MiB);

    auto sizes = remote_->write_sizes(dest);
    ASSERT_EQ(sizes.size(), writes_before + 1);
    EXPECT_EQ(sizes.back(), 2 * MiB);
    EXPECT_EQ(remote_->opens().back().offset, 8 * MiB);
    EXPECT_EQ(remote_->file(dest), read_file(path));

    auto started = observer_->started_for("resume");
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].resume_offset, 8 * MiB);
    EXPECT_EQ(observer_->percents_for("resume"), (std::vector<int>{100}));
    EXPECT_TRUE(coordinator_->list_resumable().empty());
}

TEST_F(ResumeScenarioTest, ModifiedFileRestartsFromZero) {
    auto path = create_test_file("changed.bin", 10 * MiB);
    const std::string dest = "/uploads/changed.bin";

    remote_->fail_writes_after(1, error_code::connection_lost);
    auto first = coordinator_->upload_file("changed", path, dest);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().wait().status, upload_status::failed);

    // Rewrite with different content and a clearly different mtime
    path = create_test_file("changed.bin", 10 * MiB, 7);
    std::filesystem::last_write_time(
        path, std::filesystem::last_write_time(path) + std::chrono::hours(1));

    remote_->clear_faults();
    build_coordinator();
    observer_->clear();

    auto second = coordinator_->upload_file("changed", path, dest);
    ASSERT_TRUE(second.has_value());
    auto outcome = second.value().wait();

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.resume_offset, 0u);
    EXPECT_EQ(outcome.bytes_sent, 10 * MiB);
    EXPECT_EQ(remote_->opens().back().offset, 0u);
    EXPECT_EQ(remote_->file(dest), read_file(path));
    EXPECT_EQ(observer_->percents_for("changed"), (std::vector<int>{40, 80, 100}));
}

TEST_F(ResumeScenarioTest, MissingRemoteFileRestartsFromZero) {
    auto path = create_test_file("gone.bin", 10 * MiB);
    const std::string dest = "/uploads/gone.bin";

    remote_->fail_writes_after(2, error_code::connection_lost);
    auto first = coordinator_->upload_file("gone", path, dest);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().wait().status, upload_status::failed);

    remote_->clear_faults();
    remote_->remove_file(dest);
    build_coordinator();

    auto second = coordinator_->upload_file("gone", path, dest);
    ASSERT_TRUE(second.has_value());
    auto outcome = second.value().wait();
    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.resume_offset, 0u);
    EXPECT_EQ(remote_->file(dest), read_file(path));
}

// =============================================================================
// Batches
// =============================================================================

class BatchScenarioTest : public CoordinatorFixture {};

TEST_F(BatchScenarioTest, OneForbiddenTargetDoesNotAffectOthers) {
    remote_->deny_prefix("/forbidden", error_code::remote_access_denied);

    std::map<std::string, upload_target> targets;
    targets["alpha"] = {create_test_file("alpha.bin", 3 * MiB, 1), "/uploads/alpha.bin"};
    targets["beta"] = {create_test_file("beta.bin", 5 * MiB, 2), "/uploads/beta.bin"};
    targets["gamma"] = {create_test_file("gamma.bin", 1 * MiB, 3), "/forbidden/gamma.bin"};

    auto batch = coordinator_->batch_upload(targets);
    ASSERT_TRUE(batch.has_value());
    auto summary = batch.value().wait();

    EXPECT_EQ(summary.total_files, 3u);
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.rejected, 0u);
    EXPECT_FALSE(summary.all_succeeded());
    EXPECT_EQ(summary.total_bytes, 8 * MiB);

    ASSERT_EQ(summary.file_results.size(), 3u);
    const auto& gamma = summary.file_results[2];
    EXPECT_EQ(gamma.task_id, "gamma");
    EXPECT_EQ(gamma.status, upload_status::failed);
    EXPECT_EQ(gamma.kind, error_kind::remote_permission_or_space);

    EXPECT_EQ(remote_->file("/uploads/alpha.bin"), read_file(targets["alpha"].local_path));
    EXPECT_EQ(remote_->file("/uploads/beta.bin"), read_file(targets["beta"].local_path));
    EXPECT_FALSE(remote_->has_file("/forbidden/gamma.bin"));

    auto failures = observer_->failures_for("gamma");
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].filename, "gamma.bin");

    // One terminal event per task across the whole batch
    EXPECT_EQ(observer_->completed.size(), 2u);
    EXPECT_EQ(observer_->failed.size(), 1u);
    EXPECT_TRUE(observer_->cancelled.empty());
    EXPECT_EQ(observer_->completed_count("alpha"), 1u);
    EXPECT_EQ(observer_->completed_count("beta"), 1u);
    EXPECT_EQ(observer_->completed_count("gamma"), 0u);
    EXPECT_EQ(observer_->percents_for("gamma"), std::vector<int>{});
}

TEST_F(BatchScenarioTest, EmptyBatchCompletesImmediately) {
    auto batch = coordinator_->batch_upload({});
    ASSERT_TRUE(batch.has_value());

    auto summary = batch.value().wait_for(std::chrono::milliseconds(1000));
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->total_files, 0u);
    EXPECT_TRUE(summary->all_succeeded());
}

}  // namespace resumable::upload::test
