/**
 * @file test_upload_coordinator.cpp
 * @brief Unit tests for upload_coordinator and uploader_config
 */

#include <gtest/gtest.h>

#include <resumable/upload/adapters/thread_pool_adapter.h>
#include <resumable/upload/uploader/upload_coordinator.h>

#include "integration/test_fixtures.h"

#include <chrono>
#include <fstream>
#include <map>
#include <string>

namespace resumable::upload::test {

using namespace std::chrono_literals;

// =============================================================================
// uploader_config Tests
// =============================================================================

class UploaderConfigTest : public ::testing::Test {
protected:
    static auto valid_config() -> uploader_config {
        uploader_config config;
        config.metadata_directory = "/tmp/resume";
        return config;
    }
};

TEST_F(UploaderConfigTest, DefaultsAreValidOnceDirectoryIsSet) {
    auto config = valid_config();
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.chunk_size, default_chunk_size);
    EXPECT_EQ(config.max_concurrent, 4u);
    EXPECT_EQ(config.remote_io, remote_io_mode::automatic);
    EXPECT_EQ(config.fingerprint, fingerprint_mode::size_and_mtime);
    EXPECT_TRUE(config.auto_cleanup);
}

TEST_F(UploaderConfigTest, RejectsMissingDirectory) {
    uploader_config config;
    auto valid = config.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, error_code::invalid_configuration);
}

TEST_F(UploaderConfigTest, RejectsChunkSizeOutOfRange) {
    auto config = valid_config();
    config.chunk_size = min_chunk_size - 1;
    EXPECT_FALSE(config.validate().has_value());

    config.chunk_size = max_chunk_size + 1;
    EXPECT_FALSE(config.validate().has_value());

    config.chunk_size = min_chunk_size;
    EXPECT_TRUE(config.validate().has_value());
    config.chunk_size = max_chunk_size;
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(UploaderConfigTest, RejectsZeroConcurrency) {
    auto config = valid_config();
    config.max_concurrent = 0;
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(UploaderConfigTest, RejectsBadRetryPolicy) {
    auto config = valid_config();
    config.retry.max_attempts = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = valid_config();
    config.retry.backoff_multiplier = 0.5;
    EXPECT_FALSE(config.validate().has_value());

    config = valid_config();
    config.retry.initial_delay = 5000ms;
    config.retry.max_delay = 1000ms;
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(UploaderConfigTest, RemoteIoModeNames) {
    EXPECT_STREQ(to_string(remote_io_mode::automatic), "automatic");
    EXPECT_STREQ(to_string(remote_io_mode::serialized), "serialized");
    EXPECT_STREQ(to_string(remote_io_mode::parallel), "parallel");
}

// =============================================================================
// Construction
// =============================================================================

class UploadCoordinatorBuildTest : public TempDirectoryFixture {};

TEST_F(UploadCoordinatorBuildTest, BuilderAppliesSettings) {
    auto built = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .with_chunk_size(64 * 1024)
        .with_max_concurrent(2)
        .with_fingerprint_mode(fingerprint_mode::content_hash)
        .with_remote_io_mode(remote_io_mode::serialized)
        .with_record_ttl(std::chrono::seconds(3600))
        .with_auto_cleanup(false)
        .build();
    ASSERT_TRUE(built.has_value());

    const auto& config = built.value().config();
    EXPECT_EQ(config.chunk_size, 64u * 1024);
    EXPECT_EQ(config.max_concurrent, 2u);
    EXPECT_EQ(config.fingerprint, fingerprint_mode::content_hash);
    EXPECT_EQ(config.remote_io, remote_io_mode::serialized);
    EXPECT_EQ(config.record_ttl, std::chrono::seconds(3600));
    EXPECT_FALSE(config.auto_cleanup);
    EXPECT_FALSE(built.value().has_remote_access());
}

TEST_F(UploadCoordinatorBuildTest, BuilderRejectsInvalidConfig) {
    auto built = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .with_chunk_size(16)
        .build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(UploadCoordinatorBuildTest, UploadWithoutRemoteIsRejected) {
    uploader_config config;
    config.metadata_directory = metadata_dir_;
    auto coordinator = upload_coordinator::create(config);
    ASSERT_TRUE(coordinator.has_value());

    auto path = create_test_file("a.bin", 1024);
    auto handle = coordinator.value().upload_file("a", path, "/up/a.bin");
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, error_code::remote_not_configured);

    std::map<std::string, upload_target> targets{{"a", {path, "/up/a.bin"}}};
    auto batch = coordinator.value().batch_upload(targets);
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, error_code::remote_not_configured);
}

TEST_F(UploadCoordinatorBuildTest, RemoteCanBeInstalledLater) {
    uploader_config config;
    config.metadata_directory = metadata_dir_;
    auto coordinator = upload_coordinator::create(config);
    ASSERT_TRUE(coordinator.has_value());

    auto remote = std::make_shared<memory_remote_access>();
    coordinator.value().set_remote_access(remote);
    EXPECT_TRUE(coordinator.value().has_remote_access());

    auto path = create_test_file("late.bin", 2048);
    auto handle = coordinator.value().upload_file("late", path, "/up/late.bin");
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(handle.value().wait().succeeded());
    EXPECT_EQ(remote->file("/up/late.bin"), read_file(path));
}

TEST_F(UploadCoordinatorBuildTest, AutoCleanupPurgesExpiredRecords) {
    {
        resume_store store{resume_store_config(metadata_dir_)};
        resume_record stale;
        stale.id = "stale";
        stale.remote_path = "/up/stale.bin";
        stale.local_path = (test_dir_ / "stale.bin").string();
        stale.file_size = 100;
        stale.file_fingerprint = "size:100;mtime:1";
        stale.bytes_transferred = 50;
        stale.last_status = upload_status::failed;
        stale.updated_at = std::chrono::system_clock::now() - std::chrono::hours(24 * 30);
        ASSERT_TRUE(store.save(stale).has_value());
    }

    auto kept = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .with_auto_cleanup(false)
        .build();
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept.value().list_resumable().size(), 1u);

    auto cleaned = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .build();
    ASSERT_TRUE(cleaned.has_value());
    EXPECT_TRUE(cleaned.value().list_resumable().empty());
}

TEST_F(UploadCoordinatorBuildTest, MalformedRecordDoesNotBreakStartup) {
    {
        resume_store store{resume_store_config(metadata_dir_)};
        std::ofstream file(store.record_path("task"));
        file << "{\n  \"id\": \"\\uZZZZ\",\n  \"remotePath\": \"/up/task.bin\",\n"
             << "  \"localPath\": \"x\",\n  \"fileSize\": 100,\n"
             << "  \"fileFingerprint\": \"f\",\n  \"chunkSize\": 4096,\n"
             << "  \"bytesTransferred\": 50,\n  \"updatedAt\": 0\n}\n";
    }

    auto remote = std::make_shared<memory_remote_access>();
    uploader_config config;
    config.metadata_directory = metadata_dir_;
    auto coordinator = upload_coordinator::create(config, remote);
    ASSERT_TRUE(coordinator.has_value());
    EXPECT_TRUE(coordinator.value().list_resumable().empty());

    auto path = create_test_file("task.bin", 3000);
    auto handle = coordinator.value().upload_file("task", path, "/up/task.bin");
    ASSERT_TRUE(handle.has_value());
    auto outcome = handle.value().wait();
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.resume_offset, 0u);
    EXPECT_EQ(remote->file("/up/task.bin"), read_file(path));
}

TEST_F(UploadCoordinatorBuildTest, StoppedWorkerPoolIsRejectedAtCreate) {
    auto pool = std::make_shared<adapters::bounded_upload_pool>(1);
    pool->shutdown();

    uploader_config config;
    config.metadata_directory = metadata_dir_;
    auto coordinator = upload_coordinator::create(config, nullptr, pool);
    ASSERT_FALSE(coordinator.has_value());
    EXPECT_EQ(coordinator.error().code, error_code::invalid_configuration);
}

TEST_F(UploadCoordinatorBuildTest, RefusedSubmissionIsNotLeftActive) {
    auto pool = std::make_shared<adapters::bounded_upload_pool>(1);
    auto remote = std::make_shared<memory_remote_access>();
    auto built = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .with_remote_access(remote)
        .with_worker_pool(pool)
        .build();
    ASSERT_TRUE(built.has_value());
    auto& coordinator = built.value();

    auto path = create_test_file("a.bin", 2048);
    auto accepted = coordinator.upload_file("a", path, "/up/a.bin");
    ASSERT_TRUE(accepted.has_value());
    EXPECT_TRUE(accepted.value().wait().succeeded());

    pool->shutdown();

    auto refused = coordinator.upload_file("b", path, "/up/b.bin");
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, error_code::internal_error);
    EXPECT_FALSE(coordinator.is_active("b"));
    EXPECT_EQ(coordinator.active_count(), 0u);
    EXPECT_TRUE(coordinator.wait_all_for(100ms));

    std::map<std::string, upload_target> targets{{"c", {path, "/up/c.bin"}},
                                                 {"d", {path, "/up/d.bin"}}};
    auto batch = coordinator.batch_upload(targets);
    ASSERT_TRUE(batch.has_value());
    auto summary = batch.value().wait();
    EXPECT_EQ(summary.rejected, 2u);
    EXPECT_EQ(summary.succeeded, 0u);
    EXPECT_EQ(coordinator.active_count(), 0u);
}

TEST_F(UploadCoordinatorBuildTest, CallerOwnedPoolOutlivesCoordinator) {
    auto pool = std::make_shared<adapters::bounded_upload_pool>(2);
    {
        auto built = upload_coordinator::builder()
            .with_metadata_directory(metadata_dir_)
            .with_remote_access(std::make_shared<memory_remote_access>())
            .with_worker_pool(pool)
            .build();
        ASSERT_TRUE(built.has_value());

        auto path = create_test_file("p.bin", 4096);
        auto handle = built.value().upload_file("p", path, "/up/p.bin");
        ASSERT_TRUE(handle.has_value());
    }
    EXPECT_TRUE(pool->is_running());
    EXPECT_NO_THROW(pool->submit([] {}).get());
}

TEST_F(UploadCoordinatorBuildTest, NonStandardExceptionStillRetiresTask) {
    class throwing_remote : public memory_remote_access {
    public:
        auto mkdir_all(const std::string&) -> result<void> override {
            throw 42;
        }
    };

    auto observer = std::make_shared<recording_observer>();
    auto built = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .with_remote_access(std::make_shared<throwing_remote>())
        .build();
    ASSERT_TRUE(built.has_value());
    auto& coordinator = built.value();
    coordinator.events().subscribe(observer);

    auto path = create_test_file("boom.bin", 2048);
    auto handle = coordinator.upload_file("boom", path, "/nested/boom.bin");
    ASSERT_TRUE(handle.has_value());

    auto outcome = handle.value().wait_for(5000ms);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, upload_status::failed);
    EXPECT_EQ(outcome->kind, error_kind::internal);
    EXPECT_TRUE(coordinator.wait_all_for(1000ms));
    EXPECT_EQ(observer->failures_for("boom").size(), 1u);
}

// =============================================================================
// Finished task history
// =============================================================================

class UploadCoordinatorHistoryTest : public TempDirectoryFixture {
protected:
    auto make_coordinator(std::size_t history) -> result<upload_coordinator> {
        uploader_config config;
        config.metadata_directory = metadata_dir_;
        config.finished_history = history;
        return upload_coordinator::create(config, remote_);
    }

    void upload(upload_coordinator& coordinator, const std::string& id) {
        auto handle = coordinator.upload_file(id, create_test_file(id + ".bin", 1024),
                                              "/up/" + id + ".bin");
        ASSERT_TRUE(handle.has_value());
        EXPECT_TRUE(handle.value().wait().succeeded());
    }

    std::shared_ptr<memory_remote_access> remote_ = std::make_shared<memory_remote_access>();
};

TEST_F(UploadCoordinatorHistoryTest, KeepsOnlyMostRecentSnapshots) {
    auto coordinator = make_coordinator(2);
    ASSERT_TRUE(coordinator.has_value());

    upload(coordinator.value(), "first");
    upload(coordinator.value(), "second");
    upload(coordinator.value(), "third");

    EXPECT_FALSE(coordinator.value().get_task("first").has_value());
    EXPECT_TRUE(coordinator.value().get_task("second").has_value());
    EXPECT_TRUE(coordinator.value().get_task("third").has_value());
}

TEST_F(UploadCoordinatorHistoryTest, ResubmittedIdTakesOneSlot) {
    auto coordinator = make_coordinator(2);
    ASSERT_TRUE(coordinator.has_value());

    upload(coordinator.value(), "a");
    upload(coordinator.value(), "b");
    upload(coordinator.value(), "a");
    upload(coordinator.value(), "a");

    // "b" is still within the last two distinct ids
    EXPECT_TRUE(coordinator.value().get_task("a").has_value());
    EXPECT_TRUE(coordinator.value().get_task("b").has_value());
}

TEST_F(UploadCoordinatorHistoryTest, ClearFinishedDropsSnapshots) {
    auto coordinator = make_coordinator(8);
    ASSERT_TRUE(coordinator.has_value());

    upload(coordinator.value(), "x");
    upload(coordinator.value(), "y");

    EXPECT_EQ(coordinator.value().clear_finished(), 2u);
    EXPECT_FALSE(coordinator.value().get_task("x").has_value());
    EXPECT_FALSE(coordinator.value().get_task("y").has_value());
    EXPECT_EQ(coordinator.value().clear_finished(), 0u);
}

TEST_F(UploadCoordinatorHistoryTest, ZeroHistoryKeepsNothing) {
    auto coordinator = make_coordinator(0);
    ASSERT_TRUE(coordinator.has_value());

    upload(coordinator.value(), "gone");
    EXPECT_FALSE(coordinator.value().get_task("gone").has_value());
}

// =============================================================================
// Submission and control
// =============================================================================

class UploadCoordinatorTest : public CoordinatorFixture {
protected:
    static constexpr std::size_t small_chunk = 4 * 1024;

    void SetUp() override {
        CoordinatorFixture::SetUp();
        build_coordinator(small_chunk, 2);
    }

    // 16 chunks; with a write delay the task stays active long enough to observe
    auto slow_file(const std::string& name) -> std::filesystem::path {
        return create_test_file(name, 16 * small_chunk);
    }
};

TEST_F(UploadCoordinatorTest, UploadsFile) {
    auto path = create_test_file("one.bin", 10 * 1024);
    auto handle = coordinator_->upload_file("one", path, "/dest/one.bin");
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(handle.value().is_valid());
    EXPECT_EQ(handle.value().id(), "one");

    auto outcome = handle.value().wait();
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.bytes_transferred, 10u * 1024);
    EXPECT_EQ(remote_->file("/dest/one.bin"), read_file(path));
    EXPECT_TRUE(remote_->has_directory("/dest"));
    EXPECT_EQ(observer_->completed_count("one"), 1u);

    auto task = coordinator_->get_task("one");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, upload_status::completed);
    EXPECT_FALSE(coordinator_->is_active("one"));
}

TEST_F(UploadCoordinatorTest, RejectsInvalidRequests) {
    auto path = create_test_file("x.bin", 1024);

    auto no_id = coordinator_->upload_file("", path, "/dest/x.bin");
    ASSERT_FALSE(no_id.has_value());
    EXPECT_EQ(no_id.error().code, error_code::invalid_task);

    auto no_remote = coordinator_->upload_file("x", path, "");
    ASSERT_FALSE(no_remote.has_value());
    EXPECT_EQ(no_remote.error().code, error_code::invalid_task);
}

TEST_F(UploadCoordinatorTest, RejectsDuplicateActiveId) {
    remote_->set_write_delay(20ms);
    auto path = slow_file("dup.bin");

    auto first = coordinator_->upload_file("dup", path, "/dest/dup.bin");
    ASSERT_TRUE(first.has_value());

    auto second = coordinator_->upload_file("dup", path, "/dest/other.bin");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::upload_already_active);

    remote_->set_write_delay(0ms);
    EXPECT_TRUE(first.value().wait().succeeded());
    EXPECT_FALSE(remote_->has_file("/dest/other.bin"));

    // Same id is accepted again once the first run has finished
    auto again = coordinator_->upload_file("dup", path, "/dest/dup.bin");
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again.value().wait().succeeded());
}

TEST_F(UploadCoordinatorTest, BatchCountsRejectedEntries) {
    remote_->set_write_delay(20ms);
    auto busy_path = slow_file("busy.bin");
    auto busy = coordinator_->upload_file("busy", busy_path, "/dest/busy.bin");
    ASSERT_TRUE(busy.has_value());

    std::map<std::string, upload_target> targets;
    targets["a"] = {create_test_file("a.bin", 5000), "/dest/a.bin"};
    targets["b"] = {create_test_file("b.bin", 7000), "/dest/b.bin"};
    targets["busy"] = {busy_path, "/dest/busy-again.bin"};

    auto batch = coordinator_->batch_upload(targets);
    ASSERT_TRUE(batch.has_value());
    auto ids = batch.value().task_ids();
    EXPECT_EQ(ids.size(), 3u);

    remote_->set_write_delay(0ms);
    auto summary = batch.value().wait();

    EXPECT_EQ(summary.total_files, 3u);
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.rejected, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_FALSE(summary.all_succeeded());
    EXPECT_EQ(summary.total_bytes, 12000u);

    ASSERT_EQ(summary.file_results.size(), 3u);
    EXPECT_EQ(summary.file_results[0].task_id, "a");
    EXPECT_EQ(summary.file_results[2].task_id, "busy");
    EXPECT_TRUE(summary.file_results[2].rejected);
    ASSERT_TRUE(summary.file_results[2].last_error.has_value());
    EXPECT_EQ(summary.file_results[2].last_error->code, error_code::upload_already_active);

    EXPECT_TRUE(busy.value().wait().succeeded());
}

TEST_F(UploadCoordinatorTest, ControlOfUnknownIdFails) {
    auto cancelled = coordinator_->cancel_upload("ghost");
    ASSERT_FALSE(cancelled.has_value());
    EXPECT_EQ(cancelled.error().code, error_code::upload_not_found);

    EXPECT_EQ(coordinator_->pause_upload("ghost").error().code, error_code::upload_not_found);
    EXPECT_EQ(coordinator_->resume_upload("ghost").error().code,
              error_code::upload_not_found);
    EXPECT_FALSE(coordinator_->get_task("ghost").has_value());
}

TEST_F(UploadCoordinatorTest, CancelKeepsResumeRecord) {
    remote_->set_write_delay(20ms);
    auto path = slow_file("cancel.bin");
    auto handle = coordinator_->upload_file("cancel", path, "/dest/cancel.bin");
    ASSERT_TRUE(handle.has_value());

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(coordinator_->cancel_upload("cancel").has_value());

    auto outcome = handle.value().wait();
    EXPECT_EQ(outcome.status, upload_status::cancelled);
    EXPECT_LT(outcome.bytes_transferred, 16u * small_chunk);
    EXPECT_EQ(observer_->cancelled_count("cancel"), 1u);

    auto resumable = coordinator_->list_resumable();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0].id, "cancel");
    EXPECT_EQ(resumable[0].bytes_transferred, outcome.bytes_transferred);
}

TEST_F(UploadCoordinatorTest, PauseHoldsProgressUntilResume) {
    remote_->set_write_delay(10ms);
    auto path = slow_file("pause.bin");
    auto handle = coordinator_->upload_file("pause", path, "/dest/pause.bin");
    ASSERT_TRUE(handle.has_value());

    std::this_thread::sleep_for(30ms);
    ASSERT_TRUE(coordinator_->pause_upload("pause").has_value());
    std::this_thread::sleep_for(40ms);

    auto held = coordinator_->get_task("pause");
    ASSERT_TRUE(held.has_value());
    std::this_thread::sleep_for(60ms);
    auto still = coordinator_->get_task("pause");
    ASSERT_TRUE(still.has_value());
    EXPECT_EQ(held->bytes_transferred, still->bytes_transferred);
    EXPECT_TRUE(coordinator_->is_active("pause"));

    ASSERT_TRUE(coordinator_->resume_upload("pause").has_value());
    EXPECT_TRUE(handle.value().wait().succeeded());
}

TEST_F(UploadCoordinatorTest, CancelAllAndWait) {
    remote_->set_write_delay(20ms);
    std::vector<upload_handle> handles;
    for (int i = 0; i < 3; ++i) {
        auto id = "task" + std::to_string(i);
        auto handle = coordinator_->upload_file(id, slow_file(id + ".bin"), "/dest/" + id);
        ASSERT_TRUE(handle.has_value());
        handles.push_back(handle.value());
    }

    EXPECT_FALSE(coordinator_->wait_all_for(1ms));
    EXPECT_EQ(coordinator_->cancel_all(), 3u);
    EXPECT_TRUE(coordinator_->wait_all_for(5000ms));
    EXPECT_EQ(coordinator_->active_count(), 0u);

    for (const auto& handle : handles) {
        auto outcome = handle.wait_for(100ms);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_EQ(outcome->status, upload_status::cancelled);
    }
}

TEST_F(UploadCoordinatorTest, PermissionFailureIsReported) {
    remote_->deny_prefix("/locked", error_code::remote_access_denied);
    auto path = create_test_file("locked.bin", 8000);

    auto handle = coordinator_->upload_file("locked", path, "/locked/file.bin");
    ASSERT_TRUE(handle.has_value());
    auto outcome = handle.value().wait();
    EXPECT_EQ(outcome.status, upload_status::failed);
    EXPECT_EQ(outcome.kind, error_kind::remote_permission_or_space);

    auto failures = observer_->failures_for("locked");
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].kind, error_kind::remote_permission_or_space);

    auto task = coordinator_->get_task("locked");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, upload_status::failed);
}

// =============================================================================
// Remote I/O scheduling
// =============================================================================

class UploadCoordinatorIoTest : public CoordinatorFixture {
protected:
    void run_batch(std::size_t files) {
        std::map<std::string, upload_target> targets;
        for (std::size_t i = 0; i < files; ++i) {
            auto id = "f" + std::to_string(i);
            targets[id] = {create_test_file(id + ".bin", 8 * 4096,
                                            static_cast<unsigned>(i)),
                           "/dest/" + id + ".bin"};
        }
        auto batch = coordinator_->batch_upload(targets);
        ASSERT_TRUE(batch.has_value());
        auto summary = batch.value().wait();
        EXPECT_TRUE(summary.all_succeeded());
        EXPECT_EQ(summary.succeeded, files);
    }
};

TEST_F(UploadCoordinatorIoTest, SerializesRemoteWithoutConcurrentChannels) {
    remote_->set_write_delay(2ms);
    build_coordinator(4096, 4);
    run_batch(6);
    EXPECT_EQ(remote_->max_in_flight(), 1u);
}

TEST_F(UploadCoordinatorIoTest, ParallelRemoteIsBoundedByMaxConcurrent) {
    remote_ = std::make_shared<memory_remote_access>(true);
    remote_->set_write_delay(5ms);
    build_coordinator(4096, 3);
    run_batch(8);
    EXPECT_LE(remote_->max_in_flight(), 3u);
    EXPECT_GE(remote_->max_in_flight(), 2u);
}

TEST_F(UploadCoordinatorIoTest, SerializedModeOverridesCapability) {
    remote_ = std::make_shared<memory_remote_access>(true);
    remote_->set_write_delay(2ms);

    auto built = upload_coordinator::builder()
        .with_metadata_directory(metadata_dir_)
        .with_chunk_size(4096)
        .with_max_concurrent(4)
        .with_remote_io_mode(remote_io_mode::serialized)
        .with_remote_access(remote_)
        .build();
    ASSERT_TRUE(built.has_value());
    coordinator_ = std::make_unique<upload_coordinator>(std::move(built.value()));

    run_batch(4);
    EXPECT_EQ(remote_->max_in_flight(), 1u);
}

}  // namespace resumable::upload::test
