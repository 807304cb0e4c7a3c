/**
 * @file test_serialized_remote_access.cpp
 * @brief Unit tests for serialized_remote_access
 */

#include <gtest/gtest.h>

#include <resumable/upload/remote/serialized_remote_access.h>

#include "mocks/memory_remote_access.h"

#include <chrono>
#include <thread>
#include <vector>

namespace resumable::upload::test {

class SerializedRemoteAccessTest : public ::testing::Test {
protected:
    void SetUp() override {
        inner_ = std::make_shared<memory_remote_access>(true);
        remote_ = std::make_shared<serialized_remote_access>(inner_);
    }

    std::shared_ptr<memory_remote_access> inner_;
    std::shared_ptr<serialized_remote_access> remote_;
};

TEST_F(SerializedRemoteAccessTest, ForwardsCalls) {
    ASSERT_TRUE(remote_->mkdir_all("/dir").has_value());
    EXPECT_TRUE(inner_->has_directory("/dir"));

    auto writer = remote_->open_for_write("/dir/file", 0);
    ASSERT_TRUE(writer.has_value());

    std::vector<std::byte> data(16, std::byte{0x5a});
    auto written = writer.value()->write(data);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 16u);
    ASSERT_TRUE(writer.value()->close().has_value());

    auto st = remote_->stat("/dir/file");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st.value().size, 16u);
    EXPECT_EQ(inner_->file("/dir/file"), data);
}

TEST_F(SerializedRemoteAccessTest, ForwardsErrors) {
    inner_->deny_prefix("/locked");

    auto writer = remote_->open_for_write("/locked/file", 0);
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code, error_code::remote_access_denied);
}

TEST_F(SerializedRemoteAccessTest, NeverReportsConcurrentChannels) {
    EXPECT_TRUE(inner_->supports_concurrent_channels());
    EXPECT_FALSE(remote_->supports_concurrent_channels());
    EXPECT_EQ(remote_->inner(), inner_);
}

TEST_F(SerializedRemoteAccessTest, WritesFromManyThreadsNeverOverlap) {
    inner_->set_write_delay(std::chrono::milliseconds(2));

    constexpr int thread_count = 6;
    constexpr int writes_per_thread = 5;

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this, t] {
            auto path = "/file" + std::to_string(t);
            auto writer = remote_->open_for_write(path, 0);
            if (!writer) {
                ADD_FAILURE() << writer.error().message;
                return;
            }
            std::vector<std::byte> data(8, std::byte{0x01});
            for (int i = 0; i < writes_per_thread; ++i) {
                EXPECT_TRUE(writer.value()->write(data).has_value());
            }
            EXPECT_TRUE(writer.value()->close().has_value());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(inner_->max_in_flight(), 1u);
    for (int t = 0; t < thread_count; ++t) {
        EXPECT_EQ(inner_->file("/file" + std::to_string(t)).size(),
                  static_cast<std::size_t>(8 * writes_per_thread));
    }
}

}  // namespace resumable::upload::test
