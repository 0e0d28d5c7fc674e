#include "file_streamer.hpp"
#include "scoped_fd.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <future>
#include <thread>

using lx::StreamOptions;
using lx::StreamOutcome;
using lx::StreamResult;
using lx::TransferRegistry;
using lx::TransferStatus;
using namespace std::chrono_literals;

class FileStreamerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        sender_.reset(fds[0]);
        receiver_.reset(fds[1]);

        content_ = lx::test::pattern_bytes(3 * 1024 * 1024 + 123);
        path_ = dir_.write("payload.bin", content_);
        file_.reset(open(path_.c_str(), O_RDONLY));
        ASSERT_TRUE(file_.valid());

        options_.chunk_size = 64 * 1024;
        options_.pause_poll = 20ms;
    }

    // Drains the receiving end on a separate thread until EOF
    std::future<std::string> start_reader() {
        int fd = receiver_.get();
        return std::async(std::launch::async, [fd] { return lx::test::read_to_eof(fd); });
    }

    StreamResult stream(uint64_t offset, uint64_t length, const std::string& id) {
        StreamResult result = lx::stream_file_range(sender_.get(), file_.get(), offset, length,
                                                    registry_, id, options_);
        shutdown(sender_.get(), SHUT_WR);
        return result;
    }

    lx::test::TempDir dir_;
    std::string content_;
    std::string path_;
    lx::ScopedFd file_;
    lx::ScopedFd sender_;
    lx::ScopedFd receiver_;
    TransferRegistry registry_;
    StreamOptions options_;
};

TEST_F(FileStreamerTest, ZeroCopyRangeIsByteIdentical) {
    const uint64_t offset = 1000;
    const uint64_t length = 2 * 1024 * 1024 + 7;
    std::string id = registry_.start("payload.bin", content_.size(), "local");

    auto reader = start_reader();
    StreamResult result = stream(offset, length, id);
    std::string received = reader.get();

    EXPECT_EQ(result.outcome, StreamOutcome::Completed);
    EXPECT_EQ(result.bytes_sent, length);
    EXPECT_FALSE(result.used_fallback);
    EXPECT_TRUE(received == content_.substr(offset, length));

    auto record = registry_.find(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, TransferStatus::Done);
    EXPECT_EQ(record->sent, record->size);
}

TEST_F(FileStreamerTest, BufferedFallbackIsByteIdentical) {
    options_.zero_copy = false;
    std::string id = registry_.start("payload.bin", content_.size(), "local");

    auto reader = start_reader();
    StreamResult result = stream(0, content_.size(), id);
    std::string received = reader.get();

    EXPECT_EQ(result.outcome, StreamOutcome::Completed);
    EXPECT_TRUE(result.used_fallback);
    EXPECT_TRUE(received == content_);
    EXPECT_EQ(registry_.find(id)->status, TransferStatus::Done);
}

TEST_F(FileStreamerTest, PauseHaltsProgressUntilResumed) {
    std::string id = registry_.start("payload.bin", content_.size(), "local");
    ASSERT_TRUE(registry_.pause(id));

    auto reader = start_reader();
    auto streaming = std::async(std::launch::async, [&] { return stream(0, content_.size(), id); });

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(registry_.find(id)->sent, 0u);
    EXPECT_EQ(registry_.find(id)->status, TransferStatus::Paused);
    EXPECT_EQ(streaming.wait_for(0ms), std::future_status::timeout);

    ASSERT_TRUE(registry_.resume(id));
    StreamResult result = streaming.get();
    EXPECT_EQ(result.outcome, StreamOutcome::Completed);
    EXPECT_TRUE(reader.get() == content_);
}

TEST_F(FileStreamerTest, CancelStopsTheStream) {
    std::string id = registry_.start("payload.bin", content_.size(), "local");
    ASSERT_TRUE(registry_.pause(id));

    auto reader = start_reader();
    auto streaming = std::async(std::launch::async, [&] { return stream(0, content_.size(), id); });

    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(registry_.cancel(id));

    StreamResult result = streaming.get();
    EXPECT_EQ(result.outcome, StreamOutcome::Cancelled);
    EXPECT_EQ(result.bytes_sent, 0u);
    EXPECT_TRUE(reader.get().empty());

    auto record = registry_.find(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, TransferStatus::Done);
    EXPECT_EQ(record->sent, 0u);
    EXPECT_FALSE(registry_.resume(id));
}

TEST_F(FileStreamerTest, PeerResetAbortsQuietly) {
    receiver_.reset();
    std::string id = registry_.start("payload.bin", content_.size(), "local");

    StreamResult result = stream(0, content_.size(), id);
    EXPECT_EQ(result.outcome, StreamOutcome::ConnectionLost);
    EXPECT_LT(result.bytes_sent, content_.size());

    auto record = registry_.find(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, TransferStatus::Done);
    EXPECT_LT(record->sent, record->size);
}

TEST_F(FileStreamerTest, ShortFileEndsAsExhausted) {
    const uint64_t offset = content_.size() - 100;
    std::string id = registry_.start("payload.bin", content_.size(), "local");

    auto reader = start_reader();
    StreamResult result = stream(offset, 500, id);

    EXPECT_EQ(result.outcome, StreamOutcome::SourceExhausted);
    EXPECT_EQ(result.bytes_sent, 100u);
    EXPECT_EQ(reader.get(), content_.substr(offset));
    EXPECT_EQ(registry_.find(id)->status, TransferStatus::Done);
}

TEST_F(FileStreamerTest, ZeroLengthSendsNothing) {
    std::string id = registry_.start("payload.bin", content_.size(), "local");

    auto reader = start_reader();
    StreamResult result = stream(0, 0, id);

    EXPECT_EQ(result.outcome, StreamOutcome::Completed);
    EXPECT_EQ(result.bytes_sent, 0u);
    EXPECT_TRUE(reader.get().empty());
}

TEST_F(FileStreamerTest, ProgressTracksAbsoluteOffset) {
    options_.chunk_size = 1024;
    const uint64_t offset = 4096;
    std::string id = registry_.start("payload.bin", content_.size(), "local");

    // Sample progress while the stream runs; it reports absolute file offsets
    auto reader = start_reader();
    auto streaming = std::async(std::launch::async, [&] { return stream(offset, 64 * 1024, id); });

    uint64_t observed = 0;
    for (int i = 0; i < 200 && observed == 0; ++i) {
        auto record = registry_.find(id);
        if (record && record->sent > 0) {
            observed = record->sent;
        }
        std::this_thread::sleep_for(1ms);
    }

    StreamResult result = streaming.get();
    EXPECT_EQ(result.outcome, StreamOutcome::Completed);
    if (observed != 0 && observed != content_.size()) {
        EXPECT_GT(observed, offset);
        EXPECT_LE(observed, offset + 64 * 1024);
    }
    EXPECT_EQ(reader.get(), content_.substr(offset, 64 * 1024));
}
