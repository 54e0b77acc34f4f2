// =============================================================================
//  Stream HTTP Server - Stream Module
//  文件: test_stream.cpp
//  描述: SeqStream/SocketTransport单元测试
//  版权: Copyright (c) 2026
// =============================================================================
#include <gtest/gtest.h>
#include "stream/seq_stream.hpp"
#include "stream/socket_transport.hpp"
#include "msg_center/event_loop.hpp"
#include "test/mock_transport.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

namespace stream_http {
namespace test {

using stream::SeqStream;
using utils::ErrorCode;
using utils::Result;

// ==================== SeqStream + MockTransport ====================

class SeqStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<MockTransportState>();
        stream_.reset(new SeqStream(make_mock_transport(state_)));
    }

    std::shared_ptr<MockTransportState> state_;
    std::unique_ptr<SeqStream> stream_;
};

// 正常场景：没有read时不恢复Transport
TEST_F(SeqStreamTest, TransportStaysPausedWithoutRead) {
    state_->push_data("abc");
    EXPECT_TRUE(state_->paused);
    EXPECT_EQ(state_->resume_count, 0);
    EXPECT_EQ(state_->incoming.size(), 1u);
}

// 正常场景：read送达一块数据后Transport重新暂停
TEST_F(SeqStreamTest, ReadDeliversOneChunkThenPauses) {
    state_->push_data("abc");
    state_->push_data("def");

    std::vector<std::string> got;
    stream_->read([&](Result<std::string> r) {
        ASSERT_TRUE(r.is_ok());
        got.push_back(r.value());
    });

    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "abc");
    EXPECT_TRUE(state_->paused);
    EXPECT_EQ(state_->incoming.size(), 1u);
    EXPECT_FALSE(stream_->has_pending_read());
}

// 异常场景：并发read是调用方缺陷
TEST_F(SeqStreamTest, SecondConcurrentReadThrows) {
    stream_->read([](Result<std::string>) {});
    EXPECT_TRUE(stream_->has_pending_read());
    EXPECT_THROW(stream_->read([](Result<std::string>) {}), std::logic_error);
}

// 正常场景：结束是空块，并且之后一直是空块
TEST_F(SeqStreamTest, EndIsStickyEmptyChunk) {
    state_->push_end();

    int empties = 0;
    stream_->read([&](Result<std::string> r) {
        ASSERT_TRUE(r.is_ok());
        if (r.value().empty()) {
            empties++;
        }
    });
    stream_->read([&](Result<std::string> r) {
        ASSERT_TRUE(r.is_ok());
        if (r.value().empty()) {
            empties++;
        }
    });
    EXPECT_EQ(empties, 2);
    EXPECT_TRUE(stream_->is_ended());
}

// 正常场景：回调内继续read，顺序收完所有数据
TEST_F(SeqStreamTest, ReadLoopInsideCallback) {
    state_->push_data("he");
    state_->push_data("llo");
    state_->push_end();

    std::string collected;
    bool ended = false;
    std::function<void()> next;
    next = [&]() {
        stream_->read([&](Result<std::string> r) {
            ASSERT_TRUE(r.is_ok());
            if (r.value().empty()) {
                ended = true;
                return;
            }
            collected += r.value();
            next();
        });
    };
    next();

    EXPECT_EQ(collected, "hello");
    EXPECT_TRUE(ended);
}

// 异常场景：空闲时的错误被锁存，下一次read/write立即失败
TEST_F(SeqStreamTest, IdleErrorIsLatched) {
    stream_->on_error(ErrorCode::NETWORK_READ_ERROR, "connection reset");
    EXPECT_FALSE(stream_->is_writable());

    ErrorCode read_err = ErrorCode::SUCCESS;
    stream_->read([&](Result<std::string> r) { read_err = r.error_code(); });
    EXPECT_EQ(read_err, ErrorCode::NETWORK_READ_ERROR);

    ErrorCode write_err = ErrorCode::SUCCESS;
    stream_->write("x", [&](Result<void> r) { write_err = r.error_code(); });
    EXPECT_EQ(write_err, ErrorCode::NETWORK_READ_ERROR);
    EXPECT_TRUE(state_->written.empty());
}

// 异常场景：错误到达时完成未决read
TEST_F(SeqStreamTest, ErrorFailsPendingRead) {
    state_->push_error(ErrorCode::NETWORK_READ_ERROR, "boom");

    std::string msg;
    stream_->read([&](Result<std::string> r) {
        ASSERT_TRUE(r.is_err());
        msg = r.error_message();
    });
    EXPECT_EQ(msg, "boom");
}

// 边界场景：暂停生效前送达的数据先保存，下一次read同步交付
TEST_F(SeqStreamTest, EarlyChunkIsKeptForNextRead) {
    stream_->on_data("early");

    std::string got;
    stream_->read([&](Result<std::string> r) { got = r.value(); });
    EXPECT_EQ(got, "early");
    EXPECT_EQ(state_->resume_count, 0);
}

// 正常场景：close完成未决read并销毁Transport，幂等
TEST_F(SeqStreamTest, CloseFailsPendingReadAndDestroysTransport) {
    ErrorCode err = ErrorCode::SUCCESS;
    stream_->read([&](Result<std::string> r) { err = r.error_code(); });

    stream_->close();
    EXPECT_EQ(err, ErrorCode::NETWORK_CLOSED);
    EXPECT_TRUE(state_->destroyed);
    EXPECT_TRUE(stream_->is_closed());

    stream_->close();

    ErrorCode after = ErrorCode::SUCCESS;
    stream_->read([&](Result<std::string> r) { after = r.error_code(); });
    EXPECT_EQ(after, ErrorCode::NETWORK_CLOSED);
}

// 正常场景：write透传到Transport
TEST_F(SeqStreamTest, WritePassesThrough) {
    bool done = false;
    stream_->write("Bye\n", [&](Result<void> r) {
        EXPECT_TRUE(r.is_ok());
        done = true;
    });
    EXPECT_TRUE(done);
    EXPECT_EQ(state_->written, "Bye\n");
}

// ==================== SeqStream + SocketTransport ====================

class SocketTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(loop_.init().is_ok());
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
        stream_.reset(new SeqStream(std::unique_ptr<stream::Transport>(
            new stream::SocketTransport(loop_, fds_[0]))));
    }

    void TearDown() override {
        stream_.reset();
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
        }
    }

    // 驱动事件循环直到条件满足或超过轮数
    template<typename Pred>
    bool pump_until(Pred pred, int max_rounds = 100) {
        for (int i = 0; i < max_rounds && !pred(); ++i) {
            loop_.run_once(50);
        }
        return pred();
    }

    EventLoop loop_;
    int fds_[2] = {-1, -1};
    std::unique_ptr<SeqStream> stream_;
};

TEST_F(SocketTransportTest, ReadsWhatPeerSent) {
    ASSERT_EQ(::write(fds_[1], "PING\n", 5), 5);

    std::string got;
    stream_->read([&](Result<std::string> r) {
        ASSERT_TRUE(r.is_ok());
        got = r.value();
    });
    ASSERT_TRUE(pump_until([&]() { return !got.empty(); }));
    EXPECT_EQ(got, "PING\n");
}

TEST_F(SocketTransportTest, NoReadWhilePaused) {
    ASSERT_EQ(::write(fds_[1], "data", 4), 4);
    loop_.run_once(20);
    EXPECT_FALSE(stream_->has_pending_read());

    std::string got;
    stream_->read([&](Result<std::string> r) { got = r.value(); });
    ASSERT_TRUE(pump_until([&]() { return !got.empty(); }));
    EXPECT_EQ(got, "data");
}

TEST_F(SocketTransportTest, WriteReachesPeer) {
    bool done = false;
    stream_->write("Echo: hi\n", [&](Result<void> r) {
        EXPECT_TRUE(r.is_ok());
        done = true;
    });
    ASSERT_TRUE(pump_until([&]() { return done; }));

    char buf[32];
    ssize_t n = ::read(fds_[1], buf, sizeof(buf));
    ASSERT_EQ(n, 9);
    EXPECT_EQ(std::string(buf, 9), "Echo: hi\n");
}

TEST_F(SocketTransportTest, PeerCloseIsEndOfStream) {
    ::close(fds_[1]);
    fds_[1] = -1;

    bool ended = false;
    stream_->read([&](Result<std::string> r) {
        ASSERT_TRUE(r.is_ok());
        ended = r.value().empty();
    });
    ASSERT_TRUE(pump_until([&]() { return ended; }));
    EXPECT_TRUE(stream_->is_ended());
}

TEST_F(SocketTransportTest, LargeWriteCompletesAcrossEvents) {
    std::string big(1024 * 1024, 'z');
    bool done = false;
    stream_->write(big, [&](Result<void> r) {
        EXPECT_TRUE(r.is_ok());
        done = true;
    });

    size_t received = 0;
    char buf[65536];
    for (int i = 0; i < 1000 && received < big.size(); ++i) {
        loop_.run_once(10);
        ssize_t n = ::recv(fds_[1], buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0) {
            received += static_cast<size_t>(n);
        }
    }
    ASSERT_TRUE(pump_until([&]() { return done; }));
    EXPECT_EQ(received, big.size());
}

} // namespace test
} // namespace stream_http
