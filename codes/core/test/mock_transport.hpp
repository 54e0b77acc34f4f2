// =============================================================================
//  Stream HTTP Server - Test Support
//  文件: mock_transport.hpp
//  描述: 内存Transport：按脚本投递数据/结束/错误，记录写出的字节
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "stream/transport.hpp"
#include "utils/error.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace stream_http {
namespace test {

// MockTransport与测试代码共享的状态（Transport本身的所有权交给SeqStream）
struct MockTransportState {
    enum class EventType { DATA, END, ERROR };

    struct Event {
        EventType type;
        std::string data;
        utils::ErrorCode code;
    };

    std::deque<Event> incoming;
    std::string written;
    std::vector<std::string> writes;

    bool paused = true;
    bool destroyed = false;
    bool errored = false;
    bool fail_writes = false;
    int resume_count = 0;

    void push_data(const std::string& chunk) {
        incoming.push_back(Event{EventType::DATA, chunk, utils::ErrorCode::SUCCESS});
    }
    void push_end() {
        incoming.push_back(Event{EventType::END, std::string(), utils::ErrorCode::SUCCESS});
    }
    void push_error(utils::ErrorCode code, const std::string& message) {
        incoming.push_back(Event{EventType::ERROR, message, code});
    }
};

class MockTransport : public stream::Transport {
public:
    explicit MockTransport(std::shared_ptr<MockTransportState> state)
        : state_(std::move(state))
        , listener_(nullptr)
        , delivering_(false)
    {
    }

    void set_listener(stream::TransportListener* listener) override {
        listener_ = listener;
    }

    void pause() override {
        state_->paused = true;
    }

    void resume() override {
        state_->paused = false;
        state_->resume_count++;
        deliver();
    }

    void write(std::string data, WriteCallback cb) override {
        if (state_->destroyed) {
            cb(utils::make_err(utils::ErrorCode::NETWORK_CLOSED, "transport destroyed"));
            return;
        }
        if (state_->fail_writes || state_->errored) {
            cb(utils::make_err(utils::ErrorCode::NETWORK_WRITE_ERROR, "write failed"));
            return;
        }
        state_->written += data;
        state_->writes.push_back(std::move(data));
        cb(utils::make_ok());
    }

    void destroy() override {
        state_->destroyed = true;
        listener_ = nullptr;
    }

    bool is_writable() const override {
        return !state_->destroyed && !state_->errored;
    }

    std::string peer_address() const override {
        return "mock:0";
    }

    // 测试在运行中追加数据后调用
    void deliver() {
        if (delivering_) {
            return;
        }
        delivering_ = true;
        while (!state_->paused && !state_->destroyed && listener_ != nullptr && !state_->incoming.empty()) {
            MockTransportState::Event ev = std::move(state_->incoming.front());
            state_->incoming.pop_front();
            switch (ev.type) {
                case MockTransportState::EventType::DATA:
                    listener_->on_data(std::move(ev.data));
                    break;
                case MockTransportState::EventType::END:
                    listener_->on_end();
                    break;
                case MockTransportState::EventType::ERROR:
                    state_->errored = true;
                    listener_->on_error(ev.code, ev.data);
                    break;
            }
        }
        delivering_ = false;
    }

private:
    std::shared_ptr<MockTransportState> state_;
    stream::TransportListener* listener_;
    bool delivering_;
};

inline std::unique_ptr<stream::Transport> make_mock_transport(std::shared_ptr<MockTransportState> state) {
    return std::unique_ptr<stream::Transport>(new MockTransport(std::move(state)));
}

} // namespace test
} // namespace stream_http

// 文件结束
