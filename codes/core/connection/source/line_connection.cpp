// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: line_connection.cpp
//  描述: LineConnection实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "connection/line_connection.hpp"
#include "utils/logger.hpp"

namespace stream_http {
namespace connection {

constexpr const char* LineConnection::QUIT_MESSAGE;
constexpr const char* LineConnection::BYE_REPLY;
constexpr const char* LineConnection::ECHO_PREFIX;
constexpr size_t LineConnection::MAX_LINE_SIZE;

LineConnection::LineConnection(uint64_t id, std::unique_ptr<stream::Transport> transport)
    : Connection(id, std::move(transport))
    , framer_()
    , in_cycle_(false)
    , next_cycle_(false)
{
}

LineConnection::~LineConnection() = default;

void LineConnection::start() {
    await_message();
}

void LineConnection::await_message() {
    // 写出与读取可能同步完成，重入时由外层循环继续
    if (in_cycle_) {
        next_cycle_ = true;
        return;
    }
    auto self = self_as<LineConnection>();  // 循环期间保活
    in_cycle_ = true;
    do {
        next_cycle_ = false;
        next_message();
    } while (next_cycle_ && !is_closed());
    in_cycle_ = false;
}

void LineConnection::next_message() {
    if (is_closed()) {
        return;
    }
    transition_to(ConnectionState::AWAITING_MESSAGE);

    std::string message;
    utils::ErrorCode error = utils::ErrorCode::SUCCESS;
    if (framer_.try_cut(buffer_, &message, &error) == protocol::ParseResult::OK) {
        handle_message(message);
        return;
    }

    if (buffer_.readable_bytes() >= MAX_LINE_SIZE) {
        LOG_WARN("LineConnection", "conn=%lu line exceeds %lu bytes, closing",
                 static_cast<unsigned long>(get_id()), static_cast<unsigned long>(MAX_LINE_SIZE));
        close();
        return;
    }

    auto self = self_as<LineConnection>();
    stream_.read([self](utils::Result<std::string> r) {
        self->on_read(std::move(r));
    });
}

void LineConnection::on_read(utils::Result<std::string> r) {
    if (is_closed()) {
        return;
    }
    if (r.is_err()) {
        if (r.error_code() != utils::ErrorCode::NETWORK_CLOSED) {
            LOG_ERROR("LineConnection", "conn=%lu read failed: %s",
                      static_cast<unsigned long>(get_id()), r.error_message().c_str());
        }
        close();
        return;
    }
    if (r.value().empty()) {
        // 不完整的最后一行直接丢弃
        close();
        return;
    }
    buffer_.append(r.value());
    await_message();
}

void LineConnection::handle_message(const std::string& message) {
    transition_to(ConnectionState::DISPATCHING);
    LOG_DEBUG("LineConnection", "conn=%lu message %lu bytes",
              static_cast<unsigned long>(get_id()), static_cast<unsigned long>(message.size()));

    bool last = (message == QUIT_MESSAGE);
    std::string reply = last ? std::string(BYE_REPLY) : std::string(ECHO_PREFIX) + message;

    transition_to(ConnectionState::WRITING);
    auto self = self_as<LineConnection>();
    stream_.write(std::move(reply), [self, last](utils::Result<void> r) {
        self->on_written(last, std::move(r));
    });
}

void LineConnection::on_written(bool last, utils::Result<void> r) {
    if (is_closed()) {
        return;
    }
    if (r.is_err()) {
        LOG_ERROR("LineConnection", "conn=%lu write failed: %s",
                  static_cast<unsigned long>(get_id()), r.error_message().c_str());
        close();
        return;
    }
    messages_served_++;
    if (last) {
        close();
        return;
    }
    await_message();
}

} // namespace connection
} // namespace stream_http

// 文件结束
