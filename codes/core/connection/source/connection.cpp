// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: connection.cpp
//  描述: 连接基类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "connection/connection.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

namespace stream_http {
namespace connection {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::AWAITING_MESSAGE: return "AWAITING_MESSAGE";
        case ConnectionState::DISPATCHING: return "DISPATCHING";
        case ConnectionState::WRITING: return "WRITING";
        case ConnectionState::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

Connection::Connection(uint64_t id, std::unique_ptr<stream::Transport> transport)
    : stream_(std::move(transport))
    , buffer_()
    , messages_served_(0)
    , connection_id_(id)
    , peer_(stream_.peer_address())
    , state_(ConnectionState::AWAITING_MESSAGE)
    , created_time_ms_(utils::get_monotonic_time_ms())
{
    LOG_DEBUG("Connection", "conn=%lu peer=%s created",
              static_cast<unsigned long>(connection_id_), peer_.c_str());
}

Connection::~Connection() {
    // SeqStream析构时销毁Transport
    LOG_DEBUG("Connection", "conn=%lu destroyed", static_cast<unsigned long>(connection_id_));
}

void Connection::close() {
    if (state_ == ConnectionState::CLOSED) {
        return;
    }
    transition_to(ConnectionState::CLOSED);
    stream_.close();
    on_close();

    LOG_DEBUG("Connection", "conn=%lu peer=%s closed, messages=%lu, lifetime=%lums",
              static_cast<unsigned long>(connection_id_), peer_.c_str(),
              static_cast<unsigned long>(messages_served_),
              static_cast<unsigned long>(utils::get_monotonic_time_ms() - created_time_ms_));

    if (on_closed_) {
        CloseCallback cb = std::move(on_closed_);
        on_closed_ = nullptr;
        cb(connection_id_);
    }
}

void Connection::transition_to(ConnectionState new_state) {
    if (state_ == new_state || state_ == ConnectionState::CLOSED) {
        return;
    }

#ifndef NDEBUG
    // Debug模式：校验转换规则
    if (!is_valid_state_transition(state_, new_state)) {
        LOG_WARN("Connection", "Invalid state transition: %s -> %s (conn=%lu)",
                 connection_state_to_string(state_), connection_state_to_string(new_state),
                 static_cast<unsigned long>(connection_id_));
    }
#endif

    state_ = new_state;
}

bool Connection::is_valid_state_transition(ConnectionState from, ConnectionState to) const {
    if (to == ConnectionState::CLOSED) {
        return true;
    }
    switch (from) {
        case ConnectionState::AWAITING_MESSAGE:
            return to == ConnectionState::DISPATCHING || to == ConnectionState::WRITING;
        case ConnectionState::DISPATCHING:
            return to == ConnectionState::WRITING;
        case ConnectionState::WRITING:
            return to == ConnectionState::AWAITING_MESSAGE;
        default:
            return false;
    }
}

} // namespace connection
} // namespace stream_http

// 文件结束
