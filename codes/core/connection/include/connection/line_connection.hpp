// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: line_connection.hpp
//  描述: 行协议连接：每行回显，"quit"结束会话
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "connection/connection.hpp"
#include "protocol/message_framer.hpp"
#include "utils/error.hpp"
#include <string>

namespace stream_http {
namespace connection {

class LineConnection : public Connection {
public:
    static constexpr const char* QUIT_MESSAGE = "quit\n";
    static constexpr const char* BYE_REPLY = "Bye\n";
    static constexpr const char* ECHO_PREFIX = "Echo: ";

    // 未见到'\n'时缓冲区的上限
    static constexpr size_t MAX_LINE_SIZE = 64 * 1024;

    LineConnection(uint64_t id, std::unique_ptr<stream::Transport> transport);
    ~LineConnection() override;

    void start() override;

private:
    void await_message();
    void next_message();
    void on_read(utils::Result<std::string> r);
    void handle_message(const std::string& message);
    void on_written(bool last, utils::Result<void> r);

    protocol::LineFramer framer_;
    bool in_cycle_;
    bool next_cycle_;
};

} // namespace connection
} // namespace stream_http
