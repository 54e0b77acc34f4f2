// =============================================================================
//  Stream HTTP Server - Callback Module
//  文件: echo_handler.hpp
//  描述: 示例处理器：/echo回显请求体，其他路径返回固定文本
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "callback/request_handler.hpp"
#include <string>

namespace stream_http {
namespace callback {

class EchoHandler : public RequestHandler {
public:
    static constexpr const char* ECHO_TARGET = "/echo";
    static constexpr const char* DEFAULT_BODY = "hello world.\n";

    // server_name: 每个响应的Server头部值
    explicit EchoHandler(const std::string& server_name);
    ~EchoHandler() override;

    const std::string& get_name() const override;

    void handle(const protocol::HttpRequest& request,
                std::shared_ptr<protocol::BodyReader> body,
                ResponseCallback done) override;

private:
    std::string name_;
    std::string server_name_;
};

} // namespace callback
} // namespace stream_http

// 文件结束
