// =============================================================================
//  Stream HTTP Server - Callback Module
//  文件: echo_handler.cpp
//  描述: EchoHandler实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "callback/echo_handler.hpp"
#include "utils/logger.hpp"

namespace stream_http {
namespace callback {

constexpr const char* EchoHandler::ECHO_TARGET;
constexpr const char* EchoHandler::DEFAULT_BODY;

EchoHandler::EchoHandler(const std::string& server_name)
    : name_("echo")
    , server_name_(server_name)
{
}

EchoHandler::~EchoHandler() = default;

const std::string& EchoHandler::get_name() const {
    return name_;
}

void EchoHandler::handle(const protocol::HttpRequest& request,
                         std::shared_ptr<protocol::BodyReader> body,
                         ResponseCallback done) {
    protocol::HttpResponse resp(200);
    resp.add_header("Server", server_name_);

    if (request.target == ECHO_TARGET) {
        // 直接把请求体作为响应体，长度语义保持一致
        resp.body = std::move(body);
    } else {
        resp.body = std::make_shared<protocol::MemoryBodyReader>(DEFAULT_BODY);
    }

    LOG_DEBUG("EchoHandler", "%s %s -> %d", request.method.c_str(), request.target.c_str(), resp.status_code);
    done(utils::make_ok(std::move(resp)));
}

} // namespace callback
} // namespace stream_http

// 文件结束
