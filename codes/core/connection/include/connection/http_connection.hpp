// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: http_connection.hpp
//  描述: HTTP/1.x连接驱动：读->分帧->解析->分发->写->复用或关闭
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "connection/connection.hpp"
#include "callback/request_handler.hpp"
#include "protocol/body_reader.hpp"
#include "protocol/http_message.hpp"
#include "protocol/http_parser.hpp"
#include "protocol/message_framer.hpp"
#include "utils/error.hpp"
#include <memory>
#include <string>

namespace stream_http {
namespace connection {

/**
 * @brief HTTP连接状态机
 * @note 严格顺序：同一连接上一个请求的响应写完、请求体排空后才处理下一个请求。
 *       HTTP/1.0请求应答后关闭连接。HEAD请求的响应只写头部。
 *       协议错误（分帧/解析/请求体/处理器返回的HTTP_*错误）尽力写一个错误响应再关闭；
 *       传输层错误与契约违例直接关闭。
 */
class HttpConnection : public Connection {
public:
    HttpConnection(uint64_t id,
                   std::unique_ptr<stream::Transport> transport,
                   std::shared_ptr<callback::RequestHandler> handler,
                   size_t max_header_size = protocol::MAX_HEADER_SIZE);
    ~HttpConnection() override;

    void start() override;

protected:
    void on_close() override;

private:
    void await_message();
    void next_message();
    void on_read(utils::Result<std::string> r);
    void dispatch(const std::string& header_block);
    void on_handler_done(uint64_t seq, utils::Result<protocol::HttpResponse> r);
    void write_response(const protocol::HttpResponse& response);
    void on_response_written(utils::Result<void> r);
    void on_body_drained(utils::Result<void> r);

    // 协议错误：尽力写错误响应后关闭
    void fail(utils::ErrorCode code, const std::string& message);

    // 传输层错误或契约违例：不写响应，直接关闭
    void abort(utils::ErrorCode code, const std::string& message);

    protocol::HttpHeaderFramer framer_;
    protocol::HttpParser parser_;
    std::shared_ptr<callback::RequestHandler> handler_;

    protocol::HttpRequest request_;
    std::shared_ptr<protocol::BodyReader> body_;
    uint64_t dispatch_seq_;

    // await_message循环正在栈上 / 需要再跑一轮
    bool in_cycle_;
    bool next_cycle_;
};

} // namespace connection
} // namespace stream_http

// 文件结束
