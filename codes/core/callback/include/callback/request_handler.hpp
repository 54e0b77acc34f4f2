// =============================================================================
//  Stream HTTP Server - Callback Module
//  文件: request_handler.hpp
//  描述: 业务请求处理接口
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/body_reader.hpp"
#include "protocol/http_message.hpp"
#include "utils/error.hpp"
#include <functional>
#include <memory>
#include <string>

namespace stream_http {
namespace callback {

using ResponseCallback = std::function<void(utils::Result<protocol::HttpResponse>)>;

/**
 * @brief 请求处理接口
 * @note done可以在handle()返回之后再调用（处理器可以挂起）。
 *       处理器在done之后不得继续持有body。
 *       错误结果的HTTP_*错误码映射为对应状态码，其他错误码一律500。
 */
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual const std::string& get_name() const = 0;

    virtual void handle(const protocol::HttpRequest& request,
                        std::shared_ptr<protocol::BodyReader> body,
                        ResponseCallback done) = 0;
};

} // namespace callback
} // namespace stream_http

// 文件结束
