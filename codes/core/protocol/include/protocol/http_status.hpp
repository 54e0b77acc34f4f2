// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: http_status.hpp
//  描述: 错误码到HTTP状态码映射、状态原因短语
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"

namespace stream_http {
namespace protocol {

/**
 * @brief 协议错误对应的HTTP状态码
 * @return HTTP_*错误返回对应状态码，其他错误返回0（不应产生错误响应）
 */
int http_status_for_error(utils::ErrorCode code);

// 状态码的原因短语，未知状态码返回"Unknown"
const char* http_reason_phrase(int status_code);

} // namespace protocol
} // namespace stream_http

// 文件结束
