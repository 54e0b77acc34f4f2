// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: http_parser.hpp
//  描述: HttpParser类定义 - HTTP/1.x请求头解析
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/http_message.hpp"
#include "utils/error.hpp"
#include <string>

namespace stream_http {
namespace protocol {

// ==================== HTTP解析器类 ====================
class HttpParser {
public:
    HttpParser();
    ~HttpParser();

    /**
     * @brief 解析一个完整请求头块
     * @param header_block 请求行+头部行，末尾的空行可有可无
     * @return 成功返回请求对象，失败返回HTTP_BAD_REQUEST
     */
    utils::Result<HttpRequest> parse_request(const std::string& header_block);

    /**
     * @brief 解析HTTP请求行 "METHOD SP TARGET SP HTTP/1.x"
     * @param line 请求行（不含CRLF）
     * @param method 输出方法
     * @param target 输出请求目标
     * @param version 输出版本（"1.0"或"1.1"）
     * @return 0成功，-1失败（错误信息见get_error_msg）
     */
    int parse_request_line(const std::string& line,
                           std::string* method,
                           std::string* target,
                           std::string* version);

    /**
     * @brief 解析单条头部行 "Name: value"
     * @param line 头部行（不含CRLF）
     * @param field 输出字段，值已去除首尾SP/HTAB
     * @return 0成功，-1失败
     */
    int parse_header(const std::string& line, HttpHeaderField* field);

    utils::ErrorCode get_error_code() const { return error_code_; }
    const std::string& get_error_msg() const { return error_msg_; }

    // 重置错误状态
    void reset();

private:
    void set_error(utils::ErrorCode code, const std::string& msg);

    utils::ErrorCode error_code_;
    std::string error_msg_;
};

} // namespace protocol
} // namespace stream_http

// 文件结束
