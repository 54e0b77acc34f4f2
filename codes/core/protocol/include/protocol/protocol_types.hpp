// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: protocol_types.hpp
//  描述: Protocol模块类型定义、枚举、常量
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace stream_http {
namespace protocol {

// ==================== 分帧相关常量 ====================
constexpr size_t MAX_HEADER_SIZE = 8 * 1024;        // 请求头（含终止空行）默认上限
constexpr const char* CRLF = "\r\n";
constexpr const char* HEADER_TERMINATOR = "\r\n\r\n";
constexpr char LINE_DELIMITER = '\n';

// ==================== HTTP版本 ====================
constexpr const char* HTTP_VERSION_1_0 = "1.0";
constexpr const char* HTTP_VERSION_1_1 = "1.1";

// ==================== 解析结果枚举 ====================
enum class ParseResult {
    OK = 0,
    NEED_MORE = 1,
    ERROR = 2
};

// ==================== HTTP头部字段 ====================
// 保留原始顺序与重复字段
struct HttpHeaderField {
    std::string name;
    std::string value;

    HttpHeaderField() = default;
    HttpHeaderField(std::string n, std::string v)
        : name(std::move(n))
        , value(std::move(v))
    {
    }
};

using HttpHeaders = std::vector<HttpHeaderField>;

} // namespace protocol
} // namespace stream_http

// 文件结束
