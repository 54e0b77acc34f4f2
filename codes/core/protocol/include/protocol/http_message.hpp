// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: http_message.hpp
//  描述: HttpRequest和HttpResponse类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include <memory>
#include <string>

namespace stream_http {
namespace protocol {

class BodyReader;

// ==================== HTTP请求类 ====================
// 请求头解析完成后不再修改；请求体通过BodyReader单独读取
class HttpRequest {
public:
    HttpRequest();

    /**
     * @brief 查找第一个同名字段（大小写不敏感）
     * @return 字段指针，未找到返回nullptr
     */
    const HttpHeaderField* find_header(const std::string& name) const;

    /**
     * @brief 查找字段值
     * @param value 输出字段值（可为nullptr）
     * @return true找到，false未找到
     */
    bool get_header(const std::string& name, std::string* value) const;

    // HTTP/1.0请求处理完后关闭连接
    bool is_http_1_0() const { return version == HTTP_VERSION_1_0; }

    // 公开属性
    std::string method;
    std::string target;     // 原样保留，不做解码
    std::string version;    // "1.0" 或 "1.1"
    HttpHeaders headers;
};

// ==================== HTTP响应类 ====================
// Content-Length/Transfer-Encoding由ResponseWriter计算，调用方不得设置
class HttpResponse {
public:
    HttpResponse();
    explicit HttpResponse(int code);

    void set_status(int code) { status_code = code; }

    void add_header(const std::string& name, const std::string& value);

    const HttpHeaderField* find_header(const std::string& name) const;

    // 公开属性
    int status_code;
    HttpHeaders headers;
    std::shared_ptr<BodyReader> body;   // 为空表示空响应体
};

} // namespace protocol
} // namespace stream_http

// 文件结束
