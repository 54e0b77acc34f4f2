// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: http_message.cpp
//  描述: HttpRequest和HttpResponse类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_message.hpp"
#include "protocol/protocol_utils.hpp"

namespace stream_http {
namespace protocol {

// ==================== HttpRequest实现 ====================

HttpRequest::HttpRequest()
    : method()
    , target()
    , version(HTTP_VERSION_1_1)
    , headers()
{
}

const HttpHeaderField* HttpRequest::find_header(const std::string& name) const {
    return FindHeaderField(headers, name);
}

bool HttpRequest::get_header(const std::string& name, std::string* value) const {
    const HttpHeaderField* field = find_header(name);
    if (field == nullptr) {
        return false;
    }
    if (value) {
        *value = field->value;
    }
    return true;
}

// ==================== HttpResponse实现 ====================

HttpResponse::HttpResponse()
    : status_code(200)
    , headers()
    , body()
{
}

HttpResponse::HttpResponse(int code)
    : status_code(code)
    , headers()
    , body()
{
}

void HttpResponse::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
}

const HttpHeaderField* HttpResponse::find_header(const std::string& name) const {
    return FindHeaderField(headers, name);
}

} // namespace protocol
} // namespace stream_http

// 文件结束
