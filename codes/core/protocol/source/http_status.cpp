// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: http_status.cpp
//  描述: 错误码到HTTP状态码映射实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_status.hpp"

namespace stream_http {
namespace protocol {

int http_status_for_error(utils::ErrorCode code) {
    switch (code) {
        case utils::ErrorCode::HTTP_BAD_REQUEST:
        case utils::ErrorCode::HTTP_BAD_CONTENT_LENGTH:
        case utils::ErrorCode::HTTP_BAD_CHUNK:
        case utils::ErrorCode::HTTP_UNEXPECTED_EOF:
        case utils::ErrorCode::HTTP_BODY_NOT_ALLOWED:
            return 400;
        case utils::ErrorCode::HTTP_NOT_FOUND: return 404;
        case utils::ErrorCode::HTTP_METHOD_NOT_ALLOWED: return 405;
        case utils::ErrorCode::HTTP_HEADER_TOO_LARGE: return 413;
        case utils::ErrorCode::HTTP_HANDLER_ERROR: return 500;
        case utils::ErrorCode::HTTP_NOT_IMPLEMENTED: return 501;
        default: return 0;
    }
}

const char* http_reason_phrase(int status_code) {
    switch (status_code) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

} // namespace protocol
} // namespace stream_http

// 文件结束
