// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: http_parser.cpp
//  描述: HttpParser类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_parser.hpp"
#include <cstring>

namespace stream_http {
namespace protocol {

namespace details {

inline bool is_ctl(unsigned char c) {
    return c < 0x20 || c == 0x7f;
}

inline bool is_ows(char c) {
    return c == ' ' || c == '\t';
}

// token字符：非控制字符、非空白
inline bool is_token_text(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_ctl(c) || c == ' ') {
            return false;
        }
    }
    return true;
}

} // namespace details

// ==================== HttpParser实现 ====================

HttpParser::HttpParser()
    : error_code_(utils::ErrorCode::SUCCESS)
    , error_msg_()
{
}

HttpParser::~HttpParser() = default;

utils::Result<HttpRequest> HttpParser::parse_request(const std::string& header_block) {
    reset();

    HttpRequest req;
    size_t pos = 0;
    bool first_line = true;

    while (pos < header_block.size()) {
        size_t eol = header_block.find(CRLF, pos);
        size_t line_end = (eol == std::string::npos) ? header_block.size() : eol;
        std::string line = header_block.substr(pos, line_end - pos);
        pos = (eol == std::string::npos) ? header_block.size() : eol + 2;

        if (first_line) {
            if (parse_request_line(line, &req.method, &req.target, &req.version) != 0) {
                return utils::make_err<HttpRequest>(error_code_, error_msg_);
            }
            first_line = false;
            continue;
        }

        // 空行表示头部结束，之后不允许再有内容
        if (line.empty()) {
            if (pos < header_block.size()) {
                set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "data after header terminator");
                return utils::make_err<HttpRequest>(error_code_, error_msg_);
            }
            break;
        }

        HttpHeaderField field;
        if (parse_header(line, &field) != 0) {
            return utils::make_err<HttpRequest>(error_code_, error_msg_);
        }
        req.headers.push_back(std::move(field));
    }

    if (first_line) {
        set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "empty request");
        return utils::make_err<HttpRequest>(error_code_, error_msg_);
    }

    return utils::make_ok(std::move(req));
}

int HttpParser::parse_request_line(const std::string& line,
                                   std::string* method,
                                   std::string* target,
                                   std::string* version) {
    method->clear();
    target->clear();
    version->clear();

    // 恰好两个SP分隔三部分
    size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) {
        set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad request line");
        return -1;
    }
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || line.find(' ', sp2 + 1) != std::string::npos) {
        set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad request line");
        return -1;
    }

    std::string m = line.substr(0, sp1);
    std::string t = line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string v = line.substr(sp2 + 1);

    if (!details::is_token_text(m) || !details::is_token_text(t)) {
        set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad request line");
        return -1;
    }

    if (v == "HTTP/1.1") {
        *version = HTTP_VERSION_1_1;
    } else if (v == "HTTP/1.0") {
        *version = HTTP_VERSION_1_0;
    } else {
        set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad version");
        return -1;
    }

    *method = std::move(m);
    *target = std::move(t);
    return 0;
}

int HttpParser::parse_header(const std::string& line, HttpHeaderField* field) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad field");
        return -1;
    }

    // 名字：不允许控制字符与空白（包括冒号前的空白）
    for (size_t i = 0; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (details::is_ctl(c) || details::is_ows(line[i])) {
            set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad field");
            return -1;
        }
    }

    size_t value_start = colon + 1;
    size_t value_end = line.size();
    while (value_start < value_end && details::is_ows(line[value_start])) {
        value_start++;
    }
    while (value_end > value_start && details::is_ows(line[value_end - 1])) {
        value_end--;
    }

    // 值：HTAB以外的控制字符非法
    for (size_t i = value_start; i < value_end; ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (details::is_ctl(c) && c != '\t') {
            set_error(utils::ErrorCode::HTTP_BAD_REQUEST, "bad field");
            return -1;
        }
    }

    field->name = line.substr(0, colon);
    field->value = line.substr(value_start, value_end - value_start);
    return 0;
}

void HttpParser::set_error(utils::ErrorCode code, const std::string& msg) {
    error_code_ = code;
    error_msg_ = msg;
}

void HttpParser::reset() {
    error_code_ = utils::ErrorCode::SUCCESS;
    error_msg_.clear();
}

} // namespace protocol
} // namespace stream_http

// 文件结束
