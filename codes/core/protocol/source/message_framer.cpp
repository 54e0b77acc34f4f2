// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: message_framer.cpp
//  描述: LineFramer与HttpHeaderFramer实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/message_framer.hpp"
#include <cstring>

namespace stream_http {
namespace protocol {

// ==================== LineFramer实现 ====================

ParseResult LineFramer::try_cut(utils::Buffer& buffer,
                                std::string* message,
                                utils::ErrorCode* error) const {
    (void)error;
    size_t idx = buffer.find(&LINE_DELIMITER, 1);
    if (idx == utils::Buffer::npos) {
        return ParseResult::NEED_MORE;
    }
    size_t len = idx + 1;
    if (message) {
        *message = buffer.peek(len);
    }
    buffer.consume(len);
    return ParseResult::OK;
}

// ==================== HttpHeaderFramer实现 ====================

HttpHeaderFramer::HttpHeaderFramer(size_t max_header_size)
    : max_header_size_(max_header_size)
{
}

ParseResult HttpHeaderFramer::try_cut(utils::Buffer& buffer,
                                      std::string* message,
                                      utils::ErrorCode* error) const {
    const size_t terminator_len = std::strlen(HEADER_TERMINATOR);
    size_t idx = buffer.find(HEADER_TERMINATOR, terminator_len);
    if (idx == utils::Buffer::npos) {
        if (buffer.readable_bytes() >= max_header_size_) {
            if (error) {
                *error = utils::ErrorCode::HTTP_HEADER_TOO_LARGE;
            }
            return ParseResult::ERROR;
        }
        return ParseResult::NEED_MORE;
    }

    size_t len = idx + terminator_len;
    if (len > max_header_size_) {
        if (error) {
            *error = utils::ErrorCode::HTTP_HEADER_TOO_LARGE;
        }
        return ParseResult::ERROR;
    }

    if (message) {
        *message = buffer.peek(len);
    }
    buffer.consume(len);
    return ParseResult::OK;
}

} // namespace protocol
} // namespace stream_http

// 文件结束
