// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: message_framer.hpp
//  描述: 从缓冲区头部切出一条完整消息（行分隔/HTTP请求头）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "utils/buffer.hpp"
#include "utils/error.hpp"
#include <string>

namespace stream_http {
namespace protocol {

/**
 * @brief 分帧接口
 * @note try_cut只依赖缓冲区内容，不读流；缓冲区不变时重复调用得到相同的
 *       NEED_MORE或ERROR结果。返回OK时消息字节已从缓冲区移除。
 */
class MessageFramer {
public:
    virtual ~MessageFramer() = default;

    /**
     * @brief 尝试切出一条消息
     * @param buffer 连接缓冲区
     * @param message 输出消息（包含分隔符），仅OK时有效
     * @param error 输出错误码，仅ERROR时有效
     * @return OK / NEED_MORE / ERROR
     */
    virtual ParseResult try_cut(utils::Buffer& buffer,
                                std::string* message,
                                utils::ErrorCode* error) const = 0;
};

// 以'\n'分隔的文本行，消息包含'\n'
class LineFramer : public MessageFramer {
public:
    ParseResult try_cut(utils::Buffer& buffer,
                        std::string* message,
                        utils::ErrorCode* error) const override;
};

// 以"\r\n\r\n"结束的HTTP请求头
class HttpHeaderFramer : public MessageFramer {
public:
    explicit HttpHeaderFramer(size_t max_header_size = MAX_HEADER_SIZE);

    ParseResult try_cut(utils::Buffer& buffer,
                        std::string* message,
                        utils::ErrorCode* error) const override;

    size_t max_header_size() const { return max_header_size_; }

private:
    size_t max_header_size_;
};

} // namespace protocol
} // namespace stream_http

// 文件结束
