// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: body_reader.hpp
//  描述: 拉取式HTTP消息体读取器（定长/分块/读到EOF/内存）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "stream/seq_stream.hpp"
#include "utils/buffer.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace stream_http {
namespace protocol {

/**
 * @brief 消息体读取器
 * @note read()每次回调下一块非空数据，结束时回调空块，之后的read()都返回空块。
 *       同一时刻最多一个未完成的read。必须通过std::make_shared创建。
 */
class BodyReader : public std::enable_shared_from_this<BodyReader> {
public:
    using ReadCallback = std::function<void(utils::Result<std::string>)>;

    static constexpr int64_t UNKNOWN_LENGTH = -1;

    virtual ~BodyReader() = default;

    // 消息体总长度，未知返回UNKNOWN_LENGTH
    virtual int64_t length() const = 0;

    virtual void read(ReadCallback cb) = 0;
};

// 内存数据：一次返回全部字节，然后结束
class MemoryBodyReader : public BodyReader {
public:
    explicit MemoryBodyReader(std::string data);

    int64_t length() const override { return length_; }
    void read(ReadCallback cb) override;

private:
    std::string data_;
    int64_t length_;
    bool done_;
};

// 定长：先消费连接缓冲区中的剩余字节，不足时从流读取，绝不越过边界
class LengthBodyReader : public BodyReader {
public:
    LengthBodyReader(stream::SeqStream& stream, utils::Buffer& buffer, uint64_t length);

    int64_t length() const override { return static_cast<int64_t>(length_); }
    void read(ReadCallback cb) override;

    uint64_t remaining() const { return remain_; }

private:
    void deliver(const ReadCallback& cb);

    stream::SeqStream& stream_;
    utils::Buffer& buffer_;
    uint64_t length_;
    uint64_t remain_;
};

/**
 * @brief 分块传输编码
 * @note 块大小行为十六进制，';'之后的块扩展被忽略；0号块之后的trailer
 *       读到空行为止并丢弃。块数据之后缺少CRLF或大小行非法返回HTTP_BAD_CHUNK。
 */
class ChunkedBodyReader : public BodyReader {
public:
    static constexpr size_t MAX_CHUNK_LINE = 4096;

    ChunkedBodyReader(stream::SeqStream& stream, utils::Buffer& buffer);

    int64_t length() const override { return UNKNOWN_LENGTH; }
    void read(ReadCallback cb) override;

private:
    enum class State {
        SIZE_LINE,
        DATA,
        DATA_CRLF,
        TRAILER,
        DONE,
        FAILED
    };

    // 用缓冲区推进状态机，数据不足时从流读取后继续
    void pump(const ReadCallback& cb);
    // 从流读一块；数据同步到达返回true由调用方继续循环，否则到达后自行pump
    bool fill(const ReadCallback& cb);
    void fail(const ReadCallback& cb, utils::ErrorCode code, const std::string& msg);

    stream::SeqStream& stream_;
    utils::Buffer& buffer_;
    State state_;
    uint64_t chunk_remain_;
    utils::ErrorCode error_code_;
    std::string error_msg_;
    bool filling_;
    bool filled_inline_;
};

// 没有长度信息：一直读到对端关闭
class EofBodyReader : public BodyReader {
public:
    EofBodyReader(stream::SeqStream& stream, utils::Buffer& buffer);

    int64_t length() const override { return UNKNOWN_LENGTH; }
    void read(ReadCallback cb) override;

private:
    stream::SeqStream& stream_;
    utils::Buffer& buffer_;
    bool done_;
};

/**
 * @brief 按请求方法与头部选择读取器
 * @note GET/HEAD强制长度为0，带正数Content-Length或chunked时返回HTTP_BODY_NOT_ALLOWED；
 *       Content-Length超过INT64_MAX返回HTTP_BAD_CONTENT_LENGTH；
 *       Content-Length优先于Transfer-Encoding；非chunked的Transfer-Encoding返回HTTP_NOT_IMPLEMENTED
 * @param stream 连接流，生命周期必须长于读取器
 * @param buffer 连接缓冲区，请求头之后的多余字节在这里
 */
utils::Result<std::shared_ptr<BodyReader>> create_request_body_reader(stream::SeqStream& stream,
                                                                     utils::Buffer& buffer,
                                                                     const HttpRequest& request);

/**
 * @brief 读完消息体剩余部分并丢弃
 * @param cb 读到结束回调成功，读取出错回调错误
 */
void drain_body(const std::shared_ptr<BodyReader>& reader,
                std::function<void(utils::Result<void>)> cb);

} // namespace protocol
} // namespace stream_http

// 文件结束
