// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: response_writer.hpp
//  描述: HTTP响应序列化：状态行、头部、按Content-Length或chunked写出消息体
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/body_reader.hpp"
#include "protocol/http_message.hpp"
#include "stream/seq_stream.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace stream_http {
namespace protocol {

/**
 * @brief 单个响应的写出过程
 * @note 消息体长度已知时写Content-Length并严格写出该长度，读取器多给或少给都以
 *       RESPONSE_LENGTH_MISMATCH失败；长度未知时使用chunked编码。
 *       调用方在headers里自带Content-Length/Transfer-Encoding时，不写任何字节，
 *       直接以RESPONSE_HEADER_CONFLICT失败。
 */
class ResponseWriter : public std::enable_shared_from_this<ResponseWriter> {
public:
    using DoneCallback = std::function<void(utils::Result<void>)>;

    /**
     * @brief 写出响应
     * @param stream 连接流
     * @param response 响应对象，body为空表示空消息体
     * @param cb 全部写完或出错后回调一次
     * @param head_only 只写状态行与头部（HEAD请求），消息体不读取
     */
    static void write(stream::SeqStream& stream, const HttpResponse& response, DoneCallback cb,
                      bool head_only = false);

    /**
     * @brief 生成状态行与头部块（以空行结束）
     * @param response 响应对象
     * @param body_length 消息体长度，BodyReader::UNKNOWN_LENGTH表示chunked
     * @return 头部字节，或RESPONSE_HEADER_CONFLICT
     */
    static utils::Result<std::string> encode_head(const HttpResponse& response, int64_t body_length);

    // 一个chunked数据块的线上格式
    static std::string encode_chunk(const std::string& data);

    ResponseWriter(stream::SeqStream& stream, std::shared_ptr<BodyReader> body, DoneCallback cb);

private:
    void start(std::string head);
    void pump();
    void on_piece(utils::Result<std::string> r);
    void finish(utils::Result<void> r);

    stream::SeqStream& stream_;
    std::shared_ptr<BodyReader> body_;
    DoneCallback cb_;
    int64_t length_;
    uint64_t written_;
    bool pumping_;
    bool pump_again_;
};

/**
 * @brief 构造文本响应，消息体为内存数据
 */
HttpResponse make_text_response(int status_code, const std::string& text);

} // namespace protocol
} // namespace stream_http

// 文件结束
