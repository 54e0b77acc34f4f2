// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: response_writer.cpp
//  描述: ResponseWriter实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/response_writer.hpp"
#include "protocol/http_status.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/logger.hpp"

namespace stream_http {
namespace protocol {

namespace details {

const char* const kChunkedTerminator = "0\r\n\r\n";

} // namespace details

void ResponseWriter::write(stream::SeqStream& stream, const HttpResponse& response, DoneCallback cb,
                           bool head_only) {
    std::shared_ptr<BodyReader> body = response.body;
    if (!body) {
        body = std::make_shared<MemoryBodyReader>(std::string());
    }

    utils::Result<std::string> head = encode_head(response, body->length());
    if (head.is_err()) {
        LOG_ERROR("ResponseWriter", "Refusing to write response: %s", head.error_message().c_str());
        cb(utils::make_err(head.error_code(), head.error_message()));
        return;
    }

    if (head_only) {
        // HEAD：头部照常声明长度，不写消息体
        stream.write(std::move(head.value()), std::move(cb));
        return;
    }

    auto writer = std::make_shared<ResponseWriter>(stream, std::move(body), std::move(cb));
    writer->start(std::move(head.value()));
}

utils::Result<std::string> ResponseWriter::encode_head(const HttpResponse& response, int64_t body_length) {
    for (const auto& field : response.headers) {
        if (StrCaseEqual(field.name, "Content-Length") || StrCaseEqual(field.name, "Transfer-Encoding")) {
            return utils::make_err<std::string>(utils::ErrorCode::RESPONSE_HEADER_CONFLICT,
                                                "response header already declares " + field.name);
        }
    }

    std::string out;
    out.reserve(128);
    out += "HTTP/1.1 ";
    out += std::to_string(response.status_code);
    out += ' ';
    out += http_reason_phrase(response.status_code);
    out += CRLF;

    for (const auto& field : response.headers) {
        out += field.name;
        out += ": ";
        out += field.value;
        out += CRLF;
    }

    if (body_length >= 0) {
        out += "Content-Length: ";
        out += std::to_string(body_length);
    } else {
        out += "Transfer-Encoding: chunked";
    }
    out += CRLF;
    out += CRLF;
    return utils::make_ok(std::move(out));
}

std::string ResponseWriter::encode_chunk(const std::string& data) {
    std::string out = ToHex(data.size());
    out.reserve(out.size() + data.size() + 4);
    out += CRLF;
    out += data;
    out += CRLF;
    return out;
}

ResponseWriter::ResponseWriter(stream::SeqStream& stream, std::shared_ptr<BodyReader> body, DoneCallback cb)
    : stream_(stream)
    , body_(std::move(body))
    , cb_(std::move(cb))
    , length_(body_->length())
    , written_(0)
    , pumping_(false)
    , pump_again_(false)
{
}

void ResponseWriter::start(std::string head) {
    auto self = shared_from_this();
    stream_.write(std::move(head), [self](utils::Result<void> r) {
        if (r.is_err()) {
            self->finish(std::move(r));
            return;
        }
        self->pump();
    });
}

void ResponseWriter::pump() {
    // 读取与写出同步完成时on_piece会再次调用pump，这里改为循环
    if (pumping_) {
        pump_again_ = true;
        return;
    }
    auto self = shared_from_this();
    pumping_ = true;
    do {
        pump_again_ = false;
        body_->read([self](utils::Result<std::string> r) {
            self->on_piece(std::move(r));
        });
    } while (pump_again_);
    pumping_ = false;
}

void ResponseWriter::on_piece(utils::Result<std::string> r) {
    if (r.is_err()) {
        finish(utils::make_err(r.error_code(), r.error_message()));
        return;
    }

    auto self = shared_from_this();
    std::string& data = r.value();

    if (length_ >= 0) {
        uint64_t expected = static_cast<uint64_t>(length_);
        if (data.empty()) {
            if (written_ != expected) {
                finish(utils::make_err(utils::ErrorCode::RESPONSE_LENGTH_MISMATCH,
                                       "body ended after " + std::to_string(written_) +
                                       " of " + std::to_string(expected) + " bytes"));
                return;
            }
            finish(utils::make_ok());
            return;
        }
        if (written_ + data.size() > expected) {
            finish(utils::make_err(utils::ErrorCode::RESPONSE_LENGTH_MISMATCH,
                                   "body longer than declared " + std::to_string(expected) + " bytes"));
            return;
        }
        written_ += data.size();
        stream_.write(std::move(data), [self](utils::Result<void> wr) {
            if (wr.is_err()) {
                self->finish(std::move(wr));
                return;
            }
            self->pump();
        });
        return;
    }

    // chunked
    if (data.empty()) {
        stream_.write(details::kChunkedTerminator, [self](utils::Result<void> wr) {
            self->finish(std::move(wr));
        });
        return;
    }
    written_ += data.size();
    stream_.write(encode_chunk(data), [self](utils::Result<void> wr) {
        if (wr.is_err()) {
            self->finish(std::move(wr));
            return;
        }
        self->pump();
    });
}

void ResponseWriter::finish(utils::Result<void> r) {
    if (!cb_) {
        return;
    }
    DoneCallback cb = std::move(cb_);
    cb_ = nullptr;
    cb(std::move(r));
}

HttpResponse make_text_response(int status_code, const std::string& text) {
    HttpResponse resp(status_code);
    resp.body = std::make_shared<MemoryBodyReader>(text);
    return resp;
}

} // namespace protocol
} // namespace stream_http

// 文件结束
