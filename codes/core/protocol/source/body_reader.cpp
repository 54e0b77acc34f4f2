// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: body_reader.cpp
//  描述: BodyReader各实现与选择逻辑
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/body_reader.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <limits>

namespace stream_http {
namespace protocol {

constexpr int64_t BodyReader::UNKNOWN_LENGTH;
constexpr size_t ChunkedBodyReader::MAX_CHUNK_LINE;

// ==================== MemoryBodyReader ====================

MemoryBodyReader::MemoryBodyReader(std::string data)
    : data_(std::move(data))
    , length_(static_cast<int64_t>(data_.size()))
    , done_(false)
{
}

void MemoryBodyReader::read(ReadCallback cb) {
    if (done_) {
        cb(utils::make_ok(std::string()));
        return;
    }
    done_ = true;
    std::string data;
    data.swap(data_);
    cb(utils::make_ok(std::move(data)));
}

// ==================== LengthBodyReader ====================

LengthBodyReader::LengthBodyReader(stream::SeqStream& stream, utils::Buffer& buffer, uint64_t length)
    : stream_(stream)
    , buffer_(buffer)
    , length_(length)
    , remain_(length)
{
}

void LengthBodyReader::read(ReadCallback cb) {
    if (remain_ == 0) {
        cb(utils::make_ok(std::string()));
        return;
    }
    if (!buffer_.empty()) {
        deliver(cb);
        return;
    }

    auto self = shared_from_this();
    stream_.read([self, this, cb](utils::Result<std::string> r) {
        if (r.is_err()) {
            cb(utils::make_err<std::string>(r.error_code(), r.error_message()));
            return;
        }
        if (r.value().empty()) {
            cb(utils::make_err<std::string>(utils::ErrorCode::HTTP_UNEXPECTED_EOF,
                                            "Unexpected EOF from HTTP body"));
            return;
        }
        buffer_.append(r.value());
        deliver(cb);
    });
}

void LengthBodyReader::deliver(const ReadCallback& cb) {
    size_t n = static_cast<size_t>(std::min<uint64_t>(buffer_.readable_bytes(), remain_));
    std::string data = buffer_.peek(n);
    buffer_.consume(n);
    remain_ -= n;
    cb(utils::make_ok(std::move(data)));
}

// ==================== ChunkedBodyReader ====================

ChunkedBodyReader::ChunkedBodyReader(stream::SeqStream& stream, utils::Buffer& buffer)
    : stream_(stream)
    , buffer_(buffer)
    , state_(State::SIZE_LINE)
    , chunk_remain_(0)
    , error_code_(utils::ErrorCode::SUCCESS)
    , filling_(false)
    , filled_inline_(false)
{
}

void ChunkedBodyReader::read(ReadCallback cb) {
    pump(cb);
}

void ChunkedBodyReader::pump(const ReadCallback& cb) {
    while (true) {
        switch (state_) {
            case State::FAILED:
                cb(utils::make_err<std::string>(error_code_, error_msg_));
                return;

            case State::DONE:
                cb(utils::make_ok(std::string()));
                return;

            case State::SIZE_LINE: {
                size_t idx = buffer_.find(CRLF, 2);
                if (idx == utils::Buffer::npos) {
                    if (buffer_.readable_bytes() > MAX_CHUNK_LINE) {
                        fail(cb, utils::ErrorCode::HTTP_BAD_CHUNK, "chunk size line too long");
                        return;
                    }
                    if (!fill(cb)) {
                        return;
                    }
                    break;
                }
                std::string line = buffer_.peek(idx);
                buffer_.consume(idx + 2);

                // 去掉块扩展与尾部空白
                size_t semi = line.find(';');
                if (semi != std::string::npos) {
                    line.erase(semi);
                }
                while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
                    line.pop_back();
                }

                uint64_t size = 0;
                if (!ParseHex(line, &size)) {
                    fail(cb, utils::ErrorCode::HTTP_BAD_CHUNK, "bad chunk size");
                    return;
                }
                if (size == 0) {
                    state_ = State::TRAILER;
                } else {
                    chunk_remain_ = size;
                    state_ = State::DATA;
                }
                break;
            }

            case State::DATA: {
                if (buffer_.empty()) {
                    if (!fill(cb)) {
                        return;
                    }
                    break;
                }
                size_t n = static_cast<size_t>(std::min<uint64_t>(buffer_.readable_bytes(), chunk_remain_));
                std::string data = buffer_.peek(n);
                buffer_.consume(n);
                chunk_remain_ -= n;
                if (chunk_remain_ == 0) {
                    state_ = State::DATA_CRLF;
                }
                cb(utils::make_ok(std::move(data)));
                return;
            }

            case State::DATA_CRLF: {
                if (buffer_.readable_bytes() < 2) {
                    if (!fill(cb)) {
                        return;
                    }
                    break;
                }
                if (buffer_.peek(2) != CRLF) {
                    fail(cb, utils::ErrorCode::HTTP_BAD_CHUNK, "missing CRLF after chunk data");
                    return;
                }
                buffer_.consume(2);
                state_ = State::SIZE_LINE;
                break;
            }

            case State::TRAILER: {
                size_t idx = buffer_.find(CRLF, 2);
                if (idx == utils::Buffer::npos) {
                    if (buffer_.readable_bytes() > MAX_CHUNK_LINE) {
                        fail(cb, utils::ErrorCode::HTTP_BAD_CHUNK, "trailer line too long");
                        return;
                    }
                    if (!fill(cb)) {
                        return;
                    }
                    break;
                }
                buffer_.consume(idx + 2);
                if (idx == 0) {
                    state_ = State::DONE;
                }
                break;
            }
        }
    }
}

bool ChunkedBodyReader::fill(const ReadCallback& cb) {
    auto self = shared_from_this();
    filling_ = true;
    filled_inline_ = false;
    stream_.read([self, this, cb](utils::Result<std::string> r) {
        if (r.is_err()) {
            fail(cb, r.error_code(), r.error_message());
            return;
        }
        if (r.value().empty()) {
            fail(cb, utils::ErrorCode::HTTP_UNEXPECTED_EOF, "Unexpected EOF from HTTP body");
            return;
        }
        buffer_.append(r.value());
        if (filling_) {
            // 同步到达，交回pump的循环
            filled_inline_ = true;
            return;
        }
        pump(cb);
    });
    filling_ = false;
    return filled_inline_;
}

void ChunkedBodyReader::fail(const ReadCallback& cb, utils::ErrorCode code, const std::string& msg) {
    state_ = State::FAILED;
    error_code_ = code;
    error_msg_ = msg;
    cb(utils::make_err<std::string>(code, msg));
}

// ==================== EofBodyReader ====================

EofBodyReader::EofBodyReader(stream::SeqStream& stream, utils::Buffer& buffer)
    : stream_(stream)
    , buffer_(buffer)
    , done_(false)
{
}

void EofBodyReader::read(ReadCallback cb) {
    if (!buffer_.empty()) {
        std::string data = buffer_.view();
        buffer_.clear();
        cb(utils::make_ok(std::move(data)));
        return;
    }
    if (done_) {
        cb(utils::make_ok(std::string()));
        return;
    }

    auto self = shared_from_this();
    stream_.read([self, this, cb](utils::Result<std::string> r) {
        if (r.is_err()) {
            cb(utils::make_err<std::string>(r.error_code(), r.error_message()));
            return;
        }
        if (r.value().empty()) {
            done_ = true;
        }
        cb(utils::make_ok(std::move(r.value())));
    });
}

// ==================== 选择逻辑 ====================

utils::Result<std::shared_ptr<BodyReader>> create_request_body_reader(stream::SeqStream& stream,
                                                                     utils::Buffer& buffer,
                                                                     const HttpRequest& request) {
    using ReaderResult = utils::Result<std::shared_ptr<BodyReader>>;

    bool has_length = false;
    uint64_t body_len = 0;
    const HttpHeaderField* cl = request.find_header("Content-Length");
    if (cl != nullptr) {
        if (!ParseDecimal(cl->value, &body_len) ||
            body_len > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return utils::make_err<std::shared_ptr<BodyReader>>(
                utils::ErrorCode::HTTP_BAD_CONTENT_LENGTH, "bad Content-Length");
        }
        has_length = true;
    }

    const HttpHeaderField* te = request.find_header("Transfer-Encoding");
    bool chunked = te != nullptr && StrCaseEqual(te->value, "chunked");

    bool body_allowed = !(request.method == "GET" || request.method == "HEAD");
    if (!body_allowed) {
        if ((has_length && body_len > 0) || chunked) {
            return utils::make_err<std::shared_ptr<BodyReader>>(
                utils::ErrorCode::HTTP_BODY_NOT_ALLOWED, "HTTP body not allowed");
        }
        return ReaderResult(std::make_shared<LengthBodyReader>(stream, buffer, 0));
    }

    if (has_length) {
        return ReaderResult(std::make_shared<LengthBodyReader>(stream, buffer, body_len));
    }
    if (te != nullptr) {
        if (!chunked) {
            LOG_WARN("BodyReader", "Unsupported Transfer-Encoding: %s", te->value.c_str());
            return utils::make_err<std::shared_ptr<BodyReader>>(
                utils::ErrorCode::HTTP_NOT_IMPLEMENTED, "unsupported Transfer-Encoding");
        }
        return ReaderResult(std::make_shared<ChunkedBodyReader>(stream, buffer));
    }
    return ReaderResult(std::make_shared<EofBodyReader>(stream, buffer));
}

namespace details {

// 同步完成的read在循环里继续，不递归
struct BodyDrainer {
    std::shared_ptr<BodyReader> reader;
    std::function<void(utils::Result<void>)> cb;
    bool looping = false;
    bool again = false;
};

void drain_step(const std::shared_ptr<BodyDrainer>& drainer) {
    if (drainer->looping) {
        drainer->again = true;
        return;
    }
    std::shared_ptr<BodyDrainer> keep = drainer;
    keep->looping = true;
    do {
        keep->again = false;
        keep->reader->read([keep](utils::Result<std::string> r) {
            if (r.is_err()) {
                keep->cb(utils::make_err(r.error_code(), r.error_message()));
                return;
            }
            if (r.value().empty()) {
                keep->cb(utils::make_ok());
                return;
            }
            drain_step(keep);
        });
    } while (keep->again);
    keep->looping = false;
}

} // namespace details

void drain_body(const std::shared_ptr<BodyReader>& reader,
                std::function<void(utils::Result<void>)> cb) {
    if (!reader) {
        cb(utils::make_ok());
        return;
    }
    auto drainer = std::make_shared<details::BodyDrainer>();
    drainer->reader = reader;
    drainer->cb = std::move(cb);
    details::drain_step(drainer);
}

} // namespace protocol
} // namespace stream_http

// 文件结束
