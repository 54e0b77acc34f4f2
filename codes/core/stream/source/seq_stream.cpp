// =============================================================================
//  Stream HTTP Server - Stream Module
//  文件: seq_stream.cpp
//  描述: SeqStream实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "stream/seq_stream.hpp"
#include "utils/logger.hpp"
#include <stdexcept>

namespace stream_http {
namespace stream {

SeqStream::SeqStream(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport))
    , ended_(false)
    , closed_(false)
    , error_code_(utils::ErrorCode::SUCCESS)
{
    if (transport_) {
        transport_->set_listener(this);
    }
}

SeqStream::~SeqStream() {
    // 析构时不再回调任何人
    pending_read_ = nullptr;
    if (transport_) {
        transport_->set_listener(nullptr);
        if (!closed_) {
            closed_ = true;
            transport_->destroy();
        }
    }
}

void SeqStream::read(ReadCallback cb) {
    if (pending_read_) {
        throw std::logic_error("SeqStream::read called while a previous read is still pending");
    }

    // 顺序：先交付已到达的数据，再报告错误或结束
    if (!early_chunks_.empty()) {
        std::string chunk = std::move(early_chunks_.front());
        early_chunks_.pop_front();
        cb(utils::make_ok(std::move(chunk)));
        return;
    }
    if (has_error()) {
        cb(utils::make_err<std::string>(error_code_, error_message_));
        return;
    }
    if (closed_ || !transport_) {
        cb(utils::make_err<std::string>(utils::ErrorCode::NETWORK_CLOSED));
        return;
    }
    if (ended_) {
        cb(utils::make_ok(std::string()));
        return;
    }

    pending_read_ = std::move(cb);
    // 必须最后调用：Transport可能在resume()内同步送达数据
    transport_->resume();
}

void SeqStream::write(std::string data, WriteCallback cb) {
    if (has_error()) {
        cb(utils::make_err(error_code_, error_message_));
        return;
    }
    if (closed_ || !transport_) {
        cb(utils::make_err(utils::ErrorCode::NETWORK_CLOSED));
        return;
    }
    transport_->write(std::move(data), std::move(cb));
}

void SeqStream::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (transport_) {
        transport_->destroy();
    }
    if (pending_read_) {
        ReadCallback cb = std::move(pending_read_);
        pending_read_ = nullptr;
        cb(utils::make_err<std::string>(utils::ErrorCode::NETWORK_CLOSED));
    }
}

bool SeqStream::is_writable() const {
    return !closed_ && !has_error() && transport_ && transport_->is_writable();
}

std::string SeqStream::peer_address() const {
    return transport_ ? transport_->peer_address() : std::string("<none>");
}

void SeqStream::on_data(std::string chunk) {
    if (transport_) {
        transport_->pause();
    }
    if (!pending_read_) {
        // pause()之前Transport已经送达了一块
        early_chunks_.push_back(std::move(chunk));
        return;
    }
    ReadCallback cb = std::move(pending_read_);
    pending_read_ = nullptr;
    cb(utils::make_ok(std::move(chunk)));
}

void SeqStream::on_end() {
    ended_ = true;
    if (pending_read_) {
        ReadCallback cb = std::move(pending_read_);
        pending_read_ = nullptr;
        cb(utils::make_ok(std::string()));
    }
}

void SeqStream::on_error(utils::ErrorCode code, const std::string& message) {
    if (!has_error()) {
        error_code_ = code;
        error_message_ = message;
    }
    if (pending_read_) {
        ReadCallback cb = std::move(pending_read_);
        pending_read_ = nullptr;
        cb(utils::make_err<std::string>(code, message));
    } else {
        LOG_DEBUG("SeqStream", "Latched transport error while idle: %s", message.c_str());
    }
}

} // namespace stream
} // namespace stream_http

// 文件结束
