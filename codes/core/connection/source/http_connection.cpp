// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: http_connection.cpp
//  描述: HttpConnection实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "connection/http_connection.hpp"
#include "protocol/http_status.hpp"
#include "protocol/response_writer.hpp"
#include "utils/logger.hpp"
#include <stdexcept>

namespace stream_http {
namespace connection {

HttpConnection::HttpConnection(uint64_t id,
                               std::unique_ptr<stream::Transport> transport,
                               std::shared_ptr<callback::RequestHandler> handler,
                               size_t max_header_size)
    : Connection(id, std::move(transport))
    , framer_(max_header_size)
    , parser_()
    , handler_(std::move(handler))
    , request_()
    , body_()
    , dispatch_seq_(0)
    , in_cycle_(false)
    , next_cycle_(false)
{
}

HttpConnection::~HttpConnection() = default;

void HttpConnection::start() {
    await_message();
}

void HttpConnection::on_close() {
    body_.reset();
}

// ============================================================================
//  AWAITING_MESSAGE
// ============================================================================

void HttpConnection::await_message() {
    // 读写、处理器、排空都可能同步完成，重入时只做标记，由外层循环继续
    if (in_cycle_) {
        next_cycle_ = true;
        return;
    }
    auto self = self_as<HttpConnection>();  // 循环期间保活
    in_cycle_ = true;
    do {
        next_cycle_ = false;
        next_message();
    } while (next_cycle_ && !is_closed());
    in_cycle_ = false;
}

void HttpConnection::next_message() {
    if (is_closed()) {
        return;
    }
    transition_to(ConnectionState::AWAITING_MESSAGE);

    std::string header_block;
    utils::ErrorCode error = utils::ErrorCode::SUCCESS;
    protocol::ParseResult pr = framer_.try_cut(buffer_, &header_block, &error);

    if (pr == protocol::ParseResult::OK) {
        dispatch(header_block);
        return;
    }
    if (pr == protocol::ParseResult::ERROR) {
        fail(error, utils::error_code_to_description(error));
        return;
    }

    auto self = self_as<HttpConnection>();
    stream_.read([self](utils::Result<std::string> r) {
        self->on_read(std::move(r));
    });
}

void HttpConnection::on_read(utils::Result<std::string> r) {
    if (is_closed()) {
        return;
    }
    if (r.is_err()) {
        abort(r.error_code(), r.error_message());
        return;
    }
    if (r.value().empty()) {
        if (buffer_.empty()) {
            // 两个请求之间对端正常关闭
            close();
            return;
        }
        fail(utils::ErrorCode::HTTP_UNEXPECTED_EOF, "Unexpected EOF");
        return;
    }
    buffer_.append(r.value());
    await_message();
}

// ============================================================================
//  DISPATCHING
// ============================================================================

void HttpConnection::dispatch(const std::string& header_block) {
    transition_to(ConnectionState::DISPATCHING);

    utils::Result<protocol::HttpRequest> parsed = parser_.parse_request(header_block);
    if (parsed.is_err()) {
        fail(parsed.error_code(), parsed.error_message());
        return;
    }
    request_ = std::move(parsed.value());

    utils::Result<std::shared_ptr<protocol::BodyReader>> reader =
        protocol::create_request_body_reader(stream_, buffer_, request_);
    if (reader.is_err()) {
        fail(reader.error_code(), reader.error_message());
        return;
    }
    body_ = reader.value();

    LOG_DEBUG("HttpConnection", "conn=%lu %s %s HTTP/%s body_length=%ld",
              static_cast<unsigned long>(get_id()), request_.method.c_str(),
              request_.target.c_str(), request_.version.c_str(),
              static_cast<long>(body_->length()));

    uint64_t seq = ++dispatch_seq_;
    auto self = self_as<HttpConnection>();
    try {
        handler_->handle(request_, body_, [self, seq](utils::Result<protocol::HttpResponse> result) {
            self->on_handler_done(seq, std::move(result));
        });
    } catch (const std::logic_error& e) {
        abort(utils::ErrorCode::INTERNAL_ERROR, std::string("handler contract violation: ") + e.what());
    } catch (const std::exception& e) {
        if (get_state() == ConnectionState::DISPATCHING && seq == dispatch_seq_) {
            fail(utils::ErrorCode::HTTP_HANDLER_ERROR, std::string("handler failed: ") + e.what());
        } else {
            LOG_WARN("HttpConnection", "conn=%lu handler threw after completing: %s",
                     static_cast<unsigned long>(get_id()), e.what());
        }
    }
}

void HttpConnection::on_handler_done(uint64_t seq, utils::Result<protocol::HttpResponse> r) {
    if (is_closed() || get_state() != ConnectionState::DISPATCHING || seq != dispatch_seq_) {
        LOG_WARN("HttpConnection", "conn=%lu ignoring late handler completion",
                 static_cast<unsigned long>(get_id()));
        return;
    }

    if (r.is_err()) {
        utils::ErrorCode code = r.error_code();
        if (protocol::http_status_for_error(code) == 0) {
            code = utils::ErrorCode::HTTP_HANDLER_ERROR;
        }
        fail(code, r.error_message());
        return;
    }
    write_response(r.value());
}

// ============================================================================
//  WRITING
// ============================================================================

void HttpConnection::write_response(const protocol::HttpResponse& response) {
    transition_to(ConnectionState::WRITING);

    auto self = self_as<HttpConnection>();
    protocol::ResponseWriter::write(stream_, response, [self](utils::Result<void> r) {
        self->on_response_written(std::move(r));
    }, request_.method == "HEAD");
}

void HttpConnection::on_response_written(utils::Result<void> r) {
    if (is_closed()) {
        return;
    }
    if (r.is_err()) {
        // 响应头可能已经发出，不能再补错误响应
        abort(r.error_code(), r.error_message());
        return;
    }

    messages_served_++;

    if (request_.is_http_1_0()) {
        close();
        return;
    }

    auto self = self_as<HttpConnection>();
    protocol::drain_body(body_, [self](utils::Result<void> dr) {
        self->on_body_drained(std::move(dr));
    });
}

void HttpConnection::on_body_drained(utils::Result<void> r) {
    if (is_closed()) {
        return;
    }
    if (r.is_err()) {
        abort(r.error_code(), r.error_message());
        return;
    }
    body_.reset();
    await_message();
}

// ============================================================================
//  错误处理
// ============================================================================

void HttpConnection::fail(utils::ErrorCode code, const std::string& message) {
    if (is_closed()) {
        return;
    }

    int status = protocol::http_status_for_error(code);
    if (status == 0) {
        status = 500;
    }
    LOG_WARN("HttpConnection", "conn=%lu peer=%s protocol error %d (%s): %s",
             static_cast<unsigned long>(get_id()), get_peer().c_str(), status,
             utils::error_code_to_string(code), message.c_str());

    // 传输层已经失败时静默跳过错误响应
    if (!stream_.is_writable()) {
        close();
        return;
    }

    transition_to(ConnectionState::WRITING);
    protocol::HttpResponse resp = protocol::make_text_response(status, message + "\n");
    auto self = self_as<HttpConnection>();
    protocol::ResponseWriter::write(stream_, resp, [self](utils::Result<void> r) {
        if (r.is_err()) {
            LOG_DEBUG("HttpConnection", "conn=%lu error response not delivered: %s",
                      static_cast<unsigned long>(self->get_id()), r.error_message().c_str());
        }
        self->close();
    });
}

void HttpConnection::abort(utils::ErrorCode code, const std::string& message) {
    if (is_closed()) {
        return;
    }
    if (utils::is_protocol_error(code)) {
        LOG_WARN("HttpConnection", "conn=%lu aborted after response started: %s (%s)",
                 static_cast<unsigned long>(get_id()), message.c_str(), utils::error_code_to_string(code));
    } else if (code == utils::ErrorCode::NETWORK_CLOSED) {
        LOG_DEBUG("HttpConnection", "conn=%lu stream closed", static_cast<unsigned long>(get_id()));
    } else {
        LOG_ERROR("HttpConnection", "conn=%lu peer=%s closing: %s (%s)",
                  static_cast<unsigned long>(get_id()), get_peer().c_str(),
                  message.c_str(), utils::error_code_to_string(code));
    }
    close();
}

} // namespace connection
} // namespace stream_http

// 文件结束
