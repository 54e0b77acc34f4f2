// =============================================================================
//  Stream HTTP Server - Stream Module
//  文件: socket_transport.cpp
//  描述: SocketTransport实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "stream/socket_transport.hpp"
#include "utils/logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace stream_http {
namespace stream {

constexpr size_t SocketTransport::READ_CHUNK_SIZE;

namespace details {

inline bool set_non_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

std::string describe_peer(int fd) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    std::memset(&addr, 0, sizeof(addr));
    if (::getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return "fd:" + std::to_string(fd);
    }
    char ip[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "fd:" + std::to_string(fd);
}

} // namespace details

SocketTransport::SocketTransport(EventLoop& loop, int fd)
    : loop_(loop)
    , fd_(fd)
    , peer_(details::describe_peer(fd))
    , listener_(nullptr)
    , reading_(false)
    , ended_(false)
    , failed_(false)
    , destroyed_(false)
    , registered_(false)
    , interest_(0)
{
    if (!details::set_non_blocking(fd_)) {
        LOG_WARN("Transport", "Failed to set O_NONBLOCK on fd=%d: %s", fd_, std::strerror(errno));
    }
}

SocketTransport::~SocketTransport() {
    listener_ = nullptr;
    destroy();
}

void SocketTransport::set_listener(TransportListener* listener) {
    listener_ = listener;
}

void SocketTransport::pause() {
    if (!reading_) {
        return;
    }
    reading_ = false;
    update_interest();
}

void SocketTransport::resume() {
    if (reading_ || destroyed_ || failed_ || ended_) {
        return;
    }
    reading_ = true;
    update_interest();
}

void SocketTransport::write(std::string data, WriteCallback cb) {
    if (destroyed_) {
        if (cb) {
            cb(utils::make_err(utils::ErrorCode::NETWORK_CLOSED));
        }
        return;
    }
    if (failed_) {
        if (cb) {
            cb(utils::make_err(utils::ErrorCode::NETWORK_WRITE_ERROR, "transport already failed"));
        }
        return;
    }

    size_t offset = 0;
    if (write_queue_.empty()) {
        // 队列为空时直接尝试发送，多数情况下一次写完
        while (offset < data.size()) {
            ssize_t n = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n > 0) {
                offset += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            int err = errno;
            write_queue_.push_back(PendingWrite{std::move(data), offset, std::move(cb)});
            fail(utils::ErrorCode::NETWORK_WRITE_ERROR, std::string("send failed: ") + std::strerror(err));
            return;
        }
        if (offset == data.size()) {
            if (cb) {
                cb(utils::make_ok());
            }
            return;
        }
    }

    write_queue_.push_back(PendingWrite{std::move(data), offset, std::move(cb)});
    update_interest();
}

void SocketTransport::destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    reading_ = false;
    if (registered_) {
        loop_.remove_fd(fd_);
        registered_ = false;
    }
    if (fd_ >= 0) {
        ::close(fd_);
    }
    LOG_DEBUG("Transport", "Transport %s destroyed", peer_.c_str());
    fail_pending_writes(utils::ErrorCode::NETWORK_CLOSED, "transport destroyed");
}

bool SocketTransport::is_writable() const {
    return !destroyed_ && !failed_;
}

void SocketTransport::handle_events(uint32_t events) {
    if (destroyed_ || failed_) {
        return;
    }

    if ((events & IO_ERROR) && !(events & IO_READ)) {
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error != 0) {
            fail(utils::ErrorCode::NETWORK_READ_ERROR, std::strerror(so_error));
            return;
        }
    }

    if (events & IO_WRITE) {
        handle_write();
    }
    if (destroyed_ || failed_) {
        return;
    }
    if ((events & (IO_READ | IO_ERROR)) && reading_) {
        handle_read();
    }
}

void SocketTransport::handle_read() {
    char buf[READ_CHUNK_SIZE];
    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n > 0) {
        if (listener_ != nullptr) {
            listener_->on_data(std::string(buf, static_cast<size_t>(n)));
        }
        return;
    }
    if (n == 0) {
        ended_ = true;
        reading_ = false;
        update_interest();
        LOG_DEBUG("Transport", "Peer %s closed its write side", peer_.c_str());
        if (listener_ != nullptr) {
            listener_->on_end();
        }
        return;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return;
    }
    fail(utils::ErrorCode::NETWORK_READ_ERROR, std::string("recv failed: ") + std::strerror(errno));
}

void SocketTransport::handle_write() {
    while (!write_queue_.empty()) {
        PendingWrite& front = write_queue_.front();
        while (front.offset < front.data.size()) {
            ssize_t n = ::send(fd_, front.data.data() + front.offset,
                               front.data.size() - front.offset, MSG_NOSIGNAL);
            if (n > 0) {
                front.offset += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            fail(utils::ErrorCode::NETWORK_WRITE_ERROR, std::string("send failed: ") + std::strerror(errno));
            return;
        }

        WriteCallback cb = std::move(front.cb);
        write_queue_.pop_front();
        update_interest();
        if (cb) {
            cb(utils::make_ok());
        }
        if (destroyed_ || failed_) {
            return;
        }
    }
}

void SocketTransport::update_interest() {
    if (destroyed_ || fd_ < 0) {
        return;
    }

    uint32_t desired = 0;
    if (reading_) {
        desired |= IO_READ;
    }
    if (!write_queue_.empty() && !failed_) {
        desired |= IO_WRITE;
    }

    // 不关注任何事件时从epoll摘除，避免暂停期间HUP事件反复触发
    if (desired == 0) {
        if (registered_) {
            loop_.remove_fd(fd_);
            registered_ = false;
        }
        interest_ = 0;
        return;
    }

    if (!registered_) {
        if (loop_.add_fd(fd_, desired, [this](uint32_t events) { handle_events(events); }) != 0) {
            fail(utils::ErrorCode::NETWORK_SOCKET_ERROR, "Failed to register fd with event loop");
            return;
        }
        registered_ = true;
    } else if (desired != interest_) {
        if (loop_.modify_fd(fd_, desired) != 0) {
            fail(utils::ErrorCode::NETWORK_SOCKET_ERROR, "Failed to update fd events");
            return;
        }
    }
    interest_ = desired;
}

void SocketTransport::fail(utils::ErrorCode code, const std::string& message) {
    if (failed_ || destroyed_) {
        return;
    }
    failed_ = true;
    reading_ = false;
    if (registered_) {
        loop_.remove_fd(fd_);
        registered_ = false;
    }
    LOG_ERROR("Transport", "Transport %s failed: %s (%s)",
              peer_.c_str(), message.c_str(), utils::error_code_to_string(code));

    fail_pending_writes(code, message);
    if (listener_ != nullptr) {
        listener_->on_error(code, message);
    }
}

void SocketTransport::fail_pending_writes(utils::ErrorCode code, const std::string& message) {
    std::deque<PendingWrite> pending;
    pending.swap(write_queue_);
    for (auto& w : pending) {
        if (w.cb) {
            w.cb(utils::make_err(code, message));
        }
    }
}

} // namespace stream
} // namespace stream_http

// 文件结束
