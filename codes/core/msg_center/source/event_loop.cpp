// =============================================================================
//  Stream HTTP Server - MsgCenter Module
//  文件: event_loop.cpp
//  描述: EventLoop单线程epoll事件主循环实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "msg_center/event_loop.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace stream_http {

// ============================================================================
//  内部工具函数 (namespace details)
// ============================================================================
namespace details {

constexpr int MAX_EVENTS_PER_POLL = 64;

inline uint32_t to_epoll_events(uint32_t events) {
    uint32_t ep = 0;
    if (events & IO_READ) {
        ep |= EPOLLIN | EPOLLRDHUP;
    }
    if (events & IO_WRITE) {
        ep |= EPOLLOUT;
    }
    return ep;
}

inline uint32_t from_epoll_events(uint32_t ep) {
    uint32_t events = 0;
    if (ep & (EPOLLIN | EPOLLRDHUP)) {
        events |= IO_READ;
    }
    if (ep & EPOLLOUT) {
        events |= IO_WRITE;
    }
    if (ep & (EPOLLERR | EPOLLHUP)) {
        events |= IO_ERROR;
    }
    return events;
}

} // namespace details

// ============================================================================
//  EventLoop构造函数与析构函数
// ============================================================================

EventLoop::EventLoop()
    : epoll_fd_(-1)
    , wakeup_fd_(-1)
    , running_(false)
{
}

EventLoop::~EventLoop() {
    if (wakeup_fd_ >= 0) {
        ::close(wakeup_fd_);
        wakeup_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

utils::Result<void> EventLoop::init() {
    if (epoll_fd_ >= 0) {
        return utils::make_ok();
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return utils::make_err(utils::ErrorCode::NETWORK_SOCKET_ERROR,
                               std::string("epoll_create1 failed: ") + std::strerror(errno));
    }

    wakeup_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeup_fd_ < 0) {
        int err = errno;
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        return utils::make_err(utils::ErrorCode::NETWORK_SOCKET_ERROR,
                               std::string("eventfd failed: ") + std::strerror(err));
    }

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wakeup_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wakeup_fd_, &ev) != 0) {
        int err = errno;
        ::close(wakeup_fd_);
        ::close(epoll_fd_);
        wakeup_fd_ = -1;
        epoll_fd_ = -1;
        return utils::make_err(utils::ErrorCode::NETWORK_SOCKET_ERROR,
                               std::string("epoll_ctl(wakeup) failed: ") + std::strerror(err));
    }

    loop_thread_id_ = std::this_thread::get_id();
    return utils::make_ok();
}

// ============================================================================
//  fd管理（仅循环线程）
// ============================================================================

int EventLoop::add_fd(int fd, uint32_t events, FdHandler handler) {
    if (epoll_fd_ < 0 || fd < 0 || !handler) {
        return -1;
    }

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = details::to_epoll_events(events);
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
        LOG_ERROR("EventLoop", "epoll_ctl ADD fd=%d failed: %s", fd, std::strerror(errno));
        return -1;
    }

    handlers_[fd] = std::make_shared<FdHandler>(std::move(handler));
    return 0;
}

int EventLoop::modify_fd(int fd, uint32_t events) {
    if (handlers_.find(fd) == handlers_.end()) {
        return -1;
    }

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = details::to_epoll_events(events);
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
        LOG_ERROR("EventLoop", "epoll_ctl MOD fd=%d failed: %s", fd, std::strerror(errno));
        return -1;
    }
    return 0;
}

void EventLoop::remove_fd(int fd) {
    auto it = handlers_.find(fd);
    if (it == handlers_.end()) {
        return;
    }
    handlers_.erase(it);
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
        LOG_WARN("EventLoop", "epoll_ctl DEL fd=%d failed: %s", fd, std::strerror(errno));
    }
}

// ============================================================================
//  任务投递（任意线程）
// ============================================================================

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        pending_tasks_.push_back(std::move(task));
    }
    wake_up();
}

void EventLoop::wake_up() {
    if (wakeup_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof(one));
    if (n != static_cast<ssize_t>(sizeof(one)) && errno != EAGAIN) {
        LOG_WARN("EventLoop", "wakeup write failed: %s", std::strerror(errno));
    }
}

void EventLoop::drain_wakeup() {
    uint64_t value = 0;
    while (::read(wakeup_fd_, &value, sizeof(value)) > 0) {
    }
}

void EventLoop::run_pending_tasks() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        tasks.swap(pending_tasks_);
    }
    for (auto& task : tasks) {
        if (task) {
            task();
        }
    }
}

// ============================================================================
//  主循环
// ============================================================================

int EventLoop::run_once(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return -1;
    }

    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (!pending_tasks_.empty()) {
            timeout_ms = 0;
        }
    }

    struct epoll_event events[details::MAX_EVENTS_PER_POLL];
    int n = ::epoll_wait(epoll_fd_, events, details::MAX_EVENTS_PER_POLL, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            run_pending_tasks();
            return 0;
        }
        LOG_ERROR("EventLoop", "epoll_wait failed: %s", std::strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; ++i) {
        int fd = events[i].data.fd;
        if (fd == wakeup_fd_) {
            drain_wakeup();
            continue;
        }
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            // 本轮内已被remove_fd
            continue;
        }
        std::shared_ptr<FdHandler> handler = it->second;
        (*handler)(details::from_epoll_events(events[i].events));
    }

    run_pending_tasks();
    return n;
}

void EventLoop::run() {
    loop_thread_id_ = std::this_thread::get_id();
    running_.store(true, std::memory_order_release);

    LOG_DEBUG("EventLoop", "event loop started");
    while (running_.load(std::memory_order_acquire)) {
        if (run_once(-1) < 0) {
            break;
        }
    }
    running_.store(false, std::memory_order_release);

    // 退出前执行剩余的延迟任务（连接析构等）
    run_pending_tasks();
    LOG_DEBUG("EventLoop", "event loop stopped");
}

void EventLoop::stop() {
    running_.store(false, std::memory_order_release);
    wake_up();
}

bool EventLoop::is_in_loop_thread() const {
    return std::this_thread::get_id() == loop_thread_id_;
}

} // namespace stream_http

// 文件结束
