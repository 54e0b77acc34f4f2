// =============================================================================
//  Stream HTTP Server - MsgCenter Module
//  文件: event_loop.hpp
//  描述: EventLoop单线程epoll事件主循环
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace stream_http {

// IO事件位，与平台无关
enum IoEvent : uint32_t {
    IO_READ = 0x1,
    IO_WRITE = 0x2,
    IO_ERROR = 0x4      // 对端挂断或socket错误，总是上报
};

/**
 * @brief 单线程反应器：所有连接任务都在run()所在线程上协作执行
 * @note 【线程模型】post()与stop()可从任意线程调用；其余方法只能在循环线程调用
 */
class EventLoop {
public:
    using FdHandler = std::function<void(uint32_t events)>;
    using Task = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // 禁止拷贝
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief 创建epoll实例与唤醒用eventfd
     * @return 成功返回SUCCESS，失败返回NETWORK_SOCKET_ERROR
     */
    utils::Result<void> init();

    /**
     * @brief 注册fd
     * @param fd 非阻塞文件描述符
     * @param events IoEvent位组合
     * @param handler 就绪回调，参数为就绪的IoEvent位
     * @return 0-成功，-1-失败
     */
    int add_fd(int fd, uint32_t events, FdHandler handler);

    /**
     * @brief 修改关注事件
     * @return 0-成功，-1-失败
     */
    int modify_fd(int fd, uint32_t events);

    /**
     * @brief 注销fd，之后本轮已取出的就绪事件也不再回调
     */
    void remove_fd(int fd);

    /**
     * @brief 投递任务，在下一轮循环中执行
     */
    void post(Task task);

    /**
     * @brief 运行事件循环（阻塞当前线程，直到stop()）
     */
    void run();

    /**
     * @brief 执行一轮：等待IO（最多timeout_ms，-1表示无限）并执行已投递任务
     * @return 本轮处理的IO事件数，出错返回-1
     */
    int run_once(int timeout_ms);

    /**
     * @brief 停止事件循环
     */
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    bool is_in_loop_thread() const;

private:
    void run_pending_tasks();
    void wake_up();
    void drain_wakeup();

    int epoll_fd_;
    int wakeup_fd_;
    std::atomic<bool> running_;
    std::thread::id loop_thread_id_;

    // 回调以shared_ptr保存，分发时先复制，回调内remove_fd不会销毁正在执行的函数对象
    std::unordered_map<int, std::shared_ptr<FdHandler>> handlers_;

    std::mutex task_mutex_;
    std::vector<Task> pending_tasks_;
};

} // namespace stream_http

// 文件结束
