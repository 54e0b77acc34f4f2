// =============================================================================
//  Stream HTTP Server - Server Module
//  文件: server.hpp
//  描述: Server类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <chrono>
#include "callback/request_handler.hpp"
#include "connection/connection_manager.hpp"
#include "msg_center/event_loop.hpp"
#include "utils/config.hpp"

namespace stream_http {
namespace server {

constexpr int ERR_SUCCESS = 0;
constexpr int ERR_INVALID_STATE = -1;
constexpr int ERR_CONFIG_LOAD = -2;
constexpr int ERR_CONFIG_VALIDATE = -3;
constexpr int ERR_SOCKET_CREATE = -4;
constexpr int ERR_SOCKET_BIND = -5;
constexpr int ERR_SOCKET_LISTEN = -6;
constexpr int ERR_EVENT_LOOP = -7;
constexpr int ERR_INVALID_ARGUMENT = -8;
constexpr int ERR_INTERNAL = -9;

// Server状态枚举
typedef enum {
    SERVER_STATUS_STOPPED = 0,
    SERVER_STATUS_INITIALIZED = 1,
    SERVER_STATUS_RUNNING = 2,
    SERVER_STATUS_SHUTTING_DOWN = 3,
    SERVER_STATUS_ERROR = 4
} ServerStatusEnum;

// Server状态结构体
struct ServerStatus {
    ServerStatusEnum status;
    uint64_t uptime_seconds;
    uint32_t current_connections;
    uint64_t total_connections;
    uint16_t listen_port;
    char listen_ip[64];
    char mode[16];
};

/**
 * @brief 服务器：监听socket + 事件循环 + 连接管理
 * @note 生命周期：init -> start -> run（阻塞）-> stop（任意线程）-> cleanup
 */
class Server {
public:
    Server();
    ~Server();

    // 禁止拷贝
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ==================== 生命周期管理 ====================

    /**
     * @brief 从配置文件初始化
     * @param config_file JSON配置文件路径
     * @return 0 成功，非0 失败
     */
    int init(const std::string& config_file);

    /**
     * @brief 使用已构造的配置初始化
     * @return 0 成功，非0 失败
     */
    int init(utils::Config config);

    /**
     * @brief 替换请求处理器（仅http模式使用，须在start之前调用）
     */
    void set_handler(std::shared_ptr<callback::RequestHandler> handler);

    /**
     * @brief 创建监听socket并注册到事件循环
     * @return 0 成功，非0 失败
     */
    int start();

    /**
     * @brief 在当前线程运行事件循环，直到stop()
     * @return 0 成功，非0 失败
     */
    int run();

    /**
     * @brief 停止Server：停止接受连接、关闭所有连接、退出事件循环
     * @note 可从任意线程调用
     * @return 0 成功，非0 失败
     */
    int stop();

    /**
     * @brief SIGINT/SIGTERM通过signalfd进入事件循环并触发stop()
     * @return 0 成功，非0 失败
     */
    int install_signal_handlers();

    /**
     * @brief 清理资源
     */
    void cleanup();

    // ==================== 状态查询 ====================

    void get_status(ServerStatus* status) const;

    // 实际监听端口
    uint16_t get_listen_port() const;

private:
    int init_listen_socket();
    void handle_accept(uint32_t events);
    void handle_signal(uint32_t events);
    std::shared_ptr<connection::Connection> create_connection(int fd);
    void stop_accepting();
    void handle_init_error();
    void set_status(ServerStatusEnum new_status);

    // ==================== 成员变量 ====================

    std::unique_ptr<utils::Config> config_;
    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<connection::ConnectionManager> conn_manager_;
    std::shared_ptr<callback::RequestHandler> handler_;

    int listen_fd_;
    int signal_fd_;
    uint16_t listen_port_;

    ServerStatusEnum status_;
    std::atomic<bool> stop_requested_;
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;

    static constexpr int DEFAULT_BACKLOG = 128;
};

} // namespace server
} // namespace stream_http

// 文件结束
