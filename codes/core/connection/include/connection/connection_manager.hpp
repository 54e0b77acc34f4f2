// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: connection_manager.hpp
//  描述: ConnectionManager 类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <functional>
#include "connection/connection.hpp"
#include "msg_center/event_loop.hpp"

namespace stream_http {
namespace connection {

// 连接管理器
// 持有所有活动连接；连接关闭时从登记表移除，对象的最终释放推迟到事件循环的下一轮，
// 避免在连接自己的回调栈上析构
class ConnectionManager {
public:
    explicit ConnectionManager(EventLoop& loop);
    ~ConnectionManager();

    // 禁止拷贝
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // 分配连接ID
    uint64_t next_id();

    // 登记并启动连接
    void add(std::shared_ptr<Connection> conn);

    // 获取连接
    std::shared_ptr<Connection> get_connection(uint64_t conn_id) const;

    // 移除连接（连接关闭回调调用）
    void remove(uint64_t conn_id);

    // 获取连接数
    uint32_t get_connection_count() const;

    // 累计接入的连接数
    uint64_t get_total_connections() const;

    // 遍历所有连接
    void for_each_connection(std::function<void(Connection&)> func);

    // 关闭所有连接
    void close_all();

private:
    EventLoop& loop_;
    uint64_t next_connection_id_;
    uint64_t total_connections_;
    std::unordered_map<uint64_t, std::shared_ptr<Connection>> connections_;
    mutable std::mutex mutex_;
};

} // namespace connection
} // namespace stream_http

// 文件结束
