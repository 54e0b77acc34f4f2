// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: connection_manager.cpp
//  描述: ConnectionManager 实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "connection/connection_manager.hpp"
#include "utils/logger.hpp"

namespace stream_http {
namespace connection {

ConnectionManager::ConnectionManager(EventLoop& loop)
    : loop_(loop)
    , next_connection_id_(1)
    , total_connections_(0)
{
}

ConnectionManager::~ConnectionManager() {
    close_all();
}

uint64_t ConnectionManager::next_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_connection_id_++;
}

void ConnectionManager::add(std::shared_ptr<Connection> conn) {
    if (!conn) {
        return;
    }
    uint64_t id = conn->get_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[id] = conn;
        total_connections_++;
    }
    conn->set_close_callback([this](uint64_t conn_id) {
        remove(conn_id);
    });

    LOG_INFO("ConnectionManager", "conn=%lu peer=%s accepted (active=%u)",
             static_cast<unsigned long>(id), conn->get_peer().c_str(), get_connection_count());
    conn->start();
}

std::shared_ptr<Connection> ConnectionManager::get_connection(uint64_t conn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(conn_id);
    return (it != connections_.end()) ? it->second : nullptr;
}

void ConnectionManager::remove(uint64_t conn_id) {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(conn_id);
        if (it == connections_.end()) {
            return;
        }
        conn = std::move(it->second);
        connections_.erase(it);
    }

    LOG_INFO("ConnectionManager", "conn=%lu removed, served=%lu",
             static_cast<unsigned long>(conn_id), static_cast<unsigned long>(conn->get_messages_served()));

    // 回调栈上可能还在使用连接对象，下一轮再释放
    loop_.post([conn]() {});
}

uint32_t ConnectionManager::get_connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(connections_.size());
}

uint64_t ConnectionManager::get_total_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

void ConnectionManager::for_each_connection(std::function<void(Connection&)> func) {
    std::vector<std::shared_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conns.reserve(connections_.size());
        for (auto& pair : connections_) {
            conns.push_back(pair.second);
        }
    }
    for (auto& conn : conns) {
        if (conn) {
            func(*conn);
        }
    }
}

void ConnectionManager::close_all() {
    std::vector<std::shared_ptr<Connection>> conns_to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pair : connections_) {
            conns_to_close.push_back(pair.second);
        }
        connections_.clear();
    }
    // 锁外调用每个Connection的close()
    for (auto& conn : conns_to_close) {
        if (conn) {
            conn->set_close_callback(nullptr);
            conn->close();
        }
    }
}

} // namespace connection
} // namespace stream_http

// 文件结束
