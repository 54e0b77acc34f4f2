// =============================================================================
//  Stream HTTP Server - Connection Module
//  文件: connection.hpp
//  描述: 连接基类：连接ID、状态机、顺序流与接收缓冲区
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <functional>
#include "stream/seq_stream.hpp"
#include "stream/transport.hpp"
#include "utils/buffer.hpp"

namespace stream_http {
namespace connection {

// 连接状态枚举
enum class ConnectionState : uint8_t {
    AWAITING_MESSAGE = 1,   // 在缓冲区里找下一条消息，不够就读流
    DISPATCHING = 2,        // 解析并交给处理器
    WRITING = 3,            // 写响应、排空请求体
    CLOSED = 4
};

const char* connection_state_to_string(ConnectionState state);

/**
 * @brief 连接基类
 * @note 一个连接就是一个协作式任务，所有方法都只在事件循环线程调用。
 *       连接必须由std::shared_ptr持有；异步回调通过shared_from_this()保活。
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using CloseCallback = std::function<void(uint64_t conn_id)>;

    // id: 连接ID
    // transport: 已建立的传输层（转移所有权）
    Connection(uint64_t id, std::unique_ptr<stream::Transport> transport);
    virtual ~Connection();

    // 禁止拷贝
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // 启动连接任务
    virtual void start() = 0;

    // 关闭连接，幂等；关闭后on_closed回调一次
    void close();

    // ========== 基本属性 ==========

    uint64_t get_id() const { return connection_id_; }
    ConnectionState get_state() const { return state_; }
    bool is_closed() const { return state_ == ConnectionState::CLOSED; }
    const std::string& get_peer() const { return peer_; }

    // 已经完整应答的消息数
    uint64_t get_messages_served() const { return messages_served_; }

    // 设置关闭回调（ConnectionManager用它把连接移出登记表）
    void set_close_callback(CloseCallback cb) { on_closed_ = std::move(cb); }

protected:
    void transition_to(ConnectionState new_state);

    // 子类在关闭时释放自己持有的资源
    virtual void on_close() {}

    template<typename T>
    std::shared_ptr<T> self_as() {
        return std::static_pointer_cast<T>(shared_from_this());
    }

    stream::SeqStream stream_;
    utils::Buffer buffer_;
    uint64_t messages_served_;

private:
    bool is_valid_state_transition(ConnectionState from, ConnectionState to) const;

    uint64_t connection_id_;
    std::string peer_;
    ConnectionState state_;
    uint64_t created_time_ms_;
    CloseCallback on_closed_;
};

} // namespace connection
} // namespace stream_http

// 文件结束
