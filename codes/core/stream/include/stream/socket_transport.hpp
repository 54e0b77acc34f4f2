// =============================================================================
//  Stream HTTP Server - Stream Module
//  文件: socket_transport.hpp
//  描述: 基于非阻塞TCP socket与EventLoop的Transport实现
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "stream/transport.hpp"
#include "msg_center/event_loop.hpp"
#include <deque>

namespace stream_http {
namespace stream {

class SocketTransport : public Transport {
public:
    static constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

    /**
     * @brief 构造函数，接管fd所有权
     * @param loop 所属事件循环，生命周期必须长于本对象
     * @param fd 已连接socket，内部设置为非阻塞
     */
    SocketTransport(EventLoop& loop, int fd);
    ~SocketTransport() override;

    // 禁止拷贝
    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void set_listener(TransportListener* listener) override;
    void pause() override;
    void resume() override;
    void write(std::string data, WriteCallback cb) override;
    void destroy() override;
    bool is_writable() const override;
    std::string peer_address() const override { return peer_; }

    int fd() const { return fd_; }

private:
    struct PendingWrite {
        std::string data;
        size_t offset;
        WriteCallback cb;
    };

    void handle_events(uint32_t events);
    void handle_read();
    void handle_write();

    // 按reading_与写队列计算关注事件，并同步到EventLoop
    void update_interest();
    void fail(utils::ErrorCode code, const std::string& message);
    void fail_pending_writes(utils::ErrorCode code, const std::string& message);

    EventLoop& loop_;
    int fd_;
    std::string peer_;
    TransportListener* listener_;
    bool reading_;
    bool ended_;
    bool failed_;
    bool destroyed_;
    bool registered_;
    uint32_t interest_;
    std::deque<PendingWrite> write_queue_;
};

} // namespace stream
} // namespace stream_http

// 文件结束
