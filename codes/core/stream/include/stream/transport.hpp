// =============================================================================
//  Stream HTTP Server - Stream Module
//  文件: transport.hpp
//  描述: 事件驱动字节传输接口（数据/结束/错误通知，暂停/恢复，异步写）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <functional>
#include <string>

namespace stream_http {
namespace stream {

// 传输层事件接收者
class TransportListener {
public:
    virtual ~TransportListener() = default;

    // 收到一块数据（非空）
    virtual void on_data(std::string chunk) = 0;

    // 对端关闭写方向
    virtual void on_end() = 0;

    // 传输层错误，之后不会再有任何通知
    virtual void on_error(utils::ErrorCode code, const std::string& message) = 0;
};

/**
 * @brief 传输层抽象
 * @note 新建的Transport处于暂停状态，resume()之前不会上报数据。
 *       回调可能在调用方法内同步触发。
 */
class Transport {
public:
    using WriteCallback = std::function<void(utils::Result<void>)>;

    virtual ~Transport() = default;

    virtual void set_listener(TransportListener* listener) = 0;

    // 停止上报数据（流控）
    virtual void pause() = 0;

    // 恢复上报数据
    virtual void resume() = 0;

    /**
     * @brief 异步写
     * @param data 待写数据
     * @param cb 全部字节被接收或出错后回调一次
     */
    virtual void write(std::string data, WriteCallback cb) = 0;

    // 释放底层资源，幂等；排队中的写以NETWORK_CLOSED失败
    virtual void destroy() = 0;

    // 未销毁且未出错
    virtual bool is_writable() const = 0;

    // 对端地址，仅用于日志
    virtual std::string peer_address() const = 0;
};

} // namespace stream
} // namespace stream_http

// 文件结束
