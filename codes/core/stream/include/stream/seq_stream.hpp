// =============================================================================
//  Stream HTTP Server - Stream Module
//  文件: seq_stream.hpp
//  描述: 顺序流：把事件驱动的Transport适配为"读下一块/写完再继续"的顺序接口
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "stream/transport.hpp"
#include "utils/error.hpp"
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace stream_http {
namespace stream {

/**
 * @brief 顺序读写流
 * @note 同一时刻最多一个未完成的read；只有存在未完成read时才恢复Transport，
 *       read完成后立即暂停（背压）。结束是一次成功的空读，不是错误。
 *       空闲时观察到的错误被锁存，下一次read/write立即以该错误失败。
 */
class SeqStream : public TransportListener {
public:
    using ReadCallback = std::function<void(utils::Result<std::string>)>;
    using WriteCallback = Transport::WriteCallback;

    explicit SeqStream(std::unique_ptr<Transport> transport);
    ~SeqStream() override;

    // 禁止拷贝
    SeqStream(const SeqStream&) = delete;
    SeqStream& operator=(const SeqStream&) = delete;

    /**
     * @brief 读取下一块数据
     * @param cb 收到数据时回调非空块，流结束时回调空块，出错时回调错误
     * @throws std::logic_error 上一次read尚未完成
     */
    void read(ReadCallback cb);

    /**
     * @brief 写入数据，Transport接收全部字节后回调
     */
    void write(std::string data, WriteCallback cb);

    // 关闭流并销毁Transport，幂等；未完成的read以NETWORK_CLOSED失败
    void close();

    // 未关闭且没有锁存错误
    bool is_writable() const;

    bool is_closed() const { return closed_; }
    bool is_ended() const { return ended_; }
    bool has_pending_read() const { return static_cast<bool>(pending_read_); }

    std::string peer_address() const;

    // ========== TransportListener ==========
    void on_data(std::string chunk) override;
    void on_end() override;
    void on_error(utils::ErrorCode code, const std::string& message) override;

private:
    bool has_error() const { return error_code_ != utils::ErrorCode::SUCCESS; }

    std::unique_ptr<Transport> transport_;
    ReadCallback pending_read_;
    // 暂停生效前已经送达的数据块
    std::deque<std::string> early_chunks_;
    bool ended_;
    bool closed_;
    utils::ErrorCode error_code_;
    std::string error_message_;
};

} // namespace stream
} // namespace stream_http

// 文件结束
