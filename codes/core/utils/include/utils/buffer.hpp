// =============================================================================
//  Stream HTTP Server - Utils Module
//  文件: buffer.hpp
//  描述: 可增长、可压缩的字节累积缓冲区
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace stream_http {
namespace utils {

/**
 * @brief 连接级字节缓冲区，保存尚未被上层消费的数据
 * @note 布局: [已消费 read_idx_][未读 length][空闲]
 *       不变量: read_idx_ + length <= capacity
 *       线程安全说明：Buffer 只属于一个连接任务，不做内部同步。
 */
class Buffer {
public:
    static constexpr size_t MIN_CAPACITY = 32;       // 首次分配的最小容量
    static const size_t npos;                         // find()未找到时的返回值

    Buffer();
    ~Buffer();

    // 禁止拷贝
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // 支持移动
    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    // ========== 写入方法 ==========

    // 追加数据到未读区域末尾，容量不足时按2倍扩容（最小32字节）
    void append(const uint8_t* data, size_t len);
    void append(const char* data, size_t len);

    // 追加std::string（便捷方法）
    void append(const std::string& str) {
        append(str.data(), str.size());
    }

    // ========== 读取方法 ==========

    // 逻辑移除前n个未读字节（仅移动读偏移），n超过未读长度时截断
    // 移动后若已消费部分超过容量一半，执行一次compact()
    void consume(size_t len);

    // 未读区域起始指针
    const uint8_t* data() const;

    // 未读区域的拷贝（便捷方法，测试与日志使用）
    std::string view() const;

    // 拷贝前len个未读字节，不移动读偏移
    std::string peek(size_t len) const;

    // 在未读区域中查找pattern，返回相对未读区起点的下标，未找到返回npos
    size_t find(const char* pattern, size_t pattern_len) const;
    size_t find(const std::string& pattern) const {
        return find(pattern.data(), pattern.size());
    }

    // ========== 容量管理 ==========

    // 未读字节数
    size_t readable_bytes() const;

    // 是否没有未读数据
    bool empty() const { return readable_bytes() == 0; }

    // 底层数组容量
    size_t capacity() const;

    // 已消费前缀长度（读偏移）
    size_t read_offset() const;

    // ========== 清理操作 ==========

    // 清空缓冲区（不释放内存）
    void clear();

    // 压缩空间：未读数据移到开头，读偏移归零；不改变未读内容
    void compact();

private:
    // 保证尾部至少还能写入len字节
    void ensure_writable(size_t len);

    std::vector<uint8_t> data_;
    size_t read_idx_;
    size_t write_idx_;
};

} // namespace utils
} // namespace stream_http
