// =============================================================================
//  Stream HTTP Server - Utils Module
//  文件: time.hpp
//  描述: 时间戳获取与格式化
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>

namespace stream_http {
namespace utils {

// 单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// 格式化当前本地时间
// format: strftime格式字符串
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

} // namespace utils
} // namespace stream_http
