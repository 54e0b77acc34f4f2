// =============================================================================
//  Stream HTTP Server - Utils Module
//  文件: logger.hpp
//  描述: 进程级日志器，printf风格，按模块名打标签
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstdarg>

namespace stream_http {
namespace utils {

// 日志级别枚举
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// 日志级别转字符串
const char* log_level_to_string(LogLevel level);

// 字符串转日志级别，无法识别时返回false且不修改out
bool parse_log_level(const std::string& str, LogLevel* out);

class Logger {
public:
    // 获取单例
    static Logger& instance();

    // ========== 初始化与配置 ==========

    // 初始化日志系统
    // level: 日志级别名（DEBUG/INFO/WARN/ERROR）
    // file: 日志文件路径，为空则只输出到控制台
    // return: 0-成功，-1-级别无法识别，-2-日志文件打开失败
    int init(const std::string& level, const std::string& file = "");

    int init(LogLevel level, const std::string& file = "");

    void set_level(LogLevel level);
    LogLevel get_level() const;

    // 设置日志文件，为空关闭文件输出
    // return: 0-成功，-1-打开失败
    int set_file(const std::string& file);

    // 启用/禁用控制台输出
    void set_console_output(bool enabled);

    // ========== 日志输出 ==========

    void log(LogLevel level, const char* module, const char* fmt, ...);

    void debug(const char* module, const char* fmt, ...);
    void info(const char* module, const char* fmt, ...);
    void warn(const char* module, const char* fmt, ...);
    void error(const char* module, const char* fmt, ...);

    bool is_level_enabled(LogLevel level) const;

    // ========== 刷新与关闭 ==========

    void flush();
    void shutdown();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* module, const char* fmt, va_list args);
    // 调用方必须持有mutex_
    void write_line(LogLevel level, const char* module, const char* message);
    void close_file_locked();

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ofstream file_;
    bool console_enabled_;
};

} // namespace utils
} // namespace stream_http

// ========== 便捷宏 ==========

#define LOG_DEBUG(module, fmt, ...) \
    do { \
        auto& logger_ = ::stream_http::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::stream_http::utils::LogLevel::DEBUG)) { \
            logger_.debug(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(module, fmt, ...) \
    do { \
        auto& logger_ = ::stream_http::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::stream_http::utils::LogLevel::INFO)) { \
            logger_.info(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_WARN(module, fmt, ...) \
    do { \
        auto& logger_ = ::stream_http::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::stream_http::utils::LogLevel::WARN)) { \
            logger_.warn(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(module, fmt, ...) \
    do { \
        auto& logger_ = ::stream_http::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::stream_http::utils::LogLevel::ERROR)) { \
            logger_.error(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)
