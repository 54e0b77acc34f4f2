#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cstdio>
#include <iostream>

namespace stream_http {
namespace utils {

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& str, LogLevel* out) {
    LogLevel level;
    if (str == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (str == "INFO") {
        level = LogLevel::INFO;
    } else if (str == "WARN") {
        level = LogLevel::WARN;
    } else if (str == "ERROR") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    if (out != nullptr) {
        *out = level;
    }
    return true;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , console_enabled_(true)
{
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

int Logger::init(const std::string& level, const std::string& file) {
    LogLevel parsed;
    if (!parse_log_level(level, &parsed)) {
        return -1;
    }
    return init(parsed, file);
}

int Logger::init(LogLevel level, const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    close_file_locked();
    level_ = level;

    if (!file.empty()) {
        file_.open(file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            return -2;
        }
    }
    return 0;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

int Logger::set_file(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    close_file_locked();
    if (file.empty()) {
        return 0;
    }

    file_.open(file, std::ios::out | std::ios::app);
    return file_.is_open() ? 0 : -1;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

bool Logger::is_level_enabled(LogLevel level) const {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load());
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!is_level_enabled(level)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(level, module, fmt, args);
    va_end(args);
}

void Logger::debug(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::DEBUG)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::DEBUG, module, fmt, args);
    va_end(args);
}

void Logger::info(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::INFO)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::INFO, module, fmt, args);
    va_end(args);
}

void Logger::warn(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::WARN)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::WARN, module, fmt, args);
    va_end(args);
}

void Logger::error(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::ERROR)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::ERROR, module, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* module, const char* fmt, va_list args) {
    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(mutex_);
    write_line(level, module, buffer);
}

void Logger::write_line(LogLevel level, const char* module, const char* message) {
    // [时间] [级别] [模块] 消息
    std::string line;
    line.reserve(64 + std::char_traits<char>::length(message));
    line += '[';
    line += format_current_time("%Y-%m-%d %H:%M:%S");
    line += "] [";
    line += log_level_to_string(level);
    line += "] [";
    line += module ? module : "unknown";
    line += "] ";
    line += message;
    line += '\n';

    if (console_enabled_) {
        if (level >= LogLevel::WARN) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }

    if (file_.is_open()) {
        file_ << line;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

void Logger::close_file_locked() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_locked();
}

} // namespace utils
} // namespace stream_http
