// =============================================================================
//  Stream HTTP Server - Utils Module
//  文件: error.hpp
//  描述: 统一错误码定义与Result返回值包装
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace stream_http {
namespace utils {

// 统一错误码定义
enum class ErrorCode : int32_t {
    // 通用错误 (0-999)
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    OPERATION_FAILED = 3,
    INTERNAL_ERROR = 4,

    // 文件IO错误 (1000-1999)
    FILE_NOT_FOUND = 1000,
    FILE_READ_ERROR = 1001,

    // 配置错误 (2000-2999)
    CONFIG_PARSE_ERROR = 2000,
    CONFIG_INVALID_VALUE = 2001,
    CONFIG_INVALID_PORT = 2002,
    CONFIG_INVALID_MODE = 2003,
    CONFIG_INVALID_LOG_LEVEL = 2004,

    // 网络错误 (3000-3999)，连接级致命错误，不重试
    NETWORK_SOCKET_ERROR = 3000,
    NETWORK_BIND_ERROR = 3001,
    NETWORK_LISTEN_ERROR = 3002,
    NETWORK_ACCEPT_ERROR = 3003,
    NETWORK_READ_ERROR = 3004,
    NETWORK_WRITE_ERROR = 3005,
    NETWORK_CLOSED = 3006,

    // HTTP协议错误 (5000-5999)，每个都对应一个HTTP状态码
    HTTP_BAD_REQUEST = 5000,
    HTTP_HEADER_TOO_LARGE = 5001,
    HTTP_BAD_CONTENT_LENGTH = 5002,
    HTTP_BAD_CHUNK = 5003,
    HTTP_UNEXPECTED_EOF = 5004,
    HTTP_BODY_NOT_ALLOWED = 5005,
    HTTP_NOT_FOUND = 5006,
    HTTP_METHOD_NOT_ALLOWED = 5007,
    HTTP_NOT_IMPLEMENTED = 5008,
    HTTP_HANDLER_ERROR = 5009,

    // 调用方契约违例 (9000-9999)，表示程序缺陷，不转换成协议错误
    RESPONSE_HEADER_CONFLICT = 9000,
    RESPONSE_LENGTH_MISMATCH = 9001,
};

// 错误码转字符串
const char* error_code_to_string(ErrorCode code);

// 错误码转描述
const char* error_code_to_description(ErrorCode code);

// 判断是否成功
inline bool is_success(ErrorCode code) {
    return code == ErrorCode::SUCCESS;
}

// 判断是否失败
inline bool is_error(ErrorCode code) {
    return code != ErrorCode::SUCCESS;
}

// 是否为网络传输层错误
inline bool is_network_error(ErrorCode code) {
    int32_t v = static_cast<int32_t>(code);
    return v >= 3000 && v < 4000;
}

// 是否为HTTP协议错误
inline bool is_protocol_error(ErrorCode code) {
    int32_t v = static_cast<int32_t>(code);
    return v >= 5000 && v < 6000;
}

// 是否为调用方契约违例
inline bool is_contract_violation(ErrorCode code) {
    int32_t v = static_cast<int32_t>(code);
    return v >= 9000 && v < 10000;
}

// 错误结果类（带错误码的返回值包装）
template<typename T>
class Result {
public:
    // 成功构造
    explicit Result(const T& value)
        : code_(ErrorCode::SUCCESS)
        , value_(value)
    {}

    explicit Result(T&& value)
        : code_(ErrorCode::SUCCESS)
        , value_(std::move(value))
    {}

    // 失败构造
    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
        , value_()
    {}

    Result(ErrorCode code, const std::string& message)
        : code_(code)
        , message_(message)
        , value_()
    {}

    Result(ErrorCode code, std::string&& message)
        : code_(code)
        , message_(std::move(message))
        , value_()
    {}

    bool is_ok() const { return code_ == ErrorCode::SUCCESS; }
    bool is_err() const { return code_ != ErrorCode::SUCCESS; }

    // 获取值（必须确保成功）
    const T& value() const { return value_; }
    T& value() { return value_; }

    // 获取值，带默认值
    const T& value_or(const T& default_value) const {
        return is_ok() ? value_ : default_value;
    }

    // 获取错误码
    ErrorCode error_code() const { return code_; }

    // 获取错误消息
    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    T value_;
};

// 特化void版本
template<>
class Result<void> {
public:
    Result() : code_(ErrorCode::SUCCESS) {}

    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
    {}

    Result(ErrorCode code, const std::string& message)
        : code_(code)
        , message_(message)
    {}

    Result(ErrorCode code, std::string&& message)
        : code_(code)
        , message_(std::move(message))
    {}

    bool is_ok() const { return code_ == ErrorCode::SUCCESS; }
    bool is_err() const { return code_ != ErrorCode::SUCCESS; }

    ErrorCode error_code() const { return code_; }

    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// 辅助函数创建成功结果
template<typename T>
Result<typename std::decay<T>::type> make_ok(T&& value) {
    return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

inline Result<void> make_ok() {
    return Result<void>();
}

// 辅助函数创建错误结果
template<typename T>
Result<T> make_err(ErrorCode code) {
    return Result<T>(code);
}

template<typename T>
Result<T> make_err(ErrorCode code, const std::string& message) {
    return Result<T>(code, message);
}

inline Result<void> make_err(ErrorCode code) {
    return Result<void>(code);
}

inline Result<void> make_err(ErrorCode code, const std::string& message) {
    return Result<void>(code, message);
}

} // namespace utils
} // namespace stream_http
