// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: protocol_utils.cpp
//  描述: Protocol模块公共工具函数实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/protocol_utils.hpp"
#include <limits>

namespace stream_http {
namespace protocol {

bool ParseDecimal(const std::string& text, uint64_t* out) {
    if (text.empty()) {
        return false;
    }
    uint64_t value = 0;
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    *out = value;
    return true;
}

bool ParseHex(const std::string& text, uint64_t* out) {
    if (text.empty()) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        uint64_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<uint64_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<uint64_t>(c - 'A' + 10);
        } else {
            return false;
        }
        if (value > (std::numeric_limits<uint64_t>::max() >> 4)) {
            return false;
        }
        value = (value << 4) | digit;
    }
    *out = value;
    return true;
}

std::string ToHex(uint64_t value) {
    static const char digits[] = "0123456789abcdef";
    if (value == 0) {
        return "0";
    }
    char buf[17];
    int pos = 16;
    buf[pos] = '\0';
    while (value != 0 && pos > 0) {
        buf[--pos] = digits[value & 0xF];
        value >>= 4;
    }
    return std::string(buf + pos);
}

} // namespace protocol
} // namespace stream_http

// 文件结束
