// =============================================================================
//  Stream HTTP Server - Protocol Module
//  文件: protocol_utils.hpp
//  描述: Protocol模块公共工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include <strings.h>
#include <cstdint>
#include <string>

namespace stream_http {
namespace protocol {

// 大小写不敏感字符串比较
inline int StrCaseCmp(const char* a, const char* b) {
    return strcasecmp(a, b);
}

inline bool StrCaseEqual(const std::string& a, const std::string& b) {
    return a.size() == b.size() && StrCaseCmp(a.c_str(), b.c_str()) == 0;
}

// 按名字查找第一个字段（大小写不敏感），未找到返回nullptr
inline const HttpHeaderField* FindHeaderField(const HttpHeaders& headers, const std::string& name) {
    for (const auto& field : headers) {
        if (StrCaseEqual(field.name, name)) {
            return &field;
        }
    }
    return nullptr;
}

/**
 * @brief 严格解析非负十进制数（不允许符号、空白、空串）
 * @param text 输入
 * @param out 输出
 * @return true-成功，false-格式错误或溢出
 */
bool ParseDecimal(const std::string& text, uint64_t* out);

/**
 * @brief 严格解析十六进制数（不允许前缀与空串）
 */
bool ParseHex(const std::string& text, uint64_t* out);

// 数值转小写十六进制字符串
std::string ToHex(uint64_t value);

} // namespace protocol
} // namespace stream_http

// 文件结束
