// =============================================================================
//  Stream HTTP Server - Utils Module
//  文件: config.hpp
//  描述: 服务器配置（JSON加载、校验、导出）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include "utils/error.hpp"

namespace stream_http {
namespace utils {

// ========== 配置数据结构 ==========

struct ServerConfig {
    std::string listen_ip = "127.0.0.1";
    uint16_t listen_port = 1234;
    uint32_t backlog = 128;
    std::string mode = "http";          // "http" 或 "line"
};

struct HttpConfig {
    uint32_t max_header_size = 8192;    // 请求头（含终止空行）上限
    std::string server_name = "stream_http_server";
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    bool console_output = true;
};

// ========== Config主类（防腐层） ==========
// 注意：头文件不包含nlohmann/json.hpp，完全隔离外部依赖

class Config {
public:
    static constexpr uint32_t MIN_HEADER_SIZE = 64;

    Config();
    ~Config();

    // 禁止拷贝
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // 支持移动
    Config(Config&& other) noexcept;
    Config& operator=(Config&& other) noexcept;

    // 从文件加载配置，缺省字段保留默认值
    // return: 成功返回SUCCESS，失败返回错误码
    Result<void> load_from_file(const std::string& file_path);

    // 从JSON字符串加载配置
    Result<void> load_from_string(const std::string& json_str);

    // 验证配置合法性
    Result<void> validate() const;

    // ========== 获取配置项 ==========

    const ServerConfig& get_server() const { return server_; }
    const HttpConfig& get_http() const { return http_; }
    const LoggingConfig& get_logging() const { return logging_; }

    // ========== 设置配置项 ==========

    void set_server(const ServerConfig& cfg) { server_ = cfg; }
    void set_http(const HttpConfig& cfg) { http_ = cfg; }
    void set_logging(const LoggingConfig& cfg) { logging_ = cfg; }

    // 导出为JSON字符串
    Result<std::string> to_json_string() const;

private:
    ServerConfig server_;
    HttpConfig http_;
    LoggingConfig logging_;
};

} // namespace utils
} // namespace stream_http
