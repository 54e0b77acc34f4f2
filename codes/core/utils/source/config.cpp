#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <fstream>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace stream_http {
namespace utils {

using json = nlohmann::json;

constexpr uint32_t Config::MIN_HEADER_SIZE;

namespace details {

// 解析json到配置结构体，只覆盖出现的字段
Result<void> parse_json_to_config(const json& j,
                                  ServerConfig& server,
                                  HttpConfig& http,
                                  LoggingConfig& logging) {
    if (!j.is_object()) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, "Config root must be a JSON object");
    }
    try {
        if (j.contains("server")) {
            const auto& s = j["server"];
            if (s.contains("listen_ip")) server.listen_ip = s["listen_ip"].get<std::string>();
            if (s.contains("listen_port")) {
                int64_t port = s["listen_port"].get<int64_t>();
                if (port <= 0 || port > 65535) {
                    return make_err(ErrorCode::CONFIG_INVALID_PORT, "Invalid port: " + std::to_string(port));
                }
                server.listen_port = static_cast<uint16_t>(port);
            }
            if (s.contains("backlog")) server.backlog = s["backlog"].get<uint32_t>();
            if (s.contains("mode")) server.mode = s["mode"].get<std::string>();
        }

        if (j.contains("http")) {
            const auto& h = j["http"];
            if (h.contains("max_header_size")) http.max_header_size = h["max_header_size"].get<uint32_t>();
            if (h.contains("server_name")) http.server_name = h["server_name"].get<std::string>();
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            if (l.contains("level")) logging.level = l["level"].get<std::string>();
            if (l.contains("file")) logging.file = l["file"].get<std::string>();
            if (l.contains("console_output")) logging.console_output = l["console_output"].get<bool>();
        }

        return make_ok();
    } catch (const json::type_error& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const json::exception& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("Failed to parse config: ") + e.what());
    }
}

} // namespace details

Config::Config() = default;
Config::~Config() = default;

Config::Config(Config&& other) noexcept
    : server_(std::move(other.server_))
    , http_(std::move(other.http_))
    , logging_(std::move(other.logging_))
{
}

Config& Config::operator=(Config&& other) noexcept {
    if (this != &other) {
        server_ = std::move(other.server_);
        http_ = std::move(other.http_);
        logging_ = std::move(other.logging_);
    }
    return *this;
}

Result<void> Config::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path);
    }

    try {
        json j;
        file >> j;
        return details::parse_json_to_config(j, server_, http_, logging_);
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    } catch (const json::exception& e) {
        return make_err(ErrorCode::FILE_READ_ERROR, std::string("Failed to load config: ") + e.what());
    }
}

Result<void> Config::load_from_string(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        return details::parse_json_to_config(j, server_, http_, logging_);
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    }
}

Result<void> Config::validate() const {
    if (server_.listen_port == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_PORT, "Invalid port: 0");
    }

    if (server_.mode != "http" && server_.mode != "line") {
        return make_err(ErrorCode::CONFIG_INVALID_MODE, "Invalid mode: " + server_.mode);
    }

    if (server_.backlog == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "backlog must be positive");
    }

    if (http_.max_header_size < MIN_HEADER_SIZE) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        "max_header_size too small: " + std::to_string(http_.max_header_size));
    }

    if (!parse_log_level(logging_.level, nullptr)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    return make_ok();
}

Result<std::string> Config::to_json_string() const {
    json j;
    j["server"]["listen_ip"] = server_.listen_ip;
    j["server"]["listen_port"] = server_.listen_port;
    j["server"]["backlog"] = server_.backlog;
    j["server"]["mode"] = server_.mode;

    j["http"]["max_header_size"] = http_.max_header_size;
    j["http"]["server_name"] = http_.server_name;

    j["logging"]["level"] = logging_.level;
    j["logging"]["file"] = logging_.file;
    j["logging"]["console_output"] = logging_.console_output;

    try {
        return make_ok(j.dump(4));
    } catch (const json::type_error& e) {
        // 非UTF-8字符串无法序列化
        return make_err<std::string>(ErrorCode::OPERATION_FAILED,
                                     std::string("Failed to serialize config: ") + e.what());
    }
}

} // namespace utils
} // namespace stream_http
