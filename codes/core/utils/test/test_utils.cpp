// =============================================================================
//  Stream HTTP Server - Utils Module
//  文件: test_utils.cpp
//  描述: Utils模块单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include "utils/error.hpp"
#include "utils/time.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"

using namespace stream_http::utils;

// =============================================================================
// Error模块测试用例
// =============================================================================

TEST(ErrorTest, ErrorCodeToString) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_STREQ(error_code_to_string(ErrorCode::HTTP_HEADER_TOO_LARGE), "HTTP_HEADER_TOO_LARGE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::NETWORK_CLOSED), "NETWORK_CLOSED");
    EXPECT_STREQ(error_code_to_string(ErrorCode::RESPONSE_HEADER_CONFLICT), "RESPONSE_HEADER_CONFLICT");
}

TEST(ErrorTest, ProtocolDescriptionsAreWireMessages) {
    EXPECT_STREQ(error_code_to_description(ErrorCode::HTTP_HEADER_TOO_LARGE), "header is too large");
    EXPECT_STREQ(error_code_to_description(ErrorCode::HTTP_BAD_CONTENT_LENGTH), "bad Content-Length");
    EXPECT_STREQ(error_code_to_description(ErrorCode::HTTP_BODY_NOT_ALLOWED), "HTTP body not allowed");
}

TEST(ErrorTest, Categories) {
    EXPECT_TRUE(is_network_error(ErrorCode::NETWORK_READ_ERROR));
    EXPECT_FALSE(is_network_error(ErrorCode::HTTP_BAD_REQUEST));
    EXPECT_TRUE(is_protocol_error(ErrorCode::HTTP_BAD_CHUNK));
    EXPECT_FALSE(is_protocol_error(ErrorCode::RESPONSE_LENGTH_MISMATCH));
    EXPECT_TRUE(is_contract_violation(ErrorCode::RESPONSE_LENGTH_MISMATCH));
    EXPECT_FALSE(is_contract_violation(ErrorCode::INTERNAL_ERROR));
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> r = make_ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.error_code(), ErrorCode::SUCCESS);
}

TEST(ErrorTest, ResultFailureUsesDescription) {
    Result<std::string> r = make_err<std::string>(ErrorCode::HTTP_UNEXPECTED_EOF);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error_code(), ErrorCode::HTTP_UNEXPECTED_EOF);
    EXPECT_EQ(r.error_message(), "Unexpected EOF");
    EXPECT_EQ(r.value_or("fallback"), "fallback");
}

TEST(ErrorTest, ResultVoid) {
    Result<void> ok = make_ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> err = make_err(ErrorCode::NETWORK_WRITE_ERROR, "broken pipe");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error_message(), "broken pipe");
}

// =============================================================================
// Buffer模块测试用例
// =============================================================================

TEST(BufferTest, CreateDefault) {
    Buffer buf;
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.readable_bytes(), 0u);
    EXPECT_EQ(buf.capacity(), 0u);
}

TEST(BufferTest, FirstAppendAllocatesMinCapacity) {
    Buffer buf;
    buf.append("abc");
    EXPECT_EQ(buf.readable_bytes(), 3u);
    EXPECT_GE(buf.capacity(), Buffer::MIN_CAPACITY);
}

TEST(BufferTest, GrowthDoublesCapacity) {
    Buffer buf;
    buf.append(std::string(32, 'a'));
    EXPECT_EQ(buf.capacity(), 32u);
    buf.append("b");
    EXPECT_EQ(buf.capacity(), 64u);
    buf.append(std::string(200, 'c'));
    EXPECT_EQ(buf.capacity(), 256u);
    EXPECT_EQ(buf.readable_bytes(), 233u);
}

TEST(BufferTest, ConsumeEverythingResetsOffsets) {
    Buffer buf;
    buf.append("PING\n");
    buf.consume(5);
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.read_offset(), 0u);
}

TEST(BufferTest, ConsumeClampsToReadable) {
    Buffer buf;
    buf.append("abc");
    buf.consume(100);
    EXPECT_EQ(buf.readable_bytes(), 0u);
}

TEST(BufferTest, ConsumeCompactsPastHalf) {
    Buffer buf;
    buf.append(std::string(32, 'x'));
    buf.append("tail");
    size_t cap = buf.capacity();

    buf.consume(10);
    EXPECT_EQ(buf.read_offset(), 10u);

    buf.consume(22);
    EXPECT_EQ(buf.read_offset(), 32u);
    EXPECT_EQ(buf.view(), "tail");

    buf.consume(1);
    EXPECT_EQ(buf.read_offset(), 0u);
    EXPECT_EQ(buf.view(), "ail");
    EXPECT_EQ(buf.capacity(), cap);
}

TEST(BufferTest, CompactPreservesContent) {
    Buffer buf;
    buf.append("hello world");
    buf.consume(6);
    std::string before = buf.view();
    buf.compact();
    EXPECT_EQ(buf.view(), before);
    EXPECT_EQ(buf.read_offset(), 0u);
}

TEST(BufferTest, FindIsRelativeToReadOffset) {
    Buffer buf;
    buf.append("GET / HTTP/1.1\r\n\r\nrest");
    EXPECT_EQ(buf.find("\r\n\r\n"), 14u);
    buf.consume(4);
    EXPECT_EQ(buf.find("\r\n\r\n"), 10u);
    EXPECT_EQ(buf.find("missing"), Buffer::npos);
}

TEST(BufferTest, PeekDoesNotConsume) {
    Buffer buf;
    buf.append("abcdef");
    EXPECT_EQ(buf.peek(3), "abc");
    EXPECT_EQ(buf.peek(100), "abcdef");
    EXPECT_EQ(buf.readable_bytes(), 6u);
}

TEST(BufferTest, MoveLeavesSourceEmpty) {
    Buffer a;
    a.append("data");
    Buffer b(std::move(a));
    EXPECT_EQ(b.view(), "data");
    EXPECT_EQ(a.readable_bytes(), 0u);
}

// =============================================================================
// Time模块测试用例
// =============================================================================

TEST(TimeTest, MonotonicTimeDoesNotGoBackwards) {
    uint64_t t1 = get_monotonic_time_ms();
    uint64_t t2 = get_monotonic_time_ms();
    EXPECT_GE(t2, t1);
}

TEST(TimeTest, FormatCurrentTime) {
    std::string s = format_current_time("%Y");
    EXPECT_EQ(s.size(), 4u);
}

// =============================================================================
// Logger模块测试用例
// =============================================================================

TEST(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("DEBUG", &level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("WARN", &level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("warn", &level));
    EXPECT_FALSE(parse_log_level("VERBOSE", &level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("ERROR", nullptr));
}

TEST(LoggerTest, InitRejectsUnknownLevel) {
    Logger& logger = Logger::instance();
    LogLevel before = logger.get_level();
    EXPECT_EQ(logger.init("LOUD"), -1);
    EXPECT_EQ(logger.get_level(), before);
}

TEST(LoggerTest, LevelFiltering) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    EXPECT_FALSE(logger.is_level_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_level_enabled(LogLevel::ERROR));
    logger.set_level(LogLevel::INFO);
}

TEST(LoggerTest, WritesToFile) {
    std::string path = "/tmp/stream_http_logger_test_" + std::to_string(getpid()) + ".log";
    Logger& logger = Logger::instance();
    ASSERT_EQ(logger.init(LogLevel::INFO, path), 0);
    logger.set_console_output(false);

    LOG_INFO("LoggerTest", "hello %d", 42);
    LOG_DEBUG("LoggerTest", "filtered");
    logger.flush();

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("[INFO] [LoggerTest] hello 42"), std::string::npos);
    EXPECT_EQ(content.find("filtered"), std::string::npos);

    logger.set_file("");
    logger.set_console_output(true);
    unlink(path.c_str());
}

// =============================================================================
// Config模块测试用例
// =============================================================================

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.get_server().listen_ip, "127.0.0.1");
    EXPECT_EQ(cfg.get_server().listen_port, 1234);
    EXPECT_EQ(cfg.get_server().mode, "http");
    EXPECT_EQ(cfg.get_http().max_header_size, 8192u);
    EXPECT_TRUE(cfg.validate().is_ok());
}

TEST(ConfigTest, LoadFromStringOverridesPresentFields) {
    Config cfg;
    auto r = cfg.load_from_string(R"({
        "server": { "listen_port": 8080, "mode": "line" },
        "logging": { "level": "DEBUG" }
    })");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(cfg.get_server().listen_port, 8080);
    EXPECT_EQ(cfg.get_server().mode, "line");
    EXPECT_EQ(cfg.get_server().listen_ip, "127.0.0.1");
    EXPECT_EQ(cfg.get_logging().level, "DEBUG");
    EXPECT_TRUE(cfg.validate().is_ok());
}

TEST(ConfigTest, InvalidJson) {
    Config cfg;
    auto r = cfg.load_from_string("{ not json");
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST(ConfigTest, PortOutOfRange) {
    Config cfg;
    auto r = cfg.load_from_string(R"({"server": {"listen_port": 70000}})");
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_PORT);
}

TEST(ConfigTest, WrongType) {
    Config cfg;
    auto r = cfg.load_from_string(R"({"server": {"mode": 5}})");
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(ConfigTest, ValidateRejectsBadValues) {
    Config cfg;
    ServerConfig srv;
    srv.mode = "ftp";
    cfg.set_server(srv);
    EXPECT_EQ(cfg.validate().error_code(), ErrorCode::CONFIG_INVALID_MODE);

    cfg.set_server(ServerConfig());
    HttpConfig http;
    http.max_header_size = 16;
    cfg.set_http(http);
    EXPECT_EQ(cfg.validate().error_code(), ErrorCode::CONFIG_INVALID_VALUE);

    cfg.set_http(HttpConfig());
    LoggingConfig log;
    log.level = "TRACE";
    cfg.set_logging(log);
    EXPECT_EQ(cfg.validate().error_code(), ErrorCode::CONFIG_INVALID_LOG_LEVEL);
}

TEST(ConfigTest, LoadFromMissingFile) {
    Config cfg;
    auto r = cfg.load_from_file("/nonexistent/stream_http.json");
    EXPECT_EQ(r.error_code(), ErrorCode::FILE_NOT_FOUND);
}

TEST(ConfigTest, ExportedJsonLoadsBack) {
    Config cfg;
    HttpConfig http;
    http.server_name = "unit";
    cfg.set_http(http);

    auto dumped = cfg.to_json_string();
    ASSERT_TRUE(dumped.is_ok());

    Config other;
    ASSERT_TRUE(other.load_from_string(dumped.value()).is_ok());
    EXPECT_EQ(other.get_http().server_name, "unit");
}
