// =============================================================================
//  Stream HTTP Server - Server Module Unit Tests
//  文件: test_server.cpp
//  描述: Server模块单元测试（真实socket）
//  版权: Copyright (c) 2026
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <thread>
#include <chrono>
#include <atomic>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include "server/server.hpp"
#include "utils/config.hpp"
#include "protocol/response_writer.hpp"

namespace stream_http {
namespace server {
namespace test {

// ==================== 测试辅助函数 ====================

// 原子计数器，用于生成唯一临时文件名
static std::atomic<uint64_t> temp_file_counter{0};

// RAII临时文件包装器
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count();
        uint64_t counter = temp_file_counter.fetch_add(1);
        path_ = "/tmp/test_stream_http_config_" +
               std::to_string(timestamp) + "_" +
               std::to_string(counter) + ".json";
        std::ofstream file(path_);
        file << content;
        file.close();
    }

    ~TempFile() {
        if (!path_.empty()) {
            unlink(path_.c_str());
        }
    }

    // 禁止拷贝
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

static utils::Config make_config(uint16_t port, const std::string& mode) {
    utils::Config config;
    utils::ServerConfig srv;
    srv.listen_ip = "127.0.0.1";
    srv.listen_port = port;
    srv.mode = mode;
    config.set_server(srv);

    utils::HttpConfig http;
    http.server_name = "test-server";
    config.set_http(http);

    utils::LoggingConfig log;
    log.level = "ERROR";
    log.console_output = false;
    config.set_logging(log);
    return config;
}

// 连接本地端口，设置接收超时
static int connect_to(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    struct timeval tv;
    tv.tv_sec = 3;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// 读到对端关闭或超时
static std::string recv_until_closed(int fd) {
    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// 读到至少n字节或超时
static std::string recv_at_least(int fd, size_t n) {
    std::string out;
    char buf[4096];
    while (out.size() < n) {
        ssize_t r = ::recv(fd, buf, sizeof(buf), 0);
        if (r <= 0) {
            break;
        }
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

// 后台线程运行服务器，析构时停止并等待
class RunningServer {
public:
    explicit RunningServer(Server& server)
        : server_(server)
        , thread_([this]() { server_.run(); })
    {
    }

    ~RunningServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // 禁止拷贝
    RunningServer(const RunningServer&) = delete;
    RunningServer& operator=(const RunningServer&) = delete;

private:
    Server& server_;
    std::thread thread_;
};

// ==================== 生命周期测试 ====================

class ServerTest : public ::testing::Test {
protected:
    void TearDown() override {
        server_.cleanup();
    }

    Server server_;
};

TEST_F(ServerTest, InitWithDefaultsSucceeds) {
    EXPECT_EQ(server_.init(make_config(18480, "http")), ERR_SUCCESS);

    ServerStatus status;
    server_.get_status(&status);
    EXPECT_EQ(status.status, SERVER_STATUS_INITIALIZED);
    EXPECT_STREQ(status.listen_ip, "127.0.0.1");
    EXPECT_STREQ(status.mode, "http");
    EXPECT_EQ(status.current_connections, 0u);
}

TEST_F(ServerTest, InitTwiceIsInvalidState) {
    ASSERT_EQ(server_.init(make_config(18480, "http")), ERR_SUCCESS);
    EXPECT_EQ(server_.init(make_config(18480, "http")), ERR_INVALID_STATE);
}

TEST_F(ServerTest, InitRejectsInvalidConfig) {
    EXPECT_EQ(server_.init(make_config(18480, "smtp")), ERR_CONFIG_VALIDATE);

    ServerStatus status;
    server_.get_status(&status);
    EXPECT_EQ(status.status, SERVER_STATUS_STOPPED);
}

TEST_F(ServerTest, InitFromMissingFile) {
    EXPECT_EQ(server_.init(std::string("/nonexistent/stream_http.json")), ERR_CONFIG_LOAD);
}

TEST_F(ServerTest, InitFromFile) {
    TempFile file(R"({
        "server": {"listen_ip": "127.0.0.1", "listen_port": 18483, "mode": "line"},
        "logging": {"level": "ERROR", "console_output": false}
    })");
    ASSERT_EQ(server_.init(file.path()), ERR_SUCCESS);

    ServerStatus status;
    server_.get_status(&status);
    EXPECT_STREQ(status.mode, "line");
}

TEST_F(ServerTest, StartBeforeInitFails) {
    EXPECT_EQ(server_.start(), ERR_INVALID_STATE);
    EXPECT_EQ(server_.run(), ERR_INVALID_STATE);
    EXPECT_EQ(server_.stop(), ERR_INVALID_STATE);
}

TEST_F(ServerTest, StartWithBadAddressFails) {
    utils::Config config = make_config(18484, "http");
    utils::ServerConfig srv = config.get_server();
    srv.listen_ip = "not-an-ip";
    config.set_server(srv);
    ASSERT_EQ(server_.init(std::move(config)), ERR_SUCCESS);
    EXPECT_EQ(server_.start(), ERR_INVALID_ARGUMENT);
}

TEST_F(ServerTest, StartReportsListenPort) {
    ASSERT_EQ(server_.init(make_config(18485, "http")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);
    EXPECT_EQ(server_.get_listen_port(), 18485);

    ServerStatus status;
    server_.get_status(&status);
    EXPECT_EQ(status.status, SERVER_STATUS_RUNNING);
    EXPECT_EQ(status.listen_port, 18485);
}

// ==================== 端到端测试 ====================

TEST_F(ServerTest, HttpEchoOverSocket) {
    ASSERT_EQ(server_.init(make_config(18486, "http")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);
    RunningServer running(server_);

    int fd = connect_to(18486);
    ASSERT_GE(fd, 0);

    std::string expected =
        "HTTP/1.1 200 OK\r\nServer: test-server\r\nContent-Length: 5\r\n\r\nhello";
    ASSERT_TRUE(send_all(fd, "POST /echo HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello"));
    EXPECT_EQ(recv_at_least(fd, expected.size()), expected);

    // 同一连接上的第二个请求
    std::string expected2 =
        "HTTP/1.1 200 OK\r\nServer: test-server\r\nContent-Length: 13\r\n\r\nhello world.\n";
    ASSERT_TRUE(send_all(fd, "GET / HTTP/1.1\r\nHost: x\r\n\r\n"));
    EXPECT_EQ(recv_at_least(fd, expected2.size()), expected2);

    ::close(fd);
}

TEST_F(ServerTest, Http10ClosesConnection) {
    ASSERT_EQ(server_.init(make_config(18487, "http")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);
    RunningServer running(server_);

    int fd = connect_to(18487);
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(send_all(fd, "GET / HTTP/1.0\r\n\r\n"));
    EXPECT_EQ(recv_until_closed(fd),
              "HTTP/1.1 200 OK\r\nServer: test-server\r\nContent-Length: 13\r\n\r\nhello world.\n");
    ::close(fd);
}

TEST_F(ServerTest, MalformedRequestGets400) {
    ASSERT_EQ(server_.init(make_config(18488, "http")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);
    RunningServer running(server_);

    int fd = connect_to(18488);
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(send_all(fd, "GET / HTTP/1.1\r\nBad Header\r\n\r\n"));
    EXPECT_EQ(recv_until_closed(fd),
              "HTTP/1.1 400 Bad Request\r\nContent-Length: 10\r\n\r\nbad field\n");
    ::close(fd);
}

TEST_F(ServerTest, LineModeEchoAndQuit) {
    ASSERT_EQ(server_.init(make_config(18489, "line")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);
    RunningServer running(server_);

    int fd = connect_to(18489);
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(send_all(fd, "PING\n"));
    EXPECT_EQ(recv_at_least(fd, 11), "Echo: PING\n");
    ASSERT_TRUE(send_all(fd, "quit\n"));
    EXPECT_EQ(recv_until_closed(fd), "Bye\n");
    ::close(fd);
}

// 自定义处理器替换默认EchoHandler
class TeapotHandler : public callback::RequestHandler {
public:
    TeapotHandler() : name_("teapot") {}

    const std::string& get_name() const override { return name_; }

    void handle(const protocol::HttpRequest& request,
                std::shared_ptr<protocol::BodyReader> body,
                callback::ResponseCallback done) override {
        (void)body;
        protocol::HttpResponse resp = protocol::make_text_response(200, request.method + " " + request.target);
        done(utils::make_ok(std::move(resp)));
    }

private:
    std::string name_;
};

TEST_F(ServerTest, CustomHandler) {
    server_.set_handler(std::make_shared<TeapotHandler>());
    ASSERT_EQ(server_.init(make_config(18490, "http")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);
    RunningServer running(server_);

    int fd = connect_to(18490);
    ASSERT_GE(fd, 0);
    std::string expected = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nDELETE /a1";
    ASSERT_TRUE(send_all(fd, "DELETE /a1 HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(recv_at_least(fd, expected.size()), expected);
    ::close(fd);
}

// 正常场景：stop关闭仍然打开的客户端连接
TEST_F(ServerTest, StopClosesOpenConnections) {
    ASSERT_EQ(server_.init(make_config(18491, "line")), ERR_SUCCESS);
    ASSERT_EQ(server_.start(), ERR_SUCCESS);

    int fd = -1;
    {
        RunningServer running(server_);
        fd = connect_to(18491);
        ASSERT_GE(fd, 0);
        ASSERT_TRUE(send_all(fd, "hi\n"));
        EXPECT_EQ(recv_at_least(fd, 9), "Echo: hi\n");

        ServerStatus status;
        server_.get_status(&status);
        EXPECT_EQ(status.current_connections, 1u);
        EXPECT_EQ(status.total_connections, 1u);
    }

    // 服务器已停止，连接被关闭
    EXPECT_EQ(recv_until_closed(fd), "");
    ::close(fd);

    ServerStatus status;
    server_.get_status(&status);
    EXPECT_EQ(status.status, SERVER_STATUS_INITIALIZED);
}

} // namespace test
} // namespace server
} // namespace stream_http
