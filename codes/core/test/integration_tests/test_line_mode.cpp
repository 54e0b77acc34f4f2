// =============================================================================
//  Stream HTTP Server - Integration Tests IT-010 ~ IT-012, IT-016
//  文件: test_line_mode.cpp
//  描述: 行模式端到端测试
//  版权: Copyright (c) 2026
// =============================================================================
#include "test_fixture.hpp"

namespace stream_http {
namespace integration_test {

// IT-010: 回显后quit关闭
TEST_F(IntegrationTest, IT010_LineEchoAndQuit) {
    uint16_t port = get_test_port();
    ASSERT_TRUE(start_server(get_valid_config_json(port, "line")));

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("hello\nworld\nquit\n"));
    EXPECT_EQ(client.read_until_closed(), "Echo: hello\nEcho: world\nBye\n");
}

// IT-011: 一行分多次写入
TEST_F(IntegrationTest, IT011_LineSplitAcrossWrites) {
    uint16_t port = get_test_port();
    ASSERT_TRUE(start_server(get_valid_config_json(port, "line")));

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("PI"));
    sleep_ms(20);
    ASSERT_TRUE(client.send_raw("NG\nqu"));
    sleep_ms(20);
    ASSERT_TRUE(client.send_raw("it\n"));
    EXPECT_EQ(client.read_until_closed(), "Echo: PING\nBye\n");
}

// IT-012: 服务器停止时关闭空闲连接
TEST_F(IntegrationTest, IT012_StopClosesIdleConnection) {
    uint16_t port = get_test_port();
    ASSERT_TRUE(start_server(get_valid_config_json(port, "line")));

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("ping\n"));
    sleep_ms(50);

    stop_server();
    EXPECT_EQ(client.read_until_closed(), "Echo: ping\n");
}

// IT-016: 一次写入数万行
TEST_F(IntegrationTest, IT016_ManyLinesInOneWrite) {
    uint16_t port = get_test_port();
    ASSERT_TRUE(start_server(get_valid_config_json(port, "line")));

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());

    const int kLines = 20000;
    std::string lines;
    std::string expected;
    for (int i = 0; i < kLines; ++i) {
        lines += "a\n";
        expected += "Echo: a\n";
    }
    ASSERT_TRUE(client.send_raw(lines + "quit\n"));
    EXPECT_EQ(client.read_until_closed(), expected + "Bye\n");
}

} // namespace integration_test
} // namespace stream_http

// 文件结束
