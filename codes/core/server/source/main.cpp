// =============================================================================
//  Stream HTTP Server - Server Module
//  文件: main.cpp
//  描述: 服务器程序入口：stream_http_server [config.json]
//  版权: Copyright (c) 2026
// =============================================================================
#include "server/server.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <cstdio>
#include <cstring>
#include <string>

namespace {

void print_usage(const char* prog) {
    std::fprintf(stderr, "Usage: %s [config.json]\n", prog);
    std::fprintf(stderr, "  Without a config file the server listens on 127.0.0.1:1234 in http mode.\n");
}

} // namespace

int main(int argc, char** argv) {
    using namespace stream_http;

    if (argc > 2 || (argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))) {
        print_usage(argv[0]);
        return argc > 2 ? 1 : 0;
    }

    server::Server srv;
    int ret = (argc == 2) ? srv.init(std::string(argv[1])) : srv.init(utils::Config());
    if (ret != server::ERR_SUCCESS) {
        std::fprintf(stderr, "init failed: %d\n", ret);
        return 1;
    }

    ret = srv.install_signal_handlers();
    if (ret != server::ERR_SUCCESS) {
        std::fprintf(stderr, "signal setup failed: %d\n", ret);
        return 1;
    }

    ret = srv.start();
    if (ret != server::ERR_SUCCESS) {
        std::fprintf(stderr, "start failed: %d\n", ret);
        return 1;
    }

    ret = srv.run();
    srv.cleanup();
    utils::Logger::instance().shutdown();
    return ret == server::ERR_SUCCESS ? 0 : 1;
}

// 文件结束
