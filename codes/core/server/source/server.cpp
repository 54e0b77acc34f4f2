// =============================================================================
//  Stream HTTP Server - Server Module
//  文件: server.cpp
//  描述: Server类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "server/server.hpp"
#include "callback/echo_handler.hpp"
#include "connection/http_connection.hpp"
#include "connection/line_connection.hpp"
#include "stream/socket_transport.hpp"
#include "utils/logger.hpp"
#include <sys/socket.h>
#include <sys/signalfd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <cstdio>

namespace stream_http {
namespace server {

Server::Server()
    : listen_fd_(-1)
    , signal_fd_(-1)
    , listen_port_(0)
    , status_(SERVER_STATUS_STOPPED)
    , stop_requested_(false)
{
}

Server::~Server()
{
    cleanup();
}

int Server::init(const std::string& config_file)
{
    utils::Config config;
    utils::Result<void> r = config.load_from_file(config_file);
    if (r.is_err()) {
        LOG_ERROR("Server", "Failed to load config %s: %s", config_file.c_str(), r.error_message().c_str());
        return ERR_CONFIG_LOAD;
    }
    return init(std::move(config));
}

int Server::init(utils::Config config)
{
    // 步骤1: 设置状态
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != SERVER_STATUS_STOPPED) {
            return ERR_INVALID_STATE;
        }
    }

    // 步骤2: 校验配置
    utils::Result<void> r = config.validate();
    if (r.is_err()) {
        LOG_ERROR("Server", "Invalid config: %s", r.error_message().c_str());
        return ERR_CONFIG_VALIDATE;
    }
    config_.reset(new utils::Config(std::move(config)));

    // 步骤3: 按配置初始化日志
    const utils::LoggingConfig& log_cfg = config_->get_logging();
    utils::Logger& logger = utils::Logger::instance();
    int ret = logger.init(log_cfg.level, log_cfg.file);
    if (ret != 0) {
        LOG_ERROR("Server", "Failed to init logger (level=%s, file=%s)",
                  log_cfg.level.c_str(), log_cfg.file.c_str());
        handle_init_error();
        return ERR_CONFIG_VALIDATE;
    }
    logger.set_console_output(log_cfg.console_output);

    // 步骤4: 创建事件循环与连接管理器
    loop_.reset(new EventLoop());
    utils::Result<void> lr = loop_->init();
    if (lr.is_err()) {
        LOG_ERROR("Server", "Failed to init event loop: %s", lr.error_message().c_str());
        handle_init_error();
        return ERR_EVENT_LOOP;
    }
    conn_manager_.reset(new connection::ConnectionManager(*loop_));

    if (!handler_) {
        handler_ = std::make_shared<callback::EchoHandler>(config_->get_http().server_name);
    }

    set_status(SERVER_STATUS_INITIALIZED);
    return ERR_SUCCESS;
}

void Server::set_handler(std::shared_ptr<callback::RequestHandler> handler)
{
    handler_ = std::move(handler);
}

int Server::start()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_ || status_ != SERVER_STATUS_INITIALIZED) {
            return ERR_INVALID_STATE;
        }
    }

    int ret = init_listen_socket();
    if (ret != ERR_SUCCESS) {
        return ret;
    }

    ret = loop_->add_fd(listen_fd_, IO_READ, [this](uint32_t events) {
        handle_accept(events);
    });
    if (ret != 0) {
        LOG_ERROR("Server", "Failed to register listen fd=%d", listen_fd_);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return ERR_EVENT_LOOP;
    }

    stop_requested_ = false;
    start_time_ = std::chrono::steady_clock::now();
    set_status(SERVER_STATUS_RUNNING);

    const utils::ServerConfig& srv = config_->get_server();
    LOG_INFO("Server", "Server started on %s:%u (mode=%s)",
             srv.listen_ip.c_str(), static_cast<unsigned>(listen_port_), srv.mode.c_str());
    return ERR_SUCCESS;
}

int Server::run()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != SERVER_STATUS_RUNNING) {
            return ERR_INVALID_STATE;
        }
    }

    loop_->run();

    set_status(SERVER_STATUS_INITIALIZED);
    LOG_INFO("Server", "Server stopped, %lu connections served",
             static_cast<unsigned long>(conn_manager_->get_total_connections()));
    return ERR_SUCCESS;
}

int Server::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != SERVER_STATUS_RUNNING) {
            return ERR_INVALID_STATE;
        }
        status_ = SERVER_STATUS_SHUTTING_DOWN;
    }

    bool expected = false;
    if (!stop_requested_.compare_exchange_strong(expected, true)) {
        return ERR_SUCCESS;
    }

    // 关闭动作在循环线程执行
    loop_->post([this]() {
        stop_accepting();
        conn_manager_->close_all();
        loop_->stop();
    });
    return ERR_SUCCESS;
}

int Server::install_signal_handlers()
{
    if (!loop_) {
        return ERR_INVALID_STATE;
    }
    if (signal_fd_ >= 0) {
        return ERR_SUCCESS;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_ERROR("Server", "Failed to block SIGINT/SIGTERM");
        return ERR_INTERNAL;
    }

    signal_fd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        LOG_ERROR("Server", "Failed to create signalfd: %s", std::strerror(errno));
        return ERR_INTERNAL;
    }

    if (loop_->add_fd(signal_fd_, IO_READ, [this](uint32_t events) { handle_signal(events); }) != 0) {
        LOG_ERROR("Server", "Failed to register signalfd");
        ::close(signal_fd_);
        signal_fd_ = -1;
        return ERR_EVENT_LOOP;
    }
    return ERR_SUCCESS;
}

void Server::cleanup()
{
    if (loop_ && signal_fd_ >= 0) {
        loop_->remove_fd(signal_fd_);
    }
    if (signal_fd_ >= 0) {
        ::close(signal_fd_);
        signal_fd_ = -1;
    }

    stop_accepting();

    // 先销毁连接管理器（关闭剩余连接），再销毁事件循环
    conn_manager_.reset();
    loop_.reset();
    config_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = SERVER_STATUS_STOPPED;
    }
}

void Server::get_status(ServerStatus* status) const
{
    if (status == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    status->status = status_;

    if (status_ == SERVER_STATUS_RUNNING &&
        start_time_ != std::chrono::steady_clock::time_point()) {
        auto now = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
        status->uptime_seconds = static_cast<uint64_t>(duration.count());
    } else {
        status->uptime_seconds = 0;
    }

    if (conn_manager_) {
        status->current_connections = conn_manager_->get_connection_count();
        status->total_connections = conn_manager_->get_total_connections();
    } else {
        status->current_connections = 0;
        status->total_connections = 0;
    }

    status->listen_port = listen_port_;

    std::memset(status->listen_ip, 0, sizeof(status->listen_ip));
    std::memset(status->mode, 0, sizeof(status->mode));
    if (config_) {
        std::snprintf(status->listen_ip, sizeof(status->listen_ip), "%s",
                      config_->get_server().listen_ip.c_str());
        std::snprintf(status->mode, sizeof(status->mode), "%s",
                      config_->get_server().mode.c_str());
    }
}

uint16_t Server::get_listen_port() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listen_port_;
}

int Server::init_listen_socket()
{
    const utils::ServerConfig& cfg = config_->get_server();

    // 创建socket
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR("Server", "Failed to create socket: %s", std::strerror(errno));
        return ERR_SOCKET_CREATE;
    }

    // 设置SO_REUSEADDR选项
    int opt = 1;
    int ret = setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (ret < 0) {
        LOG_ERROR("Server", "Failed to set SO_REUSEADDR");
        ::close(fd);
        return ERR_INTERNAL;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(cfg.listen_port);

    ret = inet_pton(AF_INET, cfg.listen_ip.c_str(), &addr.sin_addr);
    if (ret == 0) {
        LOG_ERROR("Server", "Invalid IP address format: %s", cfg.listen_ip.c_str());
        ::close(fd);
        return ERR_INVALID_ARGUMENT;
    } else if (ret < 0) {
        LOG_ERROR("Server", "Failed to convert IP address: %s, errno=%d", cfg.listen_ip.c_str(), errno);
        ::close(fd);
        return ERR_INTERNAL;
    }

    // 绑定
    ret = ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0) {
        LOG_ERROR("Server", "Failed to bind to %s:%u: %s", cfg.listen_ip.c_str(),
                  static_cast<unsigned>(cfg.listen_port), std::strerror(errno));
        ::close(fd);
        return ERR_SOCKET_BIND;
    }

    // 监听
    int backlog = cfg.backlog > 0 ? static_cast<int>(cfg.backlog) : DEFAULT_BACKLOG;
    ret = ::listen(fd, backlog);
    if (ret < 0) {
        LOG_ERROR("Server", "Failed to listen on %s:%u", cfg.listen_ip.c_str(),
                  static_cast<unsigned>(cfg.listen_port));
        ::close(fd);
        return ERR_SOCKET_LISTEN;
    }

    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    uint16_t port = cfg.listen_port;
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        port = ntohs(bound.sin_port);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        listen_fd_ = fd;
        listen_port_ = port;
    }
    LOG_INFO("Server", "Listening on %s:%u", cfg.listen_ip.c_str(), static_cast<unsigned>(port));
    return ERR_SUCCESS;
}

void Server::handle_accept(uint32_t events)
{
    if (events & IO_ERROR) {
        LOG_ERROR("Server", "Error on listen fd=%d", listen_fd_);
    }

    // 边读边接，直到EAGAIN
    while (listen_fd_ >= 0) {
        int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_ERROR("Server", "accept failed: %s", std::strerror(errno));
            }
            return;
        }

        std::shared_ptr<connection::Connection> conn = create_connection(fd);
        conn_manager_->add(conn);
    }
}

void Server::handle_signal(uint32_t events)
{
    (void)events;
    struct signalfd_siginfo info;
    ssize_t n = ::read(signal_fd_, &info, sizeof(info));
    if (n != static_cast<ssize_t>(sizeof(info))) {
        return;
    }
    LOG_INFO("Server", "Received signal %u, shutting down", info.ssi_signo);
    stop();
}

std::shared_ptr<connection::Connection> Server::create_connection(int fd)
{
    uint64_t id = conn_manager_->next_id();
    std::unique_ptr<stream::Transport> transport(new stream::SocketTransport(*loop_, fd));

    if (config_->get_server().mode == "line") {
        return std::make_shared<connection::LineConnection>(id, std::move(transport));
    }
    return std::make_shared<connection::HttpConnection>(id, std::move(transport), handler_,
                                                        config_->get_http().max_header_size);
}

void Server::stop_accepting()
{
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fd = listen_fd_;
        listen_fd_ = -1;
    }
    if (fd < 0) {
        return;
    }
    if (loop_) {
        loop_->remove_fd(fd);
    }
    ::close(fd);
}

void Server::handle_init_error()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = SERVER_STATUS_ERROR;
    }
    conn_manager_.reset();
    loop_.reset();
    config_.reset();
    set_status(SERVER_STATUS_STOPPED);
}

void Server::set_status(ServerStatusEnum new_status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = new_status;
}

} // namespace server
} // namespace stream_http

// 文件结束
