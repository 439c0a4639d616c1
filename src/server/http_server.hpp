#pragma once

#include "common/status.hpp"

#include <thread_pool/thread_pool.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace dopc {
namespace server {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query; // 未解码的原始查询串
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

using Handler = std::function<HttpResponse(const HttpRequest&)>;

// 生成 {"success": false, "error": "..."} 错误响应
HttpResponse JsonError(int status, const std::string& message);

struct ServerOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8000; // 0 表示由系统分配
    std::chrono::milliseconds idle_timeout{30000};
    std::string thread_pool_config_path;
};

// 基于 Boost.Beast 的 HTTP/1.1 服务器
// 独立线程负责 accept, 每个连接投递到工作线程池处理, 支持 keep-alive
// 只接受 GET, 已注册路径上的其他方法返回 405, 未注册路径返回 404
class HttpServer {
public:
    explicit HttpServer(ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // 注册 GET 路由, 需在 Start 之前调用
    void Route(const std::string& path, Handler handler);

    // 绑定端口并开始接受连接, 绑定失败返回 Unavailable
    dopc::common::Status Start();
    void Stop();

    // 实际监听端口
    std::uint16_t Port() const noexcept { return bound_port_.load(); }
    bool Running() const noexcept { return running_.load(); }

    // 路由分发, 不涉及网络
    HttpResponse Dispatch(const std::string& method, const std::string& target) const;

private:
    void AcceptLoop();
    void HandleConnection(const std::shared_ptr<boost::asio::io_context>& ioc,
                          const std::shared_ptr<boost::asio::ip::tcp::socket>& socket);
    void TrackConnection(int fd);
    void UntrackConnection(int fd);

private:
    ServerOptions options_;
    std::map<std::string, Handler> routes_;

    boost::asio::io_context accept_ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};

    std::mutex connections_mutex_;
    std::set<int> live_connections_; // 活跃连接的文件描述符, Stop 时统一关闭

    thread_pool::ThreadPool thread_pool_;
};

} // namespace server
} // namespace dopc
