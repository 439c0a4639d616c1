#include "server/http_server.hpp"

#include "common/logger.hpp"
#include "utils/url_codec.hpp"

#include <thread_pool/config.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <sys/socket.h>

#include <exception>

namespace dopc {
namespace server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr std::size_t kDefaultWorkerThreads = 32;
constexpr std::size_t kDefaultQueueCapacity = 1024;

thread_pool::ThreadPool CreateThreadPool(const std::string& config_path) {
    if (!config_path.empty()) {
        auto loader = thread_pool::ThreadPoolConfigLoader::FromFile(config_path);
        if (loader.has_value()) {
            return thread_pool::ThreadPool(loader->GetConfig());
        }
    }
    return thread_pool::ThreadPool(kDefaultWorkerThreads, kDefaultQueueCapacity);
}

// 驱动连接私有的 io_context 直到当前异步操作完成
void RunPending(asio::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

} // namespace

HttpResponse JsonError(int status, const std::string& message) {
    nlohmann::json body = {{"success", false}, {"error", message}};
    HttpResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

HttpServer::HttpServer(ServerOptions options)
    : options_(std::move(options))
    , acceptor_(accept_ioc_)
    , thread_pool_(CreateThreadPool(options_.thread_pool_config_path)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Route(const std::string& path, Handler handler) {
    routes_[path] = std::move(handler);
}

dopc::common::Status HttpServer::Start() {
    if (running_.load()) {
        return dopc::common::Status::OK();
    }
    beast::error_code ec;
    auto address = asio::ip::make_address(options_.host, ec);
    if (ec) {
        return dopc::common::Status::InvalidArgument(
            fmt::format("invalid listen address {}: {}", options_.host, ec.message()));
    }
    tcp::endpoint endpoint{address, options_.port};

    // 依次打开、设置、绑定、监听, 任一步失败都视为无法启动
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor_.non_blocking(true, ec);
    }
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return dopc::common::Status::Unavailable(
            fmt::format("failed to listen on {}:{}: {}", options_.host, options_.port, ec.message()));
    }
    bound_port_.store(acceptor_.local_endpoint(ec).port());

    thread_pool_.Start();
    running_.store(true);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    DOPC_LOG_INFO("[HttpServer] listening on {}:{}", options_.host, bound_port_.load());
    return dopc::common::Status::OK();
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    beast::error_code ec;
    acceptor_.close(ec);

    // 唤醒阻塞在 keep-alive 读取上的工作线程
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (int fd : live_connections_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    thread_pool_.Stop();
    DOPC_LOG_INFO("[HttpServer] stopped on port {}", bound_port_.load());
}

HttpResponse HttpServer::Dispatch(const std::string& method, const std::string& target) const {
    HttpRequest request;
    request.method = method;
    dopc::utils::SplitTarget(target, &request.path, &request.query);

    auto it = routes_.find(request.path);
    if (it == routes_.end()) {
        return JsonError(404, "Not found: " + request.path);
    }
    if (method != "GET") {
        return JsonError(405, "Method " + method + " not supported. Only GET requests are allowed.");
    }
    try {
        return it->second(request);
    } catch (const std::exception& ex) {
        DOPC_LOG_ERROR("[HttpServer] handler for {} failed: {}", request.path, ex.what());
        return JsonError(500, "Internal server error");
    }
}

void HttpServer::AcceptLoop() {
    while (running_.load()) {
        auto ioc = std::make_shared<asio::io_context>(1);
        auto socket = std::make_shared<tcp::socket>(*ioc);
        beast::error_code ec;
        acceptor_.accept(*socket, ec);
        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }
        if (ec) {
            DOPC_LOG_WARN("[HttpServer] accept failed: {}", ec.message());
            continue;
        }
        socket->non_blocking(false, ec);
        TrackConnection(socket->native_handle());
        try {
            thread_pool_.Post([this, ioc, socket]() { HandleConnection(ioc, socket); });
        } catch (const std::exception& ex) {
            DOPC_LOG_ERROR("[HttpServer] failed to dispatch connection: {}", ex.what());
            UntrackConnection(socket->native_handle());
            socket->close(ec);
        }
    }
}

void HttpServer::HandleConnection(const std::shared_ptr<asio::io_context>& ioc,
                                  const std::shared_ptr<tcp::socket>& socket) {
    const int fd = socket->native_handle();
    beast::tcp_stream stream(std::move(*socket));
    beast::flat_buffer buffer;
    beast::error_code ec;

    while (running_.load()) {
        http::request<http::string_body> req;
        stream.expires_after(options_.idle_timeout);
        http::async_read(stream, buffer, req, [&ec](beast::error_code result, std::size_t) {
            ec = result;
        });
        RunPending(*ioc);
        if (ec) {
            // end_of_stream 为客户端正常关闭
            if (ec != http::error::end_of_stream && ec != beast::error::timeout) {
                DOPC_LOG_DEBUG("[HttpServer] read failed: {}", ec.message());
            }
            break;
        }

        auto method = req.method_string();
        auto target = req.target();
        auto result = Dispatch(std::string(method.data(), method.size()), std::string(target.data(), target.size()));
        http::response<http::string_body> res{static_cast<http::status>(result.status), req.version()};
        res.set(http::field::server, "dopc");
        res.set(http::field::content_type, result.content_type);
        res.keep_alive(req.keep_alive());
        res.body() = std::move(result.body);
        res.prepare_payload();

        stream.expires_after(options_.idle_timeout);
        http::async_write(stream, res, [&ec](beast::error_code result_ec, std::size_t) {
            ec = result_ec;
        });
        RunPending(*ioc);
        if (ec || res.need_eof()) {
            break;
        }
    }

    UntrackConnection(fd);
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream.socket().close(ec);
}

void HttpServer::TrackConnection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    live_connections_.insert(fd);
}

void HttpServer::UntrackConnection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    live_connections_.erase(fd);
}

} // namespace server
} // namespace dopc
