#include "client/http_connection.hpp"

#include "common/logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <fmt/format.h>

#include <utility>

namespace dopc {
namespace client {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

using dopc::common::Status;
using dopc::common::StatusOr;

namespace {

// 复用的 keep-alive 连接被对端关闭, 可以重连后重试一次
bool IsStaleConnectionError(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == asio::error::eof ||
           ec == asio::error::connection_reset ||
           ec == asio::error::broken_pipe ||
           ec == asio::error::connection_aborted;
}

} // namespace

HttpConnection::HttpConnection(ConnectionOptions options)
    : options_(std::move(options)), ioc_(1), stream_(ioc_) {}

HttpConnection::~HttpConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    CloseUnlocked();
}

StatusOr<HttpReply> HttpConnection::Get(const std::string& target) {
    return Send(http::verb::get, target);
}

StatusOr<HttpReply> HttpConnection::Send(http::verb method, const std::string& target, std::string body) {
    Request request{method, target, 11};
    request.set(http::field::host, options_.host + ":" + std::to_string(options_.port));
    request.set(http::field::user_agent, "dopc");
    request.keep_alive(true);
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = std::move(body);
    }
    request.prepare_payload();

    std::lock_guard<std::mutex> lock(mutex_);
    const bool reused = connected_;
    if (!connected_) {
        auto ec = Connect();
        if (ec) {
            return Status::Unavailable(fmt::format("connect {}:{} failed: {}",
                                                   options_.host, options_.port, ec.message()));
        }
    }

    Response response;
    auto ec = RoundTrip(request, response);
    if (ec && reused && IsStaleConnectionError(ec)) {
        // 对端已关闭空闲连接, 重连后重试一次
        CloseUnlocked();
        ec = Connect();
        if (!ec) {
            response = Response{};
            ec = RoundTrip(request, response);
        }
    }
    if (ec) {
        CloseUnlocked();
        if (ec == beast::error::timeout) {
            return Status::Unavailable(fmt::format("Request to {} timed out", target));
        }
        return Status::Unavailable(fmt::format("Request error: {}", ec.message()));
    }

    HttpReply reply;
    reply.status = static_cast<int>(response.result_int());
    auto content_type = response[http::field::content_type];
    reply.content_type.assign(content_type.data(), content_type.size());
    reply.body = std::move(response.body());
    if (!response.keep_alive()) {
        CloseUnlocked();
    }
    return StatusOr<HttpReply>(std::move(reply));
}

void HttpConnection::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    CloseUnlocked();
}

bool HttpConnection::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

beast::error_code HttpConnection::Connect() {
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        return ec;
    }

    stream_.expires_after(options_.connect_timeout);
    stream_.async_connect(results, [&ec](beast::error_code result, const tcp::endpoint&) {
        ec = result;
    });
    RunPending();
    if (ec) {
        return ec;
    }
    stream_.socket().set_option(tcp::no_delay(true), ec);
    connected_ = true;
    buffer_.consume(buffer_.size());
    return {};
}

beast::error_code HttpConnection::RoundTrip(const Request& request, Response& response) {
    beast::error_code ec;
    stream_.expires_after(options_.request_timeout);
    http::async_write(stream_, request, [&ec](beast::error_code result, std::size_t) {
        ec = result;
    });
    RunPending();
    if (ec) {
        return ec;
    }

    http::async_read(stream_, buffer_, response, [&ec](beast::error_code result, std::size_t) {
        ec = result;
    });
    RunPending();
    return ec;
}

void HttpConnection::CloseUnlocked() {
    if (!connected_ && !stream_.socket().is_open()) {
        return;
    }
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        DOPC_LOG_DEBUG("[HttpConnection] shutdown {}:{} failed: {}", options_.host, options_.port, ec.message());
    }
    stream_.socket().close(ec);
    if (ec) {
        DOPC_LOG_DEBUG("[HttpConnection] close {}:{} failed: {}", options_.host, options_.port, ec.message());
    }
    connected_ = false;
    buffer_.consume(buffer_.size());
}

void HttpConnection::RunPending() {
    ioc_.restart();
    ioc_.run();
}

} // namespace client
} // namespace dopc
