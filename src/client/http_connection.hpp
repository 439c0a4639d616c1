#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace dopc {
namespace client {

struct ConnectionOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 80;
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds request_timeout{30000};
};

struct HttpReply {
    int status = 0;
    std::string content_type;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

// 长连接 HTTP/1.1 客户端
// 首次请求时建立连接, 同一连接上的请求串行执行
class HttpConnection {
public:
    explicit HttpConnection(ConnectionOptions options);
    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;
    ~HttpConnection();

    // 传输层失败返回 Unavailable, 非 2xx 响应仍作为正常 HttpReply 返回
    dopc::common::StatusOr<HttpReply> Get(const std::string& target);
    dopc::common::StatusOr<HttpReply> Send(boost::beast::http::verb method,
                                           const std::string& target,
                                           std::string body = {});

    // 关闭底层 socket, 关闭错误仅记录日志
    void Close();
    bool IsOpen() const;

private:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    boost::beast::error_code Connect();
    boost::beast::error_code RoundTrip(const Request& request, Response& response);
    void CloseUnlocked();
    // 驱动私有 io_context 直到当前异步操作完成或超时
    void RunPending();

    ConnectionOptions options_;
    mutable std::mutex mutex_;
    boost::asio::io_context ioc_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    bool connected_ = false;
};

} // namespace client
} // namespace dopc
