#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>

#include "moderag/service_context.hpp"

namespace moderag {

namespace http = boost::beast::http;

// Maps HTTP requests onto the service:
//   POST /classify (alias /moderate)  classify one text
//   GET  /health                      index and version status; ?deep=1 probes upstreams
// When an API key is configured, /classify requires a matching X-API-Key.
class RequestRouter {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    explicit RequestRouter(ServiceContext& context);

    Response handle(const Request& request) const;

private:
    ServiceContext& context_;

    Response classify(const Request& request) const;
    Response health(const Request& request) const;
    bool authorized(const Request& request) const;
};

unsigned statusFor(ErrorKind kind);

// HTTP/1.1 server: sockets are served asynchronously on an io_context, and
// each request is handled on a separate worker pool so slow upstream calls
// never stall accepting or reading.
class HttpServer {
public:
    HttpServer(ServiceContext& context, const std::string& host, unsigned short port, size_t workerThreads);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop() or SIGINT/SIGTERM.
    void run(size_t ioThreads = 1);
    void stop();

    // Invoked on SIGHUP.
    void setReloadHandler(std::function<void()> handler) { reload_ = std::move(handler); }

    unsigned short port() const;

private:
    RequestRouter router_;
    boost::asio::io_context ioc_;
    boost::asio::thread_pool workers_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::function<void()> reload_;

    void doAccept();
    void waitForSignal();
};

} // namespace moderag
