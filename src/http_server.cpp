#include "moderag/http_server.hpp"
#include "moderag/errors.hpp"

#include <algorithm>
#include <csignal>
#include <thread>
#include <vector>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace moderag {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

std::string str(beast::string_view view) {
    return std::string(view.data(), view.size());
}

RequestRouter::Response jsonResponse(const RequestRouter::Request& request,
                                     http::status status,
                                     const nlohmann::json& body) {
    RequestRouter::Response response{status, request.version()};
    response.set(http::field::server, "moderag");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

RequestRouter::Response errorResponse(const RequestRouter::Request& request,
                                      http::status status,
                                      const std::string& message,
                                      const char* kind,
                                      const char* stage = nullptr) {
    nlohmann::json body = {{"error", message}, {"kind", kind}};
    body["stage"] = stage ? nlohmann::json(stage) : nlohmann::json(nullptr);
    return jsonResponse(request, status, body);
}

// One connection. Reads and writes happen on the connection's strand; the
// request itself is handled on the worker pool.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const RequestRouter& router, net::thread_pool& workers)
        : stream_(std::move(socket)), router_(router), workers_(workers) {}

    void start() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::doRead, shared_from_this()));
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    RequestRouter::Request request_;
    std::shared_ptr<RequestRouter::Response> response_;
    const RequestRouter& router_;
    net::thread_pool& workers_;

    void doRead() {
        request_ = {};
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return doClose();
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                spdlog::debug("Read failed: {}", ec.message());
            }
            return;
        }
        stream_.expires_never();

        auto self = shared_from_this();
        net::post(workers_, [self] {
            auto response = self->router_.handle(self->request_);
            net::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
                self->doWrite(std::move(response));
            });
        });
    }

    void doWrite(RequestRouter::Response response) {
        response_ = std::make_shared<RequestRouter::Response>(std::move(response));
        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::onWrite, shared_from_this(), response_->keep_alive()));
    }

    void onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
        if (ec) {
            spdlog::debug("Write failed: {}", ec.message());
            return;
        }
        if (!keepAlive) {
            return doClose();
        }
        response_.reset();
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

unsigned statusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNREACHABLE: return 503;
        case ErrorKind::REJECTED: return 502;
        case ErrorKind::MALFORMED_RESPONSE: return 502;
        case ErrorKind::INDEX_EMPTY: return 503;
        case ErrorKind::DIMENSION_MISMATCH: return 500;
        case ErrorKind::INVALID_ARGUMENT: return 400;
        case ErrorKind::IO: return 500;
    }
    return 500;
}

RequestRouter::RequestRouter(ServiceContext& context) : context_(context) {}

RequestRouter::Response RequestRouter::handle(const Request& request) const {
    const std::string target = str(request.target());
    const std::string path = target.substr(0, target.find('?'));

    try {
        if (path == "/classify" || path == "/moderate") {
            if (request.method() != http::verb::post) {
                return errorResponse(request, http::status::method_not_allowed, "use POST", "invalid_argument");
            }
            if (!authorized(request)) {
                return errorResponse(request, http::status::unauthorized, "invalid API key", "unauthorized");
            }
            return classify(request);
        }
        if (path == "/health") {
            if (request.method() != http::verb::get) {
                return errorResponse(request, http::status::method_not_allowed, "use GET", "invalid_argument");
            }
            return health(request);
        }
        return errorResponse(request, http::status::not_found, "no route for " + path, "invalid_argument");
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error serving {}: {}", path, e.what());
        return errorResponse(request, http::status::internal_server_error, "internal error", "internal");
    }
}

bool RequestRouter::authorized(const Request& request) const {
    const std::string& expected = context_.config().api_key;
    if (expected.empty()) {
        return true;
    }
    auto it = request.find("X-API-Key");
    return it != request.end() && str(it->value()) == expected;
}

RequestRouter::Response RequestRouter::classify(const Request& request) const {
    auto body = nlohmann::json::parse(request.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("text") || !body.at("text").is_string()) {
        return errorResponse(request, http::status::bad_request,
                             "body must be a JSON object with a string 'text'", toString(ErrorKind::INVALID_ARGUMENT));
    }

    const auto& config = context_.config();
    ClassificationRequest classification;
    classification.num_examples = config.default_num_examples;
    classification.max_text_length = config.max_input_length;
    classification.max_generated_tokens = config.max_new_tokens;
    try {
        body.get_to(classification);
    } catch (const nlohmann::json::exception& e) {
        return errorResponse(request, http::status::bad_request,
                             std::string("invalid request field: ") + e.what(), toString(ErrorKind::INVALID_ARGUMENT));
    }

    try {
        auto result = context_.orchestrator().classify(classification);
        return jsonResponse(request, http::status::ok, result);
    } catch (const ClassificationError& e) {
        return errorResponse(request, static_cast<http::status>(statusFor(e.kind)), e.what(),
                             toString(e.kind), toString(e.stage));
    } catch (const ModerationError& e) {
        return errorResponse(request, static_cast<http::status>(statusFor(e.kind)), e.what(), toString(e.kind));
    }
}

RequestRouter::Response RequestRouter::health(const Request& request) const {
    const std::string target = str(request.target());
    const bool deep = target.find("deep=1") != std::string::npos || target.find("deep=true") != std::string::npos;
    return jsonResponse(request, http::status::ok, context_.orchestrator().health(deep));
}

HttpServer::HttpServer(ServiceContext& context, const std::string& host, unsigned short port, size_t workerThreads)
    : router_(context),
      workers_(workerThreads == 0 ? std::max(1u, std::thread::hardware_concurrency()) : workerThreads),
      acceptor_(ioc_),
      signals_(ioc_, SIGINT, SIGTERM) {
    signals_.add(SIGHUP);
    try {
        tcp::endpoint endpoint(net::ip::make_address(host), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        throw ModerationError(ErrorKind::IO, "cannot listen on " + host + ":" + std::to_string(port) + ": " + e.what());
    }
}

HttpServer::~HttpServer() {
    stop();
    workers_.join();
}

unsigned short HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::run(size_t ioThreads) {
    doAccept();
    waitForSignal();
    spdlog::info("Listening on {}:{}", acceptor_.local_endpoint().address().to_string(), port());

    std::vector<std::thread> threads;
    for (size_t i = 1; i < ioThreads; ++i) {
        threads.emplace_back([this] { ioc_.run(); });
    }
    ioc_.run();
    for (auto& t : threads) {
        t.join();
    }
    workers_.join();
    spdlog::info("Server stopped");
}

void HttpServer::stop() {
    ioc_.stop();
}

void HttpServer::doAccept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            spdlog::warn("Accept failed: {}", ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), router_, workers_)->start();
        }
        doAccept();
    });
}

void HttpServer::waitForSignal() {
    signals_.async_wait([this](beast::error_code ec, int signal) {
        if (ec) return;
        if (signal == SIGHUP) {
            if (reload_) {
                net::post(workers_, [this] {
                    try {
                        reload_();
                    } catch (const std::exception& e) {
                        spdlog::error("Index reload failed, keeping the current index: {}", e.what());
                    }
                });
            }
            waitForSignal();
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal);
        stop();
    });
}

} // namespace moderag
