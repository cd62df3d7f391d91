#include "moderag/service_client.hpp"
#include "moderag/errors.hpp"
#include "moderag/models.hpp"

namespace moderag {

namespace {

// The server reports {error, kind, stage}; anything else is a plain status error.
[[noreturn]] void throwServerError(const HttpResponse& response) {
    const int code = static_cast<int>(response.status);
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_object() && body.contains("kind") && body.at("kind").is_string()) {
        const std::string message = body.value("error", "server returned " + std::to_string(code));
        ModerationError cause(parseErrorKind(body.at("kind").get<std::string>()).value_or(ErrorKind::REJECTED),
                              message, code);
        if (body.contains("stage") && body.at("stage").is_string()) {
            const std::string name = body.at("stage").get<std::string>();
            if (auto stage = parseStage(name)) {
                // The server message already starts with "<stage>: ".
                const std::string prefix = name + ": ";
                if (message.compare(0, prefix.size(), prefix) == 0) {
                    cause = ModerationError(cause.kind, message.substr(prefix.size()), code);
                }
                throw ClassificationError(*stage, cause);
            }
        }
        throw cause;
    }
    throwForStatus(response, "moderation server");
    throw ModerationError(ErrorKind::REJECTED, "moderation server returned " + std::to_string(code), code);
}

} // namespace

ServiceClient::ServiceClient(const std::string& host, int port)
    : ServiceClient("http://" + host + ":" + std::to_string(port), "") {}

ServiceClient::ServiceClient(std::string baseUrl,
                             std::string apiKey,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<Transport> transport)
    : baseUrl_(std::move(baseUrl)),
      apiKey_(std::move(apiKey)),
      timeout_(timeout),
      transport_(transport ? std::move(transport) : std::make_shared<CurlTransport>()) {}

template <typename T>
T ServiceClient::request(const std::string& method,
                         const std::string& endpoint,
                         const nlohmann::json* body) {
    HttpRequest http;
    http.method = method;
    http.url = joinUrl(baseUrl_, endpoint);
    http.timeout = timeout_;
    if (body) {
        http.body = body->dump();
    }
    if (!apiKey_.empty()) {
        http.headers.push_back("X-API-Key: " + apiKey_);
    }

    HttpResponse response = transport_->perform(http);
    if (response.status < 200 || response.status >= 300) {
        throwServerError(response);
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw ModerationError(ErrorKind::MALFORMED_RESPONSE, "moderation server returned a non-JSON body",
                              static_cast<int>(response.status));
    }
    try {
        return parsed.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ModerationError(ErrorKind::MALFORMED_RESPONSE,
                              std::string("moderation server response: ") + e.what(),
                              static_cast<int>(response.status));
    }
}

ClassificationResult ServiceClient::classify(const ClassificationRequest& classification) {
    nlohmann::json body = classification;
    return request<ClassificationResult>("POST", "/classify", &body);
}

HealthStatus ServiceClient::healthCheck() {
    return request<HealthStatus>("GET", "/health");
}

} // namespace moderag
