#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "moderag/classifier.hpp"
#include "moderag/http_transport.hpp"

namespace moderag {

// Client for a running moderag server. Server-side stage failures come back
// as ClassificationError with the server's kind and stage; transport
// failures as ModerationError(UNREACHABLE). No retries.
class ServiceClient : public Classifier {
public:
    explicit ServiceClient(const std::string& host, int port);
    ServiceClient(std::string baseUrl,
                  std::string apiKey,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(90000),
                  std::shared_ptr<Transport> transport = nullptr);

    ServiceClient(const ServiceClient&) = delete;
    ServiceClient& operator=(const ServiceClient&) = delete;
    ServiceClient(ServiceClient&&) = delete;
    ServiceClient& operator=(ServiceClient&&) = delete;

    ClassificationResult classify(const ClassificationRequest& request) override;
    HealthStatus healthCheck();

    const std::string& getBaseUrl() const { return baseUrl_; }

private:
    std::string baseUrl_;
    std::string apiKey_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Transport> transport_;

    template <typename T>
    T request(const std::string& method,
              const std::string& endpoint,
              const nlohmann::json* body = nullptr);
};

} // namespace moderag
