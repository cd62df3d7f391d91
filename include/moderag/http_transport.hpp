#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace moderag {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::string body;
    std::vector<std::string> headers;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// One blocking HTTP exchange. Implementations must be safe to call from many
// threads at once. Transport-level failures throw ModerationError(UNREACHABLE);
// every HTTP status, error or not, is returned to the caller.
class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlTransport : public Transport {
public:
    explicit CurlTransport(size_t poolSize = 192);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;
    CurlTransport(CurlTransport&&) = delete;
    CurlTransport& operator=(CurlTransport&&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

    size_t poolSize() const { return poolSize_; }
    size_t inUse() const;

private:
    size_t poolSize_;
    size_t created_ = 0;
    size_t leased_ = 0;
    std::vector<CURL*> idle_;
    mutable std::mutex mutex_;
    std::condition_variable available_;

    CURL* acquire();
    void release(CURL* handle);
};

std::string encodePathParam(const std::string& param);
std::string joinUrl(const std::string& base, const std::string& path);

// Maps a non-2xx status to the error taxonomy: 5xx and 408 are UNREACHABLE
// (retryable), every other 4xx is REJECTED.
void throwForStatus(const HttpResponse& response, const std::string& upstream);

// POST a JSON body and decode a JSON answer. A body that does not parse is
// MALFORMED_RESPONSE.
nlohmann::json postJson(Transport& transport,
                        const std::string& url,
                        const nlohmann::json& body,
                        const std::string& bearerToken,
                        std::chrono::milliseconds timeout,
                        const std::string& upstream);

} // namespace moderag
