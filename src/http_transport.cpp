#include "moderag/http_transport.hpp"
#include "moderag/errors.hpp"

#include <cctype>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace moderag {

namespace {

std::once_flag curlInitOnce;

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// Returns the handle to the pool on every exit path.
class HandleLease {
public:
    HandleLease(CURL* handle, std::function<void(CURL*)> release)
        : handle_(handle), release_(std::move(release)) {}
    ~HandleLease() { release_(handle_); }

    HandleLease(const HandleLease&) = delete;
    HandleLease& operator=(const HandleLease&) = delete;

    CURL* get() const { return handle_; }

private:
    CURL* handle_;
    std::function<void(CURL*)> release_;
};

} // namespace

CurlTransport::CurlTransport(size_t poolSize)
    : poolSize_(poolSize == 0 ? 1 : poolSize) {
    std::call_once(curlInitOnce, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlTransport::~CurlTransport() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (CURL* handle : idle_) {
        curl_easy_cleanup(handle);
    }
    idle_.clear();
}

size_t CurlTransport::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_;
}

CURL* CurlTransport::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !idle_.empty() || created_ < poolSize_; });
    CURL* handle = nullptr;
    if (!idle_.empty()) {
        handle = idle_.back();
        idle_.pop_back();
    } else {
        handle = curl_easy_init();
        if (!handle) {
            throw ModerationError(ErrorKind::UNREACHABLE, "transport: curl_easy_init failed");
        }
        ++created_;
    }
    ++leased_;
    return handle;
}

void CurlTransport::release(CURL* handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(handle);
        --leased_;
    }
    available_.notify_one();
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    HandleLease lease(acquire(), [this](CURL* h) { release(h); });
    CURL* curl = lease.get();

    // reset keeps the connection cache, so keep-alive sockets are reused
    curl_easy_reset(curl);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, header.c_str());
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

    if (!request.body.empty() || request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw ModerationError(ErrorKind::UNREACHABLE,
                              std::string("transport: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::string encodePathParam(const std::string& param) {
    std::string encoded;
    for (char c : param) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += c;
        } else {
            std::ostringstream oss;
            oss << "%" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(c));
            encoded += oss.str();
        }
    }
    return encoded;
}

std::string joinUrl(const std::string& base, const std::string& path) {
    std::string left = base;
    while (!left.empty() && left.back() == '/') left.pop_back();
    if (path.empty()) return left;
    return path.front() == '/' ? left + path : left + "/" + path;
}

void throwForStatus(const HttpResponse& response, const std::string& upstream) {
    if (response.status >= 200 && response.status < 300) {
        return;
    }
    const int code = static_cast<int>(response.status);
    std::string message = upstream + " returned " + std::to_string(code) + ": " + response.body;
    if (code >= 500 || code == 408) {
        throw ModerationError(ErrorKind::UNREACHABLE, message, code);
    }
    throw ModerationError(ErrorKind::REJECTED, message, code);
}

nlohmann::json postJson(Transport& transport,
                        const std::string& url,
                        const nlohmann::json& body,
                        const std::string& bearerToken,
                        std::chrono::milliseconds timeout,
                        const std::string& upstream) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.body = body.dump();
    request.timeout = timeout;
    if (!bearerToken.empty()) {
        request.headers.push_back("Authorization: Bearer " + bearerToken);
    }

    HttpResponse response = transport.perform(request);
    throwForStatus(response, upstream);

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        throw ModerationError(ErrorKind::MALFORMED_RESPONSE,
                              upstream + " returned a body that is not JSON",
                              static_cast<int>(response.status));
    }
    return parsed;
}

} // namespace moderag
