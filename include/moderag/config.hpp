#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "moderag/gateways.hpp"
#include "moderag/response_parser.hpp"
#include "moderag/retry_policy.hpp"
#include "moderag/warehouse_index.hpp"

namespace moderag {

enum class IndexBackend {
    LOCAL,
    WAREHOUSE
};

std::optional<std::string> safeGetenv(const char* name);

struct ServiceConfig {
    std::string version = "0.1.0";

    std::string host = "0.0.0.0";
    unsigned short port = 8080;
    // Empty disables the X-API-Key check.
    std::string api_key;
    size_t server_threads = 0;

    EndpointSettings embedding{"http://localhost:8890/v1", "Alibaba-NLP/gte-Qwen2-1.5B-instruct", "",
                               std::chrono::milliseconds(30000)};
    EndpointSettings generation{"http://localhost:8899/v1", "microsoft/Phi-3.5-mini-instruct", "",
                                std::chrono::milliseconds(60000)};

    IndexBackend index_backend = IndexBackend::LOCAL;
    std::string index_path = "data/index";
    WarehouseSettings warehouse;

    int max_input_length = 2000;
    int max_new_tokens = 128;
    double temperature = 0.0;
    int default_num_examples = 3;
    ParserSettings parser;

    size_t http_pool_size = 192;
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{100};

    std::string log_level = "info";

    // Defaults overlaid with the process environment. A variable that is set
    // but does not parse throws ModerationError(INVALID_ARGUMENT).
    static ServiceConfig fromEnvironment();

    RetryPolicy retryPolicy() const;
};

struct LoadTestConfig {
    std::string server_url = "http://localhost:8080";
    std::string input_file;
    std::string api_key;
    std::vector<int> concurrency{8};
    double duration_s = 60.0;
    double ramp_up_s = 0.0;
    double cooldown_s = 10.0;
    size_t num_samples = 0;
    bool stratified = false;
    int num_examples = 3;
    // Requests per second per worker; 0 runs unpaced.
    double rate = 0.0;
    std::string output_dir = "results";
};

// Applies MODERAG_LOG_LEVEL-style names to the default spdlog logger.
void applyLogLevel(const std::string& level);

} // namespace moderag
