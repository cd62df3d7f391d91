#include "moderag/config.hpp"
#include "moderag/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

namespace moderag {

namespace {

ModerationError badValue(const char* name, const std::string& value) {
    return ModerationError(ErrorKind::INVALID_ARGUMENT,
                           std::string("environment variable ") + name + " has invalid value '" + value + "'");
}

void readString(const char* name, std::string& target) {
    if (auto v = safeGetenv(name)) {
        target = *v;
    }
}

template <typename T>
void readInteger(const char* name, T& target, long long lo, long long hi) {
    auto v = safeGetenv(name);
    if (!v) return;
    try {
        size_t used = 0;
        long long parsed = std::stoll(*v, &used);
        if (used != v->size() || parsed < lo || parsed > hi) {
            throw badValue(name, *v);
        }
        target = static_cast<T>(parsed);
    } catch (const std::logic_error&) {
        throw badValue(name, *v);
    }
}

void readDouble(const char* name, double& target, double lo, double hi) {
    auto v = safeGetenv(name);
    if (!v) return;
    try {
        size_t used = 0;
        double parsed = std::stod(*v, &used);
        if (used != v->size() || !(parsed >= lo && parsed <= hi)) {
            throw badValue(name, *v);
        }
        target = parsed;
    } catch (const std::logic_error&) {
        throw badValue(name, *v);
    }
}

void readBool(const char* name, bool& target) {
    auto v = safeGetenv(name);
    if (!v) return;
    std::string lower(*v);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") target = true;
    else if (lower == "false" || lower == "0" || lower == "no") target = false;
    else throw badValue(name, *v);
}

} // namespace

std::optional<std::string> safeGetenv(const char* name) {
    if (name == nullptr || *name == '\0') return std::nullopt;
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

ServiceConfig ServiceConfig::fromEnvironment() {
    ServiceConfig config;

    readString("VERSION", config.version);
    readString("SERVER_HOST", config.host);
    readInteger("SERVER_PORT", config.port, 1, 65535);
    readString("API_KEY", config.api_key);
    readInteger("SERVER_THREADS", config.server_threads, 0, 1024);

    readString("EMBEDDING_URL", config.embedding.base_url);
    readString("EMBEDDING_MODEL", config.embedding.model);
    readString("LLM_URL", config.generation.base_url);
    readString("LLM_MODEL", config.generation.model);

    // The inference servers treat the literal "None" as no key.
    std::string upstreamKey;
    readString("SGLANG_API_KEY", upstreamKey);
    if (upstreamKey == "None") upstreamKey.clear();
    config.embedding.api_key = upstreamKey;
    config.generation.api_key = upstreamKey;

    std::string backend;
    readString("INDEX_BACKEND", backend);
    if (backend == "local") config.index_backend = IndexBackend::LOCAL;
    else if (backend == "warehouse") config.index_backend = IndexBackend::WAREHOUSE;
    else if (!backend.empty()) throw badValue("INDEX_BACKEND", backend);
    readString("INDEX_PATH", config.index_path);

    readString("BQ_PROJECT", config.warehouse.project);
    readString("DATASET_ID", config.warehouse.dataset);
    readString("TABLE_ID", config.warehouse.table);
    readString("BQ_ACCESS_TOKEN", config.warehouse.access_token);
    if (auto v = safeGetenv("BQ_DISTANCE_TYPE")) {
        auto metric = parseMetric(*v);
        if (!metric) throw badValue("BQ_DISTANCE_TYPE", *v);
        config.warehouse.metric = *metric;
    }
    readDouble("BQ_FRACTION_LISTS_TO_SEARCH", config.warehouse.fraction_lists_to_search, 1e-9, 1.0);
    readBool("BQ_USE_BRUTE_FORCE", config.warehouse.use_brute_force);

    readInteger("MAX_INPUT_LENGTH", config.max_input_length, 1, 1000000);
    readInteger("MAX_NEW_TOKENS", config.max_new_tokens, 1, 32768);
    readDouble("TEMPERATURE", config.temperature, 0.0, 2.0);
    readInteger("NUM_EXAMPLES", config.default_num_examples, 1, 10);
    readDouble("CONFIDENCE_THRESHOLD", config.parser.confidence_threshold, 0.0, 1.0);
    if (auto v = safeGetenv("TIE_BREAK")) {
        auto tieBreak = parseTieBreak(*v);
        if (!tieBreak) throw badValue("TIE_BREAK", *v);
        config.parser.tie_break = *tieBreak;
    }

    readInteger("HTTP_POOL_SIZE", config.http_pool_size, 1, 4096);
    readInteger("MAX_ATTEMPTS", config.max_attempts, 1, 10);
    long long baseDelayMs = config.base_delay.count();
    readInteger("RETRY_BASE_DELAY_MS", baseDelayMs, 0, 60000);
    config.base_delay = std::chrono::milliseconds(baseDelayMs);

    readString("MODERAG_LOG_LEVEL", config.log_level);
    return config;
}

RetryPolicy ServiceConfig::retryPolicy() const {
    return RetryPolicy(max_attempts, base_delay);
}

void applyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "unknown log level '" + level + "'");
    }
    spdlog::set_level(parsed);
}

} // namespace moderag
