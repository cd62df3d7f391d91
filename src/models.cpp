#include "moderag/models.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace moderag {

namespace {

const char* stageKey(Stage stage) {
    switch (stage) {
        case Stage::EMBED_QUERY: return "embedding";
        case Stage::RETRIEVE: return "retrieval";
        case Stage::ASSEMBLE_PROMPT: return "prompt";
        case Stage::GENERATE: return "generation";
        case Stage::PARSE_AND_VALIDATE: return "parse";
    }
    return "unknown";
}

const Stage kStages[] = {
    Stage::EMBED_QUERY,
    Stage::RETRIEVE,
    Stage::ASSEMBLE_PROMPT,
    Stage::GENERATE,
    Stage::PARSE_AND_VALIDATE,
};

Category categoryFrom(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        return CategoryTaxonomy::fallback();
    }
    return CategoryTaxonomy::validate(j.at(key).get<std::string>());
}

} // namespace

double ClassificationResult::totalLatencyMs() const {
    double total = 0.0;
    for (const auto& t : timings) {
        total += t.latency_ms;
    }
    return total;
}

const StageTiming* ClassificationResult::timing(Stage stage) const {
    auto it = std::find_if(timings.begin(), timings.end(),
                           [stage](const StageTiming& t) { return t.stage == stage; });
    return it == timings.end() ? nullptr : &*it;
}

const char* toString(MetricType metric) {
    switch (metric) {
        case MetricType::EUCLIDEAN: return "EUCLIDEAN";
        case MetricType::COSINE: return "COSINE";
        case MetricType::DOT_PRODUCT: return "DOT_PRODUCT";
    }
    return "EUCLIDEAN";
}

std::optional<MetricType> parseMetric(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "EUCLIDEAN" || upper == "L2") return MetricType::EUCLIDEAN;
    if (upper == "COSINE") return MetricType::COSINE;
    if (upper == "DOT_PRODUCT" || upper == "INNER_PRODUCT") return MetricType::DOT_PRODUCT;
    return std::nullopt;
}

const char* toString(ParseOutcome outcome) {
    switch (outcome) {
        case ParseOutcome::OK: return "ok";
        case ParseOutcome::FALLBACK: return "fallback";
        case ParseOutcome::PARSE_FAILED: return "parse_failed";
    }
    return "parse_failed";
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void to_json(nlohmann::json& j, const Example& example) {
    j = nlohmann::json::object();
    j["text"] = example.text;
    j["category"] = toString(example.category);
    if (!example.metadata.empty()) j["metadata"] = example.metadata;
}

void from_json(const nlohmann::json& j, Example& example) {
    if (j.contains("text")) j.at("text").get_to(example.text);
    example.category = categoryFrom(j, j.contains("category") ? "category" : "moderation_category");
    if (j.contains("metadata")) example.metadata = j.at("metadata").get<std::map<std::string, nlohmann::json>>();
}

void to_json(nlohmann::json& j, const RetrievedExample& example) {
    j = nlohmann::json::object();
    j["text"] = example.text;
    j["category"] = toString(example.category);
    j["distance"] = example.distance;
}

void from_json(const nlohmann::json& j, RetrievedExample& example) {
    if (j.contains("text")) j.at("text").get_to(example.text);
    example.category = categoryFrom(j, "category");
    if (j.contains("distance")) j.at("distance").get_to(example.distance);
}

void from_json(const nlohmann::json& j, ClassificationRequest& request) {
    if (j.contains("text")) j.at("text").get_to(request.text);
    if (j.contains("num_examples")) j.at("num_examples").get_to(request.num_examples);
    if (j.contains("max_input_length")) j.at("max_input_length").get_to(request.max_text_length);
    if (j.contains("max_generated_tokens")) j.at("max_generated_tokens").get_to(request.max_generated_tokens);
}

void to_json(nlohmann::json& j, const ClassificationRequest& request) {
    j = nlohmann::json::object();
    j["text"] = request.text;
    j["num_examples"] = request.num_examples;
    j["max_input_length"] = request.max_text_length;
    j["max_generated_tokens"] = request.max_generated_tokens;
}

void to_json(nlohmann::json& j, const ClassificationResult& result) {
    j = nlohmann::json::object();
    j["query"] = result.query;
    j["category"] = toString(result.category);
    j["confidence"] = result.confidence;
    j["explanation"] = result.explanation;
    j["outcome"] = toString(result.outcome);
    j["downgraded"] = result.downgraded;
    j["raw_response"] = result.raw_response;
    j["similar_examples"] = result.similar_examples;
    if (!result.prompt.empty()) j["prompt"] = result.prompt;

    nlohmann::json timing = nlohmann::json::object();
    nlohmann::json attempts = nlohmann::json::object();
    for (const auto& t : result.timings) {
        timing[std::string(stageKey(t.stage)) + "_ms"] = t.latency_ms;
        if (t.attempts > 0) attempts[stageKey(t.stage)] = t.attempts;
    }
    timing["total_ms"] = result.totalLatencyMs();
    j["timing"] = timing;
    j["attempts"] = attempts;
    j["timestamp"] = result.timestamp;
}

void from_json(const nlohmann::json& j, ClassificationResult& result) {
    if (j.contains("query")) j.at("query").get_to(result.query);
    result.category = categoryFrom(j, "category");
    if (j.contains("confidence")) j.at("confidence").get_to(result.confidence);
    if (j.contains("explanation")) j.at("explanation").get_to(result.explanation);
    if (j.contains("outcome")) {
        auto outcome = j.at("outcome").get<std::string>();
        if (outcome == "ok") result.outcome = ParseOutcome::OK;
        else if (outcome == "fallback") result.outcome = ParseOutcome::FALLBACK;
        else result.outcome = ParseOutcome::PARSE_FAILED;
    }
    if (j.contains("downgraded")) j.at("downgraded").get_to(result.downgraded);
    if (j.contains("raw_response")) j.at("raw_response").get_to(result.raw_response);
    if (j.contains("prompt")) j.at("prompt").get_to(result.prompt);
    if (j.contains("similar_examples")) j.at("similar_examples").get_to(result.similar_examples);
    if (j.contains("timestamp")) j.at("timestamp").get_to(result.timestamp);

    result.timings.clear();
    if (j.contains("timing")) {
        const auto& timing = j.at("timing");
        const nlohmann::json attempts = j.value("attempts", nlohmann::json::object());
        for (Stage stage : kStages) {
            std::string key = std::string(stageKey(stage)) + "_ms";
            if (!timing.contains(key)) continue;
            StageTiming t;
            t.stage = stage;
            timing.at(key).get_to(t.latency_ms);
            t.attempts = attempts.value(stageKey(stage), 0);
            result.timings.push_back(t);
        }
    }
}

void to_json(nlohmann::json& j, const HealthStatus& health) {
    j = nlohmann::json::object();
    j["status"] = health.status;
    j["index_loaded"] = health.index_loaded;
    j["index_size"] = health.index_size;
    if (health.embedding_available) j["embedding_available"] = *health.embedding_available;
    if (health.llm_available) j["llm_available"] = *health.llm_available;
    j["version"] = health.version;
}

void from_json(const nlohmann::json& j, HealthStatus& health) {
    if (j.contains("status")) j.at("status").get_to(health.status);
    if (j.contains("index_loaded")) j.at("index_loaded").get_to(health.index_loaded);
    if (j.contains("index_size")) j.at("index_size").get_to(health.index_size);
    if (j.contains("embedding_available")) health.embedding_available = j.at("embedding_available").get<bool>();
    if (j.contains("llm_available")) health.llm_available = j.at("llm_available").get<bool>();
    if (j.contains("version")) j.at("version").get_to(health.version);
}

void to_json(nlohmann::json& j, const ChatMessage& message) {
    j = nlohmann::json{{"role", message.role}, {"content", message.content}};
}

void to_json(nlohmann::json& j, const ChatCompletionRequest& request) {
    j = nlohmann::json::object();
    j["model"] = request.model;
    j["messages"] = request.messages;
    j["temperature"] = request.temperature;
    j["max_tokens"] = request.max_tokens;
}

void to_json(nlohmann::json& j, const EmbeddingRequest& request) {
    j = nlohmann::json::object();
    j["model"] = request.model;
    j["input"] = request.input;
}

void to_json(nlohmann::json& j, const CategoryAccuracy& accuracy) {
    j = nlohmann::json::object();
    j["correct"] = accuracy.correct;
    j["total"] = accuracy.total;
    j["accuracy"] = accuracy.accuracy;
}

void to_json(nlohmann::json& j, const LoadTestMetrics& metrics) {
    j = nlohmann::json::object();
    j["concurrency"] = metrics.concurrency;
    j["duration"] = metrics.duration_s;
    j["ramp_up"] = metrics.ramp_up_s;
    j["elapsed"] = metrics.elapsed_s;
    j["requests_per_second"] = metrics.requests_per_second;
    j["total_requests"] = metrics.total_requests;
    j["successful_requests"] = metrics.successful_requests;
    j["failed_requests"] = metrics.failed_requests;
    j["degraded_requests"] = metrics.degraded_requests;
    j["average_latency"] = metrics.average_latency_ms;
    j["p50_latency"] = metrics.p50_latency_ms;
    j["p95_latency"] = metrics.p95_latency_ms;
    j["p99_latency"] = metrics.p99_latency_ms;
    j["avg_embedding_time"] = metrics.avg_embedding_ms;
    j["avg_retrieval_time"] = metrics.avg_retrieval_ms;
    j["avg_llm_time"] = metrics.avg_generation_ms;
    j["error_rate"] = metrics.error_rate;
    if (metrics.accuracy) {
        j["accuracy"] = *metrics.accuracy;
        j["per_category_accuracy"] = metrics.per_category_accuracy;
    }
}

} // namespace moderag
