#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "moderag/errors.hpp"
#include "moderag/taxonomy.hpp"

namespace moderag {

// Lower distance means more similar for every metric.
enum class MetricType {
    EUCLIDEAN,
    COSINE,
    DOT_PRODUCT
};

enum class ParseOutcome {
    OK,
    FALLBACK,
    PARSE_FAILED
};

struct Example {
    std::string text;
    Category category = Category::CLEAN;
    std::map<std::string, nlohmann::json> metadata;
};

struct RetrievedExample {
    std::string text;
    Category category = Category::CLEAN;
    float distance = 0.0f;
};

struct ClassificationRequest {
    std::string text;
    int num_examples = 3;
    int max_text_length = 2000;
    int max_generated_tokens = 128;
};

struct ParsedResponse {
    Category category = Category::CLEAN;
    double confidence = 0.0;
    std::string confidence_label;
    std::string explanation;
    ParseOutcome outcome = ParseOutcome::PARSE_FAILED;
    bool downgraded = false;
    std::optional<std::string> raw_category;
};

struct ClassificationResult {
    std::string query;
    Category category = Category::CLEAN;
    double confidence = 0.0;
    std::string explanation;
    ParseOutcome outcome = ParseOutcome::PARSE_FAILED;
    bool downgraded = false;
    std::string raw_response;
    std::string prompt;
    std::vector<RetrievedExample> similar_examples;
    std::vector<StageTiming> timings;
    std::string timestamp;

    double totalLatencyMs() const;
    const StageTiming* timing(Stage stage) const;
};

struct HealthStatus {
    std::string status;
    bool index_loaded = false;
    size_t index_size = 0;
    std::optional<bool> embedding_available;
    std::optional<bool> llm_available;
    std::string version;
};

struct ChatMessage {
    std::string role;
    std::string content;
};

struct ChatCompletionRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    double temperature = 0.0;
    int max_tokens = 128;
};

struct EmbeddingRequest {
    std::string model;
    std::vector<std::string> input;
};

struct CategoryAccuracy {
    long correct = 0;
    long total = 0;
    double accuracy = 0.0;
};

struct LoadTestMetrics {
    int concurrency = 0;
    double duration_s = 0.0;
    double ramp_up_s = 0.0;
    double elapsed_s = 0.0;
    double requests_per_second = 0.0;
    long total_requests = 0;
    long successful_requests = 0;
    long failed_requests = 0;
    long degraded_requests = 0;
    double average_latency_ms = 0.0;
    double p50_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    double p99_latency_ms = 0.0;
    double avg_embedding_ms = 0.0;
    double avg_retrieval_ms = 0.0;
    double avg_generation_ms = 0.0;
    double error_rate = 0.0;
    std::optional<double> accuracy;
    std::map<std::string, CategoryAccuracy> per_category_accuracy;
};

const char* toString(MetricType metric);
std::optional<MetricType> parseMetric(const std::string& name);
const char* toString(ParseOutcome outcome);

std::string currentTimestamp();

void to_json(nlohmann::json& j, const Example& example);
void from_json(const nlohmann::json& j, Example& example);
void to_json(nlohmann::json& j, const RetrievedExample& example);
void from_json(const nlohmann::json& j, RetrievedExample& example);
void from_json(const nlohmann::json& j, ClassificationRequest& request);
void to_json(nlohmann::json& j, const ClassificationRequest& request);
void to_json(nlohmann::json& j, const ClassificationResult& result);
void from_json(const nlohmann::json& j, ClassificationResult& result);
void to_json(nlohmann::json& j, const HealthStatus& health);
void from_json(const nlohmann::json& j, HealthStatus& health);
void to_json(nlohmann::json& j, const ChatMessage& message);
void to_json(nlohmann::json& j, const ChatCompletionRequest& request);
void to_json(nlohmann::json& j, const EmbeddingRequest& request);
void to_json(nlohmann::json& j, const CategoryAccuracy& accuracy);
void to_json(nlohmann::json& j, const LoadTestMetrics& metrics);

} // namespace moderag
