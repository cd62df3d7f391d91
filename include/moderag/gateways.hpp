#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "moderag/http_transport.hpp"
#include "moderag/retry_policy.hpp"

namespace moderag {

struct EndpointSettings {
    std::string base_url;
    std::string model;
    std::string api_key;
    std::chrono::milliseconds timeout{30000};
};

// OpenAI-compatible POST {base_url}/embeddings.
class EmbeddingGateway {
public:
    EmbeddingGateway(std::shared_ptr<Transport> transport,
                     EndpointSettings settings,
                     RetryPolicy retry = RetryPolicy());

    // One vector per input text, in input order.
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                          CallStats* stats = nullptr) const;
    std::vector<float> embedOne(const std::string& text, CallStats* stats = nullptr) const;

    // Splits large inputs into upstream calls of at most batchSize texts.
    std::vector<std::vector<float>> embedBatched(const std::vector<std::string>& texts,
                                                 size_t batchSize = 32) const;

    bool ping() const;

    const EndpointSettings& settings() const { return settings_; }

private:
    std::shared_ptr<Transport> transport_;
    EndpointSettings settings_;
    RetryPolicy retry_;

    std::vector<std::vector<float>> decode(const nlohmann::json& body, size_t expected) const;
};

// OpenAI-compatible POST {base_url}/chat/completions.
class GenerationGateway {
public:
    GenerationGateway(std::shared_ptr<Transport> transport,
                      EndpointSettings settings,
                      RetryPolicy retry = RetryPolicy());

    std::string generate(const std::string& systemPrompt,
                         const std::string& userPrompt,
                         int maxTokens,
                         double temperature = 0.0,
                         CallStats* stats = nullptr) const;

    bool ping() const;

    const EndpointSettings& settings() const { return settings_; }

private:
    std::shared_ptr<Transport> transport_;
    EndpointSettings settings_;
    RetryPolicy retry_;

    std::string decode(const nlohmann::json& body) const;
};

} // namespace moderag
