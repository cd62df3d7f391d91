#include "moderag/gateways.hpp"
#include "moderag/errors.hpp"
#include "moderag/models.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace moderag {

namespace {

constexpr std::chrono::milliseconds kPingTimeout{2000};

ModerationError malformed(const std::string& what) {
    return ModerationError(ErrorKind::MALFORMED_RESPONSE, what, 200);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<Transport> transport,
                                   EndpointSettings settings,
                                   RetryPolicy retry)
    : transport_(std::move(transport)), settings_(std::move(settings)), retry_(std::move(retry)) {}

std::vector<std::vector<float>> EmbeddingGateway::embed(const std::vector<std::string>& texts,
                                                        CallStats* stats) const {
    if (texts.empty()) {
        return {};
    }

    nlohmann::json body = EmbeddingRequest{settings_.model, texts};
    const std::string url = joinUrl(settings_.base_url, "embeddings");

    auto start = std::chrono::steady_clock::now();
    auto vectors = retry_.execute([&] {
        auto response = postJson(*transport_, url, body, settings_.api_key,
                                 settings_.timeout, "embedding endpoint");
        return decode(response, texts.size());
    }, stats, "embedding request");

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    spdlog::debug("Embedding request for {} text(s) took {:.2f}ms", texts.size(), elapsed.count());
    return vectors;
}

std::vector<float> EmbeddingGateway::embedOne(const std::string& text, CallStats* stats) const {
    auto vectors = embed({text}, stats);
    return std::move(vectors.front());
}

std::vector<std::vector<float>> EmbeddingGateway::embedBatched(const std::vector<std::string>& texts,
                                                               size_t batchSize) const {
    if (batchSize == 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "batch size must be positive");
    }
    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());
    for (size_t offset = 0; offset < texts.size(); offset += batchSize) {
        const size_t end = std::min(texts.size(), offset + batchSize);
        std::vector<std::string> batch(texts.begin() + offset, texts.begin() + end);
        auto embedded = embed(batch);
        for (auto& v : embedded) {
            vectors.push_back(std::move(v));
        }
        spdlog::info("Embedded {}/{} texts", end, texts.size());
    }
    return vectors;
}

bool EmbeddingGateway::ping() const {
    try {
        nlohmann::json body = EmbeddingRequest{settings_.model, {"ping"}};
        auto response = postJson(*transport_, joinUrl(settings_.base_url, "embeddings"), body,
                                 settings_.api_key, kPingTimeout, "embedding endpoint");
        decode(response, 1);
        return true;
    } catch (const ModerationError& e) {
        spdlog::warn("Embedding endpoint health probe failed: {}", e.what());
        return false;
    }
}

std::vector<std::vector<float>> EmbeddingGateway::decode(const nlohmann::json& body,
                                                         size_t expected) const {
    if (!body.is_object() || !body.contains("data") || !body.at("data").is_array()) {
        throw malformed("embedding response has no 'data' array");
    }
    const auto& data = body.at("data");
    if (data.size() != expected) {
        throw malformed("embedding response has " + std::to_string(data.size()) +
                        " entries for " + std::to_string(expected) + " inputs");
    }

    std::vector<std::vector<float>> vectors(expected);
    std::vector<bool> filled(expected, false);
    size_t dimension = 0;
    for (size_t i = 0; i < data.size(); ++i) {
        const auto& item = data.at(i);
        if (!item.is_object() || !item.contains("embedding") || !item.at("embedding").is_array()) {
            throw malformed("embedding response entry " + std::to_string(i) + " has no 'embedding'");
        }
        size_t slot = i;
        if (item.contains("index") && item.at("index").is_number_unsigned()) {
            slot = item.at("index").get<size_t>();
        }
        if (slot >= expected || filled[slot]) {
            throw malformed("embedding response entry " + std::to_string(i) + " has a bad index");
        }
        std::vector<float> vector;
        try {
            vector = item.at("embedding").get<std::vector<float>>();
        } catch (const nlohmann::json::exception&) {
            throw malformed("embedding response entry " + std::to_string(i) + " is not numeric");
        }
        if (vector.empty() || (dimension != 0 && vector.size() != dimension)) {
            throw malformed("embedding response has inconsistent vector dimensions");
        }
        dimension = vector.size();
        vectors[slot] = std::move(vector);
        filled[slot] = true;
    }
    return vectors;
}

GenerationGateway::GenerationGateway(std::shared_ptr<Transport> transport,
                                     EndpointSettings settings,
                                     RetryPolicy retry)
    : transport_(std::move(transport)), settings_(std::move(settings)), retry_(std::move(retry)) {}

std::string GenerationGateway::generate(const std::string& systemPrompt,
                                        const std::string& userPrompt,
                                        int maxTokens,
                                        double temperature,
                                        CallStats* stats) const {
    ChatCompletionRequest request;
    request.model = settings_.model;
    request.messages.push_back({"system", systemPrompt});
    request.messages.push_back({"user", userPrompt});
    request.temperature = temperature;
    request.max_tokens = maxTokens;

    nlohmann::json body = request;
    const std::string url = joinUrl(settings_.base_url, "chat/completions");

    auto start = std::chrono::steady_clock::now();
    auto text = retry_.execute([&] {
        auto response = postJson(*transport_, url, body, settings_.api_key,
                                 settings_.timeout, "generation endpoint");
        return decode(response);
    }, stats, "generation request");

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    spdlog::debug("Generation request took {:.2f}ms", elapsed.count());
    return text;
}

bool GenerationGateway::ping() const {
    try {
        ChatCompletionRequest request;
        request.model = settings_.model;
        request.messages.push_back({"user", "Hi"});
        request.max_tokens = 5;
        nlohmann::json body = request;
        auto response = postJson(*transport_, joinUrl(settings_.base_url, "chat/completions"), body,
                                 settings_.api_key, kPingTimeout, "generation endpoint");
        decode(response);
        return true;
    } catch (const ModerationError& e) {
        spdlog::warn("Generation endpoint health probe failed: {}", e.what());
        return false;
    }
}

std::string GenerationGateway::decode(const nlohmann::json& body) const {
    if (!body.is_object() || !body.contains("choices") || !body.at("choices").is_array() ||
        body.at("choices").empty()) {
        throw malformed("generation response has no 'choices'");
    }
    const auto& choice = body.at("choices").at(0);
    if (!choice.is_object() || !choice.contains("message") || !choice.at("message").is_object()) {
        throw malformed("generation response choice has no 'message'");
    }
    const auto& message = choice.at("message");
    if (!message.contains("content") || !message.at("content").is_string()) {
        throw malformed("generation response message has no 'content'");
    }
    return trim(message.at("content").get<std::string>());
}

} // namespace moderag
