#include "moderag/orchestrator.hpp"
#include "moderag/errors.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <utility>

#include <spdlog/spdlog.h>

namespace moderag {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

template <typename F>
auto runStage(Stage stage, std::vector<StageTiming>& timings, F&& fn)
    -> decltype(fn(std::declval<CallStats&>())) {
    CallStats stats;
    const auto start = std::chrono::steady_clock::now();
    try {
        auto value = fn(stats);
        timings.push_back(StageTiming{stage, elapsedMs(start), stats.attempts});
        return value;
    } catch (const ModerationError& e) {
        timings.push_back(StageTiming{stage, elapsedMs(start), std::max(stats.attempts, e.attempts)});
        spdlog::error("Classification failed at {} ({}): {}", toString(stage), toString(e.kind), e.what());
        throw ClassificationError(stage, e, timings);
    }
}

} // namespace

ClassificationOrchestrator::ClassificationOrchestrator(std::shared_ptr<const EmbeddingGateway> embedder,
                                                       std::shared_ptr<const GenerationGateway> generator,
                                                       std::shared_ptr<const IndexHolder> index,
                                                       PromptAssembler assembler,
                                                       ResponseParser parser,
                                                       OrchestratorSettings settings)
    : embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      index_(std::move(index)),
      assembler_(std::move(assembler)),
      parser_(std::move(parser)),
      settings_(std::move(settings)) {}

void ClassificationOrchestrator::validate(const ClassificationRequest& request) const {
    if (request.text.empty()) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "text must not be empty");
    }
    if (request.num_examples < 1 || request.num_examples > settings_.max_examples) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT,
                              "num_examples must be between 1 and " + std::to_string(settings_.max_examples));
    }
    if (request.max_text_length <= 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "max_input_length must be positive");
    }
    if (request.max_generated_tokens <= 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "max_generated_tokens must be positive");
    }
}

ClassificationResult ClassificationOrchestrator::classify(const ClassificationRequest& request) {
    validate(request);

    std::vector<StageTiming> timings;
    const std::string query = truncateUtf8(request.text, static_cast<size_t>(request.max_text_length));
    auto embedding = runStage(Stage::EMBED_QUERY, timings, [&](CallStats& stats) {
        return embedder_->embedOne(query, &stats);
    });
    return complete(request, embedding, std::move(timings));
}

ClassificationResult ClassificationOrchestrator::complete(const ClassificationRequest& request,
                                                          const std::vector<float>& embedding,
                                                          std::vector<StageTiming> timings) const {
    ClassificationResult result;
    result.query = request.text;

    result.similar_examples = runStage(Stage::RETRIEVE, timings, [&](CallStats& stats) {
        auto index = index_->snapshot();
        if (!index) {
            throw ModerationError(ErrorKind::INDEX_EMPTY, "no index has been loaded");
        }
        return index->search(embedding, request.num_examples, &stats);
    });

    auto prompt = runStage(Stage::ASSEMBLE_PROMPT, timings, [&](CallStats&) {
        return assembler_.assemble(request.text, result.similar_examples, request.num_examples,
                                   static_cast<size_t>(request.max_text_length));
    });
    result.similar_examples = prompt.examples;
    result.prompt = prompt.user;

    result.raw_response = runStage(Stage::GENERATE, timings, [&](CallStats& stats) {
        return generator_->generate(prompt.system, prompt.user, request.max_generated_tokens,
                                    settings_.temperature, &stats);
    });

    auto parsed = runStage(Stage::PARSE_AND_VALIDATE, timings, [&](CallStats&) {
        return parser_.parse(result.raw_response);
    });
    result.category = parsed.category;
    result.confidence = parsed.confidence;
    result.explanation = parsed.explanation;
    result.outcome = parsed.outcome;
    result.downgraded = parsed.downgraded;
    result.timings = std::move(timings);
    result.timestamp = currentTimestamp();

    spdlog::info("Classified as {} ({}, confidence {:.1f}) in {:.1f}ms", toString(result.category),
                 toString(result.outcome), result.confidence, result.totalLatencyMs());
    spdlog::debug("Stage latencies: embed {:.1f}ms, retrieve {:.1f}ms, prompt {:.1f}ms, generate {:.1f}ms, parse {:.1f}ms",
                  result.timings[0].latency_ms, result.timings[1].latency_ms, result.timings[2].latency_ms,
                  result.timings[3].latency_ms, result.timings[4].latency_ms);
    return result;
}

std::vector<BatchOutcome> ClassificationOrchestrator::classifyBatch(const std::vector<ClassificationRequest>& requests) {
    std::vector<BatchOutcome> outcomes(requests.size());
    std::vector<size_t> valid;
    std::vector<std::string> queries;
    for (size_t i = 0; i < requests.size(); ++i) {
        try {
            validate(requests[i]);
            valid.push_back(i);
            queries.push_back(truncateUtf8(requests[i].text, static_cast<size_t>(requests[i].max_text_length)));
        } catch (const ModerationError&) {
            outcomes[i].error = std::current_exception();
        }
    }
    if (valid.empty()) {
        return outcomes;
    }

    std::vector<StageTiming> timings;
    std::vector<std::vector<float>> embeddings;
    try {
        embeddings = runStage(Stage::EMBED_QUERY, timings, [&](CallStats& stats) {
            return embedder_->embed(queries, &stats);
        });
    } catch (const ClassificationError&) {
        auto error = std::current_exception();
        for (size_t i : valid) {
            outcomes[i].error = error;
        }
        return outcomes;
    }

    const size_t wave = std::max<size_t>(1, settings_.batch_workers);
    for (size_t first = 0; first < valid.size(); first += wave) {
        const size_t last = std::min(valid.size(), first + wave);
        std::vector<std::future<ClassificationResult>> pending;
        pending.reserve(last - first);
        for (size_t n = first; n < last; ++n) {
            pending.push_back(std::async(std::launch::async, [this, &requests, &embeddings, &timings, &valid, n] {
                return complete(requests[valid[n]], embeddings[n], timings);
            }));
        }
        for (size_t n = first; n < last; ++n) {
            try {
                outcomes[valid[n]].result = pending[n - first].get();
            } catch (const ModerationError&) {
                outcomes[valid[n]].error = std::current_exception();
            }
        }
    }

    spdlog::info("Classified batch of {} request(s), {} failed", requests.size(),
                 std::count_if(outcomes.begin(), outcomes.end(), [](const BatchOutcome& o) { return !o.ok(); }));
    return outcomes;
}

HealthStatus ClassificationOrchestrator::health(bool probeUpstreams) const {
    HealthStatus status;
    status.version = settings_.version;
    auto index = index_->snapshot();
    status.index_loaded = index != nullptr;
    status.index_size = index ? index->size() : 0;
    status.status = status.index_loaded ? "healthy" : "initializing";

    if (probeUpstreams) {
        status.embedding_available = embedder_->ping();
        status.llm_available = generator_->ping();
        if (!*status.embedding_available || !*status.llm_available) {
            status.status = "degraded";
        }
    }
    return status;
}

} // namespace moderag
