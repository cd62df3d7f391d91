#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "moderag/classifier.hpp"
#include "moderag/gateways.hpp"
#include "moderag/index_holder.hpp"
#include "moderag/prompt_assembler.hpp"
#include "moderag/response_parser.hpp"

namespace moderag {

struct OrchestratorSettings {
    double temperature = 0.0;
    int max_examples = 10;
    // Requests of one classifyBatch finished at the same time.
    size_t batch_workers = 8;
    std::string version = "0.1.0";
};

struct BatchOutcome {
    std::optional<ClassificationResult> result;
    std::exception_ptr error;

    bool ok() const { return result.has_value(); }
};

// Runs one request through EmbedQuery -> Retrieve -> AssemblePrompt ->
// Generate -> ParseAndValidate. Each stage records its latency and network
// attempts; the total is their sum. A failure in any of the first four stages
// aborts the request with a ClassificationError tagged with that stage.
// Parsing never fails a request. Invalid requests throw
// ModerationError(INVALID_ARGUMENT) before any stage runs.
class ClassificationOrchestrator : public Classifier {
public:
    ClassificationOrchestrator(std::shared_ptr<const EmbeddingGateway> embedder,
                               std::shared_ptr<const GenerationGateway> generator,
                               std::shared_ptr<const IndexHolder> index,
                               PromptAssembler assembler,
                               ResponseParser parser,
                               OrchestratorSettings settings = OrchestratorSettings());

    ClassificationOrchestrator(const ClassificationOrchestrator&) = delete;
    ClassificationOrchestrator& operator=(const ClassificationOrchestrator&) = delete;

    ClassificationResult classify(const ClassificationRequest& request) override;

    // Embeds every valid query in one batched call, then finishes the requests
    // in waves of at most batch_workers. Outcomes line up with requests.
    std::vector<BatchOutcome> classifyBatch(const std::vector<ClassificationRequest>& requests);

    // probeUpstreams adds reachability checks of both endpoints.
    HealthStatus health(bool probeUpstreams = false) const;

    void validate(const ClassificationRequest& request) const;

private:
    std::shared_ptr<const EmbeddingGateway> embedder_;
    std::shared_ptr<const GenerationGateway> generator_;
    std::shared_ptr<const IndexHolder> index_;
    PromptAssembler assembler_;
    ResponseParser parser_;
    OrchestratorSettings settings_;

    ClassificationResult complete(const ClassificationRequest& request,
                                  const std::vector<float>& embedding,
                                  std::vector<StageTiming> timings) const;
};

} // namespace moderag
