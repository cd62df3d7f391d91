#include <gtest/gtest.h>
#include "moderag/errors.hpp"
#include "moderag/local_index.hpp"
#include "moderag/orchestrator.hpp"
#include "fake_transport.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace moderag {
namespace {

using fakes::FakeTransport;
using fakes::chatResponse;
using fakes::embeddingResponse;
using fakes::endsWith;
using fakes::instantRetry;

const char* kThreatQuery = "You are going to regret this";

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_->setHandler([this](const HttpRequest& request) { return route(request); });
        embedder_ = std::make_shared<EmbeddingGateway>(
            transport_, EndpointSettings{"http://embed/v1", "gte", "", std::chrono::milliseconds(1000)},
            instantRetry(3));
        generator_ = std::make_shared<GenerationGateway>(
            transport_, EndpointSettings{"http://llm/v1", "phi", "", std::chrono::milliseconds(1000)},
            instantRetry(3));
        holder_ = std::make_shared<IndexHolder>(buildIndex());
        orchestrator_ = std::make_unique<ClassificationOrchestrator>(
            embedder_, generator_, holder_, PromptAssembler(), ResponseParser());
    }

    static std::shared_ptr<const VectorIndex> buildIndex() {
        ExampleStore store({
            {"I will hurt you", Category::VIOLENCE_OR_THREATS, {}},
            {"Have a nice day", Category::CLEAN, {}},
            {"Buy cheap pills now", Category::SPAM_OR_SCAMS, {}},
        });
        return LocalVectorIndex::build(std::move(store), {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}});
    }

    HttpResponse route(const HttpRequest& request) {
        auto body = nlohmann::json::parse(request.body);
        if (endsWith(request.url, "/embeddings")) {
            ++embedCalls_;
            if (embedStatus_ != 200) return {embedStatus_, "embedding backend down"};
            std::vector<std::vector<float>> vectors;
            for (const auto& text : body["input"]) {
                auto it = embeddings_.find(text.get<std::string>());
                vectors.push_back(it != embeddings_.end() ? it->second : std::vector<float>{0.1f, 0.9f, 0.0f});
            }
            return {200, embeddingResponse(vectors).dump()};
        }
        if (endsWith(request.url, "/chat/completions")) {
            ++chatCalls_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastUserPrompt_ = body["messages"][1]["content"].get<std::string>();
            }
            if (chatStatus_ != 200) return {chatStatus_, "{\"error\": \"bad request\"}"};
            const int inFlight = ++chatInFlight_;
            int peak = chatPeak_.load();
            while (inFlight > peak && !chatPeak_.compare_exchange_weak(peak, inFlight)) {
            }
            std::this_thread::sleep_for(chatDelay_);
            --chatInFlight_;
            return {200, chatResponse(generated_).dump()};
        }
        return {404, "not found"};
    }

    ClassificationRequest request(const std::string& text, int examples = 2) {
        ClassificationRequest r;
        r.text = text;
        r.num_examples = examples;
        return r;
    }

    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    std::shared_ptr<EmbeddingGateway> embedder_;
    std::shared_ptr<GenerationGateway> generator_;
    std::shared_ptr<IndexHolder> holder_;
    std::unique_ptr<ClassificationOrchestrator> orchestrator_;

    std::map<std::string, std::vector<float>> embeddings_ = {{kThreatQuery, {0.9f, 0.3f, 0.1f}}};
    std::string generated_ = "Category: violence_or_threats\nConfidence: HIGH\nExplanation: Veiled threat.";
    long embedStatus_ = 200;
    long chatStatus_ = 200;
    std::atomic<int> embedCalls_{0};
    std::atomic<int> chatCalls_{0};
    std::chrono::milliseconds chatDelay_{0};
    std::atomic<int> chatInFlight_{0};
    std::atomic<int> chatPeak_{0};
    std::mutex mutex_;
    std::string lastUserPrompt_;
};

TEST_F(OrchestratorTest, ClassifiesWithNearestExamplesFirst) {
    auto result = orchestrator_->classify(request(kThreatQuery));

    EXPECT_EQ(result.query, kThreatQuery);
    EXPECT_EQ(result.category, Category::VIOLENCE_OR_THREATS);
    EXPECT_EQ(result.outcome, ParseOutcome::OK);
    EXPECT_DOUBLE_EQ(result.confidence, ResponseParser::kHighConfidence);
    EXPECT_EQ(result.explanation, "Veiled threat.");
    EXPECT_EQ(result.raw_response, generated_);
    EXPECT_FALSE(result.timestamp.empty());

    ASSERT_EQ(result.similar_examples.size(), 2u);
    EXPECT_EQ(result.similar_examples[0].category, Category::VIOLENCE_OR_THREATS);
    EXPECT_LT(result.similar_examples[0].distance, result.similar_examples[1].distance);

    const auto threat = lastUserPrompt_.find("I will hurt you");
    ASSERT_NE(threat, std::string::npos);
    const auto other = lastUserPrompt_.find(result.similar_examples[1].text);
    EXPECT_LT(threat, other);
    EXPECT_NE(lastUserPrompt_.find(kThreatQuery), std::string::npos);
    EXPECT_EQ(result.prompt, lastUserPrompt_);
}

TEST_F(OrchestratorTest, RecordsEveryStageAndSumsThem) {
    auto result = orchestrator_->classify(request(kThreatQuery));

    ASSERT_EQ(result.timings.size(), 5u);
    const Stage order[] = {Stage::EMBED_QUERY, Stage::RETRIEVE, Stage::ASSEMBLE_PROMPT, Stage::GENERATE,
                           Stage::PARSE_AND_VALIDATE};
    double sum = 0.0;
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(result.timings[i].stage, order[i]);
        EXPECT_GE(result.timings[i].latency_ms, 0.0);
        sum += result.timings[i].latency_ms;
    }
    EXPECT_DOUBLE_EQ(result.totalLatencyMs(), sum);
    EXPECT_EQ(result.timing(Stage::EMBED_QUERY)->attempts, 1);
    EXPECT_EQ(result.timing(Stage::GENERATE)->attempts, 1);
    EXPECT_EQ(result.timing(Stage::ASSEMBLE_PROMPT)->attempts, 0);
}

TEST_F(OrchestratorTest, EmbeddingFailureStopsTheRequest) {
    embedStatus_ = 503;
    try {
        orchestrator_->classify(request(kThreatQuery));
        FAIL() << "expected ClassificationError";
    } catch (const ClassificationError& e) {
        EXPECT_EQ(e.stage, Stage::EMBED_QUERY);
        EXPECT_EQ(e.kind, ErrorKind::UNREACHABLE);
        EXPECT_EQ(e.attempts, 3);
        ASSERT_EQ(e.timings.size(), 1u);
        EXPECT_EQ(e.timings[0].attempts, 3);
    }
    EXPECT_EQ(embedCalls_.load(), 3);
    EXPECT_EQ(chatCalls_.load(), 0);
}

TEST_F(OrchestratorTest, MissingIndexFailsRetrievalWithoutGenerating) {
    holder_->publish(nullptr);
    try {
        orchestrator_->classify(request(kThreatQuery));
        FAIL() << "expected ClassificationError";
    } catch (const ClassificationError& e) {
        EXPECT_EQ(e.stage, Stage::RETRIEVE);
        EXPECT_EQ(e.kind, ErrorKind::INDEX_EMPTY);
        EXPECT_EQ(e.timings.size(), 2u);
    }
    EXPECT_EQ(chatCalls_.load(), 0);
}

TEST_F(OrchestratorTest, DimensionMismatchIsFatal) {
    embeddings_[kThreatQuery] = {0.9f, 0.3f};
    try {
        orchestrator_->classify(request(kThreatQuery));
        FAIL() << "expected ClassificationError";
    } catch (const ClassificationError& e) {
        EXPECT_EQ(e.stage, Stage::RETRIEVE);
        EXPECT_EQ(e.kind, ErrorKind::DIMENSION_MISMATCH);
    }
}

TEST_F(OrchestratorTest, RejectedGenerationPropagatesWithoutRetry) {
    chatStatus_ = 400;
    try {
        orchestrator_->classify(request(kThreatQuery));
        FAIL() << "expected ClassificationError";
    } catch (const ClassificationError& e) {
        EXPECT_EQ(e.stage, Stage::GENERATE);
        EXPECT_EQ(e.kind, ErrorKind::REJECTED);
        EXPECT_EQ(e.status_code, 400);
        EXPECT_EQ(e.timings.size(), 4u);
    }
    EXPECT_EQ(chatCalls_.load(), 1);
}

TEST_F(OrchestratorTest, UnparseableAnswerDegradesInsteadOfFailing) {
    generated_ = "Category: NotARealCategory\nConfidence: LOW";
    auto fallback = orchestrator_->classify(request(kThreatQuery));
    EXPECT_EQ(fallback.category, Category::CLEAN);
    EXPECT_EQ(fallback.outcome, ParseOutcome::FALLBACK);
    EXPECT_NEAR(fallback.confidence, 0.3, 1e-9);

    generated_ = "I cannot help with that.";
    auto failed = orchestrator_->classify(request(kThreatQuery));
    EXPECT_EQ(failed.category, Category::CLEAN);
    EXPECT_EQ(failed.outcome, ParseOutcome::PARSE_FAILED);
    EXPECT_EQ(failed.timings.size(), 5u);
}

TEST_F(OrchestratorTest, InvalidRequestsNeverReachUpstreams) {
    EXPECT_THROW(orchestrator_->classify(request("")), ModerationError);
    EXPECT_THROW(orchestrator_->classify(request("text", 0)), ModerationError);
    EXPECT_THROW(orchestrator_->classify(request("text", 11)), ModerationError);
    auto r = request("text");
    r.max_generated_tokens = 0;
    try {
        orchestrator_->classify(r);
        FAIL() << "expected INVALID_ARGUMENT";
    } catch (const ClassificationError&) {
        FAIL() << "validation is not a stage failure";
    } catch (const ModerationError& e) {
        EXPECT_EQ(e.kind, ErrorKind::INVALID_ARGUMENT);
    }
    EXPECT_EQ(transport_->callCount(), 0u);
}

TEST_F(OrchestratorTest, QueryIsTruncatedBeforeEmbedding) {
    auto r = request(std::string(50, 'a'));
    r.max_text_length = 10;
    orchestrator_->classify(r);
    auto requests = transport_->requests();
    auto body = nlohmann::json::parse(requests.front().body);
    EXPECT_EQ(body["input"][0], std::string(10, 'a'));
}

TEST_F(OrchestratorTest, SeesSwappedIndex) {
    ExampleStore store({{"Send me your bank password", Category::SPAM_OR_SCAMS, {}}});
    auto previous = holder_->publish(LocalVectorIndex::build(std::move(store), {{1, 0, 0}}));
    EXPECT_EQ(previous->size(), 3u);

    auto result = orchestrator_->classify(request(kThreatQuery));
    ASSERT_EQ(result.similar_examples.size(), 1u);
    EXPECT_EQ(result.similar_examples[0].text, "Send me your bank password");
}

TEST_F(OrchestratorTest, BatchEmbedsOnceAndReportsPerItem) {
    std::vector<ClassificationRequest> requests = {
        request(kThreatQuery),
        request(""),
        request("Have a lovely afternoon"),
    };
    auto outcomes = orchestrator_->classifyBatch(requests);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(embedCalls_.load(), 1);
    EXPECT_EQ(chatCalls_.load(), 2);

    ASSERT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[0].result->query, kThreatQuery);
    EXPECT_EQ(outcomes[0].result->timings.size(), 5u);

    EXPECT_FALSE(outcomes[1].ok());
    EXPECT_THROW(std::rethrow_exception(outcomes[1].error), ModerationError);

    ASSERT_TRUE(outcomes[2].ok());
    EXPECT_EQ(outcomes[2].result->query, "Have a lovely afternoon");
}

TEST_F(OrchestratorTest, BatchEmbeddingFailureFailsEveryValidItem) {
    embedStatus_ = 500;
    auto outcomes = orchestrator_->classifyBatch({request("a"), request("b")});
    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto& outcome : outcomes) {
        ASSERT_FALSE(outcome.ok());
        try {
            std::rethrow_exception(outcome.error);
        } catch (const ClassificationError& e) {
            EXPECT_EQ(e.stage, Stage::EMBED_QUERY);
        }
    }
}

TEST_F(OrchestratorTest, BatchFinishesInBoundedWaves) {
    OrchestratorSettings settings;
    settings.batch_workers = 2;
    ClassificationOrchestrator orchestrator(embedder_, generator_, holder_, PromptAssembler(), ResponseParser(),
                                            settings);
    chatDelay_ = std::chrono::milliseconds(30);

    std::vector<ClassificationRequest> requests;
    for (int i = 0; i < 5; ++i) requests.push_back(request("message " + std::to_string(i)));
    auto outcomes = orchestrator.classifyBatch(requests);

    ASSERT_EQ(outcomes.size(), 5u);
    for (const auto& outcome : outcomes) EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(embedCalls_.load(), 1);
    EXPECT_EQ(chatCalls_.load(), 5);
    EXPECT_LE(chatPeak_.load(), 2);
    EXPECT_GE(chatPeak_.load(), 1);
}

TEST_F(OrchestratorTest, HealthReflectsIndexAndUpstreams) {
    auto healthy = orchestrator_->health();
    EXPECT_EQ(healthy.status, "healthy");
    EXPECT_TRUE(healthy.index_loaded);
    EXPECT_EQ(healthy.index_size, 3u);
    EXPECT_FALSE(healthy.embedding_available.has_value());

    embedStatus_ = 503;
    auto deep = orchestrator_->health(true);
    EXPECT_EQ(deep.status, "degraded");
    ASSERT_TRUE(deep.embedding_available.has_value());
    ASSERT_TRUE(deep.llm_available.has_value());
    EXPECT_FALSE(*deep.embedding_available);
    EXPECT_TRUE(*deep.llm_available);

    holder_->publish(nullptr);
    EXPECT_EQ(orchestrator_->health().status, "initializing");
}

} // namespace
} // namespace moderag
