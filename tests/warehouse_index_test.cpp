#include <gtest/gtest.h>
#include "moderag/errors.hpp"
#include "moderag/warehouse_index.hpp"
#include "fake_transport.hpp"

#include <memory>

namespace moderag {
namespace {

using fakes::FakeTransport;
using fakes::instantRetry;

WarehouseSettings tableSettings() {
    WarehouseSettings settings;
    settings.project = "moderation-prod";
    settings.dataset = "moderation";
    settings.table = "examples_embedded";
    settings.access_token = "token";
    settings.dimension = 3;
    return settings;
}

nlohmann::json row(const std::string& text, const std::string& category, const std::string& distance) {
    return {{"f", {{{"v", text}}, {{"v", category}}, {{"v", distance}}}}};
}

nlohmann::json queryResponse(const std::vector<nlohmann::json>& rows) {
    return {
        {"kind", "bigquery#queryResponse"},
        {"jobComplete", true},
        {"schema", {{"fields", {
            {{"name", "text"}, {"type", "STRING"}},
            {{"name", "moderation_category"}, {"type", "STRING"}},
            {{"name", "distance"}, {"type", "FLOAT"}},
        }}}},
        {"rows", rows},
    };
}

class WarehouseIndexTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
};

TEST_F(WarehouseIndexTest, QueryInlinesValidatedOptions) {
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());
    const std::string sql = index.buildQuery(5);
    EXPECT_NE(sql.find("VECTOR_SEARCH("), std::string::npos);
    EXPECT_NE(sql.find("TABLE `moderation.examples_embedded`"), std::string::npos);
    EXPECT_NE(sql.find("(SELECT @embedding)"), std::string::npos);
    EXPECT_NE(sql.find("top_k => 5"), std::string::npos);
    EXPECT_NE(sql.find("distance_type => 'COSINE'"), std::string::npos);
    EXPECT_NE(sql.find(R"("fraction_lists_to_search":0.15)"), std::string::npos);
    EXPECT_NE(sql.find(R"("use_brute_force":false)"), std::string::npos);
    EXPECT_NE(sql.find("ORDER BY distance"), std::string::npos);
}

TEST_F(WarehouseIndexTest, SearchPostsParameterizedQuery) {
    transport_->respondJson(queryResponse({
        row("I will hurt you", "violence_or_threats", "0.12"),
        row("Have a nice day", "clean", "0.58"),
    }));
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());

    CallStats stats;
    auto results = index.search({0.5f, -0.25f, 1.0f}, 2, &stats);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].category, Category::VIOLENCE_OR_THREATS);
    EXPECT_FLOAT_EQ(results[0].distance, 0.12f);
    EXPECT_EQ(results[1].text, "Have a nice day");
    EXPECT_EQ(stats.attempts, 1);

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "https://bigquery.googleapis.com/bigquery/v2/projects/moderation-prod/queries");
    EXPECT_EQ(requests[0].headers.at(0), "Authorization: Bearer token");

    auto body = transport_->lastBody();
    EXPECT_EQ(body["useLegacySql"], false);
    EXPECT_EQ(body["parameterMode"], "NAMED");
    const auto& parameter = body["queryParameters"][0];
    EXPECT_EQ(parameter["name"], "embedding");
    EXPECT_EQ(parameter["parameterType"]["type"], "ARRAY");
    EXPECT_EQ(parameter["parameterType"]["arrayType"]["type"], "FLOAT64");
    const auto& values = parameter["parameterValue"]["arrayValues"];
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0]["value"], "0.5");
    EXPECT_EQ(values[1]["value"], "-0.25");
    EXPECT_EQ(values[2]["value"], "1");
}

TEST_F(WarehouseIndexTest, ResultsSortedAndCapped) {
    transport_->respondJson(queryResponse({
        row("far", "clean", "0.9"),
        row("near", "spam_or_scams", "0.1"),
        row("middle", "nsfw_content", "0.5"),
    }));
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());
    auto results = index.search({1, 0, 0}, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].text, "near");
    EXPECT_EQ(results[1].text, "middle");
}

TEST_F(WarehouseIndexTest, UsesSchemaColumnOrder) {
    nlohmann::json response = {
        {"jobComplete", true},
        {"schema", {{"fields", {
            {{"name", "distance"}},
            {{"name", "text"}},
            {{"name", "moderation_category"}},
        }}}},
        {"rows", {{{"f", {{{"v", "0.3"}}, {{"v", "hello"}}, {{"v", "clean"}}}}}}},
    };
    transport_->respondJson(response);
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());
    auto results = index.search({1, 0, 0}, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].text, "hello");
    EXPECT_FLOAT_EQ(results[0].distance, 0.3f);
}

TEST_F(WarehouseIndexTest, UnknownCategoryMapsToClean) {
    transport_->respondJson(queryResponse({row("odd", "harassment", "0.2")}));
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());
    auto results = index.search({1, 0, 0}, 1);
    EXPECT_EQ(results[0].category, Category::CLEAN);
}

TEST_F(WarehouseIndexTest, IncompleteJobIsRetried) {
    transport_->respondJson({{"jobComplete", false}});
    transport_->respond(500, "backend error");
    transport_->respondJson(queryResponse({row("x", "clean", "0.4")}));
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry(3));

    CallStats stats;
    auto results = index.search({1, 0, 0}, 1, &stats);
    EXPECT_EQ(results.size(), 1u);
    EXPECT_EQ(stats.attempts, 3);
    EXPECT_EQ(transport_->callCount(), 3u);
}

TEST_F(WarehouseIndexTest, QuotaErrorIsNotRetried) {
    transport_->respond(403, "{\"error\": {\"reason\": \"quotaExceeded\"}}");
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry(3));
    try {
        index.search({1, 0, 0}, 1);
        FAIL() << "expected REJECTED";
    } catch (const ModerationError& e) {
        EXPECT_EQ(e.kind, ErrorKind::REJECTED);
        EXPECT_EQ(e.attempts, 1);
    }
    EXPECT_EQ(transport_->callCount(), 1u);
}

TEST_F(WarehouseIndexTest, EmptyAndMalformedResults) {
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());

    transport_->respondJson(queryResponse({}));
    try {
        index.search({1, 0, 0}, 1);
        FAIL() << "expected INDEX_EMPTY";
    } catch (const ModerationError& e) {
        EXPECT_EQ(e.kind, ErrorKind::INDEX_EMPTY);
    }

    transport_->respondJson(queryResponse({row("x", "clean", "not-a-number")}));
    try {
        index.search({1, 0, 0}, 1);
        FAIL() << "expected MALFORMED_RESPONSE";
    } catch (const ModerationError& e) {
        EXPECT_EQ(e.kind, ErrorKind::MALFORMED_RESPONSE);
    }

    transport_->respondJson({{"jobComplete", true}, {"rows", {{{"f", {{{"v", nullptr}}}}}}}});
    EXPECT_THROW(index.search({1, 0, 0}, 1), ModerationError);
}

TEST_F(WarehouseIndexTest, ValidatesInputBeforeCalling) {
    WarehouseVectorIndex index(transport_, tableSettings(), instantRetry());
    EXPECT_THROW(index.search({1, 0}, 1), ModerationError);
    EXPECT_THROW(index.search({1, 0, 0}, 0), ModerationError);
    EXPECT_EQ(transport_->callCount(), 0u);
}

TEST_F(WarehouseIndexTest, RejectsUnsafeIdentifiers) {
    auto settings = tableSettings();
    settings.table = "examples`; DROP TABLE x; --";
    EXPECT_THROW(WarehouseVectorIndex index(transport_, settings), ModerationError);

    settings = tableSettings();
    settings.fraction_lists_to_search = 0.0;
    EXPECT_THROW(WarehouseVectorIndex index(transport_, settings), ModerationError);
}

TEST_F(WarehouseIndexTest, ReportsRemote) {
    WarehouseVectorIndex index(transport_, tableSettings());
    EXPECT_TRUE(index.remote());
    EXPECT_EQ(index.size(), 0u);
    EXPECT_NE(index.describe().find("moderation.examples_embedded"), std::string::npos);
}

} // namespace
} // namespace moderag
