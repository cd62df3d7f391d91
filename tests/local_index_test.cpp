#include <gtest/gtest.h>
#include "moderag/errors.hpp"
#include "moderag/local_index.hpp"
#include "temp_dir.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <functional>
#include <limits>
#include <random>

namespace moderag {
namespace {

using fakes::TempDir;

ExampleStore threeExamples() {
    return ExampleStore({
        {"I will hurt you", Category::VIOLENCE_OR_THREATS, {}},
        {"Have a nice day", Category::CLEAN, {}},
        {"Buy cheap pills now", Category::SPAM_OR_SCAMS, {}},
    });
}

std::vector<std::vector<float>> threeVectors() {
    return {
        {1.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f},
        {0.0f, 0.0f, 1.0f},
    };
}

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ModerationError& e) {
        return e.kind;
    }
    ADD_FAILURE() << "expected ModerationError";
    return ErrorKind::IO;
}

TEST(FlatIndexTest, EuclideanDistanceIsSquared) {
    FlatIndex index(2, MetricType::EUCLIDEAN);
    const float a[] = {0.0f, 0.0f};
    const float b[] = {3.0f, 4.0f};
    EXPECT_FLOAT_EQ(index.distance(a, b), 25.0f);
}

TEST(FlatIndexTest, CosineAndDotProductAreLowerIsCloser) {
    FlatIndex cosine(2, MetricType::COSINE);
    const float x[] = {1.0f, 0.0f};
    const float y[] = {0.0f, 2.0f};
    const float z[] = {0.0f, 0.0f};
    EXPECT_NEAR(cosine.distance(x, x), 0.0f, 1e-6f);
    EXPECT_NEAR(cosine.distance(x, y), 1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(cosine.distance(x, z), 1.0f);

    FlatIndex dot(2, MetricType::DOT_PRODUCT);
    const float big[] = {5.0f, 0.0f};
    EXPECT_LT(dot.distance(x, big), dot.distance(x, x));
}

TEST(FlatIndexTest, TiesBreakByInsertionOrder) {
    FlatIndex index(2, MetricType::EUCLIDEAN);
    index.add({1.0f, 0.0f});
    index.add({0.0f, 1.0f});
    index.add({-1.0f, 0.0f});
    index.add({0.0f, -1.0f});

    auto hits = index.search({0.0f, 0.0f}, 4);
    ASSERT_EQ(hits.size(), 4u);
    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i].first, i);
        EXPECT_FLOAT_EQ(hits[i].second, 1.0f);
    }
}

TEST(FlatIndexTest, ResultsAreNonDecreasing) {
    std::mt19937 gen(42);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    FlatIndex index(16, MetricType::EUCLIDEAN);
    for (int i = 0; i < 200; ++i) {
        std::vector<float> v(16);
        for (auto& x : v) x = dist(gen);
        index.add(v);
    }
    std::vector<float> q(16);
    for (auto& x : q) x = dist(gen);

    auto hits = index.search(q, 25);
    ASSERT_EQ(hits.size(), 25u);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_LE(hits[i - 1].second, hits[i].second);
    }
}

TEST(FlatIndexTest, RejectsBadInput) {
    FlatIndex index(3, MetricType::EUCLIDEAN);
    EXPECT_EQ(kindOf([&] { index.search({0, 0, 0}, 1); }), ErrorKind::INDEX_EMPTY);
    EXPECT_EQ(kindOf([&] { index.add({1, 2}); }), ErrorKind::DIMENSION_MISMATCH);
    EXPECT_EQ(kindOf([&] { index.add({1, 2, std::nanf("")}); }), ErrorKind::INVALID_ARGUMENT);

    index.add({1, 2, 3});
    EXPECT_EQ(kindOf([&] { index.search({1, 2, 3}, 0); }), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(kindOf([&] { index.search({1, 2, 3}, -4); }), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(kindOf([&] { index.search({1, 2, 3, 4}, 1); }), ErrorKind::DIMENSION_MISMATCH);
    EXPECT_EQ(kindOf([&] { index.search({1, 2}, 1); }), ErrorKind::DIMENSION_MISMATCH);
}

TEST(FlatIndexTest, LoadRejectsCorruptFiles) {
    TempDir dir;
    FlatIndex index(2, MetricType::COSINE);
    index.add({1.0f, 2.0f});
    index.save(dir.path() / "good.bin");

    auto garbage = dir.write("garbage.bin", "not an index at all");
    EXPECT_EQ(kindOf([&] { FlatIndex::load(garbage); }), ErrorKind::IO);

    std::ifstream in(dir.path() / "good.bin", std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto truncated = dir.write("truncated.bin", bytes.substr(0, bytes.size() - 2));
    EXPECT_EQ(kindOf([&] { FlatIndex::load(truncated); }), ErrorKind::IO);
    auto trailing = dir.write("trailing.bin", bytes + "x");
    EXPECT_EQ(kindOf([&] { FlatIndex::load(trailing); }), ErrorKind::IO);

    EXPECT_EQ(kindOf([&] { FlatIndex::load(dir.path() / "missing.bin"); }), ErrorKind::IO);
}

TEST(FlatIndexTest, LoadRejectsImplausibleHeaderCount) {
    TempDir dir;
    FlatIndex index(2, MetricType::EUCLIDEAN);
    index.add({1.0f, 2.0f});
    index.save(dir.path() / "good.bin");

    std::ifstream in(dir.path() / "good.bin", std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    // count is the u64 after magic, version, metric and dimension
    const uint64_t huge = std::numeric_limits<uint64_t>::max() / 2;
    std::memcpy(bytes.data() + 16, &huge, sizeof(huge));
    auto corrupt = dir.write("corrupt.bin", bytes);
    EXPECT_EQ(kindOf([&] { FlatIndex::load(corrupt); }), ErrorKind::IO);

    const uint64_t zero = 0;
    std::memcpy(bytes.data() + 16, &zero, sizeof(zero));
    auto short_count = dir.write("short.bin", bytes);
    EXPECT_EQ(kindOf([&] { FlatIndex::load(short_count); }), ErrorKind::IO);
}

TEST(LocalVectorIndexTest, BuildKeepsStoreAndIndexAligned) {
    auto index = LocalVectorIndex::build(threeExamples(), threeVectors());
    EXPECT_EQ(index->size(), 3u);
    EXPECT_EQ(index->store().size(), index->size());
    EXPECT_EQ(index->dimension(), 3u);
    EXPECT_FALSE(index->remote());
}

TEST(LocalVectorIndexTest, BuildRejectsMismatchedInput) {
    auto vectors = threeVectors();
    vectors.pop_back();
    EXPECT_EQ(kindOf([&] { LocalVectorIndex::build(threeExamples(), vectors); }), ErrorKind::INVALID_ARGUMENT);

    vectors = threeVectors();
    vectors[2] = {0.0f, 1.0f};
    EXPECT_EQ(kindOf([&] { LocalVectorIndex::build(threeExamples(), vectors); }), ErrorKind::DIMENSION_MISMATCH);

    EXPECT_EQ(kindOf([&] { LocalVectorIndex::build(ExampleStore(), {}); }), ErrorKind::INDEX_EMPTY);
}

TEST(LocalVectorIndexTest, NearestExampleComesFirst) {
    auto index = LocalVectorIndex::build(threeExamples(), threeVectors());
    // Embedding of "You are going to regret this" lies closest to the threat.
    auto results = index->search({0.9f, 0.3f, 0.1f}, 2);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].text, "I will hurt you");
    EXPECT_EQ(results[0].category, Category::VIOLENCE_OR_THREATS);
    EXPECT_LT(results[0].distance, results[1].distance);
    EXPECT_NE(results[1].category, Category::VIOLENCE_OR_THREATS);
}

TEST(LocalVectorIndexTest, KLargerThanSizeReturnsEverything) {
    auto index = LocalVectorIndex::build(threeExamples(), threeVectors());
    auto results = index->search({0.0f, 0.0f, 0.0f}, 10);
    EXPECT_EQ(results.size(), index->size());
}

TEST(LocalVectorIndexTest, SaveLoadRoundTripIsExact) {
    TempDir dir;
    std::mt19937 gen(7);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    ExampleStore store;
    std::vector<std::vector<float>> vectors;
    for (int i = 0; i < 50; ++i) {
        Example example{"example " + std::to_string(i), CategoryTaxonomy::all()[i % 6], {}};
        example.metadata["source"] = "unit";
        store.append(example);
        std::vector<float> v(8);
        for (auto& x : v) x = dist(gen);
        vectors.push_back(v);
    }
    auto original = LocalVectorIndex::build(store, vectors, MetricType::COSINE);
    original->save(dir.path() / "index");

    auto loaded = LocalVectorIndex::load(dir.path() / "index");
    ASSERT_EQ(loaded->size(), original->size());
    EXPECT_EQ(loaded->store().size(), loaded->size());
    EXPECT_EQ(loaded->metric(), MetricType::COSINE);
    for (size_t i = 0; i < original->size(); ++i) {
        EXPECT_EQ(std::memcmp(original->flat().row(i), loaded->flat().row(i), 8 * sizeof(float)), 0);
        EXPECT_EQ(loaded->store().at(i).text, original->store().at(i).text);
        EXPECT_EQ(loaded->store().at(i).category, original->store().at(i).category);
        EXPECT_EQ(loaded->store().at(i).metadata.at("source"), "unit");
    }

    for (int q = 0; q < 10; ++q) {
        std::vector<float> query(8);
        for (auto& x : query) x = dist(gen);
        auto a = original->search(query, 5);
        auto b = loaded->search(query, 5);
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a[i].text, b[i].text);
            EXPECT_EQ(a[i].distance, b[i].distance);
        }
    }
}

TEST(LocalVectorIndexTest, LoadRejectsMisalignedMetadata) {
    TempDir dir;
    auto index = LocalVectorIndex::build(threeExamples(), threeVectors());
    index->save(dir.path());
    dir.write(LocalVectorIndex::kMetadataFile, "{\"text\": \"only one\", \"category\": \"clean\"}\n");
    EXPECT_EQ(kindOf([&] { LocalVectorIndex::load(dir.path()); }), ErrorKind::IO);
}

TEST(LocalVectorIndexTest, LoadRejectsMistypedMetadataRow) {
    TempDir dir;
    auto index = LocalVectorIndex::build(threeExamples(), threeVectors());
    index->save(dir.path());
    dir.write(LocalVectorIndex::kMetadataFile,
              "{\"text\": \"a\", \"category\": \"clean\"}\n"
              "{\"text\": \"b\", \"category\": \"clean\", \"metadata\": \"oops\"}\n"
              "{\"text\": \"c\", \"category\": \"clean\"}\n");
    try {
        LocalVectorIndex::load(dir.path());
        FAIL() << "expected IO error";
    } catch (const ModerationError& e) {
        EXPECT_EQ(e.kind, ErrorKind::IO);
        EXPECT_NE(std::string(e.what()).find(":2"), std::string::npos);
    }
}

} // namespace
} // namespace moderag
