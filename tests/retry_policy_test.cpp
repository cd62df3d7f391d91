#include <gtest/gtest.h>
#include "moderag/retry_policy.hpp"

#include <vector>

namespace moderag {
namespace {

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy policy(int attempts, double jitter = 0.0) {
        RetryPolicy p(attempts, std::chrono::milliseconds(100), std::chrono::milliseconds(1000), jitter);
        p.setSleeper([this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
        return p;
    }

    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(RetryPolicyTest, BackoffDoublesUpToCap) {
    auto p = policy(10);
    EXPECT_EQ(p.delayFor(1).count(), 100);
    EXPECT_EQ(p.delayFor(2).count(), 200);
    EXPECT_EQ(p.delayFor(3).count(), 400);
    EXPECT_EQ(p.delayFor(4).count(), 800);
    EXPECT_EQ(p.delayFor(5).count(), 1000);
    EXPECT_EQ(p.delayFor(40).count(), 1000);
}

TEST_F(RetryPolicyTest, JitterStaysInBand) {
    auto p = policy(3, 0.2);
    for (int i = 0; i < 100; ++i) {
        auto d = p.delayFor(2).count();
        EXPECT_GE(d, 160);
        EXPECT_LE(d, 240);
    }
}

TEST_F(RetryPolicyTest, SucceedsWithoutRetry) {
    auto p = policy(3);
    CallStats stats;
    int calls = 0;
    int value = p.execute([&] { ++calls; return 7; }, &stats, "op");
    EXPECT_EQ(value, 7);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(stats.attempts, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryPolicyTest, RetriesTransientFailuresThenSucceeds) {
    auto p = policy(3);
    CallStats stats;
    int calls = 0;
    auto value = p.execute([&] {
        if (++calls < 3) throw ModerationError(ErrorKind::UNREACHABLE, "reset", 503);
        return std::string("ok");
    }, &stats, "op");
    EXPECT_EQ(value, "ok");
    EXPECT_EQ(stats.attempts, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 100);
    EXPECT_EQ(sleeps_[1].count(), 200);
}

TEST_F(RetryPolicyTest, PersistentFailureRespectsAttemptBudget) {
    auto p = policy(4);
    CallStats stats;
    int calls = 0;
    try {
        p.execute([&]() -> int { ++calls; throw ModerationError(ErrorKind::UNREACHABLE, "down"); }, &stats, "op");
        FAIL() << "expected failure";
    } catch (const ModerationError& e) {
        EXPECT_EQ(e.kind, ErrorKind::UNREACHABLE);
        EXPECT_EQ(e.attempts, 4);
    }
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(stats.attempts, 4);
    EXPECT_EQ(sleeps_.size(), 3u);
}

TEST_F(RetryPolicyTest, NonRetryableFailsImmediately) {
    auto p = policy(5);
    int calls = 0;
    for (ErrorKind kind : {ErrorKind::REJECTED, ErrorKind::MALFORMED_RESPONSE}) {
        calls = 0;
        try {
            p.execute([&]() -> int { ++calls; throw ModerationError(kind, "no", 429); }, nullptr, "op");
            FAIL() << "expected failure";
        } catch (const ModerationError& e) {
            EXPECT_EQ(e.kind, kind);
            EXPECT_EQ(e.attempts, 1);
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryPolicyTest, CustomPredicate) {
    auto p = policy(3);
    p.setRetryable([](const ModerationError& e) { return e.kind == ErrorKind::MALFORMED_RESPONSE; });
    int calls = 0;
    EXPECT_THROW(p.execute([&]() -> int { ++calls; throw ModerationError(ErrorKind::MALFORMED_RESPONSE, "x"); },
                           nullptr, "op"),
                 ModerationError);
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryPolicyTest, AtLeastOneAttempt) {
    RetryPolicy p(0, std::chrono::milliseconds(10));
    EXPECT_EQ(p.maxAttempts(), 1);
}

} // namespace
} // namespace moderag
