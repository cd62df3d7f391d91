#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "moderag/classifier.hpp"
#include "moderag/models.hpp"

namespace moderag {

struct CorpusItem {
    std::string text;
    // Ground-truth label, when the corpus carries one.
    std::optional<std::string> expected;
};

// JSONL with a string "text" per line and an optional "moderation_category"
// (or "category") label.
std::vector<CorpusItem> loadCorpus(const std::filesystem::path& path);

std::vector<CorpusItem> sampleRandom(std::vector<CorpusItem> items, size_t count, std::mt19937& rng);

// Exactly min(count, items) items. Each label gets floor(count * share) items,
// a label rounded down to zero still gets one while room remains, and the
// rest is drawn from items not yet taken. Unlabeled items share one group.
std::vector<CorpusItem> sampleStratified(const std::vector<CorpusItem>& items, size_t count, std::mt19937& rng);

// Element at floor(size * p / 100) of an ascending sequence; 0 when empty.
double percentile(const std::vector<double>& sorted, double p);

// Index of the level with the highest throughput whose error rate stays
// below maxErrorRate.
std::optional<size_t> bestLevel(const std::vector<LoadTestMetrics>& levels, double maxErrorRate = 0.05);

std::filesystem::path saveMetrics(const LoadTestMetrics& metrics,
                                  const std::filesystem::path& dir,
                                  const std::string& prefix = "");
std::filesystem::path saveScalingReport(const std::vector<LoadTestMetrics>& levels,
                                        const std::filesystem::path& dir);

class LoadHarness {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using LevelCallback = std::function<void(const std::vector<LoadTestMetrics>&)>;

    LoadHarness(Classifier& classifier, std::vector<CorpusItem> corpus, unsigned seed = std::random_device{}());

    // Holds `concurrency` requests in flight for `duration`. During `rampUp`
    // the permitted number of in-flight requests grows linearly from 1.
    // constantRate > 0 makes each worker pause 1/constantRate seconds between
    // requests. Requests running at the deadline finish; no new ones start.
    LoadTestMetrics run(int concurrency,
                        std::chrono::milliseconds duration,
                        std::chrono::milliseconds rampUp = std::chrono::milliseconds(0),
                        double constantRate = 0.0);

    // One run per level, in the order given, with `cooldown` between levels.
    // onLevel sees the results so far after every level.
    std::vector<LoadTestMetrics> runScaling(const std::vector<int>& levels,
                                            std::chrono::milliseconds durationPerLevel,
                                            std::chrono::milliseconds cooldown,
                                            std::chrono::milliseconds rampUp = std::chrono::milliseconds(0),
                                            double constantRate = 0.0,
                                            const LevelCallback& onLevel = {});

    bool hasLabels() const;
    size_t corpusSize() const { return corpus_.size(); }

    void setNumExamples(int numExamples) { numExamples_ = numExamples; }
    // Used for pacing and cooldown pauses.
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    Classifier& classifier_;
    std::vector<CorpusItem> corpus_;
    unsigned seed_;
    int numExamples_ = 3;
    Sleeper sleeper_;
};

} // namespace moderag
