#include "moderag/load_harness.hpp"
#include "moderag/errors.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <map>
#include <mutex>
#include <numeric>
#include <semaphore>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace moderag {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kRampStep = std::chrono::milliseconds(50);

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double stageLatency(const ClassificationResult& result, Stage stage) {
    const StageTiming* timing = result.timing(stage);
    return timing ? timing->latency_ms : 0.0;
}

std::string fileTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::filesystem::path writeJson(const nlohmann::json& j, const std::filesystem::path& dir, const std::string& name) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ModerationError(ErrorKind::IO, "cannot create " + dir.string() + ": " + ec.message());
    }
    const auto path = dir / name;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ModerationError(ErrorKind::IO, "cannot open " + path.string() + " for writing");
    }
    out << j.dump(2) << '\n';
    if (!out) {
        throw ModerationError(ErrorKind::IO, "write to " + path.string() + " failed");
    }
    return path;
}

// Shared between the workers of one run.
struct Recorder {
    std::mutex mutex;
    std::vector<double> latencies;
    std::vector<double> embedding;
    std::vector<double> retrieval;
    std::vector<double> generation;
    long total = 0;
    long succeeded = 0;
    long failed = 0;
    long degraded = 0;
    long labeled = 0;
    long correct = 0;
    std::map<std::string, CategoryAccuracy> perCategory;

    void success(const CorpusItem& item, const ClassificationResult& result, double latencyMs) {
        std::lock_guard<std::mutex> lock(mutex);
        ++total;
        ++succeeded;
        latencies.push_back(latencyMs);
        embedding.push_back(stageLatency(result, Stage::EMBED_QUERY));
        retrieval.push_back(stageLatency(result, Stage::RETRIEVE));
        generation.push_back(stageLatency(result, Stage::GENERATE));
        if (result.outcome != ParseOutcome::OK || result.downgraded) {
            ++degraded;
        }
        if (item.expected) {
            auto& bucket = perCategory[*item.expected];
            ++bucket.total;
            ++labeled;
            if (CategoryTaxonomy::lookup(*item.expected) == result.category) {
                ++bucket.correct;
                ++correct;
            }
        }
    }

    void failure() {
        std::lock_guard<std::mutex> lock(mutex);
        ++total;
        ++failed;
    }
};

} // namespace

std::vector<CorpusItem> loadCorpus(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ModerationError(ErrorKind::IO, "cannot open " + path.string());
    }

    std::vector<CorpusItem> items;
    std::map<std::string, long> distribution;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("text") || !j.at("text").is_string()) {
            throw ModerationError(ErrorKind::IO, path.string() + ":" + std::to_string(lineNo) + ": no string 'text'");
        }
        CorpusItem item;
        item.text = j.at("text").get<std::string>();
        for (const char* key : {"moderation_category", "category"}) {
            if (j.contains(key) && j.at(key).is_string()) {
                item.expected = j.at(key).get<std::string>();
                ++distribution[*item.expected];
                break;
            }
        }
        items.push_back(std::move(item));
    }

    spdlog::info("Loaded {} test samples from {}", items.size(), path.string());
    if (distribution.empty()) {
        spdlog::warn("No labels in {}; accuracy will not be reported", path.string());
    } else {
        for (const auto& [label, count] : distribution) {
            spdlog::info("  {}: {}", label, count);
        }
    }
    return items;
}

std::vector<CorpusItem> sampleRandom(std::vector<CorpusItem> items, size_t count, std::mt19937& rng) {
    if (count >= items.size()) {
        return items;
    }
    std::shuffle(items.begin(), items.end(), rng);
    items.resize(count);
    spdlog::info("Random sampling kept {} items", items.size());
    return items;
}

std::vector<CorpusItem> sampleStratified(const std::vector<CorpusItem>& items, size_t count, std::mt19937& rng) {
    if (count >= items.size()) {
        return items;
    }

    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < items.size(); ++i) {
        groups[items[i].expected.value_or("")].push_back(i);
    }

    std::vector<bool> taken(items.size(), false);
    std::vector<CorpusItem> sampled;
    sampled.reserve(count);

    // Each label gets its share of count, rounded down.
    std::map<std::string, size_t> quota;
    size_t assigned = 0;
    for (auto& [label, members] : groups) {
        std::shuffle(members.begin(), members.end(), rng);
        quota[label] = count * members.size() / items.size();
        assigned += quota[label];
    }
    // Labels rounded down to nothing still get one item while room remains.
    for (auto& [label, q] : quota) {
        if (q == 0 && assigned < count) {
            q = 1;
            ++assigned;
        }
    }
    for (const auto& [label, members] : groups) {
        const size_t n = std::min(quota[label], members.size());
        for (size_t k = 0; k < n; ++k) {
            taken[members[k]] = true;
            sampled.push_back(items[members[k]]);
        }
    }

    if (sampled.size() < count) {
        std::vector<size_t> rest;
        for (size_t i = 0; i < items.size(); ++i) {
            if (!taken[i]) rest.push_back(i);
        }
        std::shuffle(rest.begin(), rest.end(), rng);
        const size_t n = std::min(count - sampled.size(), rest.size());
        for (size_t k = 0; k < n; ++k) {
            sampled.push_back(items[rest[k]]);
        }
    }

    spdlog::info("Stratified sampling kept {} items across {} labels", sampled.size(), groups.size());
    return sampled;
}

double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    auto idx = static_cast<size_t>(static_cast<double>(sorted.size()) * p / 100.0);
    return sorted[std::min(idx, sorted.size() - 1)];
}

std::optional<size_t> bestLevel(const std::vector<LoadTestMetrics>& levels, double maxErrorRate) {
    std::optional<size_t> best;
    for (size_t i = 0; i < levels.size(); ++i) {
        if (levels[i].error_rate >= maxErrorRate || levels[i].total_requests == 0) continue;
        if (!best || levels[i].requests_per_second > levels[*best].requests_per_second) {
            best = i;
        }
    }
    return best;
}

std::filesystem::path saveMetrics(const LoadTestMetrics& metrics,
                                  const std::filesystem::path& dir,
                                  const std::string& prefix) {
    auto path = writeJson(metrics, dir, prefix + "stress_test_" + fileTimestamp() + ".json");
    spdlog::info("Results saved to {}", path.string());
    return path;
}

std::filesystem::path saveScalingReport(const std::vector<LoadTestMetrics>& levels,
                                        const std::filesystem::path& dir) {
    nlohmann::json report;
    report["scaling_results"] = levels;
    auto best = bestLevel(levels);
    report["best_concurrency"] = best ? nlohmann::json(levels[*best].concurrency) : nlohmann::json(nullptr);
    auto path = writeJson(report, dir, "scaling_test_" + fileTimestamp() + ".json");
    spdlog::info("Scaling results saved to {}", path.string());
    return path;
}

LoadHarness::LoadHarness(Classifier& classifier, std::vector<CorpusItem> corpus, unsigned seed)
    : classifier_(classifier),
      corpus_(std::move(corpus)),
      seed_(seed),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

bool LoadHarness::hasLabels() const {
    return std::any_of(corpus_.begin(), corpus_.end(), [](const CorpusItem& i) { return i.expected.has_value(); });
}

LoadTestMetrics LoadHarness::run(int concurrency,
                                 std::chrono::milliseconds duration,
                                 std::chrono::milliseconds rampUp,
                                 double constantRate) {
    if (concurrency < 1) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "concurrency must be at least 1");
    }
    if (corpus_.empty()) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "no test data to send");
    }
    spdlog::info("Starting load test: concurrency={}, duration={}ms, ramp_up={}ms",
                 concurrency, duration.count(), rampUp.count());

    Recorder recorder;
    std::counting_semaphore<> gate(1);
    const auto start = Clock::now();
    const auto deadline = start + duration;
    const auto pause = constantRate > 0.0
        ? std::chrono::milliseconds(static_cast<long long>(1000.0 / constantRate))
        : std::chrono::milliseconds(0);

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(concurrency));
    for (int w = 0; w < concurrency; ++w) {
        workers.emplace_back([&, w] {
            std::mt19937 rng(seed_ + static_cast<unsigned>(w) * 7919u);
            std::uniform_int_distribution<size_t> pick(0, corpus_.size() - 1);
            while (gate.try_acquire_until(deadline)) {
                if (Clock::now() >= deadline) {
                    gate.release();
                    break;
                }
                const CorpusItem& item = corpus_[pick(rng)];
                ClassificationRequest request;
                request.text = item.text;
                request.num_examples = numExamples_;

                const auto sent = Clock::now();
                try {
                    auto result = classifier_.classify(request);
                    recorder.success(item, result,
                                     std::chrono::duration<double, std::milli>(Clock::now() - sent).count());
                } catch (const std::exception& e) {
                    spdlog::debug("Request failed: {}", e.what());
                    recorder.failure();
                }
                gate.release();

                if (pause.count() > 0 && Clock::now() < deadline) {
                    sleeper_(pause);
                }
            }
        });
    }

    // Grow the number of permits from 1 to concurrency across the ramp-up window.
    int permits = 1;
    if (rampUp.count() > 0) {
        while (permits < concurrency && Clock::now() < deadline) {
            const double fraction = std::chrono::duration<double>(Clock::now() - start) /
                                    std::chrono::duration<double>(rampUp);
            const int target = std::clamp(static_cast<int>(concurrency * fraction), 1, concurrency);
            if (target > permits) {
                gate.release(target - permits);
                permits = target;
            }
            std::this_thread::sleep_for(kRampStep);
        }
    }
    if (permits < concurrency) {
        gate.release(concurrency - permits);
    }

    for (auto& t : workers) {
        t.join();
    }
    const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();

    LoadTestMetrics metrics;
    metrics.concurrency = concurrency;
    metrics.duration_s = std::chrono::duration<double>(duration).count();
    metrics.ramp_up_s = std::chrono::duration<double>(rampUp).count();
    metrics.elapsed_s = elapsed;
    metrics.total_requests = recorder.total;
    metrics.successful_requests = recorder.succeeded;
    metrics.failed_requests = recorder.failed;
    metrics.degraded_requests = recorder.degraded;
    metrics.requests_per_second = elapsed > 0.0 ? static_cast<double>(recorder.total) / elapsed : 0.0;
    metrics.error_rate = recorder.total > 0
        ? static_cast<double>(recorder.failed) / static_cast<double>(recorder.total)
        : 0.0;

    std::sort(recorder.latencies.begin(), recorder.latencies.end());
    metrics.average_latency_ms = mean(recorder.latencies);
    metrics.p50_latency_ms = percentile(recorder.latencies, 50);
    metrics.p95_latency_ms = percentile(recorder.latencies, 95);
    metrics.p99_latency_ms = percentile(recorder.latencies, 99);
    metrics.avg_embedding_ms = mean(recorder.embedding);
    metrics.avg_retrieval_ms = mean(recorder.retrieval);
    metrics.avg_generation_ms = mean(recorder.generation);

    if (recorder.labeled > 0) {
        metrics.accuracy = 100.0 * static_cast<double>(recorder.correct) / static_cast<double>(recorder.labeled);
        for (auto& [label, bucket] : recorder.perCategory) {
            bucket.accuracy = bucket.total > 0
                ? 100.0 * static_cast<double>(bucket.correct) / static_cast<double>(bucket.total)
                : 0.0;
        }
        metrics.per_category_accuracy = std::move(recorder.perCategory);
    }

    spdlog::info("Load test finished: {} requests, {} successful, {} failed, {} degraded",
                 metrics.total_requests, metrics.successful_requests, metrics.failed_requests,
                 metrics.degraded_requests);
    spdlog::info("Average latency {:.2f}ms, p95 {:.2f}ms, throughput {:.2f} req/s",
                 metrics.average_latency_ms, metrics.p95_latency_ms, metrics.requests_per_second);
    if (metrics.accuracy) {
        spdlog::info("Overall accuracy: {:.2f}%", *metrics.accuracy);
    }
    return metrics;
}

std::vector<LoadTestMetrics> LoadHarness::runScaling(const std::vector<int>& levels,
                                                     std::chrono::milliseconds durationPerLevel,
                                                     std::chrono::milliseconds cooldown,
                                                     std::chrono::milliseconds rampUp,
                                                     double constantRate,
                                                     const LevelCallback& onLevel) {
    std::vector<LoadTestMetrics> results;
    results.reserve(levels.size());
    for (size_t i = 0; i < levels.size(); ++i) {
        spdlog::info("=== Testing concurrency level: {} ===", levels[i]);
        results.push_back(run(levels[i], durationPerLevel, rampUp, constantRate));
        if (onLevel) {
            onLevel(results);
        }
        if (i + 1 < levels.size() && cooldown.count() > 0) {
            spdlog::info("Cooling down for {}ms before next level", cooldown.count());
            sleeper_(cooldown);
        }
    }
    return results;
}

} // namespace moderag
