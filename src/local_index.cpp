#include "moderag/local_index.hpp"
#include "moderag/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include <spdlog/spdlog.h>

namespace moderag {

namespace {

template <typename T>
void writePod(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
void readPod(std::ifstream& in, T& value, const std::filesystem::path& path) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) {
        throw ModerationError(ErrorKind::IO, path.string() + ": truncated header");
    }
}

float dot(const float* a, const float* b, size_t n) {
    float acc = 0.0f;
    for (size_t i = 0; i < n; ++i) acc += a[i] * b[i];
    return acc;
}

} // namespace

FlatIndex::FlatIndex(size_t dimension, MetricType metric)
    : dimension_(dimension), metric_(metric) {
    if (dimension == 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "index dimension must be positive");
    }
}

void FlatIndex::add(const std::vector<float>& vector) {
    if (vector.size() != dimension_) {
        throw ModerationError(ErrorKind::DIMENSION_MISMATCH,
                              "vector has dimension " + std::to_string(vector.size()) +
                              ", index expects " + std::to_string(dimension_));
    }
    if (!std::all_of(vector.begin(), vector.end(), [](float v) { return std::isfinite(v); })) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "vector holds a non-finite value");
    }
    data_.insert(data_.end(), vector.begin(), vector.end());
    ++count_;
}

float FlatIndex::distance(const float* a, const float* b) const {
    switch (metric_) {
        case MetricType::EUCLIDEAN: {
            float acc = 0.0f;
            for (size_t i = 0; i < dimension_; ++i) {
                const float d = a[i] - b[i];
                acc += d * d;
            }
            return acc;
        }
        case MetricType::COSINE: {
            const float na = std::sqrt(dot(a, a, dimension_));
            const float nb = std::sqrt(dot(b, b, dimension_));
            if (na == 0.0f || nb == 0.0f) return 1.0f;
            return 1.0f - dot(a, b, dimension_) / (na * nb);
        }
        case MetricType::DOT_PRODUCT:
            return -dot(a, b, dimension_);
    }
    return 0.0f;
}

std::vector<std::pair<size_t, float>> FlatIndex::search(const std::vector<float>& query, int k) const {
    if (k <= 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "k must be positive, got " + std::to_string(k));
    }
    if (count_ == 0) {
        throw ModerationError(ErrorKind::INDEX_EMPTY, "index holds no vectors");
    }
    if (query.size() != dimension_) {
        throw ModerationError(ErrorKind::DIMENSION_MISMATCH,
                              "query has dimension " + std::to_string(query.size()) +
                              ", index expects " + std::to_string(dimension_));
    }
    for (float v : query) {
        if (!std::isfinite(v)) {
            throw ModerationError(ErrorKind::INVALID_ARGUMENT, "query vector holds a non-finite value");
        }
    }

    std::vector<std::pair<size_t, float>> scored;
    scored.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        scored.emplace_back(i, distance(query.data(), row(i)));
    }

    const size_t n = std::min(count_, static_cast<size_t>(k));
    std::partial_sort(scored.begin(), scored.begin() + n, scored.end(),
                      [](const auto& a, const auto& b) {
                          if (a.second != b.second) return a.second < b.second;
                          return a.first < b.first;
                      });
    scored.resize(n);
    return scored;
}

void FlatIndex::save(const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ModerationError(ErrorKind::IO, "cannot open " + path.string() + " for writing");
    }
    writePod(out, kMagic);
    writePod(out, kVersion);
    writePod(out, static_cast<uint32_t>(metric_));
    writePod(out, static_cast<uint32_t>(dimension_));
    writePod(out, static_cast<uint64_t>(count_));
    out.write(reinterpret_cast<const char*>(data_.data()),
              static_cast<std::streamsize>(data_.size() * sizeof(float)));
    if (!out) {
        throw ModerationError(ErrorKind::IO, "write to " + path.string() + " failed");
    }
}

FlatIndex FlatIndex::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ModerationError(ErrorKind::IO, "cannot open " + path.string());
    }

    uint32_t magic = 0, version = 0, metric = 0, dimension = 0;
    uint64_t count = 0;
    readPod(in, magic, path);
    if (magic != kMagic) {
        throw ModerationError(ErrorKind::IO, path.string() + ": not a flat index file");
    }
    readPod(in, version, path);
    if (version != kVersion) {
        throw ModerationError(ErrorKind::IO, path.string() + ": unsupported version " + std::to_string(version));
    }
    readPod(in, metric, path);
    readPod(in, dimension, path);
    readPod(in, count, path);
    if (metric > static_cast<uint32_t>(MetricType::DOT_PRODUCT)) {
        throw ModerationError(ErrorKind::IO, path.string() + ": unknown metric " + std::to_string(metric));
    }

    if (dimension == 0) {
        throw ModerationError(ErrorKind::IO, path.string() + ": zero dimension in header");
    }

    // The header count must agree with the payload before anything is allocated.
    std::error_code ec;
    const uintmax_t fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        throw ModerationError(ErrorKind::IO, "cannot stat " + path.string() + ": " + ec.message());
    }
    const uintmax_t headerBytes = static_cast<uintmax_t>(in.tellg());
    const uintmax_t payload = fileSize > headerBytes ? fileSize - headerBytes : 0;
    const uintmax_t rowBytes = static_cast<uintmax_t>(dimension) * sizeof(float);
    if (count > payload / rowBytes) {
        throw ModerationError(ErrorKind::IO,
                              path.string() + ": truncated vector data (header claims " +
                              std::to_string(count) + " vectors)");
    }
    if (count * rowBytes != payload) {
        throw ModerationError(ErrorKind::IO, path.string() + ": trailing bytes after vector data");
    }

    FlatIndex index(dimension, static_cast<MetricType>(metric));
    index.data_.resize(static_cast<size_t>(count) * dimension);
    in.read(reinterpret_cast<char*>(index.data_.data()),
            static_cast<std::streamsize>(index.data_.size() * sizeof(float)));
    if (!in) {
        throw ModerationError(ErrorKind::IO, path.string() + ": truncated vector data");
    }
    index.count_ = static_cast<size_t>(count);
    return index;
}

LocalVectorIndex::LocalVectorIndex(FlatIndex flat, ExampleStore store)
    : flat_(std::move(flat)), store_(std::move(store)) {}

std::shared_ptr<LocalVectorIndex> LocalVectorIndex::build(ExampleStore store,
                                                          const std::vector<std::vector<float>>& vectors,
                                                          MetricType metric) {
    if (store.size() != vectors.size()) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT,
                              std::to_string(store.size()) + " examples but " +
                              std::to_string(vectors.size()) + " vectors");
    }
    if (vectors.empty()) {
        throw ModerationError(ErrorKind::INDEX_EMPTY, "cannot build an index from zero examples");
    }

    FlatIndex flat(vectors.front().size(), metric);
    for (const auto& v : vectors) {
        flat.add(v);
    }
    spdlog::info("Built {} index with {} vectors of dimension {}",
                 toString(metric), flat.size(), flat.dimension());
    return std::shared_ptr<LocalVectorIndex>(new LocalVectorIndex(std::move(flat), std::move(store)));
}

std::shared_ptr<LocalVectorIndex> LocalVectorIndex::load(const std::filesystem::path& dir) {
    FlatIndex flat = FlatIndex::load(dir / kIndexFile);
    ExampleStore store = ExampleStore::loadJsonl(dir / kMetadataFile);
    if (flat.size() != store.size()) {
        throw ModerationError(ErrorKind::IO,
                              dir.string() + ": " + std::to_string(flat.size()) + " vectors but " +
                              std::to_string(store.size()) + " metadata rows");
    }
    spdlog::info("Loaded index from {} ({} vectors, dimension {}, {})",
                 dir.string(), flat.size(), flat.dimension(), toString(flat.metric()));
    return std::shared_ptr<LocalVectorIndex>(new LocalVectorIndex(std::move(flat), std::move(store)));
}

void LocalVectorIndex::save(const std::filesystem::path& dir) const {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ModerationError(ErrorKind::IO, "cannot create " + dir.string() + ": " + ec.message());
    }
    flat_.save(dir / kIndexFile);
    store_.saveJsonl(dir / kMetadataFile);
    spdlog::info("Saved index with {} vectors to {}", flat_.size(), dir.string());
}

std::vector<RetrievedExample> LocalVectorIndex::search(const std::vector<float>& query,
                                                       int k,
                                                       CallStats* /*stats*/) const {
    auto hits = flat_.search(query, k);
    std::vector<RetrievedExample> results;
    results.reserve(hits.size());
    for (const auto& [row, distance] : hits) {
        const Example& example = store_.at(row);
        results.push_back(RetrievedExample{example.text, example.category, distance});
    }
    return results;
}

std::string LocalVectorIndex::describe() const {
    return std::string("local flat ") + toString(flat_.metric()) + " index (" +
           std::to_string(flat_.size()) + " x " + std::to_string(flat_.dimension()) + ")";
}

} // namespace moderag
