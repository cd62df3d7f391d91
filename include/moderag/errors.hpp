#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace moderag {

enum class ErrorKind {
    UNREACHABLE,
    REJECTED,
    MALFORMED_RESPONSE,
    INDEX_EMPTY,
    DIMENSION_MISMATCH,
    INVALID_ARGUMENT,
    IO
};

enum class Stage {
    EMBED_QUERY,
    RETRIEVE,
    ASSEMBLE_PROMPT,
    GENERATE,
    PARSE_AND_VALIDATE
};

const char* toString(ErrorKind kind);
const char* toString(Stage stage);
std::optional<ErrorKind> parseErrorKind(const std::string& name);
std::optional<Stage> parseStage(const std::string& name);

struct ModerationError : public std::runtime_error {
    ErrorKind kind;
    int status_code;
    int attempts;

    ModerationError(ErrorKind k, const std::string& msg, int code = 0, int tries = 0)
        : std::runtime_error(msg), kind(k), status_code(code), attempts(tries) {}

    // Connection failures, timeouts and 5xx answers all land in UNREACHABLE.
    bool retryable() const { return kind == ErrorKind::UNREACHABLE; }
};

struct StageTiming {
    Stage stage = Stage::EMBED_QUERY;
    double latency_ms = 0.0;
    int attempts = 0;
};

struct ClassificationError : public ModerationError {
    Stage stage;
    std::vector<StageTiming> timings;

    ClassificationError(Stage s, const ModerationError& cause, std::vector<StageTiming> t = {})
        : ModerationError(cause.kind,
                          std::string(toString(s)) + ": " + cause.what(),
                          cause.status_code,
                          cause.attempts),
          stage(s),
          timings(std::move(t)) {}
};

} // namespace moderag
