#include "moderag/errors.hpp"

namespace moderag {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNREACHABLE: return "upstream_unreachable";
        case ErrorKind::REJECTED: return "upstream_rejected";
        case ErrorKind::MALFORMED_RESPONSE: return "malformed_upstream_response";
        case ErrorKind::INDEX_EMPTY: return "index_empty";
        case ErrorKind::DIMENSION_MISMATCH: return "dimension_mismatch";
        case ErrorKind::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorKind::IO: return "io";
    }
    return "unknown";
}

const char* toString(Stage stage) {
    switch (stage) {
        case Stage::EMBED_QUERY: return "embed_query";
        case Stage::RETRIEVE: return "retrieve";
        case Stage::ASSEMBLE_PROMPT: return "assemble_prompt";
        case Stage::GENERATE: return "generate";
        case Stage::PARSE_AND_VALIDATE: return "parse_and_validate";
    }
    return "unknown";
}

std::optional<ErrorKind> parseErrorKind(const std::string& name) {
    for (ErrorKind kind : {ErrorKind::UNREACHABLE, ErrorKind::REJECTED, ErrorKind::MALFORMED_RESPONSE,
                           ErrorKind::INDEX_EMPTY, ErrorKind::DIMENSION_MISMATCH, ErrorKind::INVALID_ARGUMENT,
                           ErrorKind::IO}) {
        if (name == toString(kind)) return kind;
    }
    return std::nullopt;
}

std::optional<Stage> parseStage(const std::string& name) {
    for (Stage stage : {Stage::EMBED_QUERY, Stage::RETRIEVE, Stage::ASSEMBLE_PROMPT, Stage::GENERATE,
                        Stage::PARSE_AND_VALIDATE}) {
        if (name == toString(stage)) return stage;
    }
    return std::nullopt;
}

} // namespace moderag
