#pragma once

#include <regex>
#include <string>

#include "moderag/models.hpp"

namespace moderag {

enum class TieBreak {
    // The first taxonomy member named in a "Category:" field wins.
    FIRST_MENTION,
    // The named member that comes first in CategoryTaxonomy::all() wins.
    TAXONOMY_PRIORITY
};

struct ParserSettings {
    // Non-clean labels under this confidence are downgraded to clean. 0 disables.
    double confidence_threshold = 0.0;
    TieBreak tie_break = TieBreak::FIRST_MENTION;
};

const char* toString(TieBreak tieBreak);
std::optional<TieBreak> parseTieBreak(const std::string& name);

// Maps any generated text to a taxonomy member plus an outcome tag:
//   OK           a "Category:" field named a taxonomy member
//   FALLBACK     a "Category:" field was found but named no member
//   PARSE_FAILED no "Category:" field at all
// parse() never throws and is deterministic for a given input.
class ResponseParser {
public:
    static constexpr double kHighConfidence = 0.9;
    static constexpr double kMediumConfidence = 0.6;
    static constexpr double kLowConfidence = 0.3;
    // Only this prefix of the generated text is inspected.
    static constexpr size_t kMaxParseBytes = 16384;

    explicit ResponseParser(ParserSettings settings = ParserSettings());

    ParsedResponse parse(const std::string& raw) const;

    const ParserSettings& settings() const { return settings_; }

private:
    ParserSettings settings_;
    std::regex category_;
    std::regex confidence_;
    std::regex explanation_;

    void parseFields(const std::string& text, ParsedResponse& out) const;
};

} // namespace moderag
