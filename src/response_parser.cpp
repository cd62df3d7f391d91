#include "moderag/response_parser.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <spdlog/spdlog.h>

namespace moderag {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

size_t priorityOf(Category category) {
    const auto& all = CategoryTaxonomy::all();
    return static_cast<size_t>(std::find(all.begin(), all.end(), category) - all.begin());
}

} // namespace

const char* toString(TieBreak tieBreak) {
    switch (tieBreak) {
        case TieBreak::FIRST_MENTION: return "first_mention";
        case TieBreak::TAXONOMY_PRIORITY: return "taxonomy_priority";
    }
    return "first_mention";
}

std::optional<TieBreak> parseTieBreak(const std::string& name) {
    const std::string u = upper(name);
    if (u == "FIRST_MENTION") return TieBreak::FIRST_MENTION;
    if (u == "TAXONOMY_PRIORITY") return TieBreak::TAXONOMY_PRIORITY;
    return std::nullopt;
}

ResponseParser::ResponseParser(ParserSettings settings)
    : settings_(settings),
      // Every repetition is bounded: std::regex recursion grows with match length.
      category_(R"(category\s{0,8}\*{0,4}\s{0,8}:[ \t*\["']{0,16}(\w{1,64}))",
                std::regex::ECMAScript | std::regex::icase),
      confidence_(R"(confidence\s{0,8}\*{0,4}\s{0,8}:[ \t*\["']{0,16}(high|medium|low)\b)",
                  std::regex::ECMAScript | std::regex::icase),
      explanation_(R"(explanation\s{0,8}\*{0,4}\s{0,8}:\s{0,8}\*{0,4}[ \t]{0,16})",
                   std::regex::ECMAScript | std::regex::icase) {}

ParsedResponse ResponseParser::parse(const std::string& raw) const {
    ParsedResponse out;
    out.category = CategoryTaxonomy::fallback();
    out.confidence = kLowConfidence;
    out.confidence_label = "LOW";
    out.outcome = ParseOutcome::PARSE_FAILED;

    const std::string text = raw.size() > kMaxParseBytes ? raw.substr(0, kMaxParseBytes) : raw;
    try {
        parseFields(text, out);
    } catch (const std::regex_error& e) {
        spdlog::warn("Response parsing aborted ({}), using '{}'", e.what(), toString(out.category));
        out.category = CategoryTaxonomy::fallback();
        out.outcome = ParseOutcome::PARSE_FAILED;
        return out;
    }

    switch (out.outcome) {
        case ParseOutcome::OK:
            break;
        case ParseOutcome::FALLBACK:
            spdlog::warn("Generated category '{}' is not a known category, falling back to '{}'",
                         out.raw_category.value_or(""), toString(out.category));
            break;
        case ParseOutcome::PARSE_FAILED:
            spdlog::warn("No category field in generated text, falling back to '{}'",
                         toString(out.category));
            break;
    }

    if (settings_.confidence_threshold > 0.0 && !CategoryTaxonomy::isClean(out.category) &&
        out.confidence < settings_.confidence_threshold) {
        spdlog::info("Downgrading '{}' to '{}': confidence {:.2f} below threshold {:.2f}",
                     toString(out.category), toString(CategoryTaxonomy::fallback()),
                     out.confidence, settings_.confidence_threshold);
        out.category = CategoryTaxonomy::fallback();
        out.downgraded = true;
    }
    return out;
}

void ResponseParser::parseFields(const std::string& text, ParsedResponse& out) const {
    std::optional<Category> chosen;
    size_t chosenPriority = std::numeric_limits<size_t>::max();

    for (auto it = std::sregex_iterator(text.begin(), text.end(), category_); it != std::sregex_iterator(); ++it) {
        const std::string token = (*it)[1].str();
        if (!out.raw_category) {
            out.raw_category = token;
        }
        auto member = CategoryTaxonomy::lookup(token);
        if (!member) {
            continue;
        }
        if (settings_.tie_break == TieBreak::FIRST_MENTION) {
            chosen = member;
            out.raw_category = token;
            break;
        }
        if (priorityOf(*member) < chosenPriority) {
            chosen = member;
            chosenPriority = priorityOf(*member);
            out.raw_category = token;
        }
    }

    if (chosen) {
        out.category = *chosen;
        out.outcome = ParseOutcome::OK;
    } else if (out.raw_category) {
        out.outcome = ParseOutcome::FALLBACK;
    }

    std::smatch m;
    if (std::regex_search(text, m, confidence_)) {
        out.confidence_label = upper(m[1].str());
        if (out.confidence_label == "HIGH") out.confidence = kHighConfidence;
        else if (out.confidence_label == "MEDIUM") out.confidence = kMediumConfidence;
        else out.confidence = kLowConfidence;
    }

    if (std::regex_search(text, m, explanation_)) {
        const size_t start = static_cast<size_t>(m.position(0) + m.length(0));
        const size_t end = text.find('\n', start);
        std::string explanation = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        const size_t first = explanation.find_first_not_of(" \t");
        explanation.erase(0, first == std::string::npos ? explanation.size() : first);
        while (!explanation.empty() && std::isspace(static_cast<unsigned char>(explanation.back()))) {
            explanation.pop_back();
        }
        out.explanation = std::move(explanation);
    }
}

} // namespace moderag
