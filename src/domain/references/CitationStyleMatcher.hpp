/**
 * @file CitationStyleMatcher.hpp
 * @brief Ordered citation-grammar chain (APA, MLA, Chicago, IEEE).
 */

#pragma once

#include <functional>
#include <regex>
#include <string>
#include <vector>

#include "domain/references/ExtractedReference.hpp"
#include "domain/references/ReferenceCandidate.hpp"

namespace citewalker::domain::references {

/**
 * @struct StyleGrammar
 * @brief One pattern of one citation style plus the mapping of its capture groups.
 */
struct StyleGrammar {
    CitationStyle style;
    std::string form;       ///< "journal" or "book", for diagnostics.
    std::regex pattern;
    std::function<void(const std::smatch&, ExtractedReference&)> mapFields;
};

/**
 * @class CitationStyleMatcher
 * @brief Turns a candidate into an ExtractedReference using the first grammar that matches.
 *
 * Grammars are evaluated in fixed order: every APA pattern, then MLA, Chicago
 * and IEEE. There is no scoring across styles; the first hit wins.
 */
class CitationStyleMatcher {
public:
    static constexpr float MatchedConfidence = 0.8f;
    static constexpr float UnmatchedConfidence = 0.3f;
    static constexpr size_t MaxMatchLength = 2000;

    /**
     * @brief Parses one candidate.
     * @return A reference with style fields populated, or a minimal unknown-style record.
     */
    ExtractedReference match(const ReferenceCandidate& candidate) const;

    /** @brief The ordered grammar list. */
    static const std::vector<StyleGrammar>& Grammars();

    /**
     * @brief Splits an author capture into individual names on "&" and " and ".
     */
    static std::vector<std::string> SplitAuthors(const std::string& authorGroup);
};

} // namespace citewalker::domain::references
