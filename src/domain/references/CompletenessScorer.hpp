/**
 * @file CompletenessScorer.hpp
 * @brief Final cleanup and completeness-based confidence scoring.
 */

#pragma once

#include <vector>

#include "domain/references/ExtractedReference.hpp"

namespace citewalker::domain::references {

/**
 * @class CompletenessScorer
 * @brief Cleans text fields, validates the year and overwrites confidenceScore.
 *
 * score = 0.3*[authors] + 0.3*[title] + 0.2*[year] + 0.2*[venue]
 *       + 0.2*(filled optional fields / 5), clamped to [0,1].
 * The style-match confidence stays available in matchConfidence.
 */
class CompletenessScorer {
public:
    /** @brief Cleans, validates and scores one reference in place. */
    void finalize(ExtractedReference& reference) const;

    /** @brief Applies finalize() to every reference. */
    void finalizeAll(std::vector<ExtractedReference>& references) const;

    /** @brief Pure completeness score of the current field values. */
    static float Score(const ExtractedReference& reference);
};

} // namespace citewalker::domain::references
