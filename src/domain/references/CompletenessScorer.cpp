/**
 * @file CompletenessScorer.cpp
 * @brief Implementation of CompletenessScorer.
 */

#include "domain/references/CompletenessScorer.hpp"
#include "domain/references/TextNormalization.hpp"

#include <algorithm>
#include <array>

namespace citewalker::domain::references {

float CompletenessScorer::Score(const ExtractedReference& reference) {
    float score = 0.0f;

    if (!reference.authors.empty()) score += 0.3f;
    if (!reference.title.empty()) score += 0.3f;
    if (reference.year.has_value()) score += 0.2f;
    if (!reference.venue.empty()) score += 0.2f;

    const std::array<const std::string*, 5> optionalFields = {
        &reference.doi, &reference.url, &reference.volume, &reference.issue, &reference.pages
    };
    int filled = 0;
    for (const auto* field : optionalFields) {
        if (!field->empty()) ++filled;
    }
    score += 0.2f * (static_cast<float>(filled) / static_cast<float>(optionalFields.size()));

    return std::clamp(score, 0.0f, 1.0f);
}

void CompletenessScorer::finalize(ExtractedReference& reference) const {
    reference.fullText = CleanReferenceText(reference.fullText);
    reference.title = CleanReferenceText(reference.title);
    reference.venue = CleanReferenceText(reference.venue);

    if (reference.year &&
        (*reference.year < ExtractedReference::MinValidYear || *reference.year > ExtractedReference::MaxValidYear)) {
        reference.year.reset();
        reference.appendNote("Invalid year detected.");
    }

    reference.confidenceScore = Score(reference);
}

void CompletenessScorer::finalizeAll(std::vector<ExtractedReference>& references) const {
    for (auto& reference : references) {
        finalize(reference);
    }
}

} // namespace citewalker::domain::references
