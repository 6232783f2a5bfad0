/**
 * @file ReferenceParsingPipeline.cpp
 * @brief Implementation of ReferenceParsingPipeline.
 */

#include "application/ReferenceParsingPipeline.hpp"
#include "domain/references/ExtractionErrors.hpp"
#include "domain/references/TextNormalization.hpp"

namespace citewalker::application {

using namespace citewalker::domain::references;

ReferenceParsingPipeline::ReferenceParsingPipeline(size_t minReferenceLength)
    : m_segmenter(minReferenceLength) {}

std::vector<ExtractedReference> ReferenceParsingPipeline::extractReferences(const std::string& rawText) const {
    if (Trim(rawText).empty()) {
        throw MalformedInputError("Raw text is empty or whitespace only.");
    }

    const auto candidates = m_segmenter.segment(rawText);

    std::vector<ExtractedReference> parsed;
    parsed.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        ExtractedReference reference = m_matcher.match(candidate);
        m_enricher.enrich(reference, candidate.text);
        parsed.push_back(std::move(reference));
    }

    auto references = m_deduplicator.deduplicate(parsed);
    m_scorer.finalizeAll(references);
    return references;
}

std::vector<ExtractedReference> ReferenceParsingPipeline::FilterByConfidence(
    const std::vector<ExtractedReference>& references, float threshold) {
    std::vector<ExtractedReference> filtered;
    for (const auto& reference : references) {
        if (reference.confidenceScore >= threshold) {
            filtered.push_back(reference);
        }
    }
    return filtered;
}

} // namespace citewalker::application
