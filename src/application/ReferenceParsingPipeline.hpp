/**
 * @file ReferenceParsingPipeline.hpp
 * @brief Raw text to scored reference list.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/references/CitationStyleMatcher.hpp"
#include "domain/references/CompletenessScorer.hpp"
#include "domain/references/ExtractedReference.hpp"
#include "domain/references/MetadataEnricher.hpp"
#include "domain/references/ReferenceDeduplicator.hpp"
#include "domain/references/ReferenceSegmenter.hpp"

namespace citewalker::application {

/**
 * @class ReferenceParsingPipeline
 * @brief Segment, match, enrich, deduplicate and score.
 *
 * Synchronous and stateless between calls, so one instance can serve several
 * documents concurrently.
 */
class ReferenceParsingPipeline {
public:
    explicit ReferenceParsingPipeline(size_t minReferenceLength = domain::references::ReferenceSegmenter::DefaultMinReferenceLength);

    /**
     * @brief Full pipeline entry point.
     * @param rawText Text selected by the arbiter (or supplied directly).
     * @return Deduplicated references with completeness scores, unfiltered.
     * @throws domain::references::MalformedInputError for empty or blank text.
     */
    std::vector<domain::references::ExtractedReference> extractReferences(const std::string& rawText) const;

    /** @brief Keeps references whose confidence is at least the threshold. */
    static std::vector<domain::references::ExtractedReference> FilterByConfidence(
        const std::vector<domain::references::ExtractedReference>& references, float threshold);

private:
    domain::references::ReferenceSegmenter m_segmenter;
    domain::references::CitationStyleMatcher m_matcher;
    domain::references::MetadataEnricher m_enricher;
    domain::references::ReferenceDeduplicator m_deduplicator;
    domain::references::CompletenessScorer m_scorer;
};

} // namespace citewalker::application
