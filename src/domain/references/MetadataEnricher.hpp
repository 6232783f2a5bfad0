/**
 * @file MetadataEnricher.hpp
 * @brief Auxiliary identifier extraction and reference-type classification.
 */

#pragma once

#include <string>

#include "domain/references/ExtractedReference.hpp"

namespace citewalker::domain::references {

/**
 * @class MetadataEnricher
 * @brief Fills DOI, URL, ISBN, volume, issue, pages and type from the raw candidate text.
 *
 * Runs on every reference regardless of whether a citation grammar matched.
 * Each pattern is independent; a reference may gain any subset of fields.
 */
class MetadataEnricher {
public:
    /**
     * @brief Enriches the reference in place.
     * @param reference Record produced by the style matcher.
     * @param sourceText Candidate text the record came from.
     */
    void enrich(ExtractedReference& reference, const std::string& sourceText) const;

    /** @brief Keyword-priority classification: journal, conference, book, website, thesis. */
    static ReferenceType ClassifyType(const std::string& sourceText);
};

} // namespace citewalker::domain::references
