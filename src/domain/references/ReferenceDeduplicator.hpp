/**
 * @file ReferenceDeduplicator.hpp
 * @brief Near-duplicate collapsing over the combined candidate list.
 */

#pragma once

#include <vector>

#include "domain/references/ExtractedReference.hpp"

namespace citewalker::domain::references {

/**
 * @class ReferenceDeduplicator
 * @brief Order-sensitive pairwise merge keeping the higher-confidence entry.
 *
 * Each incoming reference is compared with every accepted one. On a match the
 * incoming entry replaces the accepted one only if its confidence is strictly
 * higher; otherwise it is dropped. A replacement is re-checked against the
 * other accepted entries, so no two survivors are similar and a second pass
 * returns the same list. Entries are never merged field by field.
 */
class ReferenceDeduplicator {
public:
    static constexpr double TitleThreshold = 0.8;
    static constexpr double FullTextThreshold = 0.9;

    std::vector<ExtractedReference> deduplicate(const std::vector<ExtractedReference>& references) const;

    /**
     * @brief Title Jaccard above TitleThreshold when both titles exist,
     * otherwise full-text Jaccard above FullTextThreshold.
     */
    static bool AreSimilar(const ExtractedReference& a, const ExtractedReference& b);
};

} // namespace citewalker::domain::references
