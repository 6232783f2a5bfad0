/**
 * @file ReferenceCandidate.hpp
 * @brief Transient text span believed to hold one reference.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/references/ExtractedReference.hpp"

namespace citewalker::domain::references {

/**
 * @struct ReferenceCandidate
 * @brief Produced by the segmenter, consumed by the style matcher.
 */
struct ReferenceCandidate {
    std::string text;                   ///< Span handed to the grammars (keeps the [n] marker).
    std::optional<int> sequenceNumber;
    SegmentationStrategy provenance = SegmentationStrategy::LineBased;
};

} // namespace citewalker::domain::references
