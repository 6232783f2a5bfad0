/**
 * @file ReferenceSegmenter.hpp
 * @brief Splits raw document text into candidate reference strings.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/references/ReferenceCandidate.hpp"

namespace citewalker::domain::references {

/**
 * @class ReferenceSegmenter
 * @brief Locates the bibliography region and cuts it into candidates.
 *
 * Two passes run on every document: a region pass (bracket-numbered split, or
 * line-based split with continuation lines) and a global pass that picks up
 * every "[n] text" entry in the whole document. The passes overlap on purpose;
 * the deduplicator collapses the resulting duplicates.
 */
class ReferenceSegmenter {
public:
    static constexpr size_t DefaultMinReferenceLength = 20;

    explicit ReferenceSegmenter(size_t minReferenceLength = DefaultMinReferenceLength);

    /**
     * @brief Runs both passes and drops candidates shorter than the minimum length.
     * @param text Full document text.
     * @return Region candidates followed by global-pass candidates.
     */
    std::vector<ReferenceCandidate> segment(const std::string& text) const;

    /**
     * @brief Finds the text between a bibliography header and the next trailing section.
     * @return std::nullopt when no bibliography header exists.
     */
    std::optional<std::string> findReferenceSection(const std::string& text) const;

    /**
     * @brief Splits a bibliography region with the bracket or line-based strategy.
     * Short candidates are not filtered here.
     */
    std::vector<ReferenceCandidate> splitRegion(const std::string& region) const;

    /**
     * @brief Whole-document scan for "[n] text" up to the next marker or blank line.
     * Short candidates are not filtered here.
     */
    std::vector<ReferenceCandidate> findNumberedReferences(const std::string& text) const;

    /** @brief True if the (trimmed) line opens a new reference entry. */
    static bool IsReferenceStart(const std::string& line);

    size_t getMinReferenceLength() const { return m_minReferenceLength; }

private:
    size_t m_minReferenceLength;

    std::vector<ReferenceCandidate> splitOnBrackets(const std::string& region) const;
    std::vector<ReferenceCandidate> splitOnLines(const std::string& region) const;
    bool isLongEnough(const ReferenceCandidate& candidate) const;
};

} // namespace citewalker::domain::references
