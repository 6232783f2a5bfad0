/**
 * @file ExtractedReference.hpp
 * @brief Domain entity for a single structured bibliographic reference.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace citewalker::domain::references {

/**
 * @enum ReferenceType
 * @brief Broad category of the cited work.
 */
enum class ReferenceType {
    Journal,
    Conference,
    Book,
    Website,
    Thesis,
    Unknown
};

/**
 * @enum CitationStyle
 * @brief Citation grammar that recognized the reference.
 */
enum class CitationStyle {
    Apa,
    Mla,
    Chicago,
    Ieee,
    Unknown
};

/**
 * @enum SegmentationStrategy
 * @brief Which segmentation pass produced a candidate.
 */
enum class SegmentationStrategy {
    BracketNumbered,    ///< Region split on [n] markers.
    LineBased,          ///< Region split on reference-start lines.
    GlobalNumbered      ///< Whole-document [n] scan.
};

inline std::string ReferenceTypeToString(ReferenceType type) {
    switch (type) {
        case ReferenceType::Journal: return "journal";
        case ReferenceType::Conference: return "conference";
        case ReferenceType::Book: return "book";
        case ReferenceType::Website: return "website";
        case ReferenceType::Thesis: return "thesis";
        default: return "unknown";
    }
}

inline std::string CitationStyleToString(CitationStyle style) {
    switch (style) {
        case CitationStyle::Apa: return "apa";
        case CitationStyle::Mla: return "mla";
        case CitationStyle::Chicago: return "chicago";
        case CitationStyle::Ieee: return "ieee";
        default: return "unknown";
    }
}

inline std::string StrategyToString(SegmentationStrategy strategy) {
    switch (strategy) {
        case SegmentationStrategy::BracketNumbered: return "bracket_numbered";
        case SegmentationStrategy::LineBased: return "line_based";
        case SegmentationStrategy::GlobalNumbered: return "global_numbered";
        default: return "unknown";
    }
}

/**
 * @struct ExtractedReference
 * @brief Output unit of the extraction pipeline.
 *
 * Created by the style matcher, mutated in place by the metadata enricher and
 * the completeness scorer, then handed to the caller for filtering and export.
 */
struct ExtractedReference {
    static constexpr int MinValidYear = 1900;
    static constexpr int MaxValidYear = 2030;

    std::optional<int> sequenceNumber;  ///< Bracket number or positional index.
    std::string fullText;               ///< Cleaned candidate text.
    std::vector<std::string> authors;
    std::string title;
    std::optional<int> year;            ///< Only within [MinValidYear, MaxValidYear] once scored.
    std::string venue;                  ///< Journal, conference or publisher.
    std::string volume;
    std::string issue;
    std::string pages;
    std::string doi;
    std::string url;
    std::string isbn;
    ReferenceType referenceType = ReferenceType::Unknown;
    CitationStyle citationStyle = CitationStyle::Unknown;
    float confidenceScore = 0.0f;       ///< Final completeness score in [0,1].
    float matchConfidence = 0.0f;       ///< Style-match signal, kept for diagnostics.
    SegmentationStrategy provenance = SegmentationStrategy::LineBased;
    std::string notes;

    void appendNote(const std::string& note) {
        if (!notes.empty() && notes.back() != ' ') notes += ' ';
        notes += note;
    }
};

} // namespace citewalker::domain::references
