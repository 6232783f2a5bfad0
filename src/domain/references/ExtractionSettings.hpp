/**
 * @file ExtractionSettings.hpp
 * @brief Tunables of the reference extraction pipeline.
 */

#pragma once

#include <string>
#include <vector>

namespace citewalker::domain::references {

/** @brief Built-in vocabulary of academic-document markers used to rate raw text. */
inline std::vector<std::string> DefaultQualityIndicators() {
    return {
        "abstract", "introduction", "methodology", "results", "conclusion",
        "references", "bibliography", "doi:", "http://", "https://",
        "journal", "conference", "proceedings", "volume", "issue"
    };
}

/**
 * @struct ExtractionSettings
 * @brief Values read from settings.json; every field has a usable default.
 */
struct ExtractionSettings {
    float minConfidenceThreshold = 0.3f;    ///< Applied by callers before export.
    size_t minReferenceLength = 20;         ///< Shorter candidates are dropped at segmentation.
    double maxFileSizeMb = 50.0;
    std::vector<std::string> extractionMethods = {"pdftotext", "pdftotext-raw", "ocr", "text"};
    bool enableOcr = true;
    std::string ocrLanguage = "eng";
    std::vector<std::string> outputFormats = {"json", "csv", "txt", "md"};
    std::vector<std::string> qualityIndicators = DefaultQualityIndicators();
    size_t maxParallelDocuments = 1;        ///< 1 keeps batch processing sequential.
};

} // namespace citewalker::domain::references
