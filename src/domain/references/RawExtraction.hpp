/**
 * @file RawExtraction.hpp
 * @brief Result of one text-extraction backend run over a document.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace citewalker::domain::references {

/**
 * @struct PageText
 * @brief Text of a single page as reported by the backend.
 */
struct PageText {
    int pageNumber = 0;
    std::string text;
    size_t charCount = 0;
};

/**
 * @struct RawExtraction
 * @brief Backend output plus the quality score assigned by the arbiter.
 */
struct RawExtraction {
    std::string method;                 ///< Backend name ("pdftotext", "ocr", ...).
    std::string text;
    std::vector<PageText> pages;
    bool success = false;
    bool isOcr = false;
    std::optional<std::string> error;
    float qualityScore = 0.0f;
};

} // namespace citewalker::domain::references
