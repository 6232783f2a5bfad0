/**
 * @file TextExtractionArbiter.hpp
 * @brief Runs every extraction backend and keeps the best raw text.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "domain/TextExtractionBackend.hpp"
#include "domain/references/ExtractionSettings.hpp"
#include "domain/references/RawExtraction.hpp"

namespace citewalker::application {

/**
 * @class TextExtractionArbiter
 * @brief Strict maximum selection over backend results.
 *
 * Backends are invoked one after another. A backend that throws, reports
 * failure or returns blank text is logged and skipped. Ties go to the backend
 * earlier in priority order, where non-OCR backends precede OCR ones.
 */
class TextExtractionArbiter {
public:
    static constexpr float OcrPenalty = 0.8f;

    /**
     * @brief Outcome of one arbitration.
     */
    struct ArbitrationResult {
        domain::references::RawExtraction best;
        std::vector<domain::references::RawExtraction> attempts;  ///< One entry per backend, in call order.
    };

    TextExtractionArbiter(std::vector<std::shared_ptr<domain::TextExtractionBackend>> backends,
                          std::vector<std::string> qualityIndicators = domain::references::DefaultQualityIndicators());

    /**
     * @brief Extracts the document with every backend and selects the winner.
     * @throws domain::references::NoTextExtractedError if no backend produced usable text.
     */
    ArbitrationResult select(const std::string& documentPath,
                             std::function<void(std::string)> statusCallback = nullptr) const;

    /**
     * @brief Quality of a raw text: length, word density and academic vocabulary.
     * @return Value in [0,1]; 0 for empty text.
     */
    float scoreText(const std::string& text) const;

private:
    std::vector<std::shared_ptr<domain::TextExtractionBackend>> m_backends;  ///< Priority order.
    std::vector<std::string> m_indicators;                                   ///< Lower-cased.
};

} // namespace citewalker::application
