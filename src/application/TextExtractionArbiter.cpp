/**
 * @file TextExtractionArbiter.cpp
 * @brief Implementation of TextExtractionArbiter.
 */

#include "application/TextExtractionArbiter.hpp"
#include "domain/references/ExtractionErrors.hpp"
#include "domain/references/TextNormalization.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace citewalker::application {

using domain::references::RawExtraction;

TextExtractionArbiter::TextExtractionArbiter(std::vector<std::shared_ptr<domain::TextExtractionBackend>> backends,
                                             std::vector<std::string> qualityIndicators)
    : m_backends(std::move(backends)) {
    m_backends.erase(std::remove(m_backends.begin(), m_backends.end(), nullptr), m_backends.end());
    std::stable_partition(m_backends.begin(), m_backends.end(),
                          [](const auto& backend) { return !backend->isOcr(); });

    for (const auto& indicator : qualityIndicators) {
        if (!indicator.empty()) m_indicators.push_back(domain::references::ToLower(indicator));
    }
}

float TextExtractionArbiter::scoreText(const std::string& text) const {
    if (text.empty()) return 0.0f;

    const double charCount = static_cast<double>(text.size());

    size_t words = 0;
    std::istringstream ss(text);
    std::string word;
    while (ss >> word) ++words;

    double indicatorRatio = 0.0;
    if (!m_indicators.empty()) {
        const std::string lowered = domain::references::ToLower(text);
        size_t present = 0;
        for (const auto& indicator : m_indicators) {
            if (lowered.find(indicator) != std::string::npos) ++present;
        }
        indicatorRatio = static_cast<double>(present) / static_cast<double>(m_indicators.size());
    }

    const double score = (charCount / 10000.0) * 0.3 +
                         (static_cast<double>(words) / 2000.0) * 0.3 +
                         indicatorRatio * 0.4;
    return static_cast<float>(std::min(1.0, score));
}

TextExtractionArbiter::ArbitrationResult TextExtractionArbiter::select(
    const std::string& documentPath,
    std::function<void(std::string)> statusCallback) const {
    ArbitrationResult result;
    const RawExtraction* best = nullptr;

    for (const auto& backend : m_backends) {
        if (statusCallback) statusCallback("Extracting text with " + backend->name() + "...");

        RawExtraction attempt;
        try {
            attempt = backend->extract(documentPath);
        } catch (const std::exception& e) {
            attempt = RawExtraction{};
            attempt.success = false;
            attempt.error = e.what();
        }
        attempt.method = backend->name();
        attempt.isOcr = backend->isOcr();

        if (attempt.success && domain::references::Trim(attempt.text).empty()) {
            attempt.success = false;
            attempt.error = "Backend returned no text.";
        }

        if (!attempt.success) {
            std::cerr << "[Arbiter] " << attempt.method << " failed for " << documentPath << ": "
                      << attempt.error.value_or("unknown error") << std::endl;
            attempt.qualityScore = 0.0f;
            result.attempts.push_back(std::move(attempt));
            continue;
        }

        attempt.qualityScore = scoreText(attempt.text);
        if (attempt.isOcr) attempt.qualityScore *= OcrPenalty;
        std::cout << "[Arbiter] " << attempt.method << " quality: " << attempt.qualityScore << std::endl;

        result.attempts.push_back(std::move(attempt));
    }

    for (const auto& attempt : result.attempts) {
        if (!attempt.success) continue;
        if (!best || attempt.qualityScore > best->qualityScore) {
            best = &attempt;
        }
    }

    if (!best) {
        throw domain::references::NoTextExtractedError("No text could be extracted from: " + documentPath);
    }

    result.best = *best;
    return result;
}

} // namespace citewalker::application
