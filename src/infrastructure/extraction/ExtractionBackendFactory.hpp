/**
 * @file ExtractionBackendFactory.hpp
 * @brief Builds the ordered backend list from settings.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "domain/TextExtractionBackend.hpp"
#include "domain/references/ExtractionSettings.hpp"

namespace citewalker::infrastructure::extraction {

class ExtractionBackendFactory {
public:
    /**
     * @brief Creates one backend per known name in settings.extractionMethods.
     *
     * Unknown names are logged and skipped. "ocr" is skipped when OCR is disabled.
     */
    static std::vector<std::shared_ptr<domain::TextExtractionBackend>> Create(
        const domain::references::ExtractionSettings& settings,
        std::function<void(std::string)> statusCallback = nullptr);
};

} // namespace citewalker::infrastructure::extraction
