/**
 * @file ExtractionBackendFactory.cpp
 * @brief Implementation of ExtractionBackendFactory.
 */

#include "infrastructure/extraction/ExtractionBackendFactory.hpp"
#include "infrastructure/extraction/OcrBackend.hpp"
#include "infrastructure/extraction/PdfToTextBackend.hpp"
#include "infrastructure/extraction/PlainTextBackend.hpp"

#include <iostream>

namespace citewalker::infrastructure::extraction {

std::vector<std::shared_ptr<domain::TextExtractionBackend>> ExtractionBackendFactory::Create(
    const domain::references::ExtractionSettings& settings,
    std::function<void(std::string)> statusCallback) {

    std::vector<std::shared_ptr<domain::TextExtractionBackend>> backends;
    for (const auto& method : settings.extractionMethods) {
        if (method == "pdftotext") {
            backends.push_back(std::make_shared<PdfToTextBackend>(PdfToTextBackend::Mode::Reading));
        } else if (method == "pdftotext-raw") {
            backends.push_back(std::make_shared<PdfToTextBackend>(PdfToTextBackend::Mode::Raw));
        } else if (method == "ocr") {
            if (settings.enableOcr) {
                backends.push_back(std::make_shared<OcrBackend>(settings.ocrLanguage, statusCallback));
            }
        } else if (method == "text") {
            backends.push_back(std::make_shared<PlainTextBackend>());
        } else {
            std::cerr << "[BackendFactory] Unknown extraction method ignored: " << method << std::endl;
        }
    }
    return backends;
}

} // namespace citewalker::infrastructure::extraction
