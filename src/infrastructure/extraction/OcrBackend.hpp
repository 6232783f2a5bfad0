/**
 * @file OcrBackend.hpp
 * @brief OCR text extraction for scanned PDFs and images.
 */

#pragma once

#include <functional>
#include <string>

#include "domain/TextExtractionBackend.hpp"

namespace citewalker::infrastructure::extraction {

/**
 * @class OcrBackend
 * @brief Tiered OCR: ocrmypdf + pdftotext, then pdftoppm + tesseract per page.
 *
 * Image files go straight to tesseract. Results are flagged as OCR so the
 * arbiter applies its fidelity penalty.
 */
class OcrBackend : public domain::TextExtractionBackend {
public:
    explicit OcrBackend(std::string language = "eng",
                        std::function<void(std::string)> statusCallback = nullptr);

    domain::references::RawExtraction extract(const std::string& documentPath) override;
    std::string name() const override { return "ocr"; }
    bool isOcr() const override { return true; }

private:
    std::string m_language;
    std::function<void(std::string)> m_statusCallback;

    domain::references::RawExtraction extractWithOcrmypdf(const std::string& pdfPath);
    domain::references::RawExtraction extractWithTesseractPages(const std::string& pdfPath);
    domain::references::RawExtraction extractImage(const std::string& imagePath);
    std::string runTesseract(const std::string& imagePath, bool& ok);
    void report(const std::string& message) const;
};

} // namespace citewalker::infrastructure::extraction
