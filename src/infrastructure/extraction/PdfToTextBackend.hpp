/**
 * @file PdfToTextBackend.hpp
 * @brief Text extraction through Poppler's pdftotext tool.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/TextExtractionBackend.hpp"

namespace citewalker::infrastructure::extraction {

/**
 * @class PdfToTextBackend
 * @brief Runs pdftotext in reading-order mode or in raw content-stream mode.
 */
class PdfToTextBackend : public domain::TextExtractionBackend {
public:
    enum class Mode { Reading, Raw };

    explicit PdfToTextBackend(Mode mode = Mode::Reading);

    domain::references::RawExtraction extract(const std::string& documentPath) override;
    std::string name() const override;

    /** @brief Splits pdftotext output on form feeds; blank pages are skipped. */
    static std::vector<domain::references::PageText> SplitPages(const std::string& text);

    /** @brief Runs pdftotext on a PDF and fills text and pages. */
    static domain::references::RawExtraction RunPdfToText(const std::string& pdfPath, const std::string& extraFlags);

private:
    Mode m_mode;
};

/** @brief Lower-cased extension including the dot. */
std::string LowerExtension(const std::string& path);

} // namespace citewalker::infrastructure::extraction
