/**
 * @file PdfToTextBackend.cpp
 * @brief Implementation of PdfToTextBackend.
 */

#include "infrastructure/extraction/PdfToTextBackend.hpp"
#include "infrastructure/CommandRunner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace citewalker::infrastructure::extraction {

using domain::references::PageText;
using domain::references::RawExtraction;

std::string LowerExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext;
}

PdfToTextBackend::PdfToTextBackend(Mode mode) : m_mode(mode) {}

std::string PdfToTextBackend::name() const {
    return m_mode == Mode::Raw ? "pdftotext-raw" : "pdftotext";
}

std::vector<PageText> PdfToTextBackend::SplitPages(const std::string& text) {
    std::vector<PageText> pages;
    size_t start = 0;
    int pageNumber = 1;
    while (start <= text.size()) {
        size_t ff = text.find('\f', start);
        size_t end = (ff == std::string::npos) ? text.size() : ff;
        std::string pageText = text.substr(start, end - start);
        bool blank = std::all_of(pageText.begin(), pageText.end(), [](unsigned char c){ return std::isspace(c); });
        if (!blank) {
            pages.push_back(PageText{pageNumber, pageText, pageText.size()});
        }
        if (ff == std::string::npos) break;
        start = ff + 1;
        ++pageNumber;
    }
    return pages;
}

RawExtraction PdfToTextBackend::RunPdfToText(const std::string& pdfPath, const std::string& extraFlags) {
    RawExtraction result;

    std::string cmd = "pdftotext " + extraFlags + (extraFlags.empty() ? "" : " ") +
                      CommandRunner::Quote(pdfPath) + " - 2>/dev/null";
    auto run = CommandRunner::Run(cmd);
    if (!run.started) {
        result.error = "Failed to start pdftotext.";
        return result;
    }
    if (run.exitCode != 0) {
        result.error = "pdftotext exited with code " + std::to_string(run.exitCode);
        return result;
    }

    result.pages = SplitPages(run.output);
    std::string joined;
    for (size_t i = 0; i < result.pages.size(); ++i) {
        if (i > 0) joined += "\n";
        joined += result.pages[i].text;
    }
    result.text = std::move(joined);
    result.success = true;
    return result;
}

RawExtraction PdfToTextBackend::extract(const std::string& documentPath) {
    if (LowerExtension(documentPath) != ".pdf") {
        RawExtraction result;
        result.method = name();
        result.error = "Not a PDF document.";
        return result;
    }

    RawExtraction result = RunPdfToText(documentPath, m_mode == Mode::Raw ? "-raw" : "");
    result.method = name();
    return result;
}

} // namespace citewalker::infrastructure::extraction
