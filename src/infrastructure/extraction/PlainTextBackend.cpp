/**
 * @file PlainTextBackend.cpp
 * @brief Implementation of PlainTextBackend.
 */

#include "infrastructure/extraction/PlainTextBackend.hpp"
#include "infrastructure/extraction/PdfToTextBackend.hpp"

#include <fstream>
#include <sstream>

namespace citewalker::infrastructure::extraction {

using domain::references::PageText;
using domain::references::RawExtraction;

bool PlainTextBackend::IsSupported(const std::string& documentPath) {
    const std::string ext = LowerExtension(documentPath);
    return ext == ".txt" || ext == ".md" || ext == ".tex";
}

RawExtraction PlainTextBackend::extract(const std::string& documentPath) {
    RawExtraction result;
    result.method = name();

    if (!IsSupported(documentPath)) {
        result.error = "Not a plain-text document.";
        return result;
    }

    std::ifstream file(documentPath, std::ios::binary);
    if (!file.is_open()) {
        result.error = "Could not open " + documentPath;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    result.text = buffer.str();
    result.pages.push_back(PageText{1, result.text, result.text.size()});
    result.success = true;
    return result;
}

} // namespace citewalker::infrastructure::extraction
