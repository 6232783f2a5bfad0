/**
 * @file PlainTextBackend.hpp
 * @brief Reads documents that are already text (.txt, .md, .tex).
 */

#pragma once

#include "domain/TextExtractionBackend.hpp"

namespace citewalker::infrastructure::extraction {

class PlainTextBackend : public domain::TextExtractionBackend {
public:
    domain::references::RawExtraction extract(const std::string& documentPath) override;
    std::string name() const override { return "text"; }

    static bool IsSupported(const std::string& documentPath);
};

} // namespace citewalker::infrastructure::extraction
