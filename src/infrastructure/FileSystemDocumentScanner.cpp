/**
 * @file FileSystemDocumentScanner.cpp
 * @brief Implementation of FileSystemDocumentScanner.
 */

#include "infrastructure/FileSystemDocumentScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace citewalker::infrastructure {

FileSystemDocumentScanner::FileSystemDocumentScanner(const std::string& directory)
    : m_directory(directory) {}

std::vector<domain::SourceDocument> FileSystemDocumentScanner::scan() const {
    std::vector<domain::SourceDocument> documents;

    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        std::cerr << "[Scanner] Not a directory: " << m_directory << std::endl;
        return documents;
    }

    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (!entry.is_regular_file()) continue;

        domain::DocumentType type = ClassifyByExtension(entry.path().extension().string());
        if (type == domain::DocumentType::Unknown) continue;

        domain::SourceDocument document;
        document.path = entry.path().string();
        document.filename = entry.path().filename().string();
        document.type = type;
        std::error_code sizeError;
        auto size = fs::file_size(entry.path(), sizeError);
        document.sizeBytes = sizeError ? 0 : static_cast<long long>(size);
        documents.push_back(document);
    }
    if (ec) {
        std::cerr << "[Scanner] Error listing " << m_directory << ": " << ec.message() << std::endl;
    }

    std::sort(documents.begin(), documents.end(),
              [](const domain::SourceDocument& a, const domain::SourceDocument& b) { return a.path < b.path; });
    return documents;
}

domain::DocumentType FileSystemDocumentScanner::ClassifyByExtension(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    if (ext == ".txt") return domain::DocumentType::PlainText;
    if (ext == ".md") return domain::DocumentType::Markdown;
    if (ext == ".pdf") return domain::DocumentType::PDF;
    if (ext == ".tex") return domain::DocumentType::LaTeX;
    if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".tif" || ext == ".tiff" || ext == ".bmp") {
        return domain::DocumentType::Image;
    }
    return domain::DocumentType::Unknown;
}

} // namespace citewalker::infrastructure
