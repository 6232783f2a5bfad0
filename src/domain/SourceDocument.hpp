/**
 * @file SourceDocument.hpp
 * @brief A document file queued for reference extraction.
 */

#pragma once
#include <string>

namespace citewalker::domain {

/**
 * @enum DocumentType
 * @brief Categorization of input documents by extension.
 */
enum class DocumentType {
    PlainText,
    Markdown,
    PDF,
    LaTeX,
    Image,
    Unknown
};

/**
 * @struct SourceDocument
 * @brief A physical file found in an input directory.
 */
struct SourceDocument {
    std::string path;               ///< Path as found on disk.
    std::string filename;           ///< Basename of the file.
    DocumentType type = DocumentType::Unknown;
    long long sizeBytes = 0;
};

} // namespace citewalker::domain
