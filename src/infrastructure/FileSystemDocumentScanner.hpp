/**
 * @file FileSystemDocumentScanner.hpp
 * @brief Scanner for documents in a batch input directory.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/SourceDocument.hpp"

namespace citewalker::infrastructure {

/**
 * @class FileSystemDocumentScanner
 * @brief Lists supported documents directly inside a directory, sorted by path.
 */
class FileSystemDocumentScanner {
public:
    explicit FileSystemDocumentScanner(const std::string& directory);

    std::vector<domain::SourceDocument> scan() const;

    /** @brief Maps a file extension (any case, with dot) to a document type. */
    static domain::DocumentType ClassifyByExtension(const std::string& extension);

private:
    std::string m_directory;
};

} // namespace citewalker::infrastructure
