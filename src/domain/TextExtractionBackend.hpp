/**
 * @file TextExtractionBackend.hpp
 * @brief Interface for services that turn a document into raw text.
 */

#pragma once

#include <string>

#include "domain/references/RawExtraction.hpp"

namespace citewalker::domain {

/**
 * @class TextExtractionBackend
 * @brief Abstract collaborator consumed by the extraction arbiter.
 *
 * Implementations may block on file I/O or a subprocess. They report failure
 * either by throwing or by returning a result with success == false.
 */
class TextExtractionBackend {
public:
    virtual ~TextExtractionBackend() = default;

    /**
     * @brief Extracts text from the document at the given path.
     * @param documentPath Path to the source document.
     * @return Raw extraction (qualityScore is left for the arbiter to fill).
     */
    virtual references::RawExtraction extract(const std::string& documentPath) = 0;

    /** @brief Stable backend identifier, used in logs and results. */
    virtual std::string name() const = 0;

    /** @brief True when the text comes from optical character recognition. */
    virtual bool isOcr() const { return false; }
};

} // namespace citewalker::domain
