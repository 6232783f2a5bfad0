/**
 * @file ExtractionErrors.hpp
 * @brief Document-level failures of the reference extraction pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace citewalker::domain::references {

/** @brief Every configured backend failed to deliver usable text. */
class NoTextExtractedError : public std::runtime_error {
public:
    explicit NoTextExtractedError(const std::string& message)
        : std::runtime_error(message) {}
};

/** @brief Raw text handed to the pipeline is empty or whitespace only. */
class MalformedInputError : public std::runtime_error {
public:
    explicit MalformedInputError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace citewalker::domain::references
