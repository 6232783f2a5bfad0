/**
 * @file ReferenceExportService.hpp
 * @brief Renders extracted references as JSON, CSV, plain-text and Markdown reports.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/references/ExtractedReference.hpp"

namespace citewalker::application {

/**
 * @class ReferenceExportService
 * @brief Stateless formatter for one document's references.
 *
 * Renders to strings only; the caller owns the files. The Markdown report also
 * carries the quality summary.
 */
class ReferenceExportService {
public:
    /** @brief Formats Render() understands, in default output order. */
    static const std::vector<std::string>& SupportedFormats();

    /**
     * @brief Renders references in the named format ("json", "csv", "txt", "md").
     * @return std::nullopt for an unknown format.
     */
    static std::optional<std::string> Render(const std::string& format,
                                             const std::vector<domain::references::ExtractedReference>& references,
                                             const std::string& timestamp);

    /**
     * @brief Flat record with the field names of the data model; authors as an array.
     */
    static nlohmann::json ToJsonRecord(const domain::references::ExtractedReference& reference);

    static std::string ToJson(const std::vector<domain::references::ExtractedReference>& references,
                              const std::string& timestamp);

    /** @brief RFC 4180 CSV; authors joined with "; ". */
    static std::string ToCsv(const std::vector<domain::references::ExtractedReference>& references);

    static std::string ToText(const std::vector<domain::references::ExtractedReference>& references,
                              const std::string& timestamp);

    static std::string ToMarkdown(const std::vector<domain::references::ExtractedReference>& references,
                                  const std::string& timestamp);

    /** @brief Local time as "YYYY-MM-DD HH:MM:SS". */
    static std::string CurrentTimestamp();

    static std::string JoinAuthors(const std::vector<std::string>& authors);
};

} // namespace citewalker::application
