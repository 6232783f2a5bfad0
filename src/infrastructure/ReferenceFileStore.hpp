/**
 * @file ReferenceFileStore.hpp
 * @brief Atomic file writes for export reports.
 */

#pragma once

#include <optional>
#include <string>

namespace citewalker::infrastructure {

/**
 * @class ReferenceFileStore
 * @brief Writes each file to a temp sibling and renames it into place.
 *
 * Readers never observe a partially written report.
 */
class ReferenceFileStore {
public:
    /**
     * @brief Writes content to path, creating parent directories.
     * @return std::nullopt on success, otherwise an error message.
     */
    static std::optional<std::string> WriteAtomic(const std::string& path, const std::string& content);
};

} // namespace citewalker::infrastructure
