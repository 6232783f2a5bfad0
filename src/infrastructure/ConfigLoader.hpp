/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving extraction configuration (settings.json).
 *
 * Keeps JSON parsing in one place so the rest of the code only sees
 * ExtractionSettings.
 */

#pragma once

#include <string>

#include "domain/references/ExtractionSettings.hpp"

namespace citewalker::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Parsed settings. Missing keys, a missing file or a parse error yield defaults.
     */
    static domain::references::ExtractionSettings Load(const std::string& configPath);

    /**
     * @brief Writes settings to a JSON file, preserving unrelated keys already present.
     * @return True on success.
     */
    static bool Save(const std::string& configPath, const domain::references::ExtractionSettings& settings);
};

} // namespace citewalker::infrastructure
