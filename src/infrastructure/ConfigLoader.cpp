/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace citewalker::infrastructure {

using domain::references::ExtractionSettings;

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid value for '" << key << "': " << e.what() << std::endl;
    }
}

// Counts must be non-negative integers; get<size_t>() would wrap a negative one.
void ReadKey(const nlohmann::json& j, const char* key, size_t& target) {
    if (!j.contains(key)) return;
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a non-negative integer, got " << value.dump() << std::endl;
        return;
    }
    target = value.get<size_t>();
}

} // namespace

ExtractionSettings ConfigLoader::Load(const std::string& configPath) {
    ExtractionSettings settings;
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }

    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object, using defaults." << std::endl;
        return settings;
    }

    ReadKey(j, "min_confidence_threshold", settings.minConfidenceThreshold);
    ReadKey(j, "min_reference_length", settings.minReferenceLength);
    ReadKey(j, "max_file_size_mb", settings.maxFileSizeMb);
    ReadKey(j, "extraction_methods", settings.extractionMethods);
    ReadKey(j, "enable_ocr", settings.enableOcr);
    ReadKey(j, "ocr_language", settings.ocrLanguage);
    ReadKey(j, "output_formats", settings.outputFormats);
    ReadKey(j, "quality_indicators", settings.qualityIndicators);
    ReadKey(j, "max_parallel_documents", settings.maxParallelDocuments);

    if (settings.maxParallelDocuments == 0) settings.maxParallelDocuments = 1;
    return settings;
}

bool ConfigLoader::Save(const std::string& configPath, const ExtractionSettings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing " << configPath << " is unreadable, overwriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["min_confidence_threshold"] = settings.minConfidenceThreshold;
    j["min_reference_length"] = settings.minReferenceLength;
    j["max_file_size_mb"] = settings.maxFileSizeMb;
    j["extraction_methods"] = settings.extractionMethods;
    j["enable_ocr"] = settings.enableOcr;
    j["ocr_language"] = settings.ocrLanguage;
    j["output_formats"] = settings.outputFormats;
    j["quality_indicators"] = settings.qualityIndicators;
    j["max_parallel_documents"] = settings.maxParallelDocuments;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace citewalker::infrastructure
