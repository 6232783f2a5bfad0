#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"

namespace fs = std::filesystem;
using citewalker::infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path testRoot = fs::temp_directory_path() / "citewalker_config_test";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);
    const std::string configPath = (testRoot / "settings.json").string();

    // Missing file
    {
        auto settings = ConfigLoader::Load(configPath);
        assert(settings.minConfidenceThreshold == 0.3f);
        assert(settings.minReferenceLength == 20);
        assert(settings.outputFormats.size() == 4);
        assert(settings.qualityIndicators.size() == 15);
        assert(settings.maxParallelDocuments == 1);
    }

    // Partial file with one bad value
    {
        std::ofstream f(configPath);
        f << R"({
            "min_confidence_threshold": 0.5,
            "min_reference_length": "not a number",
            "enable_ocr": false,
            "extraction_methods": ["text"],
            "output_formats": ["json"],
            "max_parallel_documents": 4,
            "video_driver": "x11"
        })";
    }
    {
        auto settings = ConfigLoader::Load(configPath);
        assert(settings.minConfidenceThreshold == 0.5f);
        assert(settings.minReferenceLength == 20 && "Invalid values fall back to the default.");
        assert(!settings.enableOcr);
        assert(settings.extractionMethods == std::vector<std::string>{"text"});
        assert(settings.outputFormats == std::vector<std::string>{"json"});
        assert(settings.maxParallelDocuments == 4);
        assert(settings.ocrLanguage == "eng");
    }

    // Save keeps unrelated keys
    {
        auto settings = ConfigLoader::Load(configPath);
        settings.ocrLanguage = "por";
        settings.minReferenceLength = 30;
        assert(ConfigLoader::Save(configPath, settings));

        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        assert(j["video_driver"] == "x11");
        assert(j["ocr_language"] == "por");
        assert(j["min_reference_length"] == 30);

        auto reloaded = ConfigLoader::Load(configPath);
        assert(reloaded.ocrLanguage == "por");
        assert(reloaded.minReferenceLength == 30);
        assert(reloaded.maxParallelDocuments == 4);
    }

    // Negative or fractional counts keep their defaults
    {
        std::ofstream f(configPath);
        f << R"({"min_reference_length": -1, "max_parallel_documents": -3, "min_confidence_threshold": 0.5})";
    }
    {
        auto settings = ConfigLoader::Load(configPath);
        assert(settings.minReferenceLength == 20);
        assert(settings.maxParallelDocuments == 1);
        assert(settings.minConfidenceThreshold == 0.5f);
    }
    {
        std::ofstream f(configPath);
        f << R"({"min_reference_length": 12.5})";
    }
    assert(ConfigLoader::Load(configPath).minReferenceLength == 20);

    // Malformed file
    {
        std::ofstream f(configPath);
        f << "{ this is not json";
    }
    {
        auto settings = ConfigLoader::Load(configPath);
        assert(settings.minConfidenceThreshold == 0.3f);
        assert(settings.enableOcr);
    }

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test Complete." << std::endl;
    return 0;
}
