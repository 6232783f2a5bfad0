/**
 * @file CiteWalkerApp.cpp
 * @brief Implementation of the CiteWalkerApp class.
 */
#include "app/CiteWalkerApp.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "application/ReferenceExportService.hpp"
#include "application/ReferenceExtractionService.hpp"
#include "domain/references/ExtractionErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileSystemDocumentScanner.hpp"
#include "infrastructure/extraction/ExtractionBackendFactory.hpp"

namespace fs = std::filesystem;

namespace citewalker::app {

namespace {

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

void PrintStatus(const std::string& message) {
    std::cout << "  " << message << std::endl;
}

application::ReferenceExtractionService MakeService(const domain::references::ExtractionSettings& settings,
                                                    bool quiet) {
    auto callback = quiet ? std::function<void(std::string)>() : std::function<void(std::string)>(PrintStatus);
    return application::ReferenceExtractionService(
        settings, infrastructure::extraction::ExtractionBackendFactory::Create(settings, callback));
}

} // namespace

void CiteWalkerApp::PrintUsage() {
    std::cout <<
        "Usage: citewalker <command> [options]\n"
        "\n"
        "Commands:\n"
        "  extract <document>           Extract references from one document\n"
        "  batch <dir|documents...>     Extract references from several documents\n"
        "  text <file>                  Parse references from a text file, print JSON\n"
        "  init-config                  Write the current settings to the config file\n"
        "  help                         Show this message\n"
        "\n"
        "Options:\n"
        "  --output <path>              Output base (extract) or directory (batch)\n"
        "  --formats <a,b,...>          Output formats: json, csv, txt, md\n"
        "  --config <path>              Settings file (default: settings.json)\n"
        "  --min-confidence <x>         Override the confidence threshold\n"
        "  --jobs <n>                   Documents processed in parallel (batch)\n"
        "  --quiet                      Suppress progress messages\n";
}

std::optional<CommandLine> CiteWalkerApp::ParseArguments(const std::vector<std::string>& args, std::string& error) {
    if (args.empty()) {
        error = "No command given.";
        return std::nullopt;
    }

    CommandLine cmd;
    cmd.command = args[0];
    if (cmd.command == "-h" || cmd.command == "--help") cmd.command = "help";
    if (cmd.command != "extract" && cmd.command != "batch" && cmd.command != "text" &&
        cmd.command != "init-config" && cmd.command != "help") {
        error = "Unknown command: " + cmd.command;
        return std::nullopt;
    }

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&](const std::string& option) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + option;
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "--output" || arg == "--output-dir" || arg == "-o") {
            auto value = needValue(arg);
            if (!value) return std::nullopt;
            cmd.output = *value;
        } else if (arg == "--formats" || arg == "-f") {
            auto value = needValue(arg);
            if (!value) return std::nullopt;
            cmd.formats = SplitList(*value);
        } else if (arg == "--config" || arg == "-c") {
            auto value = needValue(arg);
            if (!value) return std::nullopt;
            cmd.configPath = *value;
        } else if (arg == "--min-confidence") {
            auto value = needValue(arg);
            if (!value) return std::nullopt;
            try {
                cmd.minConfidence = std::stof(*value);
            } catch (const std::exception&) {
                error = "Invalid confidence value: " + *value;
                return std::nullopt;
            }
        } else if (arg == "--jobs" || arg == "-j") {
            auto value = needValue(arg);
            if (!value) return std::nullopt;
            try {
                int jobs = std::stoi(*value);
                if (jobs < 1) throw std::out_of_range("jobs");
                cmd.jobs = static_cast<size_t>(jobs);
            } catch (const std::exception&) {
                error = "Invalid job count: " + *value;
                return std::nullopt;
            }
        } else if (arg == "--quiet" || arg == "-q") {
            cmd.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.command = "help";
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else {
            cmd.inputs.push_back(arg);
        }
    }

    if ((cmd.command == "extract" || cmd.command == "text") && cmd.inputs.size() != 1) {
        error = "Command '" + cmd.command + "' expects exactly one input file.";
        return std::nullopt;
    }
    if (cmd.command == "batch" && cmd.inputs.empty()) {
        error = "Command 'batch' expects a directory or at least one document.";
        return std::nullopt;
    }
    return cmd;
}

int CiteWalkerApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;
    auto cmd = ParseArguments(args, error);
    if (!cmd) {
        std::cerr << "[CLI] " << error << std::endl;
        PrintUsage();
        return 2;
    }

    if (cmd->command == "help") {
        PrintUsage();
        return 0;
    }
    if (cmd->command == "init-config") {
        return runInitConfig(*cmd);
    }

    auto settings = infrastructure::ConfigLoader::Load(cmd->configPath);
    if (cmd->minConfidence) settings.minConfidenceThreshold = *cmd->minConfidence;
    if (cmd->jobs) settings.maxParallelDocuments = *cmd->jobs;
    if (cmd->formats) settings.outputFormats = *cmd->formats;

    if (cmd->command == "extract") return runExtract(*cmd, settings);
    if (cmd->command == "batch") return runBatch(*cmd, settings);
    return runText(*cmd, settings);
}

int CiteWalkerApp::runExtract(const CommandLine& cmd, const domain::references::ExtractionSettings& settings) {
    auto service = MakeService(settings, cmd.quiet);
    auto result = service.processDocument(cmd.inputs.front(), cmd.output, std::nullopt,
                                          cmd.quiet ? nullptr : std::function<void(std::string)>(PrintStatus));
    if (!result.ok()) {
        std::cerr << "[CLI] Extraction failed: " << result.error.value_or("unknown error") << std::endl;
        return 1;
    }

    std::cout << "Method: " << result.methodUsed << "\n"
              << "References: " << result.filteredCount << " of " << result.totalFound
              << " above threshold\n";
    for (const auto& [format, path] : result.outputFiles) {
        std::cout << "  " << format << ": " << path << "\n";
    }
    return 0;
}

int CiteWalkerApp::runBatch(const CommandLine& cmd, const domain::references::ExtractionSettings& settings) {
    std::vector<std::string> documents;
    for (const auto& input : cmd.inputs) {
        std::error_code ec;
        if (fs::is_directory(input, ec)) {
            for (const auto& document : infrastructure::FileSystemDocumentScanner(input).scan()) {
                documents.push_back(document.path);
            }
        } else {
            documents.push_back(input);
        }
    }
    if (documents.empty()) {
        std::cerr << "[CLI] No documents to process." << std::endl;
        return 1;
    }

    auto service = MakeService(settings, cmd.quiet);
    auto batch = service.processBatch(documents, cmd.output.value_or("batch_extraction"),
                                      cmd.quiet ? nullptr : std::function<void(std::string)>(PrintStatus));

    std::cout << "Files: " << batch.totalFiles << ", succeeded: " << batch.successfulExtractions
              << ", failed: " << batch.failedExtractions << "\n"
              << "References extracted: " << batch.totalReferencesExtracted << "\n";
    if (!batch.summaryFile.empty()) std::cout << "Summary: " << batch.summaryFile << "\n";
    return batch.failedExtractions == 0 ? 0 : 1;
}

int CiteWalkerApp::runText(const CommandLine& cmd, const domain::references::ExtractionSettings& settings) {
    std::ifstream file(cmd.inputs.front(), std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[CLI] Could not open " << cmd.inputs.front() << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    application::ReferenceExtractionService service(settings, {});
    try {
        auto references = application::ReferenceExtractionService::FilterByConfidence(
            service.extractReferences(buffer.str()), settings.minConfidenceThreshold);
        std::cout << application::ReferenceExportService::ToJson(
                         references, application::ReferenceExportService::CurrentTimestamp())
                  << std::endl;
    } catch (const domain::references::MalformedInputError& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int CiteWalkerApp::runInitConfig(const CommandLine& cmd) {
    auto settings = infrastructure::ConfigLoader::Load(cmd.configPath);
    if (!infrastructure::ConfigLoader::Save(cmd.configPath, settings)) {
        return 1;
    }
    std::cout << "Settings written to " << cmd.configPath << std::endl;
    return 0;
}

} // namespace citewalker::app
