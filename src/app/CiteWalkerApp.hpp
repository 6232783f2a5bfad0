/**
 * @file CiteWalkerApp.hpp
 * @brief Command-line front end for CiteWalker.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/references/ExtractionSettings.hpp"

namespace citewalker::app {

/**
 * @struct CommandLine
 * @brief Parsed command and options.
 */
struct CommandLine {
    std::string command;                         ///< extract, batch, text, init-config, help.
    std::vector<std::string> inputs;
    std::optional<std::string> output;           ///< Output base (extract) or directory (batch).
    std::optional<std::vector<std::string>> formats;
    std::string configPath = "settings.json";
    std::optional<float> minConfidence;
    std::optional<size_t> jobs;
    bool quiet = false;
};

/**
 * @class CiteWalkerApp
 * @brief Parses arguments, wires the services and runs one command.
 */
class CiteWalkerApp {
public:
    /**
     * @brief Runs the command described by argv.
     * @return Process exit code: 0 success, 1 processing failure, 2 usage error.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses arguments (without the program name).
     * @return std::nullopt with a message in error on invalid usage.
     */
    static std::optional<CommandLine> ParseArguments(const std::vector<std::string>& args, std::string& error);

    static void PrintUsage();

private:
    int runExtract(const CommandLine& cmd, const domain::references::ExtractionSettings& settings);
    int runBatch(const CommandLine& cmd, const domain::references::ExtractionSettings& settings);
    int runText(const CommandLine& cmd, const domain::references::ExtractionSettings& settings);
    int runInitConfig(const CommandLine& cmd);
};

} // namespace citewalker::app
