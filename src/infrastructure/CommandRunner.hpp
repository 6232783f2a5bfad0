/**
 * @file CommandRunner.hpp
 * @brief Blocking subprocess helpers built on popen.
 */

#pragma once

#include <functional>
#include <string>

namespace citewalker::infrastructure {

/**
 * @class CommandRunner
 * @brief Runs a shell command and reports its exit status and stdout.
 */
class CommandRunner {
public:
    struct Result {
        std::string output;
        int exitCode = -1;
        bool started = false;

        bool ok() const { return started && exitCode == 0; }
    };

    /** @brief Runs a shell command and captures its standard output. */
    static Result Run(const std::string& cmd);

    /**
     * @brief Runs a command and streams each output line to the callback.
     * @return True if the command exited with code 0.
     */
    static bool RunWithCallback(const std::string& cmd, std::function<void(const std::string&)> lineCallback);

    /** @brief True if the tool is on PATH. */
    static bool HasTool(const std::string& tool);

    /** @brief Single-quotes an argument for /bin/sh. */
    static std::string Quote(const std::string& argument);
};

} // namespace citewalker::infrastructure
