#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "app/CiteWalkerApp.hpp"

using citewalker::app::CiteWalkerApp;

int main() {
    std::cout << "[Test] Starting CLI Arguments Test..." << std::endl;
    std::string error;

    {
        auto cmd = CiteWalkerApp::ParseArguments(
            {"extract", "paper.pdf", "--output", "out/refs", "--formats", "json,md", "--min-confidence", "0.5"}, error);
        assert(cmd);
        assert(cmd->command == "extract");
        assert(cmd->inputs == std::vector<std::string>{"paper.pdf"});
        assert(cmd->output == std::string("out/refs"));
        assert(cmd->formats && cmd->formats->size() == 2 && (*cmd->formats)[1] == "md");
        assert(cmd->minConfidence && *cmd->minConfidence == 0.5f);
        assert(cmd->configPath == "settings.json");
    }

    {
        auto cmd = CiteWalkerApp::ParseArguments({"batch", "a.pdf", "b.txt", "-j", "3", "--config", "c.json", "-q"}, error);
        assert(cmd);
        assert(cmd->inputs.size() == 2);
        assert(cmd->jobs == size_t{3});
        assert(cmd->configPath == "c.json");
        assert(cmd->quiet);
    }

    assert(CiteWalkerApp::ParseArguments({"--help"}, error)->command == "help");
    assert(CiteWalkerApp::ParseArguments({"extract", "x.pdf", "--help"}, error)->command == "help");

    // Invalid usage
    assert(!CiteWalkerApp::ParseArguments({}, error));
    assert(!CiteWalkerApp::ParseArguments({"frobnicate"}, error));
    assert(error.find("frobnicate") != std::string::npos);
    assert(!CiteWalkerApp::ParseArguments({"extract"}, error));
    assert(!CiteWalkerApp::ParseArguments({"extract", "a.pdf", "b.pdf"}, error));
    assert(!CiteWalkerApp::ParseArguments({"batch"}, error));
    assert(!CiteWalkerApp::ParseArguments({"extract", "a.pdf", "--output"}, error));
    assert(!CiteWalkerApp::ParseArguments({"extract", "a.pdf", "--min-confidence", "high"}, error));
    assert(!CiteWalkerApp::ParseArguments({"batch", "dir", "--jobs", "0"}, error));
    assert(!CiteWalkerApp::ParseArguments({"text", "a.txt", "--verbose"}, error));

    std::cout << "[PASS] CLI Arguments Test Complete." << std::endl;
    return 0;
}
