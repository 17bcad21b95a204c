#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"

class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical);

    // Throws std::runtime_error when an option that takes a value is last.
    void parse(int argc, char* argv[]);

    bool has(const std::string& canonical) const;
    std::string get(const std::string& canonical, const std::string& def = "") const;
};

// Fills a Config from the command line. Options may appear anywhere; the
// first positional argument is the command, the rest are its arguments.
Config parseArgs(int argc, char* argv[]);
