#pragma once
#include <string>
#include <vector>

struct Config {
    std::string command;
    std::vector<std::string> args;  // positional arguments after the command
    bool jsonOutput = false;
    std::string jsonFile;
    bool verbose = false;
    bool debug = false;
    bool showHelp = false;          // -h given, or no command at all
};
