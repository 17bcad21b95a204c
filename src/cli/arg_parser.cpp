#include "arg_parser.hpp"
#include <stdexcept>
#include "logger.hpp"

void ArgParser::addOption(const std::string& name, bool takesValue, const std::string& canonical) {
    optionDefs[name] = {takesValue, canonical};
}

void ArgParser::parse(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Is this a known option?
        auto it = optionDefs.find(arg);
        if (it != optionDefs.end()) {
            const auto& info = it->second;

            if (info.takesValue) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for option: " + arg);
                }
                parsedOptions[info.canonicalName] = argv[++i];
            } else {
                parsedOptions[info.canonicalName] = "true";
            }
        }
        else {
            // Not an option → positional argument
            positional.push_back(arg);
        }
    }
}

bool ArgParser::has(const std::string& canonical) const {
    return parsedOptions.count(canonical) != 0;
}

std::string ArgParser::get(const std::string& canonical, const std::string& def) const {
    auto it = parsedOptions.find(canonical);
    return it != parsedOptions.end() ? it->second : def;
}

Config parseArgs(int argc, char* argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.parse(argc, argv);

    config.debug = args.has("debug");

    if (args.has("verbose")) {
        Logger::debug("Enabling verbose Output");
        config.verbose = true;
    }

    if (args.has("jsonPath")) {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to " + config.jsonFile);
    }

    if (args.has("help") || args.positional.empty()) {
        config.showHelp = true;
        return config;
    }

    config.command = args.positional.front();
    config.args.assign(args.positional.begin() + 1, args.positional.end());

    return config;
}
