#include <iostream>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "command_registry.hpp"
#include "config.hpp"
#include "logger.hpp"


static void printUsage() {
    std::cout << "Usage: chunkdig [-d] [-v] [-O file] <command> <args...>\n"
              << "Commands:\n";
    for (const auto& command : CommandRegistry::instance().createAll()) {
        std::cout << "  " << command->usage() << "\n";
    }
    std::cout << "Options:\n"
              << "  -O [file]  print: also write chunks as JSON to file\n"
              << "  -d         Enable Debug mode\n"
              << "  -v         Verbose output (data previews)\n"
              << "  -h         Show this help message\n";
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);

    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.debug) {
        Logger::setLevel(LogLevel::DEBUG);
        Logger::debug("chunkdig v0.1, debug mode");
    }

    if (config.showHelp) {
        printUsage();
        return 0;
    }

    auto command = CommandRegistry::instance().create(config.command);
    if (!command) {
        Logger::error("Unknown command: " + config.command);
        printUsage();
        return 1;
    }

    Logger::debug("Running " + command->name());
    return command->run(config);
}
