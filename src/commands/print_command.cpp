#include "command_registration.hpp"
#include "command_helpers.hpp"
#include <string>
#include "logger.hpp"
#include "printer.hpp"

class PrintCommand : public BaseCommand {
public:
    std::string name() const override { return "print"; }
    std::string usage() const override { return "print <file>"; }

    int run(const Config& config) override {
        const auto& args = config.args;
        if (args.size() != 1) {
            Logger::error("Usage: " + usage());
            return 1;
        }

        auto png = loadPng(args[0]);
        if (!png)
            return 1;

        printChunks(*png, args[0], config.verbose);

        if (config.jsonOutput) {
            Logger::debug("Writing JSON to " + config.jsonFile);
            if (!dumpJson(*png, config.jsonFile)) {
                Logger::error("Error: Cannot write JSON to " + config.jsonFile);
                return 1;
            }
        }
        return 0;
    }
};

REGISTER_COMMAND(PrintCommand)
