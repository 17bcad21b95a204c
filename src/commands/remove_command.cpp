#include "command_registration.hpp"
#include "command_helpers.hpp"
#include <iostream>
#include <string>
#include "helpers.hpp"
#include "logger.hpp"

class RemoveCommand : public BaseCommand {
public:
    std::string name() const override { return "remove"; }
    std::string usage() const override { return "remove <file> <type>"; }

    int run(const Config& config) override {
        const auto& args = config.args;
        if (args.size() != 2) {
            Logger::error("Usage: " + usage());
            return 1;
        }

        auto png = loadPng(args[0]);
        if (!png)
            return 1;

        auto removed = png->removeFirstChunk(args[1]);
        if (!removed.isValid) {
            Logger::error(chunkErrorName(removed.error) + ": " + removed.info);
            return 1;
        }

        if (!savePng(args[0], *png))
            return 1;

        // Binary payloads get a hex preview instead of text
        auto message = removed.value->dataAsString();
        if (message.isValid) {
            std::cout << *message.value << std::endl;
        } else {
            std::cout << hex_preview(removed.value->data()) << std::endl;
        }
        Logger::info("Removed " + args[1] + " (" + std::to_string(removed.value->length()) + " bytes) from " + args[0]);
        return 0;
    }
};

REGISTER_COMMAND(RemoveCommand)
