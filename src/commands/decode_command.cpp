#include "command_registration.hpp"
#include "command_helpers.hpp"
#include <iostream>
#include <string>
#include "logger.hpp"

class DecodeCommand : public BaseCommand {
public:
    std::string name() const override { return "decode"; }
    std::string usage() const override { return "decode <file> <type>"; }

    int run(const Config& config) override {
        const auto& args = config.args;
        if (args.size() != 2) {
            Logger::error("Usage: " + usage());
            return 1;
        }

        auto type = ChunkType::fromString(args[1]);
        if (!type.isValid) {
            Logger::error(chunkErrorName(type.error) + ": " + type.info);
            return 1;
        }

        auto png = loadPng(args[0]);
        if (!png)
            return 1;

        const Chunk* chunk = png->chunkByType(args[1]);
        if (chunk == nullptr) {
            Logger::error("No chunk of type " + args[1] + " in " + args[0]);
            return 1;
        }

        auto message = chunk->dataAsString();
        if (!message.isValid) {
            Logger::error(message.info);
            return 1;
        }

        std::cout << *message.value << std::endl;
        return 0;
    }
};

REGISTER_COMMAND(DecodeCommand)
