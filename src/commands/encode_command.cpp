#include "command_registration.hpp"
#include "command_helpers.hpp"
#include <string>
#include <vector>
#include "logger.hpp"

class EncodeCommand : public BaseCommand {
public:
    std::string name() const override { return "encode"; }
    std::string usage() const override { return "encode <file> <type> <message> [output]"; }

    int run(const Config& config) override {
        const auto& args = config.args;
        if (args.size() < 3 || args.size() > 4) {
            Logger::error("Usage: " + usage());
            return 1;
        }

        auto type = ChunkType::fromString(args[1]);
        if (!type.isValid) {
            Logger::error(type.info);
            return 1;
        }
        if (!type.value->isReservedBitValid()) {
            Logger::warn("Chunk type " + args[1] + " has the reserved bit set, PNG readers will treat it as invalid");
        }

        const std::string& message = args[2];
        if (!Chunk::fitsDataSize(message.size())) {
            Logger::error("Message of " + std::to_string(message.size()) + " bytes does not fit in one chunk");
            return 1;
        }

        auto png = loadPng(args[0]);
        if (!png)
            return 1;

        png->appendChunk(Chunk(*type.value, std::vector<uint8_t>(message.begin(), message.end())));

        const std::string& output = args.size() == 4 ? args[3] : args[0];
        if (!savePng(output, *png))
            return 1;

        Logger::info("Encoded " + std::to_string(message.size()) + " bytes as " + args[1] + " into " + output);
        return 0;
    }
};

REGISTER_COMMAND(EncodeCommand)
