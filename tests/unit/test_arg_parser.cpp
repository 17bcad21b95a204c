#include "arg_parser.hpp"

#include <catch2/catch_all.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Owns the strings behind a mutable argv array.
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> pointers;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "chunkdig");
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }
};

Config parse(std::vector<std::string> args) {
    Argv argv(std::move(args));
    return parseArgs(argv.argc(), argv.argv());
}

}  // namespace

TEST_CASE("Command line parsing", "[cli]") {
    SECTION("Command and arguments") {
        auto config = parse({"encode", "in.png", "ruSt", "hello", "out.png"});
        REQUIRE_FALSE(config.showHelp);
        REQUIRE(config.command == "encode");
        REQUIRE(config.args == std::vector<std::string>{"in.png", "ruSt", "hello", "out.png"});
        REQUIRE_FALSE(config.verbose);
        REQUIRE_FALSE(config.debug);
        REQUIRE_FALSE(config.jsonOutput);
    }

    SECTION("Switches fill the config wherever they appear") {
        auto config = parse({"-d", "print", "-v", "file.png", "-O", "chunks.json"});
        REQUIRE(config.debug);
        REQUIRE(config.verbose);
        REQUIRE(config.jsonOutput);
        REQUIRE(config.jsonFile == "chunks.json");
        REQUIRE(config.command == "print");
        REQUIRE(config.args == std::vector<std::string>{"file.png"});
    }

    SECTION("Long option names") {
        auto config = parse({"--verbose", "--jsonPath", "x.json", "print", "f.png"});
        REQUIRE(config.verbose);
        REQUIRE(config.jsonFile == "x.json");
    }

    SECTION("Option value missing throws") {
        REQUIRE_THROWS_AS(parse({"print", "file.png", "-O"}), std::runtime_error);
        REQUIRE_THROWS_WITH(parse({"--jsonPath"}), "Missing value for option: --jsonPath");
    }

    SECTION("Help") {
        REQUIRE(parse({}).showHelp);
        REQUIRE(parse({"-h", "print", "f.png"}).showHelp);
        REQUIRE(parse({"--help"}).showHelp);
    }
}

TEST_CASE("ArgParser option table", "[cli]") {
    ArgParser parser;
    parser.addOption("-x", true, "extra");
    Argv argv({"-x", "42", "rest"});
    parser.parse(argv.argc(), argv.argv());

    REQUIRE(parser.has("extra"));
    REQUIRE(parser.get("extra") == "42");
    REQUIRE(parser.get("missing", "fallback") == "fallback");
    REQUIRE(parser.positional == std::vector<std::string>{"rest"});
}
