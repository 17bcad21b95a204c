#include "printer.hpp"
#include "chunk_fixtures.hpp"
#include "file_reader.hpp"

#include <catch2/catch_all.hpp>
#include <cjson/cJSON.h>

using namespace chunk_fixtures;

TEST_CASE("Flag descriptions", "[printer]") {
    REQUIRE(describeFlags(*ChunkType::fromString("IHDR").value) == "critical, public, unsafe-to-copy");
    REQUIRE(describeFlags(*ChunkType::fromString("ruSt").value) == "ancillary, private, safe-to-copy");
    REQUIRE(describeFlags(*ChunkType::fromString("Rust").value) ==
            "critical, private, safe-to-copy, reserved bit set");
    REQUIRE(describeFlags(ChunkType({'R', 'u', '1', 'T'})).find("non-alphabetic") != std::string::npos);
}

TEST_CASE("JSON dump", "[printer]") {
    auto png = *Png::fromBytes(minimal_png_bytes()).value;
    png.appendChunk(make_chunk("ruSt", kMessage));

    auto path = temp_path("dump.json");
    REQUIRE(dumpJson(png, path.string()));

    auto raw = readFile(path.string());
    std::string text(raw.begin(), raw.end());
    cJSON* root = cJSON_Parse(text.c_str());
    REQUIRE(root != nullptr);
    REQUIRE(cJSON_IsArray(root));
    REQUIRE(cJSON_GetArraySize(root) == 3);

    cJSON* ihdr = cJSON_GetArrayItem(root, 0);
    REQUIRE(std::string(cJSON_GetObjectItem(ihdr, "type")->valuestring) == "IHDR");
    REQUIRE(std::string(cJSON_GetObjectItem(ihdr, "offset")->valuestring) == "8");
    REQUIRE(cJSON_GetObjectItem(ihdr, "length")->valuedouble == 13);
    REQUIRE(cJSON_IsTrue(cJSON_GetObjectItem(ihdr, "critical")));

    cJSON* secret = cJSON_GetArrayItem(root, 1);
    REQUIRE(std::string(cJSON_GetObjectItem(secret, "type")->valuestring) == "ruSt");
    // 8 signature + 12 + 13 IHDR = 33 = 0x21
    REQUIRE(std::string(cJSON_GetObjectItem(secret, "offset")->valuestring) == "21");
    REQUIRE(std::string(cJSON_GetObjectItem(secret, "crc")->valuestring) ==
            to_hex(make_chunk("ruSt", kMessage).crc()));
    REQUIRE(cJSON_IsFalse(cJSON_GetObjectItem(secret, "public")));
    REQUIRE(cJSON_IsTrue(cJSON_GetObjectItem(secret, "safeToCopy")));
    REQUIRE(std::string(cJSON_GetObjectItem(secret, "text")->valuestring) == kMessage);

    cJSON_Delete(root);
}
