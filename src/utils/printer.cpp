#include<iostream>
#include "printer.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <cjson/cJSON.h>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <string>
#include <fstream>
#include <vector>

std::string describeFlags(const ChunkType& type) {
    std::ostringstream oss;
    oss << (type.isCritical() ? "critical" : "ancillary")
        << ", " << (type.isPublic() ? "public" : "private")
        << ", " << (type.isSafeToCopy() ? "safe-to-copy" : "unsafe-to-copy");
    if (!type.isReservedBitValid())
        oss << ", reserved bit set";
    if (!type.isAlphabetic())
        oss << ", non-alphabetic";
    return oss.str();
}

static cJSON* build_json_chunk(const Chunk& chunk, size_t offset) {
    const ChunkType& type = chunk.chunkType();
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "offset", to_hex(offset).c_str());
    cJSON_AddStringToObject(item, "type", type.toString().c_str());
    cJSON_AddNumberToObject(item, "length", static_cast<double>(chunk.length()));
    cJSON_AddStringToObject(item, "crc", to_hex(chunk.crc()).c_str());
    cJSON_AddBoolToObject(item, "critical", type.isCritical());
    cJSON_AddBoolToObject(item, "public", type.isPublic());
    cJSON_AddBoolToObject(item, "reservedBitValid", type.isReservedBitValid());
    cJSON_AddBoolToObject(item, "safeToCopy", type.isSafeToCopy());
    cJSON_AddBoolToObject(item, "valid", type.isValid());

    auto text = chunk.dataAsString();
    if (text.isValid) {
        cJSON_AddStringToObject(item, "text", text.value->c_str());
    }
    return item;
}

bool dumpJson(const Png& png, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open())
        return false;

    cJSON* root = cJSON_CreateArray();
    size_t offset = Png::STANDARD_HEADER.size();
    for (const auto& chunk : png.chunks()) {
        cJSON_AddItemToArray(root, build_json_chunk(chunk, offset));
        offset += Chunk::MIN_SIZE + chunk.length();
    }

    char* jsonStr = cJSON_Print(root);
    cJSON_Delete(root);
    if (jsonStr == nullptr)
        return false;

    outFile.write(jsonStr, static_cast<std::streamsize>(std::strlen(jsonStr)));
    std::free(jsonStr);
    return static_cast<bool>(outFile);
}

// Wrap long text into multiple lines with indentation
static std::vector<std::string> wrapText(const std::string& text, size_t width) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word, line;
    while (words >> word) {
        if (!line.empty() && line.size() + word.size() + 1 > width) {
            lines.push_back(line);
            line.clear();
        }
        if (!line.empty()) line += " ";
        line += word;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

static void printChunk(const Chunk& chunk, size_t offset, bool verbose, const std::string& prefix, bool last) {
    // Offset in cyan, type in bold yellow, length in green
    std::ostringstream oss;
    oss << ansi::cyan << "[0x" << std::hex << std::setw(4) << std::setfill('0') << offset << "]" << ansi::reset
        << " " << ansi::bold << ansi::yellow << chunk.chunkType() << ansi::reset
        << " (length=" << ansi::green << std::dec << chunk.length() << ansi::reset
        << ", crc=0x" << std::hex << std::setw(8) << std::setfill('0') << chunk.crc() << std::dec << ")";

    std::cout << prefix << (last ? "└── " : "├── ") << oss.str() << "\n";

    std::string childPrefix = prefix + (last ? "    " : "│   ");

    std::cout << childPrefix << ansi::magenta << "Flags: " << describeFlags(chunk.chunkType()) << ansi::reset << "\n";

    if (!verbose)
        return;

    // Data preview wrapped, in gray
    auto text = chunk.dataAsString();
    std::string preview = text.isValid ? *text.value : hex_preview(chunk.data());
    auto lines = wrapText(preview, 60);
    if (!lines.empty()) {
        std::cout << childPrefix << ansi::gray << "Data: " << lines[0] << ansi::reset << "\n";
        for (size_t i = 1; i < lines.size(); ++i) {
            std::cout << childPrefix << ansi::gray << "      " << lines[i] << ansi::reset << "\n";
        }
    }
}

void printChunks(const Png& png, const std::string& inputFile, bool verbose) {
    std::cout << "* " << inputFile << std::endl;
    const auto& chunks = png.chunks();
    size_t offset = Png::STANDARD_HEADER.size();
    for (size_t i = 0; i < chunks.size(); ++i) {
        printChunk(chunks[i], offset, verbose, "", i == chunks.size() - 1);
        offset += Chunk::MIN_SIZE + chunks[i].length();
    }
}
