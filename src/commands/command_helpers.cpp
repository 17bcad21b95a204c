#include "command_helpers.hpp"
#include <filesystem>
#include <system_error>
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

std::optional<Png> loadPng(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        Logger::error("Error, not a regular file: " + path);
        return std::nullopt;
    }
    auto size = fs::file_size(path, ec);
    if (ec || size > MAX_INPUT_FILE_SIZE) {
        Logger::error("Error: " + path + " is too large or unreadable");
        return std::nullopt;
    }

    Logger::debug("Opening " + path + "...");
    auto blob = readFile(path);
    if (blob.size() != size) {
        Logger::error("Error: Cannot read file " + path);
        return std::nullopt;
    }

    auto png = Png::fromBytes(blob);
    if (!png.isValid) {
        Logger::error(path + ": " + chunkErrorName(png.error) + ": " + png.info);
        return std::nullopt;
    }
    Logger::debug(path + ": " + std::to_string(png.value->chunks().size()) + " chunks");
    return std::move(png.value);
}

bool savePng(const std::string& path, const Png& png) {
    if (!writeFile(path, png.asBytes())) {
        Logger::error("Error: Cannot write file " + path);
        return false;
    }
    Logger::debug("Wrote " + path);
    return true;
}
