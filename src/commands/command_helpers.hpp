#pragma once
#include <optional>
#include <string>
#include "png.hpp"

// Reads and parses a PNG file. Failures are logged and yield nullopt.
std::optional<Png> loadPng(const std::string& path);
bool savePng(const std::string& path, const Png& png);
