#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::vector<uint8_t> readFile(const std::string& path);
bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes);
