#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <iomanip>
#include <sstream>

#define MAX_INPUT_FILE_SIZE 1024*1024*1024
//
// Big-endian reader / writer
//
uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset);
void write_be32(std::vector<uint8_t>& out, uint32_t value);

//
// UTF-8 validation (rejects overlong forms, surrogates and code points above U+10FFFF)
//
bool is_valid_utf8(const std::vector<uint8_t>& bytes);

std::string to_hex(size_t value);
// Space separated hex dump of at most maxLength leading bytes.
std::string hex_preview(const std::vector<uint8_t>& bytes, size_t maxLength = 16);
