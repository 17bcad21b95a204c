#include "helpers.hpp"
#include <cstdint>
#include <vector>
#include <string>
#include <charconv>
#include <array>
#include <algorithm>
//
// Big-endian reader / writer
//
uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset]) << 24) |
           (static_cast<uint32_t>(blob[offset + 1]) << 16) |
           (static_cast<uint32_t>(blob[offset + 2]) << 8) |
           (static_cast<uint32_t>(blob[offset + 3]));
}

void write_be32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

//
// UTF-8 validation
//
bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        uint8_t lead = bytes[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t width;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            width = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            width = 3;
            if (lead == 0xE0) lo = 0xA0;      // overlong
            else if (lead == 0xED) hi = 0x9F; // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            width = 4;
            if (lead == 0xF0) lo = 0x90;      // overlong
            else if (lead == 0xF4) hi = 0x8F; // > U+10FFFF
        } else {
            return false;
        }

        if (i + width > n) return false;

        // Only the first continuation byte has a narrowed range
        if (bytes[i + 1] < lo || bytes[i + 1] > hi) return false;
        for (size_t k = 2; k < width; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) return false;
        }
        i += width;
    }
    return true;
}

std::string to_hex(size_t value)
{
   std::array<char, 32> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string hex_preview(const std::vector<uint8_t>& bytes, size_t maxLength) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(maxLength, bytes.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(bytes[i]);
        if (i + 1 != limit) oss << ' ';
    }
    if (bytes.size() > limit) oss << " ...";
    return oss.str();
}
