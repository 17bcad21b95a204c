#pragma once
#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include "chunk_error.hpp"

// 4-byte PNG chunk type code. The case of each letter encodes one property
// bit (bit 5, 0x20):
//   byte 0  ancillary   (lowercase) / critical       (uppercase)
//   byte 1  private     (lowercase) / public         (uppercase)
//   byte 2  reserved, must be uppercase
//   byte 3  safe to copy (lowercase) / unsafe to copy (uppercase)
class ChunkType {
public:
    // Stores the bytes verbatim, alphabetic or not.
    explicit ChunkType(const std::array<uint8_t, 4>& bytes);

    // Stricter than the array constructor: exactly 4 ASCII letters.
    static ChunkResult<ChunkType> fromString(const std::string& code);

    const std::array<uint8_t, 4>& bytes() const { return typeBytes; }

    bool isAlphabetic() const;
    bool isValid() const;
    bool isCritical() const;
    bool isPublic() const;
    bool isReservedBitValid() const;
    bool isSafeToCopy() const;

    std::string toString() const;

    bool operator==(const ChunkType& other) const { return typeBytes == other.typeBytes; }
    bool operator!=(const ChunkType& other) const { return !(*this == other); }

private:
    std::array<uint8_t, 4> typeBytes;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);
