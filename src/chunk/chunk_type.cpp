#include "chunk_type.hpp"

static const uint8_t PROPERTY_BIT = 0x20;

static bool isAsciiLetter(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

ChunkType::ChunkType(const std::array<uint8_t, 4>& bytes) : typeBytes(bytes) {}

ChunkResult<ChunkType> ChunkType::fromString(const std::string& code) {
    if (code.size() != 4) {
        return ChunkResult<ChunkType>::fail(ChunkError::InvalidTypeCode,
            "Chunk type must be 4 bytes, got " + std::to_string(code.size()) + ": \"" + code + "\"");
    }

    std::array<uint8_t, 4> bytes;
    for (size_t i = 0; i < 4; ++i) {
        uint8_t c = static_cast<uint8_t>(code[i]);
        if (!isAsciiLetter(c)) {
            return ChunkResult<ChunkType>::fail(ChunkError::InvalidTypeCode,
                "Chunk type \"" + code + "\" contains a non-letter at position " + std::to_string(i));
        }
        bytes[i] = c;
    }
    return ChunkResult<ChunkType>::ok(ChunkType(bytes));
}

bool ChunkType::isAlphabetic() const {
    for (uint8_t c : typeBytes) {
        if (!isAsciiLetter(c))
            return false;
    }
    return true;
}

bool ChunkType::isValid() const {
    return isAlphabetic() && isReservedBitValid();
}

bool ChunkType::isCritical() const {
    return (typeBytes[0] & PROPERTY_BIT) == 0;
}

bool ChunkType::isPublic() const {
    return (typeBytes[1] & PROPERTY_BIT) == 0;
}

bool ChunkType::isReservedBitValid() const {
    return (typeBytes[2] & PROPERTY_BIT) == 0;
}

bool ChunkType::isSafeToCopy() const {
    return (typeBytes[3] & PROPERTY_BIT) != 0;
}

std::string ChunkType::toString() const {
    return std::string(typeBytes.begin(), typeBytes.end());
}

std::ostream& operator<<(std::ostream& os, const ChunkType& type) {
    return os << type.toString();
}
