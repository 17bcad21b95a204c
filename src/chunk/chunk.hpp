#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "chunk_error.hpp"
#include "chunk_type.hpp"

struct TakenChunk;

// One PNG chunk:
//   length (4, BE) | type (4) | data (length) | crc (4, BE)
// crc is CRC-32/IEEE over type ++ data.
class Chunk {
public:
    static constexpr size_t HEADER_SIZE = 8;   // length + type
    static constexpr size_t CRC_SIZE = 4;
    static constexpr size_t MIN_SIZE = HEADER_SIZE + CRC_SIZE;
    static constexpr uint64_t MAX_DATA_SIZE = 0xFFFFFFFFu;  // length field is 32 bits

    static bool fitsDataSize(uint64_t size) { return size <= MAX_DATA_SIZE; }

    // data must satisfy fitsDataSize(); callers holding untrusted sizes check first.
    Chunk(ChunkType chunkType, std::vector<uint8_t> data);

    // Parses the chunk starting at offset. On success also reports how many
    // bytes of blob follow the chunk.
    static ChunkResult<TakenChunk> takeFrom(const std::vector<uint8_t>& blob, size_t offset = 0);

    // Like takeFrom, but bytes must hold exactly one chunk.
    static ChunkResult<Chunk> tryFrom(const std::vector<uint8_t>& bytes);

    static uint32_t computeCrc(const ChunkType& chunkType, const std::vector<uint8_t>& data);

    uint32_t length() const { return chunkLength; }
    const ChunkType& chunkType() const { return type; }
    const std::vector<uint8_t>& data() const { return payload; }
    uint32_t crc() const { return checksum; }

    ChunkResult<std::string> dataAsString() const;

    std::vector<uint8_t> asBytes() const;

private:
    uint32_t chunkLength;
    ChunkType type;
    std::vector<uint8_t> payload;
    uint32_t checksum;
};

// Writes the data as text. Sets failbit when it is not UTF-8.
std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

struct TakenChunk {
    Chunk chunk;
    size_t remaining;
};
