#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "chunk.hpp"

// PNG file body: signature followed by an ordered list of chunks. Chunk order
// and mandatory chunks are not validated.
class Png {
public:
    static const std::array<uint8_t, 8> STANDARD_HEADER;

    Png() = default;
    explicit Png(std::vector<Chunk> chunks);

    // Checks the signature, then takes chunks one after another until the
    // buffer is exhausted. The first chunk error is returned as is.
    static ChunkResult<Png> fromBytes(const std::vector<uint8_t>& blob);

    // Inserted before IEND when the file has one, appended otherwise.
    void appendChunk(Chunk chunk);
    ChunkResult<Chunk> removeFirstChunk(const std::string& chunkType);

    const std::array<uint8_t, 8>& header() const { return STANDARD_HEADER; }
    const std::vector<Chunk>& chunks() const { return chunkList; }
    const Chunk* chunkByType(const std::string& chunkType) const;

    std::vector<uint8_t> asBytes() const;

private:
    std::vector<Chunk> chunkList;
};
