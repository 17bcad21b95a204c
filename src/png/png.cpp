#include "png.hpp"
#include <algorithm>
#include <cstring>
#include "logger.hpp"

const std::array<uint8_t, 8> Png::STANDARD_HEADER = {
    0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A
};

Png::Png(std::vector<Chunk> chunks) : chunkList(std::move(chunks)) {}

ChunkResult<Png> Png::fromBytes(const std::vector<uint8_t>& blob) {
    if (blob.size() < STANDARD_HEADER.size() ||
        std::memcmp(blob.data(), STANDARD_HEADER.data(), STANDARD_HEADER.size()) != 0) {
        return ChunkResult<Png>::fail(ChunkError::InvalidSignature, "Missing PNG signature");
    }

    std::vector<Chunk> chunks;
    size_t pos = STANDARD_HEADER.size();
    while (pos < blob.size()) {
        auto taken = Chunk::takeFrom(blob, pos);
        if (!taken.isValid) {
            return ChunkResult<Png>::fail(taken.error,
                "Chunk #" + std::to_string(chunks.size()) + " at offset " + std::to_string(pos) + ": " + taken.info);
        }
        Logger::debug("Chunk " + taken.value->chunk.chunkType().toString() + " at offset "
                      + std::to_string(pos) + " length " + std::to_string(taken.value->chunk.length()));
        pos = blob.size() - taken.value->remaining;
        chunks.push_back(std::move(taken.value->chunk));
    }

    return ChunkResult<Png>::ok(Png(std::move(chunks)));
}

void Png::appendChunk(Chunk chunk) {
    auto iend = std::find_if(chunkList.begin(), chunkList.end(), [](const Chunk& c) {
        return c.chunkType().toString() == "IEND";
    });
    chunkList.insert(iend, std::move(chunk));
}

ChunkResult<Chunk> Png::removeFirstChunk(const std::string& chunkType) {
    auto type = ChunkType::fromString(chunkType);
    if (!type.isValid) {
        return ChunkResult<Chunk>::fail(type.error, type.info);
    }

    auto it = std::find_if(chunkList.begin(), chunkList.end(), [&](const Chunk& c) {
        return c.chunkType() == *type.value;
    });
    if (it == chunkList.end()) {
        return ChunkResult<Chunk>::fail(ChunkError::ChunkNotFound, "No chunk of type " + chunkType);
    }

    Chunk removed = std::move(*it);
    chunkList.erase(it);
    return ChunkResult<Chunk>::ok(std::move(removed));
}

const Chunk* Png::chunkByType(const std::string& chunkType) const {
    for (const auto& chunk : chunkList) {
        if (chunk.chunkType().toString() == chunkType)
            return &chunk;
    }
    return nullptr;
}

std::vector<uint8_t> Png::asBytes() const {
    std::vector<uint8_t> out(STANDARD_HEADER.begin(), STANDARD_HEADER.end());
    for (const auto& chunk : chunkList) {
        auto bytes = chunk.asBytes();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}
