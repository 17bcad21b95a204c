#include "chunk.hpp"
#include <zlib.h>
#include <sstream>
#include "helpers.hpp"
#include "logger.hpp"

Chunk::Chunk(ChunkType chunkType, std::vector<uint8_t> data)
    : chunkLength(static_cast<uint32_t>(data.size())),
      type(chunkType),
      payload(std::move(data)),
      checksum(computeCrc(type, payload)) {}

uint32_t Chunk::computeCrc(const ChunkType& chunkType, const std::vector<uint8_t>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, chunkType.bytes().data(), static_cast<uInt>(chunkType.bytes().size()));
    if (!data.empty())
        crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

ChunkResult<TakenChunk> Chunk::takeFrom(const std::vector<uint8_t>& blob, size_t offset) {
    const size_t available = offset < blob.size() ? blob.size() - offset : 0;

    if (available < MIN_SIZE) {
        return ChunkResult<TakenChunk>::fail(ChunkError::TooShort,
            "Chunk needs at least " + std::to_string(MIN_SIZE) + " bytes, got " + std::to_string(available));
    }

    uint32_t length = read_be32(blob, offset);

    ChunkType chunkType({blob[offset + 4], blob[offset + 5], blob[offset + 6], blob[offset + 7]});

    // 64-bit so a huge declared length cannot wrap
    const uint64_t crcStart = HEADER_SIZE + static_cast<uint64_t>(length);
    if (crcStart + CRC_SIZE > available) {
        std::ostringstream info;
        info << "Chunk " << chunkType << " declares " << length << " data bytes but only "
             << (available - MIN_SIZE) << " are available";
        return ChunkResult<TakenChunk>::fail(ChunkError::TruncatedData, info.str());
    }

    const size_t dataBegin = offset + HEADER_SIZE;
    const size_t crcOffset = offset + static_cast<size_t>(crcStart);
    uint32_t providedCrc = read_be32(blob, crcOffset);

    std::vector<uint8_t> data(blob.begin() + dataBegin, blob.begin() + crcOffset);
    uint32_t computedCrc = computeCrc(chunkType, data);

    if (providedCrc != computedCrc) {
        Logger::debug("Chunk " + chunkType.toString() + " CRC computed: " + std::to_string(computedCrc)
                      + ", provided: " + std::to_string(providedCrc));
        std::ostringstream info;
        info << "Chunk " << chunkType << " CRC mismatch: stored 0x" << to_hex(providedCrc)
             << ", computed 0x" << to_hex(computedCrc);
        return ChunkResult<TakenChunk>::fail(ChunkError::CrcMismatch, info.str());
    }

    const size_t consumed = static_cast<size_t>(crcStart) + CRC_SIZE;
    TakenChunk taken{Chunk(chunkType, std::move(data)), available - consumed};
    return ChunkResult<TakenChunk>::ok(std::move(taken));
}

ChunkResult<Chunk> Chunk::tryFrom(const std::vector<uint8_t>& bytes) {
    auto taken = takeFrom(bytes);
    if (!taken.isValid) {
        return ChunkResult<Chunk>::fail(taken.error, taken.info);
    }
    if (taken.value->remaining != 0) {
        return ChunkResult<Chunk>::fail(ChunkError::TrailingData,
            std::to_string(taken.value->remaining) + " trailing bytes after chunk "
            + taken.value->chunk.chunkType().toString());
    }
    return ChunkResult<Chunk>::ok(std::move(taken.value->chunk));
}

ChunkResult<std::string> Chunk::dataAsString() const {
    if (!is_valid_utf8(payload)) {
        return ChunkResult<std::string>::fail(ChunkError::Encoding,
            "Chunk " + type.toString() + " data is not valid UTF-8");
    }
    return ChunkResult<std::string>::ok(std::string(payload.begin(), payload.end()));
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    auto text = chunk.dataAsString();
    if (!text.isValid) {
        os.setstate(std::ios::failbit);
        return os;
    }
    return os << *text.value;
}

std::vector<uint8_t> Chunk::asBytes() const {
    std::vector<uint8_t> out;
    out.reserve(MIN_SIZE + payload.size());
    write_be32(out, chunkLength);
    out.insert(out.end(), type.bytes().begin(), type.bytes().end());
    out.insert(out.end(), payload.begin(), payload.end());
    write_be32(out, checksum);
    return out;
}
