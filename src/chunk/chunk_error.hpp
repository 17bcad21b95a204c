#pragma once
#include <optional>
#include <string>
#include <utility>

enum class ChunkError {
    None,
    InvalidTypeCode,   // type string is not 4 ASCII letters
    TooShort,          // fewer than 12 bytes available
    TruncatedData,     // declared length runs past the buffer
    CrcMismatch,
    TrailingData,      // strict parse found bytes after the chunk
    Encoding,          // payload is not UTF-8
    InvalidSignature,  // file does not start with the PNG signature
    ChunkNotFound
};

inline std::string chunkErrorName(ChunkError error) {
    switch (error) {
        case ChunkError::None:             return "None";
        case ChunkError::InvalidTypeCode:  return "InvalidTypeCode";
        case ChunkError::TooShort:         return "TooShort";
        case ChunkError::TruncatedData:    return "TruncatedData";
        case ChunkError::CrcMismatch:      return "CrcMismatch";
        case ChunkError::TrailingData:     return "TrailingData";
        case ChunkError::Encoding:         return "Encoding";
        case ChunkError::InvalidSignature: return "InvalidSignature";
        case ChunkError::ChunkNotFound:    return "ChunkNotFound";
    }
    return "Unknown";
}

// Outcome of a parse or lookup: either a value, or an error code plus a
// human readable reason in info.
template <typename T>
struct ChunkResult {
    bool isValid = false;
    ChunkError error = ChunkError::None;
    std::string info;
    std::optional<T> value;

    static ChunkResult ok(T v) {
        ChunkResult r;
        r.isValid = true;
        r.value = std::move(v);
        return r;
    }

    static ChunkResult fail(ChunkError e, std::string reason) {
        ChunkResult r;
        r.isValid = false;
        r.error = e;
        r.info = std::move(reason);
        return r;
    }
};
