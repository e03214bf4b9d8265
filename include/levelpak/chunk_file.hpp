/**
 * LevelPak - Chunk File
 * 
 * A level file is a flat sequence of chunks:
 *   [type i32][size i32][version i32][payload: size bytes] ...
 * optionally wrapped in a single zlib stream.
 */

#pragma once

#include "chunk_decoder.hpp"
#include "result.hpp"
#include "types.hpp"
#include <filesystem>
#include <optional>
#include <vector>
#include <cstdint>

namespace levelpak {

namespace fs = std::filesystem;

/**
 * Chunk location, offset of its header within the (inflated) data.
 */
struct ChunkEntry {
    size_t offset = 0;
    ChunkHeader header;
};

struct DecodedChunk {
    size_t offset = 0;
    ChunkHeader header;
    ChunkRecord record;
};

struct ChunkFileOptions {
    bool strict_chunk_size = false;     // Unconsumed payload bytes are a SizeMismatch error
    std::optional<ChunkType> filter;    // Only decode chunks of this type
};

class ChunkFile {
public:
    ChunkFile() = default;
    
    /**
     * Read a file from disk. Inflates it first if it is zlib-compressed.
     */
    Result<void> load(const fs::path& path);
    
    /**
     * Take ownership of an in-memory buffer. Inflates it first if it is
     * zlib-compressed.
     */
    Result<void> load(std::vector<uint8_t> data);
    
    /**
     * Walk chunk headers without decoding payloads.
     */
    Result<std::vector<ChunkEntry>> list() const;
    
    /**
     * Decode every chunk (or every chunk matching options.filter).
     * Stops at the first error, which carries the chunk offset as context.
     */
    Result<std::vector<DecodedChunk>> decode_all(const ChunkDecoder& decoder,
                                                 const ChunkFileOptions& options = {}) const;
    
    const std::vector<uint8_t>& data() const { return data_; }
    bool was_compressed() const { return was_compressed_; }
    const fs::path& path() const { return path_; }

private:
    /**
     * Read the next header and split off a reader over exactly its payload.
     */
    Result<ByteReader> next_chunk(ByteReader& reader, ChunkEntry& entry) const;
    
    std::vector<uint8_t> data_;
    fs::path path_;
    bool was_compressed_ = false;
};

} // namespace levelpak
