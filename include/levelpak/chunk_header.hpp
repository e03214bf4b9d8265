/**
 * LevelPak - Chunk Header Decoder
 */

#pragma once

#include "byte_reader.hpp"
#include "result.hpp"
#include "types.hpp"
#include <optional>
#include <string_view>
#include <cstdint>

namespace levelpak {

/**
 * Map a raw type code onto the closed ChunkType set.
 */
std::optional<ChunkType> chunk_type_from_code(int32_t code);

/**
 * Display name of a chunk type ("Materials", "World", ...).
 */
const char* chunk_type_name(ChunkType type);

/**
 * Reverse of chunk_type_name, used for CLI filters. Case-sensitive.
 */
std::optional<ChunkType> chunk_type_from_name(std::string_view name);

/**
 * Decode type code, size and version, in that order.
 * 
 * Fails with UnrecognizedChunkType if the code is not a known chunk type;
 * size and version are passed through without interpretation.
 */
Result<ChunkHeader> decode_chunk_header(ByteReader& reader);

} // namespace levelpak
