/**
 * LevelPak - Model Part / Vertex Decoder
 * 
 * A model part is a fixed header followed by vertex_count vertex records.
 * The part's flags word selects which optional fields every vertex of the
 * part carries, and its low byte gives the number of UV pairs.
 */

#pragma once

#include "byte_reader.hpp"
#include "result.hpp"
#include "types.hpp"
#include <cstdint>

namespace levelpak {

// ============================================================================
// Vertex layout bits (ModelPart::flags)
// ============================================================================
constexpr uint32_t VERTEX_HAS_POSITION = 1u << 8;
constexpr uint32_t VERTEX_HAS_NORMAL = 1u << 9;
constexpr uint32_t VERTEX_HAS_RECIPROCAL_HOMOGENEOUS_W = 1u << 10;
constexpr uint32_t VERTEX_HAS_DIFFUSE = 1u << 11;
constexpr uint32_t VERTEX_HAS_WEIGHT = 1u << 12;
constexpr uint32_t VERTEX_HAS_INDICES = 1u << 13;
constexpr uint32_t VERTEX_UV_COUNT_MASK = 0xFF;

// Header: 8 flag words, vertex count, 3 u16 counts, material hash,
// 4 index bounds, layer z, floor flags, flags, lighting id
constexpr size_t MODEL_PART_HEADER_SIZE = 8 * 4 + 4 + 3 * 2 + 4 + 4 * 4 + 4 * 4;

inline uint32_t vertex_uv_count(uint32_t flags) {
    return flags & VERTEX_UV_COUNT_MASK;
}

/**
 * Encoded byte size of one vertex under the given flags word.
 */
size_t vertex_stride(uint32_t flags);

/**
 * Decode one vertex whose layout is selected by `flags`.
 * Fields are read in the order position, normal, reciprocal homogeneous w,
 * diffuse, weight, indices, then the UV pairs.
 */
Result<Vertex> decode_vertex(ByteReader& reader, uint32_t flags);

Result<ModelPart> decode_model_part(ByteReader& reader);

} // namespace levelpak
