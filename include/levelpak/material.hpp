/**
 * LevelPak - Material Decoder
 * 
 * Material payload layout (little-endian, no padding):
 * - Attribute prefix: flags, name hash (discarded), lighting/colour/blend/
 *   alpha-test/depth state, material hash, owner, colour buffer write mask
 * - 5 texture slots: uv set, name length, and when the length is positive
 *   the texture descriptor (name, format, filter, address, mask name,
 *   border colour, hash)
 * - 5 transform slots: presence flag, then a 4x4 matrix when set
 * - 5 generator codes
 * - Envmap type and planar sheer envmap distance
 */

#pragma once

#include "byte_reader.hpp"
#include "result.hpp"
#include "types.hpp"
#include <vector>
#include <cstdint>

namespace levelpak {

/**
 * Byte length of the serialized Attributes block.
 */
constexpr size_t ATTRIBUTES_SERIALIZED_SIZE = 149;

Result<Material> decode_material(ByteReader& reader);

/**
 * Serialize attributes field by field in declaration order: integers and
 * floats as 4 little-endian bytes, booleans as one byte, no padding.
 */
std::vector<uint8_t> serialize_attributes(const Attributes& attributes);

/**
 * CRC-32 over serialize_attributes(). Content-derived identity of a
 * material, independent of Material::material_hash.
 */
uint32_t compute_structural_hash(const Attributes& attributes);

} // namespace levelpak
