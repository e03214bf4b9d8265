/**
 * LevelPak - World / Floor Decoder
 * 
 * World payload: flags, ambient colour (3 bytes), floor count, floors,
 * zone count, then four presence flags (occlusion BSP, nulls, waypoints,
 * mesh).
 */

#pragma once

#include "byte_reader.hpp"
#include "result.hpp"
#include "types.hpp"

namespace levelpak {

// Floor: occlusion BSP reference + min/max box
constexpr size_t FLOOR_ENCODED_SIZE = 4 + 24;

// Bytes of a world payload excluding its floor records
constexpr size_t WORLD_FIXED_SIZE = 4 + 3 + 4 + 4 + 4 * 4;

Result<Floor> decode_floor(ByteReader& reader);

/**
 * Decode a world record. A negative floor count is InvalidLength; a count
 * larger than the payload holds fails with ShortRead at the first floor
 * that does not fit.
 */
Result<World> decode_world(ByteReader& reader);

} // namespace levelpak
