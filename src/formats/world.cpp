/**
 * LevelPak - World / Floor Decoder Implementation
 */

#include "levelpak/world.hpp"
#include "levelpak/logging.hpp"
#include <algorithm>

namespace levelpak {

Result<Floor> decode_floor(ByteReader& reader) {
    Floor floor;
    TRY_ASSIGN(occlusion_bsp, reader.read_u32());
    TRY_ASSIGN(ghost_camera, reader.read_bounding_box());
    floor.occlusion_bsp = occlusion_bsp;
    floor.ghost_camera = ghost_camera;
    return floor;
}

Result<World> decode_world(ByteReader& reader) {
    size_t start = reader.absolute_offset();
    World world;
    
    TRY_ASSIGN(flags, reader.read_u32());
    TRY_ASSIGN(ambient, reader.read_rgb_u8());
    TRY_ASSIGN(floor_count, reader.read_i32());
    world.flags = flags;
    world.ambient = ambient;
    
    if (floor_count < 0) {
        return Error::invalid_length("floor list", floor_count)
            .with_context("world @" + std::to_string(start));
    }
    
    world.floors.reserve(std::min<size_t>(static_cast<size_t>(floor_count),
                                          reader.remaining() / FLOOR_ENCODED_SIZE));
    for (int32_t i = 0; i < floor_count; i++) {
        auto floor = decode_floor(reader);
        if (!floor) {
            return floor.error().with_context("floor " + std::to_string(i));
        }
        world.floors.push_back(*floor);
    }
    
    TRY_ASSIGN(zone_count, reader.read_i32());
    TRY_ASSIGN(have_occlusion_bsp, reader.read_bool32());
    TRY_ASSIGN(have_nulls, reader.read_bool32());
    TRY_ASSIGN(have_waypoints, reader.read_bool32());
    TRY_ASSIGN(have_mesh, reader.read_bool32());
    world.zone_count = zone_count;
    world.have_occlusion_bsp = have_occlusion_bsp;
    world.have_nulls = have_nulls;
    world.have_waypoints = have_waypoints;
    world.have_mesh = have_mesh;
    
    LOG_DEBUG("World", "@" << start << " floors=" << world.floors.size()
              << " zones=" << zone_count);
    return world;
}

} // namespace levelpak
