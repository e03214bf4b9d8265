/**
 * LevelPak - Chunk Header Decoder Implementation
 */

#include "levelpak/chunk_header.hpp"
#include "levelpak/logging.hpp"
#include <array>
#include <string_view>

namespace levelpak {

namespace {

struct ChunkTypeEntry {
    ChunkType type;
    const char* name;
};

constexpr std::array<ChunkTypeEntry, 26> CHUNK_TYPES = {{
    {ChunkType::Textures,       "Textures"},
    {ChunkType::Materials,      "Materials"},
    {ChunkType::MaterialObj,    "MaterialObj"},
    {ChunkType::World,          "World"},
    {ChunkType::AnimLib,        "AnimLib"},
    {ChunkType::Entities,       "Entities"},
    {ChunkType::Entity,         "Entity"},
    {ChunkType::SpLights,       "SpLights"},
    {ChunkType::Zones,          "Zones"},
    {ChunkType::NavigationMesh, "NavigationMesh"},
    {ChunkType::WpPoints,       "WpPoints"},
    {ChunkType::SectorOctree,   "SectorOctree"},
    {ChunkType::Occlusion,      "Occlusion"},
    {ChunkType::Area,           "Area"},
    {ChunkType::SkinObj,        "SkinObj"},
    {ChunkType::BoneObj,        "BoneObj"},
    {ChunkType::OcclusionMesh,  "OcclusionMesh"},
    {ChunkType::ModelGroup,     "ModelGroup"},
    {ChunkType::SPMesh,         "SPMesh"},
    {ChunkType::Collision,      "Collision"},
    {ChunkType::AtomicMesh,     "AtomicMesh"},
    {ChunkType::GLCamera,       "GLCamera"},
    {ChunkType::GLProject,      "GLProject"},
    {ChunkType::LightObj,       "LightObj"},
    {ChunkType::LinkEmm,        "LinkEmm"},
    {ChunkType::LevelObj,       "LevelObj"},
}};

} // namespace

std::optional<ChunkType> chunk_type_from_code(int32_t code) {
    for (const auto& entry : CHUNK_TYPES) {
        if (static_cast<int32_t>(entry.type) == code) {
            return entry.type;
        }
    }
    return std::nullopt;
}

const char* chunk_type_name(ChunkType type) {
    for (const auto& entry : CHUNK_TYPES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "Unknown";
}

std::optional<ChunkType> chunk_type_from_name(std::string_view name) {
    for (const auto& entry : CHUNK_TYPES) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

Result<ChunkHeader> decode_chunk_header(ByteReader& reader) {
    size_t start = reader.absolute_offset();
    
    TRY_ASSIGN(code, reader.read_i32());
    auto type = chunk_type_from_code(code);
    if (!type) {
        return Error::unrecognized_chunk_type(code)
            .with_context("offset " + std::to_string(start));
    }
    
    TRY_ASSIGN(size, reader.read_i32());
    TRY_ASSIGN(version, reader.read_i32());
    
    ChunkHeader header;
    header.type = *type;
    header.size = size;
    header.version = version;
    
    LOG_DEBUG("ChunkHeader", "@" << start << " " << chunk_type_name(header.type)
              << " (" << code << ") size=" << size << " version=" << version);
    return header;
}

} // namespace levelpak
