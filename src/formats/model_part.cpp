/**
 * LevelPak - Model Part / Vertex Decoder Implementation
 */

#include "levelpak/model_part.hpp"
#include "levelpak/logging.hpp"
#include <algorithm>

namespace levelpak {

size_t vertex_stride(uint32_t flags) {
    size_t stride = 0;
    if (flags & VERTEX_HAS_POSITION) stride += 12;
    if (flags & VERTEX_HAS_NORMAL) stride += 12;
    if (flags & VERTEX_HAS_RECIPROCAL_HOMOGENEOUS_W) stride += 4;
    if (flags & VERTEX_HAS_DIFFUSE) stride += 4;
    if (flags & VERTEX_HAS_WEIGHT) stride += 4;
    if (flags & VERTEX_HAS_INDICES) stride += 4;
    stride += vertex_uv_count(flags) * 8;
    return stride;
}

Result<Vertex> decode_vertex(ByteReader& reader, uint32_t flags) {
    Vertex vertex;
    
    if (flags & VERTEX_HAS_POSITION) {
        TRY_ASSIGN(position, reader.read_vector3());
        vertex.position = position;
    }
    
    if (flags & VERTEX_HAS_NORMAL) {
        TRY_ASSIGN(normal, reader.read_vector3());
        vertex.normal = normal;
    }
    
    if (flags & VERTEX_HAS_RECIPROCAL_HOMOGENEOUS_W) {
        TRY_ASSIGN(rhw, reader.read_u32());
        vertex.reciprocal_homogeneous_w = rhw;
    }
    
    if (flags & VERTEX_HAS_DIFFUSE) {
        TRY_ASSIGN(diffuse, reader.read_rgba_u8());
        vertex.diffuse = diffuse;
    }
    
    if (flags & VERTEX_HAS_WEIGHT) {
        TRY_ASSIGN(weight, reader.read_f32());
        vertex.weight = weight;
    }
    
    if (flags & VERTEX_HAS_INDICES) {
        TRY_ASSIGN(index0, reader.read_u16());
        TRY_ASSIGN(index1, reader.read_u16());
        vertex.indices = std::make_pair(index0, index1);
    }
    
    uint32_t uv_count = vertex_uv_count(flags);
    vertex.uvs.reserve(uv_count);
    for (uint32_t i = 0; i < uv_count; i++) {
        TRY_ASSIGN(uv, reader.read_vector2());
        vertex.uvs.push_back(uv);
    }
    
    return vertex;
}

Result<ModelPart> decode_model_part(ByteReader& reader) {
    size_t start = reader.absolute_offset();
    ModelPart part;
    
    TRY_ASSIGN(read_access_flags, reader.read_u32());
    TRY_ASSIGN(vertex_read_flags, reader.read_u32());
    TRY_ASSIGN(write_access_flags, reader.read_u32());
    TRY_ASSIGN(vertex_write_flags, reader.read_u32());
    TRY_ASSIGN(hint_flags, reader.read_u32());
    TRY_ASSIGN(constant_flags, reader.read_u32());
    TRY_ASSIGN(vertex_flags, reader.read_u32());
    TRY_ASSIGN(render_flags, reader.read_u32());
    TRY_ASSIGN(vertex_count, reader.read_u32());
    TRY_ASSIGN(triangle_count, reader.read_u16());
    TRY_ASSIGN(strip_count, reader.read_u16());
    TRY_ASSIGN(strip_triangle_count, reader.read_u16());
    TRY_ASSIGN(material_hash, reader.read_u32());
    TRY_ASSIGN(triangle_index0, reader.read_i32());
    TRY_ASSIGN(triangle_index1, reader.read_i32());
    TRY_ASSIGN(vertex_index0, reader.read_i32());
    TRY_ASSIGN(vertex_index1, reader.read_i32());
    TRY_ASSIGN(layer_z, reader.read_u32());
    TRY_ASSIGN(floor_flags, reader.read_u32());
    TRY_ASSIGN(flags, reader.read_u32());
    TRY_ASSIGN(lighting_id, reader.read_u32());
    
    part.read_access_flags = read_access_flags;
    part.vertex_read_flags = vertex_read_flags;
    part.write_access_flags = write_access_flags;
    part.vertex_write_flags = vertex_write_flags;
    part.hint_flags = hint_flags;
    part.constant_flags = constant_flags;
    part.vertex_flags = vertex_flags;
    part.render_flags = render_flags;
    part.triangle_count = triangle_count;
    part.strip_count = strip_count;
    part.strip_triangle_count = strip_triangle_count;
    part.material_hash = material_hash;
    part.triangle_index0 = triangle_index0;
    part.triangle_index1 = triangle_index1;
    part.vertex_index0 = vertex_index0;
    part.vertex_index1 = vertex_index1;
    part.layer_z = layer_z;
    part.floor_flags = floor_flags;
    part.flags = flags;
    part.lighting_id = lighting_id;
    
    // Don't trust the declared count for the allocation; a bogus count
    // still fails with ShortRead once the bytes run out.
    size_t stride = vertex_stride(flags);
    if (stride == 0 && vertex_count > reader.size()) {
        // Empty vertices consume nothing, so the count is never checked by a read
        return Error::invalid_length("vertex list", vertex_count)
            .with_context("model part @" + std::to_string(start));
    }
    
    size_t reserve = 0;
    if (stride > 0) {
        reserve = std::min<size_t>(vertex_count, reader.remaining() / stride);
    }
    part.vertices.reserve(reserve);
    
    for (uint32_t i = 0; i < vertex_count; i++) {
        auto vertex = decode_vertex(reader, flags);
        if (!vertex) {
            return vertex.error().with_context("vertex " + std::to_string(i));
        }
        part.vertices.push_back(std::move(*vertex));
    }
    
    LOG_DEBUG("ModelPart", "@" << start << " vertices=" << vertex_count
              << " flags=0x" << std::hex << flags << std::dec
              << " stride=" << stride << " material=0x" << std::hex << material_hash << std::dec);
    return part;
}

} // namespace levelpak
