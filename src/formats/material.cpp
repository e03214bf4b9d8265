/**
 * LevelPak - Material Decoder Implementation
 */

#include "levelpak/material.hpp"
#include "levelpak/compression.hpp"
#include "levelpak/logging.hpp"
#include <cstring>

namespace levelpak {

namespace {

Result<BlendModes> decode_blend_modes(ByteReader& reader) {
    BlendModes modes;
    TRY_ASSIGN(source, reader.read_i32());
    TRY_ASSIGN(destination, reader.read_i32());
    modes.source_mode = source;
    modes.destination_mode = destination;
    return modes;
}

Result<AlphaTestMode> decode_alpha_test_mode(ByteReader& reader) {
    AlphaTestMode mode;
    TRY_ASSIGN(function, reader.read_i32());
    TRY_ASSIGN(reference, reader.read_f32());
    mode.comparison_function = function;
    mode.reference = reference;
    return mode;
}

/**
 * Texture descriptor following a positive name length.
 */
Result<MaterialTexture> decode_material_texture(ByteReader& reader, uint32_t uv_set, int32_t name_length) {
    MaterialTexture texture;
    texture.uv_set = uv_set;
    
    TRY_ASSIGN(name, reader.read_code_point_string(name_length));
    TRY_ASSIGN(format, reader.read_i32());
    TRY_ASSIGN(filter, reader.read_i32());
    TRY_ASSIGN(address, reader.read_i32());
    
    TRY_ASSIGN(mask_length, reader.read_i32());
    if (mask_length < 0) {
        return Error::invalid_length("texture mask name", mask_length)
            .with_context("texture '" + name + "'");
    }
    TRY_ASSIGN(mask_name, reader.read_code_point_string(mask_length));
    TRY_ASSIGN(border, reader.read_rgba());
    TRY_ASSIGN(hash, reader.read_u32());
    
    texture.name = std::move(name);
    texture.format = format;
    texture.filter_mode = filter;
    texture.address_mode = address;
    texture.mask_name = std::move(mask_name);
    texture.border_colour = border;
    texture.hash = hash;
    return texture;
}

// Append helpers for the attribute serialization
void put_u8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 24));
}

void put_i32(std::vector<uint8_t>& out, int32_t v) {
    put_u32(out, static_cast<uint32_t>(v));
}

void put_f32(std::vector<uint8_t>& out, float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    put_u32(out, bits);
}

void put_bool(std::vector<uint8_t>& out, bool v) {
    put_u8(out, v ? 1 : 0);
}

void put_rgba(std::vector<uint8_t>& out, const Rgba& c) {
    put_f32(out, c.r);
    put_f32(out, c.g);
    put_f32(out, c.b);
    put_f32(out, c.a);
}

} // namespace

Result<Material> decode_material(ByteReader& reader) {
    size_t start = reader.absolute_offset();
    Material material;
    Attributes& attr = material.attributes;
    
    TRY_ASSIGN(flags, reader.read_u32());
    TRY(reader.read_u32());  // Name hash, superseded by the material hash below
    TRY_ASSIGN(additive, reader.read_bool32());
    TRY_ASSIGN(colour, reader.read_rgba());
    TRY_ASSIGN(specular, reader.read_rgba());
    TRY_ASSIGN(power, reader.read_f32());
    TRY_ASSIGN(shading_mode, reader.read_i32());
    TRY_ASSIGN(blend, reader.read_bool32());
    TRY_ASSIGN(blend_modes, decode_blend_modes(reader));
    TRY_ASSIGN(alpha_test, reader.read_bool32());
    TRY_ASSIGN(alpha_test_mode, decode_alpha_test_mode(reader));
    TRY_ASSIGN(depth_write, reader.read_bool32());
    TRY_ASSIGN(depth_comparison, reader.read_i32());
    TRY_ASSIGN(material_hash, reader.read_u32());
    TRY_ASSIGN(owner, reader.read_u32());
    TRY_ASSIGN(colour_buffer_write, reader.read_u32());
    
    attr.flags = flags;
    attr.additive_lighting_model = additive;
    attr.colour = colour;
    attr.specular = specular;
    attr.power = power;
    attr.shading_mode = shading_mode;
    attr.blend = blend;
    attr.blend_modes = blend_modes;
    attr.alpha_test = alpha_test;
    attr.alpha_test_mode = alpha_test_mode;
    attr.depth_buffer_write = depth_write;
    attr.depth_buffer_comparison_mode = depth_comparison;
    attr.owner = owner;
    attr.colour_buffer_write = colour_buffer_write;
    material.material_hash = material_hash;
    
    // Texture slots. A non-positive name length means the slot is empty and
    // nothing else follows for it.
    for (size_t i = 0; i < MATERIAL_SLOT_COUNT; i++) {
        TRY_ASSIGN(uv_set, reader.read_u32());
        TRY_ASSIGN(name_length, reader.read_i32());
        attr.uv_sets[i] = uv_set;
        
        if (name_length <= 0) {
            continue;
        }
        
        auto texture = decode_material_texture(reader, uv_set, name_length);
        if (!texture) {
            return texture.error().with_context("texture slot " + std::to_string(i));
        }
        attr.texture_hashes[i] = texture->hash;
        material.textures[i] = std::move(*texture);
    }
    
    for (size_t i = 0; i < MATERIAL_SLOT_COUNT; i++) {
        TRY_ASSIGN(use_matrix, reader.read_bool32());
        attr.use_matrices[i] = use_matrix;
        if (use_matrix) {
            TRY_ASSIGN(matrix, reader.read_matrix());
            material.uv_transforms[i] = matrix;
        }
    }
    
    for (size_t i = 0; i < MATERIAL_SLOT_COUNT; i++) {
        TRY_ASSIGN(generator, reader.read_i32());
        attr.generators[i] = generator;
    }
    
    TRY_ASSIGN(envmap_type, reader.read_i32());
    TRY_ASSIGN(envmap_distance, reader.read_f32());
    attr.envmap_type = envmap_type;
    attr.planar_sheer_envmap_distance = envmap_distance;
    
    LOG_DEBUG("Material", "@" << start << " hash=0x" << std::hex << material.material_hash
              << std::dec << " consumed=" << (reader.absolute_offset() - start) << " bytes");
    return material;
}

std::vector<uint8_t> serialize_attributes(const Attributes& a) {
    std::vector<uint8_t> out;
    out.reserve(ATTRIBUTES_SERIALIZED_SIZE);
    
    put_u32(out, a.flags);
    put_bool(out, a.additive_lighting_model);
    put_rgba(out, a.colour);
    put_rgba(out, a.specular);
    put_f32(out, a.power);
    put_i32(out, a.shading_mode);
    put_bool(out, a.depth_buffer_write);
    put_i32(out, a.depth_buffer_comparison_mode);
    put_bool(out, a.blend);
    put_i32(out, a.blend_modes.source_mode);
    put_i32(out, a.blend_modes.destination_mode);
    put_bool(out, a.alpha_test);
    put_i32(out, a.alpha_test_mode.comparison_function);
    put_f32(out, a.alpha_test_mode.reference);
    put_u32(out, a.owner);
    put_u32(out, a.colour_buffer_write);
    for (bool use : a.use_matrices) put_bool(out, use);
    for (int32_t gen : a.generators) put_i32(out, gen);
    for (uint32_t uv : a.uv_sets) put_u32(out, uv);
    for (uint32_t hash : a.texture_hashes) put_u32(out, hash);
    put_i32(out, a.envmap_type);
    put_f32(out, a.planar_sheer_envmap_distance);
    
    return out;
}

uint32_t compute_structural_hash(const Attributes& attributes) {
    auto bytes = serialize_attributes(attributes);
    return crc32_checksum(bytes.data(), bytes.size());
}

} // namespace levelpak
