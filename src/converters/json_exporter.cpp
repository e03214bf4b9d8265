/**
 * LevelPak - JSON Export Implementation
 */

#include "levelpak/json_export.hpp"
#include "levelpak/chunk_header.hpp"
#include "levelpak/material.hpp"

namespace levelpak {

using nlohmann::json;

namespace {

json vec_to_json(const Vector2& v) { return json::array({v.x, v.y}); }
json vec_to_json(const Vector3& v) { return json::array({v.x, v.y, v.z}); }
json vec_to_json(const Rgba& c) { return json::array({c.r, c.g, c.b, c.a}); }

json matrix_to_json(const Matrix& m) {
    json out = json::array();
    for (int col = 0; col < 4; col++) {
        for (int row = 0; row < 4; row++) {
            out.push_back(m[col][row]);
        }
    }
    return out;
}

json bounding_box_to_json(const BoundingBox& box) {
    return json{{"min", vec_to_json(box.min)}, {"max", vec_to_json(box.max)}};
}

json attributes_to_json(const Attributes& a) {
    json j;
    j["flags"] = a.flags;
    j["additive_lighting_model"] = a.additive_lighting_model;
    j["colour"] = vec_to_json(a.colour);
    j["specular"] = vec_to_json(a.specular);
    j["power"] = a.power;
    j["shading_mode"] = a.shading_mode;
    j["depth_buffer_write"] = a.depth_buffer_write;
    j["depth_buffer_comparison_mode"] = a.depth_buffer_comparison_mode;
    j["blend"] = a.blend;
    j["blend_modes"] = {{"source", a.blend_modes.source_mode},
                        {"destination", a.blend_modes.destination_mode}};
    j["alpha_test"] = a.alpha_test;
    j["alpha_test_mode"] = {{"comparison_function", a.alpha_test_mode.comparison_function},
                            {"reference", a.alpha_test_mode.reference}};
    j["owner"] = a.owner;
    j["colour_buffer_write"] = a.colour_buffer_write;
    j["use_matrices"] = a.use_matrices;
    j["generators"] = a.generators;
    j["uv_sets"] = a.uv_sets;
    j["texture_hashes"] = a.texture_hashes;
    j["envmap_type"] = a.envmap_type;
    j["planar_sheer_envmap_distance"] = a.planar_sheer_envmap_distance;
    return j;
}

json texture_to_json(const MaterialTexture& t) {
    json j;
    j["uv_set"] = t.uv_set;
    j["name"] = t.name;
    j["format"] = t.format;
    j["address_mode"] = t.address_mode;
    j["mask_name"] = t.mask_name;
    j["border_colour"] = vec_to_json(t.border_colour);
    j["hash"] = t.hash;
    return j;
}

} // namespace

json chunk_header_to_json(const ChunkHeader& header) {
    return json{
        {"type", chunk_type_name(header.type)},
        {"code", static_cast<int32_t>(header.type)},
        {"size", header.size},
        {"version", header.version}
    };
}

json material_to_json(const Material& material) {
    json j;
    j["material_hash"] = material.material_hash;
    j["structural_hash"] = compute_structural_hash(material.attributes);
    j["attributes"] = attributes_to_json(material.attributes);
    
    json textures = json::array();
    json transforms = json::array();
    for (size_t i = 0; i < MATERIAL_SLOT_COUNT; i++) {
        textures.push_back(material.textures[i] ? texture_to_json(*material.textures[i]) : json(nullptr));
        transforms.push_back(material.uv_transforms[i] ? matrix_to_json(*material.uv_transforms[i]) : json(nullptr));
    }
    j["textures"] = std::move(textures);
    j["uv_transforms"] = std::move(transforms);
    return j;
}

json vertex_to_json(const Vertex& v) {
    json j = json::object();
    if (v.position) j["position"] = vec_to_json(*v.position);
    if (v.normal) j["normal"] = vec_to_json(*v.normal);
    if (v.reciprocal_homogeneous_w) j["reciprocal_homogeneous_w"] = *v.reciprocal_homogeneous_w;
    if (v.diffuse) j["diffuse"] = vec_to_json(*v.diffuse);
    if (v.weight) j["weight"] = *v.weight;
    if (v.indices) j["indices"] = json::array({v.indices->first, v.indices->second});
    if (!v.uvs.empty()) {
        json uvs = json::array();
        for (const auto& uv : v.uvs) {
            uvs.push_back(vec_to_json(uv));
        }
        j["uvs"] = std::move(uvs);
    }
    return j;
}

json model_part_to_json(const ModelPart& p) {
    json j;
    j["read_access_flags"] = p.read_access_flags;
    j["vertex_read_flags"] = p.vertex_read_flags;
    j["write_access_flags"] = p.write_access_flags;
    j["vertex_write_flags"] = p.vertex_write_flags;
    j["hint_flags"] = p.hint_flags;
    j["constant_flags"] = p.constant_flags;
    j["vertex_flags"] = p.vertex_flags;
    j["render_flags"] = p.render_flags;
    j["triangle_count"] = p.triangle_count;
    j["strip_count"] = p.strip_count;
    j["strip_triangle_count"] = p.strip_triangle_count;
    j["material_hash"] = p.material_hash;
    j["triangle_index"] = json::array({p.triangle_index0, p.triangle_index1});
    j["vertex_index"] = json::array({p.vertex_index0, p.vertex_index1});
    j["layer_z"] = p.layer_z;
    j["floor_flags"] = p.floor_flags;
    j["flags"] = p.flags;
    j["lighting_id"] = p.lighting_id;
    
    json vertices = json::array();
    for (const auto& v : p.vertices) {
        vertices.push_back(vertex_to_json(v));
    }
    j["vertices"] = std::move(vertices);
    return j;
}

json world_to_json(const World& w) {
    json j;
    j["flags"] = w.flags;
    j["ambient"] = vec_to_json(w.ambient);
    
    json floors = json::array();
    for (const auto& f : w.floors) {
        floors.push_back({{"occlusion_bsp", f.occlusion_bsp},
                          {"ghost_camera", bounding_box_to_json(f.ghost_camera)}});
    }
    j["floors"] = std::move(floors);
    j["zone_count"] = w.zone_count;
    j["have_occlusion_bsp"] = w.have_occlusion_bsp;
    j["have_nulls"] = w.have_nulls;
    j["have_waypoints"] = w.have_waypoints;
    j["have_mesh"] = w.have_mesh;
    return j;
}

json record_to_json(const ChunkRecord& record) {
    if (const auto* material = std::get_if<Material>(&record)) {
        return material_to_json(*material);
    }
    if (const auto* part = std::get_if<ModelPart>(&record)) {
        return model_part_to_json(*part);
    }
    if (const auto* world = std::get_if<World>(&record)) {
        return world_to_json(*world);
    }
    const auto& raw = std::get<RawChunk>(record);
    return json{{"payload_size", raw.payload.size()}};
}

json chunks_to_json(const std::vector<DecodedChunk>& chunks) {
    json list = json::array();
    for (const auto& chunk : chunks) {
        list.push_back({
            {"offset", chunk.offset},
            {"header", chunk_header_to_json(chunk.header)},
            {"kind", record_kind_name(chunk.record)},
            {"record", record_to_json(chunk.record)}
        });
    }
    return json{{"chunks", std::move(list)}};
}

std::string export_chunks_json(const std::vector<DecodedChunk>& chunks, int indent) {
    // Names are code points cut to one byte each, so they need not be UTF-8
    return chunks_to_json(chunks).dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace levelpak
