/**
 * LevelPak - JSON Export
 * 
 * Renders decoded records as JSON for inspection. Absent optional vertex
 * fields are left out of the output rather than written as zeros.
 */

#pragma once

#include "chunk_file.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace levelpak {

nlohmann::json chunk_header_to_json(const ChunkHeader& header);
nlohmann::json material_to_json(const Material& material);
nlohmann::json vertex_to_json(const Vertex& vertex);
nlohmann::json model_part_to_json(const ModelPart& part);
nlohmann::json world_to_json(const World& world);
nlohmann::json record_to_json(const ChunkRecord& record);

/**
 * {"chunks": [{"offset", "header", "kind", "record"}, ...]}
 */
nlohmann::json chunks_to_json(const std::vector<DecodedChunk>& chunks);

/**
 * Serialize with the given indent (-1 = compact).
 */
std::string export_chunks_json(const std::vector<DecodedChunk>& chunks, int indent = 2);

} // namespace levelpak
