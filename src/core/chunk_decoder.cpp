/**
 * LevelPak - Chunk Decoder Dispatch Implementation
 */

#include "levelpak/chunk_decoder.hpp"
#include "levelpak/chunk_header.hpp"
#include "levelpak/logging.hpp"
#include "levelpak/material.hpp"
#include "levelpak/model_part.hpp"
#include "levelpak/world.hpp"

namespace levelpak {

namespace {

// Adapts a typed decoder to the uniform DecodeFn signature
template<typename T, Result<T> (*Decode)(ByteReader&)>
Result<ChunkRecord> decode_as(ByteReader& payload, const ChunkHeader&) {
    TRY_ASSIGN(record, Decode(payload));
    return ChunkRecord(std::move(record));
}

Result<ChunkRecord> decode_raw(ByteReader& payload, const ChunkHeader& header) {
    TRY_ASSIGN(bytes, payload.read_bytes(payload.remaining()));
    RawChunk raw;
    raw.header = header;
    raw.payload.assign(bytes.begin(), bytes.end());
    return ChunkRecord(std::move(raw));
}

} // namespace

const char* record_kind_name(const ChunkRecord& record) {
    switch (record.index()) {
        case 0:  return "Raw";
        case 1:  return "Material";
        case 2:  return "ModelPart";
        case 3:  return "World";
        default: return "Unknown";
    }
}

ChunkDecoder::ChunkDecoder() {
    register_decoder(ChunkType::Materials, decode_as<Material, decode_material>);
    register_decoder(ChunkType::MaterialObj, decode_as<Material, decode_material>);
    register_decoder(ChunkType::World, decode_as<World, decode_world>);
    register_decoder(ChunkType::SPMesh, decode_as<ModelPart, decode_model_part>);
}

void ChunkDecoder::register_decoder(ChunkType type, DecodeFn fn) {
    decoders_[type] = std::move(fn);
}

void ChunkDecoder::unregister_decoder(ChunkType type) {
    decoders_.erase(type);
}

bool ChunkDecoder::has_decoder(ChunkType type) const {
    return decoders_.find(type) != decoders_.end();
}

Result<ChunkRecord> ChunkDecoder::decode(ByteReader& payload, const ChunkHeader& header) const {
    auto it = decoders_.find(header.type);
    if (it == decoders_.end()) {
        LOG_DEBUG("ChunkDecoder", chunk_type_name(header.type) << ": no decoder, keeping "
                  << payload.remaining() << " raw bytes");
        return decode_raw(payload, header);
    }
    
    auto result = it->second(payload, header);
    if (!result) {
        return result.error().with_context(chunk_type_name(header.type));
    }
    return result;
}

} // namespace levelpak
