/**
 * LevelPak - Chunk Decoder Dispatch
 * 
 * Maps chunk types to record decoders. Every decoder has the same shape:
 * take a reader positioned at the start of the chunk payload plus the
 * chunk header, and return a typed record or an Error.
 */

#pragma once

#include "byte_reader.hpp"
#include "result.hpp"
#include "types.hpp"
#include <functional>
#include <unordered_map>
#include <variant>

namespace levelpak {

using ChunkRecord = std::variant<RawChunk, Material, ModelPart, World>;

/**
 * Short name of the record alternative held ("Raw", "Material", ...).
 */
const char* record_kind_name(const ChunkRecord& record);

class ChunkDecoder {
public:
    using DecodeFn = std::function<Result<ChunkRecord>(ByteReader& payload, const ChunkHeader& header)>;
    
    /**
     * Creates a decoder with the built-in registrations:
     * Materials, MaterialObj -> Material; World -> World; SPMesh -> ModelPart.
     */
    ChunkDecoder();
    
    /**
     * Register or replace the decoder for a chunk type.
     */
    void register_decoder(ChunkType type, DecodeFn fn);
    
    void unregister_decoder(ChunkType type);
    
    bool has_decoder(ChunkType type) const;
    
    /**
     * Decode one record from `payload`. Types without a registered decoder
     * produce a RawChunk holding the rest of the payload.
     */
    Result<ChunkRecord> decode(ByteReader& payload, const ChunkHeader& header) const;

private:
    std::unordered_map<ChunkType, DecodeFn> decoders_;
};

} // namespace levelpak
