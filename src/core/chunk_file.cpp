/**
 * LevelPak - Chunk File Implementation
 * 
 * Chunk boundaries come from each header's size field. The payload decoder
 * only ever sees a reader bounded to that size, so it cannot run into the
 * next chunk; reading past the end is a ShortRead. An unrecognized type
 * code stops the walk, since nothing is known about what follows it.
 */

#include "levelpak/chunk_file.hpp"
#include "levelpak/chunk_header.hpp"
#include "levelpak/compression.hpp"
#include "levelpak/files.hpp"
#include "levelpak/logging.hpp"
#include <stdexcept>

namespace levelpak {

Result<void> ChunkFile::load(const fs::path& path) {
    LOG_DEBUG("ChunkFile", "Opening: " << path.string());
    
    TRY_ASSIGN(data, read_file(path));
    auto result = load(std::move(data));
    if (!result) {
        return result.error().with_context(path.string());
    }
    path_ = path;
    
    LOG_INFO("ChunkFile", "Loaded: " << path.filename().string() << " ("
             << format_file_size(data_.size()) << (was_compressed_ ? ", zlib" : "") << ")");
    return Result<void>::success();
}

Result<void> ChunkFile::load(std::vector<uint8_t> data) {
    path_.clear();
    was_compressed_ = false;
    
    if (detect_compression(data.data(), data.size()) == CompressionType::Zlib) {
        try {
            LOG_DEBUG("ChunkFile", "Inflating zlib stream (" << data.size() << " bytes)");
            data_ = decompress_zlib(data);
            was_compressed_ = true;
        } catch (const std::exception& e) {
            data_.clear();
            return Error::compression_error(e.what());
        }
    } else {
        data_ = std::move(data);
    }
    
    return Result<void>::success();
}

Result<ByteReader> ChunkFile::next_chunk(ByteReader& reader, ChunkEntry& entry) const {
    entry.offset = reader.absolute_offset();
    
    TRY_ASSIGN(header, decode_chunk_header(reader));
    entry.header = header;
    
    if (header.size < 0) {
        return Error::invalid_length("chunk payload", header.size)
            .with_context(std::string(chunk_type_name(header.type)) + " @" + std::to_string(entry.offset));
    }
    
    auto payload = reader.sub_reader(static_cast<size_t>(header.size));
    if (!payload) {
        return payload.error().with_context(
            std::string(chunk_type_name(header.type)) + " @" + std::to_string(entry.offset));
    }
    return payload;
}

Result<std::vector<ChunkEntry>> ChunkFile::list() const {
    std::vector<ChunkEntry> entries;
    ByteReader reader(data_);
    
    while (!reader.at_end()) {
        ChunkEntry entry;
        TRY(next_chunk(reader, entry));
        entries.push_back(entry);
    }
    
    return entries;
}

Result<std::vector<DecodedChunk>> ChunkFile::decode_all(const ChunkDecoder& decoder,
                                                        const ChunkFileOptions& options) const {
    std::vector<DecodedChunk> chunks;
    ByteReader reader(data_);
    
    while (!reader.at_end()) {
        ChunkEntry entry;
        TRY_ASSIGN(payload, next_chunk(reader, entry));
        
        if (options.filter && entry.header.type != *options.filter) {
            continue;
        }
        
        std::string where = std::string(chunk_type_name(entry.header.type)) +
                            " @" + std::to_string(entry.offset);
        
        auto record = decoder.decode(payload, entry.header);
        if (!record) {
            return record.error().with_context("chunk @" + std::to_string(entry.offset));
        }
        
        if (!payload.at_end()) {
            if (options.strict_chunk_size) {
                return Error::size_mismatch(
                    "Decoder left " + std::to_string(payload.remaining()) + " of " +
                    std::to_string(entry.header.size) + " payload bytes unread").with_context(where);
            }
            LOG_WARNING("ChunkFile", where << ": " << payload.remaining()
                        << " trailing payload bytes skipped");
        }
        
        DecodedChunk chunk;
        chunk.offset = entry.offset;
        chunk.header = entry.header;
        chunk.record = std::move(*record);
        chunks.push_back(std::move(chunk));
    }
    
    LOG_DEBUG("ChunkFile", "Decoded " << chunks.size() << " chunks");
    return chunks;
}

} // namespace levelpak
