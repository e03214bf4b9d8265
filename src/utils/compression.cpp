/**
 * LevelPak - Compression Implementation
 */

#include "levelpak/compression.hpp"
#include <zlib.h>
#include <stdexcept>
#include <string>

namespace levelpak {

// Helper to convert zlib error code to string
static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size) {
    constexpr size_t CHUNK = 64 * 1024;
    std::vector<uint8_t> result;
    
    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    
    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize zlib decompression: ") + zlib_error_string(ret));
    }
    
    // Grow the output until the stream ends
    do {
        size_t offset = result.size();
        result.resize(offset + CHUNK);
        strm.next_out = result.data() + offset;
        strm.avail_out = static_cast<uInt>(CHUNK);
        
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw std::runtime_error(std::string("Zlib decompression failed: ") + zlib_error_string(ret) +
                                     " (input=" + std::to_string(size) + ")");
        }
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            // Input exhausted without an end-of-stream marker
            inflateEnd(&strm);
            throw std::runtime_error("Zlib decompression failed: truncated stream (input=" +
                                     std::to_string(size) + ")");
        }
    } while (ret != Z_STREAM_END);
    
    result.resize(strm.total_out);
    inflateEnd(&strm);
    return result;
}

std::vector<uint8_t> decompress_zlib(const std::vector<uint8_t>& data) {
    return decompress_zlib(data.data(), data.size());
}

CompressionType detect_compression(const uint8_t* data, size_t size) {
    if (size < 2) {
        return CompressionType::None;
    }
    
    // Check for zlib header
    // 78 01 - low compression
    // 78 9C - default compression
    // 78 DA - best compression
    if (data[0] == 0x78 && (data[1] == 0x01 || data[1] == 0x9C || data[1] == 0xDA)) {
        return CompressionType::Zlib;
    }
    
    return CompressionType::None;
}

uint32_t crc32_checksum(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(size));
    return static_cast<uint32_t>(crc);
}

} // namespace levelpak
