/**
 * LevelPak - Compression utilities
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace levelpak {

/**
 * Container wrapping of a level file. Plain chunk streams start with a
 * little-endian type code and never with a zlib header byte.
 */
enum class CompressionType {
    None,
    Zlib
};

/**
 * Detect compression type from data.
 */
CompressionType detect_compression(const uint8_t* data, size_t size);

/**
 * Decompress zlib data whose inflated size is not known up front.
 * Throws std::runtime_error on malformed input.
 */
std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size);
std::vector<uint8_t> decompress_zlib(const std::vector<uint8_t>& data);

/**
 * zlib CRC-32 of a byte range.
 */
uint32_t crc32_checksum(const uint8_t* data, size_t size);

} // namespace levelpak
