/**
 * LevelPak - Byte Reader
 * 
 * Forward-only little-endian cursor over a byte span. Every read either
 * consumes exactly the width of the requested value or fails with
 * Error::Code::ShortRead and leaves the cursor where it was.
 */

#pragma once

#include "result.hpp"
#include "types.hpp"
#include <span>
#include <string>
#include <cstdint>
#include <cstddef>

namespace levelpak {

class ByteReader {
public:
    /**
     * @param data         Bytes to decode. Not copied; must outlive the reader.
     * @param base_offset  Offset of data[0] within the enclosing file, used
     *                     only for error context.
     */
    explicit ByteReader(std::span<const uint8_t> data, size_t base_offset = 0);
    
    size_t position() const { return pos_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }
    size_t absolute_offset() const { return base_offset_ + pos_; }
    
    // Primitives
    Result<uint8_t> read_u8();
    Result<int8_t> read_i8();
    Result<uint16_t> read_u16();
    Result<int16_t> read_i16();
    Result<uint32_t> read_u32();
    Result<int32_t> read_i32();
    Result<float> read_f32();
    
    /**
     * 32-bit integer interpreted as a boolean (nonzero = true).
     */
    Result<bool> read_bool32();
    
    // Composites, components in the listed order
    Result<Vector2> read_vector2();             // x, y
    Result<Vector3> read_vector3();             // x, y, z
    Result<Rgba> read_rgba();                   // r, g, b, a as f32
    Result<Rgba> read_rgba_u8();                // r, g, b, a as u8 / 255
    Result<Rgba> read_rgb_u8();                 // r, g, b as u8 / 255, alpha 1
    Result<Matrix> read_matrix();               // 16 f32 in glm element order
    Result<BoundingBox> read_bounding_box();    // min, max
    
    /**
     * Read `length` 32-bit code points and keep the low 8 bits of each as
     * a narrow character. A negative length is Error::Code::InvalidLength.
     */
    Result<std::string> read_code_point_string(int32_t length);
    
    /**
     * Borrow the next `count` bytes and advance past them.
     */
    Result<std::span<const uint8_t>> read_bytes(size_t count);
    
    /**
     * Split off a reader over the next `count` bytes and advance past them.
     */
    Result<ByteReader> sub_reader(size_t count);
    
    Result<void> skip(size_t count);

private:
    Result<void> require(size_t count) const;
    const uint8_t* cursor() const { return data_.data() + pos_; }
    
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
    size_t base_offset_ = 0;
};

} // namespace levelpak
