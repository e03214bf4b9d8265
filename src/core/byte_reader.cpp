/**
 * LevelPak - Byte Reader Implementation
 */

#include "levelpak/byte_reader.hpp"
#include <cstring>

namespace levelpak {

// Little-endian loads from an already bounds-checked pointer
static inline uint16_t load_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8);
}

static inline uint32_t load_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static inline float load_f32_le(const uint8_t* p) {
    uint32_t bits = load_u32_le(p);
    float f;
    std::memcpy(&f, &bits, sizeof(float));
    return f;
}

ByteReader::ByteReader(std::span<const uint8_t> data, size_t base_offset)
    : data_(data)
    , pos_(0)
    , base_offset_(base_offset)
{
}

Result<void> ByteReader::require(size_t count) const {
    if (count > remaining()) {
        return Error::short_read(count, remaining(), absolute_offset());
    }
    return Result<void>::success();
}

Result<uint8_t> ByteReader::read_u8() {
    TRY(require(1));
    uint8_t v = *cursor();
    pos_ += 1;
    return v;
}

Result<int8_t> ByteReader::read_i8() {
    TRY(require(1));
    int8_t v = static_cast<int8_t>(*cursor());
    pos_ += 1;
    return v;
}

Result<uint16_t> ByteReader::read_u16() {
    TRY(require(2));
    uint16_t v = load_u16_le(cursor());
    pos_ += 2;
    return v;
}

Result<int16_t> ByteReader::read_i16() {
    TRY(require(2));
    int16_t v = static_cast<int16_t>(load_u16_le(cursor()));
    pos_ += 2;
    return v;
}

Result<uint32_t> ByteReader::read_u32() {
    TRY(require(4));
    uint32_t v = load_u32_le(cursor());
    pos_ += 4;
    return v;
}

Result<int32_t> ByteReader::read_i32() {
    TRY(require(4));
    int32_t v = static_cast<int32_t>(load_u32_le(cursor()));
    pos_ += 4;
    return v;
}

Result<float> ByteReader::read_f32() {
    TRY(require(4));
    float v = load_f32_le(cursor());
    pos_ += 4;
    return v;
}

Result<bool> ByteReader::read_bool32() {
    TRY_ASSIGN(v, read_i32());
    return v != 0;
}

// Composites check their full width up front so a short buffer never
// leaves the cursor part-way through a value.

Result<Vector2> ByteReader::read_vector2() {
    TRY(require(8));
    const uint8_t* p = cursor();
    Vector2 v(load_f32_le(p), load_f32_le(p + 4));
    pos_ += 8;
    return v;
}

Result<Vector3> ByteReader::read_vector3() {
    TRY(require(12));
    const uint8_t* p = cursor();
    Vector3 v(load_f32_le(p), load_f32_le(p + 4), load_f32_le(p + 8));
    pos_ += 12;
    return v;
}

Result<Rgba> ByteReader::read_rgba() {
    TRY(require(16));
    const uint8_t* p = cursor();
    Rgba c(load_f32_le(p), load_f32_le(p + 4), load_f32_le(p + 8), load_f32_le(p + 12));
    pos_ += 16;
    return c;
}

Result<Rgba> ByteReader::read_rgba_u8() {
    TRY(require(4));
    const uint8_t* p = cursor();
    Rgba c(p[0] / 255.0f, p[1] / 255.0f, p[2] / 255.0f, p[3] / 255.0f);
    pos_ += 4;
    return c;
}

Result<Rgba> ByteReader::read_rgb_u8() {
    TRY(require(3));
    const uint8_t* p = cursor();
    Rgba c(p[0] / 255.0f, p[1] / 255.0f, p[2] / 255.0f, 1.0f);
    pos_ += 3;
    return c;
}

Result<Matrix> ByteReader::read_matrix() {
    TRY(require(64));
    const uint8_t* p = cursor();
    Matrix m(1.0f);
    for (int col = 0; col < 4; col++) {
        for (int row = 0; row < 4; row++) {
            m[col][row] = load_f32_le(p);
            p += 4;
        }
    }
    pos_ += 64;
    return m;
}

Result<BoundingBox> ByteReader::read_bounding_box() {
    TRY(require(24));
    BoundingBox box;
    TRY_ASSIGN(lo, read_vector3());
    TRY_ASSIGN(hi, read_vector3());
    box.min = lo;
    box.max = hi;
    return box;
}

Result<std::string> ByteReader::read_code_point_string(int32_t length) {
    if (length < 0) {
        return Error::invalid_length("string", length)
            .with_context("offset " + std::to_string(absolute_offset()));
    }
    
    size_t byte_count = static_cast<size_t>(length) * 4;
    TRY(require(byte_count));
    
    std::string text;
    text.reserve(static_cast<size_t>(length));
    const uint8_t* p = cursor();
    for (int32_t i = 0; i < length; i++) {
        // Only the low byte of each code point is kept
        text.push_back(static_cast<char>(p[0]));
        p += 4;
    }
    pos_ += byte_count;
    return text;
}

Result<std::span<const uint8_t>> ByteReader::read_bytes(size_t count) {
    TRY(require(count));
    auto bytes = data_.subspan(pos_, count);
    pos_ += count;
    return bytes;
}

Result<ByteReader> ByteReader::sub_reader(size_t count) {
    size_t start = absolute_offset();
    TRY_ASSIGN(bytes, read_bytes(count));
    return ByteReader(bytes, start);
}

Result<void> ByteReader::skip(size_t count) {
    TRY(require(count));
    pos_ += count;
    return Result<void>::success();
}

} // namespace levelpak
