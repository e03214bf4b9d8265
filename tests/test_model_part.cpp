// Model part header and flag-driven vertex layout

#include <gtest/gtest.h>

#include "levelpak/model_part.hpp"
#include "test_helpers.hpp"

using namespace levelpak;
using levelpak::test::ByteBuilder;

namespace {

void write_part_header(ByteBuilder& b, uint32_t vertex_count, uint32_t flags) {
    for (uint32_t i = 0; i < 8; i++) {
        b.u32(0x100 + i);               // access / hint / render flag words
    }
    b.u32(vertex_count);
    b.u16(12).u16(2).u16(10);           // triangles, strips, strip triangles
    b.u32(0xFEEDF00D);                  // material hash
    b.i32(0).i32(11).i32(0).i32(static_cast<int32_t>(vertex_count));
    b.u32(3);                           // layer z
    b.u32(0x40);                        // floor flags
    b.u32(flags);
    b.u32(77);                          // lighting id
}

// Writes one vertex with every field the flags select
void write_vertex(ByteBuilder& b, uint32_t flags, float seed) {
    if (flags & VERTEX_HAS_POSITION) b.vec3(seed, seed + 1, seed + 2);
    if (flags & VERTEX_HAS_NORMAL) b.vec3(0.0f, 1.0f, 0.0f);
    if (flags & VERTEX_HAS_RECIPROCAL_HOMOGENEOUS_W) b.u32(0x3F800000);
    if (flags & VERTEX_HAS_DIFFUSE) b.u8(255).u8(0).u8(0).u8(255);
    if (flags & VERTEX_HAS_WEIGHT) b.f32(0.75f);
    if (flags & VERTEX_HAS_INDICES) b.u16(3).u16(9);
    for (uint32_t i = 0; i < vertex_uv_count(flags); i++) {
        b.vec2(seed + i, -seed);
    }
}

} // namespace

TEST(ModelPartTest, HeaderSize) {
    ByteBuilder b;
    write_part_header(b, 0, 0);
    EXPECT_EQ(b.size(), MODEL_PART_HEADER_SIZE);
}

TEST(ModelPartTest, NormalPresentOnlyWithBit9) {
    const uint32_t layout_bits[] = {
        0, VERTEX_HAS_POSITION, VERTEX_HAS_NORMAL,
        VERTEX_HAS_POSITION | VERTEX_HAS_NORMAL,
        VERTEX_HAS_NORMAL | VERTEX_HAS_DIFFUSE | 2,
        VERTEX_HAS_POSITION | VERTEX_HAS_WEIGHT | VERTEX_HAS_INDICES | 1,
        0x3F00 | 3
    };
    
    for (uint32_t flags : layout_bits) {
        ByteBuilder b;
        write_vertex(b, flags, 1.0f);
        EXPECT_EQ(b.size(), vertex_stride(flags)) << std::hex << flags;
        
        ByteReader reader(b.bytes());
        auto vertex = decode_vertex(reader, flags);
        ASSERT_TRUE(vertex) << vertex.error().full_message();
        EXPECT_TRUE(reader.at_end());
        
        EXPECT_EQ(vertex->normal.has_value(), (flags & VERTEX_HAS_NORMAL) != 0) << std::hex << flags;
        EXPECT_EQ(vertex->position.has_value(), (flags & VERTEX_HAS_POSITION) != 0);
        EXPECT_EQ(vertex->reciprocal_homogeneous_w.has_value(),
                  (flags & VERTEX_HAS_RECIPROCAL_HOMOGENEOUS_W) != 0);
        EXPECT_EQ(vertex->diffuse.has_value(), (flags & VERTEX_HAS_DIFFUSE) != 0);
        EXPECT_EQ(vertex->weight.has_value(), (flags & VERTEX_HAS_WEIGHT) != 0);
        EXPECT_EQ(vertex->indices.has_value(), (flags & VERTEX_HAS_INDICES) != 0);
        EXPECT_EQ(vertex->uvs.size(), flags & 0xFF);
    }
}

TEST(ModelPartTest, NoUvsWhenCountIsZero) {
    uint32_t flags = VERTEX_HAS_POSITION;
    ByteBuilder b;
    write_vertex(b, flags, 2.0f);
    ByteReader reader(b.bytes());
    
    auto vertex = decode_vertex(reader, flags);
    ASSERT_TRUE(vertex);
    EXPECT_TRUE(vertex->uvs.empty());
}

TEST(ModelPartTest, FieldValues) {
    uint32_t flags = 0x3F00 | 2;
    ByteBuilder b;
    write_vertex(b, flags, 5.0f);
    ByteReader reader(b.bytes());
    
    auto vertex = decode_vertex(reader, flags);
    ASSERT_TRUE(vertex);
    EXPECT_EQ(*vertex->position, Vector3(5.0f, 6.0f, 7.0f));
    EXPECT_EQ(*vertex->normal, Vector3(0.0f, 1.0f, 0.0f));
    EXPECT_EQ(*vertex->reciprocal_homogeneous_w, 0x3F800000u);
    EXPECT_EQ(*vertex->diffuse, Rgba(1.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(*vertex->weight, 0.75f);
    EXPECT_EQ(vertex->indices->first, 3);
    EXPECT_EQ(vertex->indices->second, 9);
    ASSERT_EQ(vertex->uvs.size(), 2u);
    EXPECT_EQ(vertex->uvs[1], Vector2(6.0f, -5.0f));
}

TEST(ModelPartTest, FlagBitsOutsideLayoutDoNotChangeStride) {
    uint32_t flags = VERTEX_HAS_POSITION | 1;
    EXPECT_EQ(vertex_stride(flags), vertex_stride(flags | 0x4000 | 0x80000000));
    EXPECT_EQ(vertex_stride(flags), 20u);
}

TEST(ModelPartTest, DecodesFullPart) {
    uint32_t flags = VERTEX_HAS_POSITION | VERTEX_HAS_NORMAL | 1;
    ByteBuilder b;
    write_part_header(b, 2, flags);
    write_vertex(b, flags, 0.0f);
    write_vertex(b, flags, 10.0f);
    ByteReader reader(b.bytes());
    
    auto part = decode_model_part(reader);
    ASSERT_TRUE(part) << part.error().full_message();
    EXPECT_TRUE(reader.at_end());
    
    EXPECT_EQ(part->read_access_flags, 0x100u);
    EXPECT_EQ(part->render_flags, 0x107u);
    EXPECT_EQ(part->triangle_count, 12);
    EXPECT_EQ(part->strip_count, 2);
    EXPECT_EQ(part->strip_triangle_count, 10);
    EXPECT_EQ(part->material_hash, 0xFEEDF00Du);
    EXPECT_EQ(part->triangle_index1, 11);
    EXPECT_EQ(part->vertex_index1, 2);
    EXPECT_EQ(part->layer_z, 3u);
    EXPECT_EQ(part->floor_flags, 0x40u);
    EXPECT_EQ(part->flags, flags);
    EXPECT_EQ(part->lighting_id, 77u);
    
    ASSERT_EQ(part->vertices.size(), 2u);
    EXPECT_EQ(*part->vertices[1].position, Vector3(10.0f, 11.0f, 12.0f));
    EXPECT_FALSE(part->vertices[1].diffuse);
    ASSERT_EQ(part->vertices[1].uvs.size(), 1u);
}

TEST(ModelPartTest, TruncatedVertexReportsIndex) {
    uint32_t flags = VERTEX_HAS_POSITION;
    ByteBuilder b;
    write_part_header(b, 2, flags);
    write_vertex(b, flags, 0.0f);
    b.f32(1.0f).f32(2.0f);
    ByteReader reader(b.bytes());
    
    auto part = decode_model_part(reader);
    ASSERT_FALSE(part);
    EXPECT_EQ(part.error().code, Error::Code::ShortRead);
    EXPECT_NE(part.error().context.find("vertex 1"), std::string::npos);
}

TEST(ModelPartTest, MaximumUvCountNeedsAllBytes) {
    uint32_t flags = 0xFF;
    EXPECT_EQ(vertex_stride(flags), 255u * 8);
    
    ByteBuilder b;
    for (int i = 0; i < 254; i++) {
        b.vec2(0.0f, 0.0f);
    }
    ByteReader reader(b.bytes());
    
    auto vertex = decode_vertex(reader, flags);
    ASSERT_FALSE(vertex);
    EXPECT_EQ(vertex.error().code, Error::Code::ShortRead);
}

TEST(ModelPartTest, HugeVertexCountFailsWithoutAllocating) {
    ByteBuilder b;
    write_part_header(b, 0xFFFFFFFF, VERTEX_HAS_POSITION);
    ByteReader reader(b.bytes());
    
    auto part = decode_model_part(reader);
    ASSERT_FALSE(part);
    EXPECT_EQ(part.error().code, Error::Code::ShortRead);
    EXPECT_NE(part.error().context.find("vertex 0"), std::string::npos);
}

TEST(ModelPartTest, HugeVertexCountWithEmptyLayout) {
    // No layout bits and no UVs: every vertex is zero bytes wide
    ByteBuilder b;
    write_part_header(b, 0xFFFFFFFF, 0);
    ByteReader reader(b.bytes());
    
    auto part = decode_model_part(reader);
    ASSERT_FALSE(part);
    EXPECT_EQ(part.error().code, Error::Code::InvalidLength);
}

TEST(ModelPartTest, EmptyLayoutWithSmallCount) {
    ByteBuilder b;
    write_part_header(b, 3, 0);
    ByteReader reader(b.bytes());
    
    auto part = decode_model_part(reader);
    ASSERT_TRUE(part) << part.error().full_message();
    ASSERT_EQ(part->vertices.size(), 3u);
    EXPECT_FALSE(part->vertices[2].position);
    EXPECT_TRUE(part->vertices[2].uvs.empty());
    EXPECT_TRUE(reader.at_end());
}
