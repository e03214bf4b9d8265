// Chunk stream walking, dispatch and container handling

#include <gtest/gtest.h>

#include "levelpak/chunk_file.hpp"
#include "levelpak/compression.hpp"
#include "levelpak/world.hpp"
#include "levelpak/files.hpp"
#include "levelpak/logging.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace levelpak;
using levelpak::test::ByteBuilder;

namespace {

// World, Materials, an undecoded Zones chunk and another World
std::vector<uint8_t> mixed_stream() {
    ByteBuilder b;
    b.chunk(1012, 1, test::world_payload(1, 1));
    b.chunk(1010, 2, test::empty_material_payload(0x11112222));
    b.chunk(1023, 0, {1, 2, 3, 4, 5});
    b.chunk(1012, 1, test::world_payload(0, 0));
    return b.bytes();
}

class LogCapture {
public:
    LogCapture() {
        Logger::instance().set_level(LogLevel::Info);
        Logger::instance().set_callback([this](LogLevel level, const std::string& line) {
            if (level == LogLevel::Warning) {
                warnings.push_back(line);
            }
        });
    }
    ~LogCapture() { Logger::instance().set_callback(nullptr); }
    
    std::vector<std::string> warnings;
};

} // namespace

TEST(ChunkFileTest, DecodesMixedStream) {
    ChunkFile file;
    ASSERT_TRUE(file.load(mixed_stream()));
    EXPECT_FALSE(file.was_compressed());
    
    ChunkDecoder decoder;
    auto chunks = file.decode_all(decoder);
    ASSERT_TRUE(chunks) << chunks.error().full_message();
    ASSERT_EQ(chunks->size(), 4u);
    
    EXPECT_EQ((*chunks)[0].offset, 0u);
    ASSERT_TRUE(std::holds_alternative<World>((*chunks)[0].record));
    EXPECT_EQ(std::get<World>((*chunks)[0].record).floors.size(), 1u);
    
    ASSERT_TRUE(std::holds_alternative<Material>((*chunks)[1].record));
    EXPECT_EQ(std::get<Material>((*chunks)[1].record).material_hash, 0x11112222u);
    EXPECT_EQ((*chunks)[1].header.version, 2);
    
    ASSERT_TRUE(std::holds_alternative<RawChunk>((*chunks)[2].record));
    const auto& raw = std::get<RawChunk>((*chunks)[2].record);
    EXPECT_EQ(raw.header.type, ChunkType::Zones);
    EXPECT_EQ(raw.payload, (std::vector<uint8_t>{1, 2, 3, 4, 5}));
    EXPECT_STREQ(record_kind_name((*chunks)[2].record), "Raw");
    
    ASSERT_TRUE(std::holds_alternative<World>((*chunks)[3].record));
}

TEST(ChunkFileTest, ListsHeadersWithoutDecoding) {
    ByteBuilder b;
    b.chunk(1002, 0, {0xFF, 0xFF});     // Would not decode as a model part
    b.chunk(1010, 0, {});
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    auto entries = file.list();
    ASSERT_TRUE(entries) << entries.error().full_message();
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0].header.type, ChunkType::SPMesh);
    EXPECT_EQ((*entries)[1].offset, ChunkHeader::ENCODED_SIZE + 2);
    EXPECT_EQ((*entries)[1].header.size, 0);
}

TEST(ChunkFileTest, EmptyStreamHasNoChunks) {
    ChunkFile file;
    ASSERT_TRUE(file.load(std::vector<uint8_t>{}));
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_TRUE(chunks);
    EXPECT_TRUE(chunks->empty());
}

TEST(ChunkFileTest, UnknownTypeStopsWalk) {
    ByteBuilder b;
    b.chunk(1012, 0, test::world_payload(0, 0));
    b.chunk(4242, 0, {0, 0, 0, 0});
    b.chunk(1012, 0, test::world_payload(0, 0));
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, Error::Code::UnrecognizedChunkType);
    
    auto entries = file.list();
    ASSERT_FALSE(entries);
    EXPECT_EQ(entries.error().code, Error::Code::UnrecognizedChunkType);
}

TEST(ChunkFileTest, DeclaredSizeBeyondEndOfData) {
    ByteBuilder b;
    b.i32(1012).i32(1000).i32(0);
    b.append(test::world_payload(0, 0));
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, Error::Code::ShortRead);
    EXPECT_NE(chunks.error().context.find("World @0"), std::string::npos);
}

TEST(ChunkFileTest, NegativeSizeIsInvalid) {
    ByteBuilder b;
    b.i32(1010).i32(-1).i32(0);
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    auto entries = file.list();
    ASSERT_FALSE(entries);
    EXPECT_EQ(entries.error().code, Error::Code::InvalidLength);
}

TEST(ChunkFileTest, DecoderCannotReadIntoNextChunk) {
    // World payload missing its last flag, followed by a valid chunk
    auto world = test::world_payload(0, 0);
    world.resize(world.size() - 4);
    ByteBuilder b;
    b.chunk(1012, 0, world);
    b.chunk(1012, 0, test::world_payload(0, 0));
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, Error::Code::ShortRead);
    EXPECT_NE(chunks.error().context.find("chunk @0"), std::string::npos);
}

TEST(ChunkFileTest, TrailingPayloadBytesWarnByDefault) {
    auto world = test::world_payload(0, 0);
    world.push_back(0xEE);
    world.push_back(0xEE);
    ByteBuilder b;
    b.chunk(1012, 0, world);
    b.chunk(1012, 0, test::world_payload(0, 0));
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    
    LogCapture capture;
    Logger::instance().reset_counts();
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_TRUE(chunks) << chunks.error().full_message();
    EXPECT_EQ(chunks->size(), 2u);
    EXPECT_EQ((*chunks)[1].offset, ChunkHeader::ENCODED_SIZE + world.size());
    ASSERT_EQ(capture.warnings.size(), 1u);
    EXPECT_NE(capture.warnings[0].find("2 trailing payload bytes"), std::string::npos);
    EXPECT_NE(capture.warnings[0].find("World @0"), std::string::npos);
    EXPECT_EQ(Logger::instance().count(LogLevel::Warning), 1u);
}

TEST(ChunkFileTest, DecodeFailureIsReturnedNotLogged) {
    auto world = test::world_payload(0, 0);
    world.resize(world.size() - 1);
    ByteBuilder b;
    b.chunk(1012, 0, world);
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    
    LogCapture capture;
    Logger::instance().reset_counts();
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, Error::Code::ShortRead);
    EXPECT_EQ(Logger::instance().count(LogLevel::Error), 0u);
}

TEST(ChunkFileTest, TrailingPayloadBytesFailWhenStrict) {
    auto world = test::world_payload(0, 0);
    world.push_back(0xEE);
    ByteBuilder b;
    b.chunk(1012, 0, world);
    
    ChunkFile file;
    ASSERT_TRUE(file.load(b.bytes()));
    
    ChunkFileOptions options;
    options.strict_chunk_size = true;
    auto chunks = file.decode_all(ChunkDecoder(), options);
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, Error::Code::SizeMismatch);
}

TEST(ChunkFileTest, FilterSelectsOneType) {
    ChunkFile file;
    ASSERT_TRUE(file.load(mixed_stream()));
    
    ChunkFileOptions options;
    options.filter = ChunkType::World;
    auto chunks = file.decode_all(ChunkDecoder(), options);
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks->size(), 2u);
    for (const auto& chunk : *chunks) {
        EXPECT_EQ(chunk.header.type, ChunkType::World);
    }
}

TEST(ChunkFileTest, CustomDecoderRegistration) {
    ChunkDecoder decoder;
    EXPECT_TRUE(decoder.has_decoder(ChunkType::Materials));
    EXPECT_TRUE(decoder.has_decoder(ChunkType::MaterialObj));
    EXPECT_TRUE(decoder.has_decoder(ChunkType::SPMesh));
    EXPECT_FALSE(decoder.has_decoder(ChunkType::Zones));
    
    int calls = 0;
    decoder.register_decoder(ChunkType::Zones,
        [&calls](ByteReader& payload, const ChunkHeader& header) -> Result<ChunkRecord> {
            calls++;
            TRY(payload.skip(payload.remaining()));
            RawChunk raw;
            raw.header = header;
            raw.payload = {0x5A};
            return ChunkRecord(std::move(raw));
        });
    decoder.unregister_decoder(ChunkType::World);
    EXPECT_FALSE(decoder.has_decoder(ChunkType::World));
    
    ChunkFile file;
    ASSERT_TRUE(file.load(mixed_stream()));
    auto chunks = file.decode_all(decoder);
    ASSERT_TRUE(chunks) << chunks.error().full_message();
    
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(std::get<RawChunk>((*chunks)[2].record).payload, std::vector<uint8_t>{0x5A});
    ASSERT_TRUE(std::holds_alternative<RawChunk>((*chunks)[0].record));
    EXPECT_EQ(std::get<RawChunk>((*chunks)[0].record).payload.size(), WORLD_FIXED_SIZE + FLOOR_ENCODED_SIZE);
}

TEST(ChunkFileTest, InflatesZlibContainer) {
    auto plain = mixed_stream();
    auto packed = test::compress_zlib(plain);
    ASSERT_EQ(detect_compression(packed.data(), packed.size()), CompressionType::Zlib);
    
    ChunkFile file;
    ASSERT_TRUE(file.load(packed));
    EXPECT_TRUE(file.was_compressed());
    EXPECT_EQ(file.data(), plain);
    
    auto chunks = file.decode_all(ChunkDecoder());
    ASSERT_TRUE(chunks);
    EXPECT_EQ(chunks->size(), 4u);
}

TEST(ChunkFileTest, CorruptZlibContainer) {
    auto packed = test::compress_zlib(mixed_stream());
    packed.resize(packed.size() / 2);
    
    ChunkFile file;
    auto result = file.load(packed);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Error::Code::CompressionError);
}

TEST(ChunkFileTest, MissingFile) {
    ChunkFile file;
    auto result = file.load(fs::path("/nonexistent/levelpak/world.lvl"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Error::Code::FileNotFound);
}

TEST(ChunkFileTest, LoadsFromDisk) {
    auto path = fs::temp_directory_path() / "levelpak_chunk_file_test.lvl";
    auto stream = mixed_stream();
    ASSERT_TRUE(write_text_file(path, std::string(stream.begin(), stream.end())));
    
    ChunkFile file;
    auto result = file.load(path);
    ASSERT_TRUE(result) << result.error().full_message();
    EXPECT_EQ(file.path(), path);
    EXPECT_EQ(file.data().size(), stream.size());
    
    auto entries = file.list();
    ASSERT_TRUE(entries);
    EXPECT_EQ(entries->size(), 4u);
    
    fs::remove(path);
}
