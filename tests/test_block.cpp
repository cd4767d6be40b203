#include <gtest/gtest.h>
#include <zlib.h>
#include "block.hpp"
#include "bgcode_errors.hpp"
#include "test_helpers.hpp"

TEST(Crc32Test, MatchesCheckValue) {
    const std::string check = "123456789";
    Crc32 crc;
    crc.update(reinterpret_cast<const uint8_t*>(check.data()), check.size());
    EXPECT_EQ(crc.value(), 0xCBF43926u);
}

TEST(Crc32Test, RunningUpdatesEqualOneShot) {
    auto a = bytes_of("header");
    auto b = bytes_of("params");
    auto c = bytes_of("payload bytes");

    Crc32 running;
    running.update(a);
    running.update(b);
    running.update(c);

    std::vector<uint8_t> all;
    append_bytes(all, a);
    append_bytes(all, b);
    append_bytes(all, c);
    Crc32 once;
    once.update(all);

    EXPECT_EQ(running.value(), once.value());
}

TEST(Crc32Test, EmptyInputIsZero) {
    Crc32 crc;
    crc.update(std::vector<uint8_t>{});
    EXPECT_EQ(crc.value(), 0u);
}

TEST(BlockParamsTest, SizeDependsOnlyOnType) {
    EXPECT_EQ(params_size(BlockType::Thumbnail), 6u);
    EXPECT_EQ(params_size(BlockType::GCode), 2u);
    EXPECT_EQ(params_size(BlockType::FileMetadata), 2u);
    EXPECT_EQ(params_size(BlockType::PrinterMetadata), 2u);
    EXPECT_EQ(params_size(BlockType::PrintMetadata), 2u);
    EXPECT_EQ(params_size(BlockType::SlicerMetadata), 2u);
    EXPECT_EQ(params_size(static_cast<uint16_t>(42)), 2u);
}

TEST(BlockParamsTest, ThumbnailParamsLayout) {
    auto bytes = encode_params(ThumbnailParams{ThumbnailFormat::PNG, 220, 124});
    ASSERT_EQ(bytes.size(), 6u);
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0, 0, 220, 0, 124, 0}));

    auto decoded = std::get<ThumbnailParams>(decode_params(static_cast<uint16_t>(BlockType::Thumbnail), bytes));
    EXPECT_EQ(decoded.format, ThumbnailFormat::PNG);
    EXPECT_EQ(decoded.width, 220);
    EXPECT_EQ(decoded.height, 124);
}

TEST(BlockParamsTest, DecodeSelectsVariantByType) {
    auto gcode = decode_params(static_cast<uint16_t>(BlockType::GCode), u16_params(1));
    ASSERT_TRUE(std::holds_alternative<GCodeParams>(gcode));
    EXPECT_EQ(std::get<GCodeParams>(gcode).encoding, GCodeEncoding::MeatPack);

    auto meta = decode_params(static_cast<uint16_t>(BlockType::PrintMetadata), u16_params(0));
    EXPECT_TRUE(std::holds_alternative<MetadataParams>(meta));

    EXPECT_THROW(decode_params(static_cast<uint16_t>(BlockType::Thumbnail), u16_params(0)), std::invalid_argument);
}

TEST(SerializeBlockTest, UncompressedLayout) {
    auto payload = bytes_of("G28\n");
    auto block = serialize_block(BlockType::GCode, CompressionType::None, GCodeParams{}, payload);

    // header(8) + params(2) + payload(4) + crc(4)
    ASSERT_EQ(block.size(), 18u);
    EXPECT_EQ(load_pod<uint16_t>(block.data(), 0), 1);
    EXPECT_EQ(load_pod<uint16_t>(block.data(), 2), 0);
    EXPECT_EQ(load_pod<uint32_t>(block.data(), 4), 4u);
    EXPECT_EQ(load_pod<uint16_t>(block.data(), 8), 0);
    EXPECT_EQ(std::string(block.begin() + 10, block.begin() + 14), "G28\n");

    Crc32 crc;
    crc.update(block.data(), 14);
    EXPECT_EQ(load_pod<uint32_t>(block.data(), 14), crc.value());
}

TEST(SerializeBlockTest, DeflateLayout) {
    std::string text;
    for (int i = 0; i < 200; ++i) text += "G1 X10 Y10 E0.5\n";
    auto payload = bytes_of(text);
    auto block = serialize_block(BlockType::GCode, CompressionType::Deflate, GCodeParams{}, payload);

    EXPECT_EQ(load_pod<uint16_t>(block.data(), 2), 1);
    EXPECT_EQ(load_pod<uint32_t>(block.data(), 4), payload.size());
    uint32_t compressed_size = load_pod<uint32_t>(block.data(), 8);
    ASSERT_EQ(block.size(), 12u + 2u + compressed_size + 4u);
    EXPECT_LT(compressed_size, payload.size());

    // zlib wrapper: CMF 0x78
    EXPECT_EQ(block[14], 0x78);

    auto inflated = inflate_payload(block.data() + 14, compressed_size, static_cast<uint32_t>(payload.size()), 0);
    EXPECT_EQ(inflated, payload);
}

TEST(SerializeBlockTest, IsDeterministic) {
    auto payload = bytes_of("M104 S215\nG28\n");
    auto a = serialize_block(BlockType::GCode, CompressionType::Deflate, GCodeParams{}, payload);
    auto b = serialize_block(BlockType::GCode, CompressionType::Deflate, GCodeParams{}, payload);
    EXPECT_EQ(a, b);
}

TEST(SerializeBlockTest, RejectsParamsOfAnotherKind) {
    EXPECT_THROW(serialize_block(BlockType::Thumbnail, CompressionType::None, MetadataParams{}, {}),
                 std::invalid_argument);
    EXPECT_THROW(serialize_block(BlockType::FileMetadata, CompressionType::None, GCodeParams{}, {}),
                 std::invalid_argument);
}

TEST(SerializeBlockTest, RejectsHeatshrink) {
    EXPECT_THROW(serialize_block(BlockType::GCode, CompressionType::Heatshrink_11_4, GCodeParams{}, bytes_of("G28\n")),
                 UnsupportedCompression);
}

TEST(SerializeBlockTest, AppendKeepsExistingBytes) {
    std::vector<uint8_t> out = {0xAA, 0xBB};
    size_t n = append_block(out, BlockType::SlicerMetadata, CompressionType::None, MetadataParams{}, {});
    EXPECT_EQ(n, 14u);
    ASSERT_EQ(out.size(), 16u);
    EXPECT_EQ(out[0], 0xAA);
    EXPECT_EQ(out[1], 0xBB);
}

TEST(ParseBlockTest, ReturnsFieldsAndNextOffset) {
    std::vector<uint8_t> buffer = {0xFF, 0xFF, 0xFF};
    append_block(buffer, BlockType::Thumbnail, CompressionType::None,
                 ThumbnailParams{ThumbnailFormat::PNG, 16, 8}, bytes_of("img"));

    Block block = parse_block(buffer.data(), buffer.size(), 3);
    EXPECT_EQ(block.type, static_cast<uint16_t>(BlockType::Thumbnail));
    EXPECT_EQ(block.compression, 0);
    EXPECT_EQ(block.uncompressed_size, 3u);
    EXPECT_EQ(block.params.size(), 6u);
    EXPECT_EQ(block.payload, bytes_of("img"));
    EXPECT_EQ(block.offset, 3u);
    EXPECT_EQ(block.next_offset, buffer.size());

    auto params = std::get<ThumbnailParams>(block.typed_params());
    EXPECT_EQ(params.width, 16);
    EXPECT_EQ(params.height, 8);
}

TEST(ParseBlockTest, DeflatePayloadLengthIsCompressedSize) {
    std::string text(4096, 'A');
    auto block_bytes = serialize_block(BlockType::GCode, CompressionType::Deflate, GCodeParams{}, bytes_of(text));

    Block block = parse_block(block_bytes.data(), block_bytes.size(), 0);
    EXPECT_EQ(block.uncompressed_size, 4096u);
    EXPECT_EQ(block.payload.size(), load_pod<uint32_t>(block_bytes.data(), 8));
    EXPECT_EQ(block.next_offset, block_bytes.size());
}

TEST(ParseBlockTest, RejectsHeatshrinkCompression) {
    for (uint16_t comp : {2, 3}) {
        auto block = raw_block(static_cast<uint16_t>(BlockType::GCode), comp, u16_params(0), bytes_of("G28\n"));
        try {
            parse_block(block.data(), block.size(), 0);
            FAIL() << "compression " << comp << " was accepted";
        } catch (const UnsupportedCompression& e) {
            EXPECT_EQ(e.value, comp);
            EXPECT_EQ(e.offset, 0u);
        }
    }
}

TEST(ParseBlockTest, UnsupportedCompressionIsAnUnsupportedEncoding) {
    auto block = raw_block(static_cast<uint16_t>(BlockType::FileMetadata), 7, u16_params(0), {});
    EXPECT_THROW(parse_block(block.data(), block.size(), 0), UnsupportedEncoding);
}

TEST(ParseBlockTest, ChecksumMismatchNamesOffsetAndValues) {
    std::vector<uint8_t> buffer(5, 0);
    append_block(buffer, BlockType::GCode, CompressionType::None, GCodeParams{}, bytes_of("G28\n"));
    buffer[5 + 10] ^= 0x01; // first payload byte

    try {
        parse_block(buffer.data(), buffer.size(), 5);
        FAIL() << "tampered block was accepted";
    } catch (const ChecksumMismatch& e) {
        EXPECT_EQ(e.offset, 5u);
        EXPECT_EQ(e.block_type, static_cast<uint16_t>(BlockType::GCode));
        EXPECT_EQ(e.expected, load_pod<uint32_t>(buffer.data(), buffer.size() - 4));
        EXPECT_NE(e.expected, e.computed);
    }
}

TEST(ParseBlockTest, TruncationIsReported) {
    auto block = serialize_block(BlockType::GCode, CompressionType::None, GCodeParams{}, bytes_of("G28\n"));
    for (size_t len = 0; len < block.size(); ++len) {
        EXPECT_THROW(parse_block(block.data(), len, 0), TruncatedBlock) << "length " << len;
    }
}

TEST(ParseBlockTest, HugeDeclaredSizeIsTruncation) {
    std::vector<uint8_t> block;
    append_pod(block, static_cast<uint16_t>(BlockType::GCode));
    append_pod(block, static_cast<uint16_t>(0));
    append_pod(block, static_cast<uint32_t>(0xFFFFFFFF));
    append_bytes(block, u16_params(0));
    EXPECT_THROW(parse_block(block.data(), block.size(), 0), TruncatedBlock);
}

TEST(InflatePayloadTest, CorruptStreamFails) {
    std::vector<uint8_t> garbage = {0x78, 0x9c, 0xde, 0xad, 0xbe, 0xef};
    EXPECT_THROW(inflate_payload(garbage.data(), garbage.size(), 10, 0), DecompressionFailed);
}

TEST(InflatePayloadTest, SizeMismatchFails) {
    auto compressed = deflate_payload(bytes_of("G28\nG1 X10\n"), 6);
    EXPECT_THROW(inflate_payload(compressed.data(), compressed.size(), 5, 0), DecompressionFailed);
    EXPECT_THROW(inflate_payload(compressed.data(), compressed.size(), 50, 0), DecompressionFailed);
}

TEST(InflatePayloadTest, EmptyPayloadRoundTrips) {
    auto compressed = deflate_payload({}, 6);
    EXPECT_FALSE(compressed.empty());
    EXPECT_TRUE(inflate_payload(compressed.data(), compressed.size(), 0, 0).empty());
}
