#include <gtest/gtest.h>
#include <zlib.h>
#include <cstring>
#include <string>
#include "png_encoder.hpp"
#include "utils.hpp"

struct PngChunk {
    std::string tag;
    std::vector<uint8_t> data;
    uint32_t crc;
};

static std::vector<PngChunk> read_chunks(const std::vector<uint8_t>& png) {
    std::vector<PngChunk> chunks;
    size_t pos = 8;
    while (pos + 12 <= png.size()) {
        uint32_t len = load_be32(png.data() + pos);
        PngChunk chunk;
        chunk.tag.assign(reinterpret_cast<const char*>(png.data() + pos + 4), 4);
        chunk.data.assign(png.begin() + pos + 8, png.begin() + pos + 8 + len);
        chunk.crc = load_be32(png.data() + pos + 8 + len);
        chunks.push_back(chunk);
        pos += 12 + len;
    }
    EXPECT_EQ(pos, png.size());
    return chunks;
}

static std::vector<uint8_t> inflate_idat(const std::vector<uint8_t>& idat, size_t expected) {
    std::vector<uint8_t> raw(expected);
    uLongf len = static_cast<uLongf>(expected);
    int ret = uncompress(raw.data(), &len, idat.data(), static_cast<uLong>(idat.size()));
    EXPECT_EQ(ret, Z_OK);
    EXPECT_EQ(len, expected);
    return raw;
}

TEST(PngEncoderTest, SignatureAndChunkOrder) {
    auto png = encode_png(3, 2, std::vector<Rgb>(6, Rgb{1, 2, 3}));

    const uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    ASSERT_GE(png.size(), 8u);
    EXPECT_EQ(std::memcmp(png.data(), signature, 8), 0);

    auto chunks = read_chunks(png);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].tag, "IHDR");
    EXPECT_EQ(chunks[1].tag, "IDAT");
    EXPECT_EQ(chunks[2].tag, "IEND");
    EXPECT_TRUE(chunks[2].data.empty());
    EXPECT_EQ(chunks[2].crc, 0xAE426082u);
}

TEST(PngEncoderTest, HeaderFields) {
    auto png = encode_png(300, 5, std::vector<Rgb>(1500, Rgb{0, 0, 0}));
    auto ihdr = read_chunks(png)[0].data;

    ASSERT_EQ(ihdr.size(), 13u);
    EXPECT_EQ(load_be32(ihdr.data()), 300u);
    EXPECT_EQ(load_be32(ihdr.data() + 4), 5u);
    EXPECT_EQ(ihdr[8], 8);  // bit depth
    EXPECT_EQ(ihdr[9], 2);  // truecolor
    EXPECT_EQ(ihdr[10], 0);
    EXPECT_EQ(ihdr[11], 0);
    EXPECT_EQ(ihdr[12], 0);
}

TEST(PngEncoderTest, ChunkCrcsCoverTagAndData) {
    auto png = encode_png(4, 4, std::vector<Rgb>(16, Rgb{200, 100, 50}));
    for (const auto& chunk : read_chunks(png)) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(chunk.tag.data()), 4);
        if (!chunk.data.empty()) {
            crc = crc32(crc, chunk.data.data(), static_cast<uInt>(chunk.data.size()));
        }
        EXPECT_EQ(chunk.crc, static_cast<uint32_t>(crc)) << chunk.tag;
    }
}

TEST(PngEncoderTest, ScanlinesUseFilterNoneAndMaskChannels) {
    std::vector<Rgb> pixels = {
        {10, 20, 30}, {256 + 5, -1, 0x1FF},
        {0, 0, 0},    {255, 255, 255},
    };
    auto png = encode_png(2, 2, pixels);
    auto raw = inflate_idat(read_chunks(png)[1].data, 2 * (1 + 2 * 3));

    std::vector<uint8_t> expected = {
        0, 10, 20, 30, 5, 255, 255,
        0, 0, 0, 0, 255, 255, 255,
    };
    EXPECT_EQ(raw, expected);
}

TEST(PngEncoderTest, IsDeterministic) {
    std::vector<Rgb> pixels(64, Rgb{12, 34, 56});
    EXPECT_EQ(encode_png(8, 8, pixels), encode_png(8, 8, pixels));
}

TEST(PngEncoderTest, RejectsBadInput) {
    EXPECT_THROW(encode_png(0, 4, {}), std::invalid_argument);
    EXPECT_THROW(encode_png(4, 0, {}), std::invalid_argument);
    EXPECT_THROW(encode_png(2, 2, std::vector<Rgb>(3)), std::invalid_argument);
}

TEST(PngEncoderTest, ReadDimensions) {
    auto png = encode_png(17, 9, std::vector<Rgb>(17 * 9, Rgb{0, 0, 0}));
    auto dims = read_png_dimensions(png);
    EXPECT_EQ(dims.first, 17u);
    EXPECT_EQ(dims.second, 9u);

    std::vector<uint8_t> not_png(32, 0);
    EXPECT_THROW(read_png_dimensions(not_png), std::invalid_argument);
    EXPECT_THROW(read_png_dimensions(std::vector<uint8_t>(png.begin(), png.begin() + 10)), std::invalid_argument);
}

TEST(RasterTest, StartsFilledWithBackground) {
    Raster r(4, 3);
    EXPECT_EQ(r.width(), 4u);
    EXPECT_EQ(r.height(), 3u);
    ASSERT_EQ(r.pixels().size(), 12u);
    for (const auto& p : r.pixels()) {
        EXPECT_EQ(p, Raster::DEFAULT_BACKGROUND);
    }
}

TEST(RasterTest, FillRectIsHalfOpenAndClipped) {
    Raster r(5, 5, Rgb{0, 0, 0}, Rgb{9, 9, 9});
    r.fill_rect(3, 3, 10, 10);
    r.fill_rect(-4, -4, 1, 1);

    EXPECT_EQ(r.at(0, 0), (Rgb{9, 9, 9}));
    EXPECT_EQ(r.at(1, 1), (Rgb{0, 0, 0}));
    EXPECT_EQ(r.at(2, 2), (Rgb{0, 0, 0}));
    EXPECT_EQ(r.at(3, 3), (Rgb{9, 9, 9}));
    EXPECT_EQ(r.at(4, 4), (Rgb{9, 9, 9}));
    EXPECT_EQ(r.at(4, 2), (Rgb{0, 0, 0}));
}

TEST(RasterTest, SetIgnoresOutOfCanvas) {
    Raster r(2, 2, Rgb{0, 0, 0});
    r.set(-1, 0);
    r.set(0, 2);
    r.set(2, 0);
    for (const auto& p : r.pixels()) {
        EXPECT_EQ(p, (Rgb{0, 0, 0}));
    }
    r.set(1, 1, Rgb{7, 7, 7});
    EXPECT_EQ(r.at(1, 1), (Rgb{7, 7, 7}));
}

TEST(RasterTest, LineCoversEndpoints) {
    const Rgb on{1, 1, 1};
    Raster r(10, 10, Rgb{0, 0, 0}, on);
    r.line(1, 8, 8, 2);
    EXPECT_EQ(r.at(1, 8), on);
    EXPECT_EQ(r.at(8, 2), on);

    Raster h(10, 3, Rgb{0, 0, 0}, on);
    h.line(0, 1, 9, 1);
    for (uint32_t x = 0; x < 10; ++x) {
        EXPECT_EQ(h.at(x, 1), on);
        EXPECT_EQ(h.at(x, 0), (Rgb{0, 0, 0}));
    }
}

TEST(RasterTest, ThickLineWidensPen) {
    const Rgb on{1, 1, 1};
    Raster r(10, 5, Rgb{0, 0, 0}, on);
    r.line(2, 2, 7, 2, 3);
    EXPECT_EQ(r.at(4, 1), on);
    EXPECT_EQ(r.at(4, 3), on);
    EXPECT_EQ(r.at(4, 0), (Rgb{0, 0, 0}));
}

TEST(RasterTest, LineClipsAtEdges) {
    Raster r(4, 4, Rgb{0, 0, 0}, Rgb{5, 5, 5});
    EXPECT_NO_THROW(r.line(-10, -10, 20, 20, 3));
    EXPECT_EQ(r.at(2, 2), (Rgb{5, 5, 5}));
}

TEST(PlaceholderThumbnailTest, HasRequestedDimensions) {
    const std::vector<std::pair<uint32_t, uint32_t>> sizes = {{16, 16}, {220, 124}, {313, 173}, {1, 1}};
    for (const auto& [w, h] : sizes) {
        auto png = render_placeholder_thumbnail(w, h);
        auto dims = read_png_dimensions(png);
        EXPECT_EQ(dims.first, w);
        EXPECT_EQ(dims.second, h);
    }
}

TEST(PlaceholderThumbnailTest, DrawsForegroundOnBackground) {
    const uint32_t w = 64;
    const uint32_t h = 48;
    auto png = render_placeholder_thumbnail(w, h);
    auto chunks = read_chunks(png);
    auto raw = inflate_idat(chunks[1].data, h * (1 + w * 3));

    size_t fg = 0;
    size_t bg = 0;
    for (uint32_t y = 0; y < h; ++y) {
        const uint8_t* row = raw.data() + y * (1 + w * 3) + 1;
        for (uint32_t x = 0; x < w; ++x) {
            Rgb p{row[x * 3], row[x * 3 + 1], row[x * 3 + 2]};
            if (p == Raster::DEFAULT_FOREGROUND) ++fg;
            if (p == Raster::DEFAULT_BACKGROUND) ++bg;
        }
    }
    EXPECT_GT(fg, 0u);
    EXPECT_GT(bg, fg);
    EXPECT_EQ(fg + bg, static_cast<size_t>(w) * h);
}

TEST(PlaceholderThumbnailTest, IsDeterministic) {
    EXPECT_EQ(render_placeholder_thumbnail(100, 60), render_placeholder_thumbnail(100, 60));
}

TEST(RasterTest, RejectsOversizedCanvas) {
    EXPECT_NO_THROW(Raster(Raster::MAX_DIMENSION, 1));
    EXPECT_THROW(Raster(Raster::MAX_DIMENSION + 1, 1), std::invalid_argument);
    EXPECT_THROW(Raster(1, 65535), std::invalid_argument);
    EXPECT_THROW(render_placeholder_thumbnail(65535, 65535), std::invalid_argument);
}
