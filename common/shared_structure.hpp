#ifndef SHARED_STRUCTURE_HPP
#define SHARED_STRUCTURE_HPP

#include <cstdint>
#include <cstddef>

// Disable padding for all structures for binary compatibility.
// All multi-byte fields are little-endian on disk; structures are copied
// with memcpy, which assumes a little-endian host.
#pragma pack(push, 1)

struct BgcodeFileHeader {
    uint32_t magic;
    uint32_t version;
    uint16_t checksum_type;
};

struct BgcodeBlockHeader {
    uint16_t type;
    uint16_t compression;
    uint32_t uncompressed_size;
    uint32_t compressed_size; // only present on disk when compression != None
};

struct BgcodeThumbnailParams {
    uint16_t format;
    uint16_t width;
    uint16_t height;
};

// Restore default packing alignment
#pragma pack(pop)

enum class BlockType : uint16_t {
    FileMetadata = 0,
    GCode = 1,
    SlicerMetadata = 2,
    PrinterMetadata = 3,
    PrintMetadata = 4,
    Thumbnail = 5,
};

enum class CompressionType : uint16_t {
    None = 0,
    Deflate = 1,
    Heatshrink_11_4 = 2,
    Heatshrink_12_4 = 3,
};

enum class MetadataEncoding : uint16_t {
    INI = 0,
};

enum class GCodeEncoding : uint16_t {
    None = 0,
    MeatPack = 1,
    MeatPackComments = 2,
};

enum class ThumbnailFormat : uint16_t {
    PNG = 0,
    JPG = 1,
    QOI = 2,
};

enum class ChecksumType : uint16_t {
    None = 0,
    CRC32 = 1,
};

constexpr uint32_t BGCODE_MAGIC = 0x45444347; // "GCDE"
constexpr uint32_t BGCODE_VERSION = 1;
constexpr size_t BGCODE_FILE_HDR_SIZE = sizeof(BgcodeFileHeader);
constexpr size_t BLOCK_HDR_SIZE_UNCOMPRESSED = 8;
constexpr size_t BLOCK_HDR_SIZE_COMPRESSED = sizeof(BgcodeBlockHeader);
constexpr size_t BLOCK_CHECKSUM_SIZE = 4;
constexpr size_t BLOCK_PARAMS_SIZE = 2;
constexpr size_t THUMBNAIL_PARAMS_SIZE = sizeof(BgcodeThumbnailParams);

constexpr uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
constexpr uint8_t PNG_COLOR_TYPE_RGB = 2;
constexpr int PNG_DEFLATE_LEVEL = 6;

static_assert(sizeof(BgcodeFileHeader) == 10, "file header must be 10 bytes");
static_assert(sizeof(BgcodeBlockHeader) == 12, "compressed block header must be 12 bytes");
static_assert(sizeof(BgcodeThumbnailParams) == 6, "thumbnail params must be 6 bytes");

#endif
