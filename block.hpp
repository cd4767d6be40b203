#ifndef BLOCK_HPP
#define BLOCK_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <variant>
#include "shared_structure.hpp"

// Running CRC32 (zlib polynomial) over consecutive byte spans.
class Crc32 {
public:
    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
    uint32_t value() const { return crc; }

private:
    uint32_t crc = 0;
};

// Block parameters, one type per block kind. The four metadata kinds share
// the same layout.
struct MetadataParams {
    MetadataEncoding encoding = MetadataEncoding::INI;
};

struct GCodeParams {
    GCodeEncoding encoding = GCodeEncoding::None;
};

struct ThumbnailParams {
    ThumbnailFormat format = ThumbnailFormat::PNG;
    uint16_t width = 0;
    uint16_t height = 0;
};

using BlockParams = std::variant<MetadataParams, GCodeParams, ThumbnailParams>;

// One block as found in a container. `type` and `compression` keep the raw
// on-disk values so that unknown block types can still be walked over.
struct Block {
    uint16_t type;
    uint16_t compression;
    uint32_t uncompressed_size;
    std::vector<uint8_t> params;  // exactly as stored
    std::vector<uint8_t> payload; // stored (possibly compressed) bytes
    uint32_t checksum;
    size_t offset;                // of the block header
    size_t next_offset;           // first byte after the checksum

    BlockParams typed_params() const;
};

// Params length on disk: 6 for Thumbnail, 2 for every other type (including
// types this codec does not know).
size_t params_size(uint16_t block_type);
size_t params_size(BlockType block_type);

std::string block_type_name(uint16_t block_type);
std::string compression_name(uint16_t compression);
bool is_metadata_block(BlockType block_type);

std::vector<uint8_t> encode_params(const BlockParams& params);
BlockParams decode_params(uint16_t block_type, const std::vector<uint8_t>& params);

// zlib-wrapped DEFLATE (window bits 15), the only compression this codec writes.
std::vector<uint8_t> deflate_payload(const std::vector<uint8_t>& input, int level);

// Inverse of deflate_payload. Throws DecompressionFailed when the stream is
// corrupt or does not inflate to exactly expected_size bytes.
std::vector<uint8_t> inflate_payload(const uint8_t* data, size_t size, uint32_t expected_size, size_t offset);

// Appends one complete block (header, params, payload, CRC32) to `out`.
// Returns the number of bytes appended.
size_t append_block(std::vector<uint8_t>& out, BlockType type, CompressionType compression,
                    const BlockParams& params, const std::vector<uint8_t>& payload,
                    int compression_level = 6);

std::vector<uint8_t> serialize_block(BlockType type, CompressionType compression,
                                     const BlockParams& params, const std::vector<uint8_t>& payload,
                                     int compression_level = 6);

// Parses and checksum-validates the block starting at `offset`.
Block parse_block(const uint8_t* data, size_t size, size_t offset);

#endif // BLOCK_HPP
