#include "block.hpp"
#include "bgcode_errors.hpp"
#include "utils.hpp"
#include <zlib.h>
#include <cstring>
#include <limits>
#include <algorithm>
#include <stdexcept>
#include <sstream>

void Crc32::update(const uint8_t* data, size_t size) {
    // zlib takes uInt lengths; feed very large spans in pieces.
    while (size > 0) {
        uInt n = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
        crc = static_cast<uint32_t>(crc32(crc, reinterpret_cast<const Bytef*>(data), n));
        data += n;
        size -= n;
    }
}

size_t params_size(uint16_t block_type) {
    return block_type == static_cast<uint16_t>(BlockType::Thumbnail) ? THUMBNAIL_PARAMS_SIZE : BLOCK_PARAMS_SIZE;
}

size_t params_size(BlockType block_type) {
    return params_size(static_cast<uint16_t>(block_type));
}

std::string block_type_name(uint16_t block_type) {
    switch (static_cast<BlockType>(block_type)) {
        case BlockType::FileMetadata:    return "FileMetadata";
        case BlockType::GCode:           return "GCode";
        case BlockType::SlicerMetadata:  return "SlicerMetadata";
        case BlockType::PrinterMetadata: return "PrinterMetadata";
        case BlockType::PrintMetadata:   return "PrintMetadata";
        case BlockType::Thumbnail:       return "Thumbnail";
    }
    return "Unknown(" + std::to_string(block_type) + ")";
}

std::string compression_name(uint16_t compression) {
    switch (static_cast<CompressionType>(compression)) {
        case CompressionType::None:            return "none";
        case CompressionType::Deflate:         return "deflate";
        case CompressionType::Heatshrink_11_4: return "heatshrink_11_4";
        case CompressionType::Heatshrink_12_4: return "heatshrink_12_4";
    }
    return "unknown(" + std::to_string(compression) + ")";
}

bool is_metadata_block(BlockType block_type) {
    return block_type == BlockType::FileMetadata || block_type == BlockType::PrinterMetadata ||
           block_type == BlockType::PrintMetadata || block_type == BlockType::SlicerMetadata;
}

static bool params_match(BlockType type, const BlockParams& params) {
    if (type == BlockType::Thumbnail) return std::holds_alternative<ThumbnailParams>(params);
    if (type == BlockType::GCode) return std::holds_alternative<GCodeParams>(params);
    return std::holds_alternative<MetadataParams>(params);
}

std::vector<uint8_t> encode_params(const BlockParams& params) {
    std::vector<uint8_t> out;
    if (const auto* thumb = std::get_if<ThumbnailParams>(&params)) {
        BgcodeThumbnailParams raw{};
        raw.format = static_cast<uint16_t>(thumb->format);
        raw.width = thumb->width;
        raw.height = thumb->height;
        append_pod(out, raw);
    } else if (const auto* gcode = std::get_if<GCodeParams>(&params)) {
        append_pod(out, static_cast<uint16_t>(gcode->encoding));
    } else {
        append_pod(out, static_cast<uint16_t>(std::get<MetadataParams>(params).encoding));
    }
    return out;
}

BlockParams decode_params(uint16_t block_type, const std::vector<uint8_t>& params) {
    if (params.size() != params_size(block_type)) {
        throw std::invalid_argument("Params of block type " + std::to_string(block_type) +
                                    " must be " + std::to_string(params_size(block_type)) + " bytes");
    }
    if (block_type == static_cast<uint16_t>(BlockType::Thumbnail)) {
        auto raw = load_pod<BgcodeThumbnailParams>(params.data(), 0);
        return ThumbnailParams{static_cast<ThumbnailFormat>(raw.format), raw.width, raw.height};
    }
    auto encoding = load_pod<uint16_t>(params.data(), 0);
    if (block_type == static_cast<uint16_t>(BlockType::GCode)) {
        return GCodeParams{static_cast<GCodeEncoding>(encoding)};
    }
    return MetadataParams{static_cast<MetadataEncoding>(encoding)};
}

BlockParams Block::typed_params() const {
    return decode_params(type, params);
}

std::vector<uint8_t> deflate_payload(const std::vector<uint8_t>& input, int level) {
    z_stream strm = {};
    if (deflateInit2(&strm, level, Z_DEFLATED, 15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflateInit2 failed");
    }
    std::vector<uint8_t> compressed_data(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    strm.avail_out = static_cast<uInt>(compressed_data.size());
    strm.next_out = reinterpret_cast<Bytef*>(compressed_data.data());

    if (deflate(&strm, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&strm);
        throw std::runtime_error("zlib deflate failed");
    }
    compressed_data.resize(strm.total_out);
    deflateEnd(&strm);
    return compressed_data;
}

std::vector<uint8_t> inflate_payload(const uint8_t* data, size_t size, uint32_t expected_size, size_t offset) {
    z_stream strm = {};
    if (inflateInit(&strm) != Z_OK) {
        throw DecompressionFailed(offset, "inflateInit failed");
    }

    std::vector<uint8_t> decompressed_data;
    decompressed_data.reserve(expected_size);

    strm.avail_in = static_cast<uInt>(size);
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));

    std::vector<uint8_t> out_buffer(64 * 1024);
    int ret = Z_OK;
    do {
        strm.avail_out = static_cast<uInt>(out_buffer.size());
        strm.next_out = reinterpret_cast<Bytef*>(out_buffer.data());
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string reason = strm.msg ? strm.msg : ("zlib error " + std::to_string(ret));
            if (ret == Z_BUF_ERROR) reason = "unexpected end of compressed data";
            inflateEnd(&strm);
            throw DecompressionFailed(offset, reason);
        }
        size_t have = out_buffer.size() - strm.avail_out;
        if (decompressed_data.size() + have > expected_size) {
            inflateEnd(&strm);
            throw DecompressionFailed(offset, "payload inflates past its declared size of " +
                                              std::to_string(expected_size) + " bytes");
        }
        decompressed_data.insert(decompressed_data.end(), out_buffer.begin(), out_buffer.begin() + have);
    } while (ret != Z_STREAM_END);
    inflateEnd(&strm);

    if (decompressed_data.size() != expected_size) {
        throw DecompressionFailed(offset, "inflated " + std::to_string(decompressed_data.size()) +
                                          " bytes, header declares " + std::to_string(expected_size));
    }
    return decompressed_data;
}

size_t append_block(std::vector<uint8_t>& out, BlockType type, CompressionType compression,
                    const BlockParams& params, const std::vector<uint8_t>& payload,
                    int compression_level) {
    if (!params_match(type, params)) {
        throw std::invalid_argument("Params do not match block type " +
                                    block_type_name(static_cast<uint16_t>(type)));
    }
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Block payload exceeds 4 GiB");
    }
    if (compression != CompressionType::None && compression != CompressionType::Deflate) {
        throw UnsupportedCompression(static_cast<uint16_t>(compression), out.size());
    }

    std::vector<uint8_t> header;
    std::vector<uint8_t> compressed;
    const std::vector<uint8_t>* stored = &payload;

    BgcodeBlockHeader hdr{};
    hdr.type = static_cast<uint16_t>(type);
    hdr.compression = static_cast<uint16_t>(compression);
    hdr.uncompressed_size = static_cast<uint32_t>(payload.size());
    if (compression == CompressionType::None) {
        header.assign(reinterpret_cast<const uint8_t*>(&hdr),
                      reinterpret_cast<const uint8_t*>(&hdr) + BLOCK_HDR_SIZE_UNCOMPRESSED);
    } else {
        compressed = deflate_payload(payload, compression_level);
        stored = &compressed;
        hdr.compressed_size = static_cast<uint32_t>(compressed.size());
        header.assign(reinterpret_cast<const uint8_t*>(&hdr),
                      reinterpret_cast<const uint8_t*>(&hdr) + BLOCK_HDR_SIZE_COMPRESSED);
    }
    std::vector<uint8_t> params_bytes = encode_params(params);

    Crc32 crc;
    crc.update(header);
    crc.update(params_bytes);
    crc.update(*stored);

    size_t start = out.size();
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), params_bytes.begin(), params_bytes.end());
    out.insert(out.end(), stored->begin(), stored->end());
    append_pod(out, crc.value());
    return out.size() - start;
}

std::vector<uint8_t> serialize_block(BlockType type, CompressionType compression,
                                     const BlockParams& params, const std::vector<uint8_t>& payload,
                                     int compression_level) {
    std::vector<uint8_t> out;
    append_block(out, type, compression, params, payload, compression_level);
    return out;
}

Block parse_block(const uint8_t* data, size_t size, size_t offset) {
    if (offset > size || size - offset < 4) {
        throw TruncatedBlock(offset, "Truncated block header at offset " + std::to_string(offset));
    }

    Block block{};
    block.offset = offset;
    block.type = load_pod<uint16_t>(data, offset);
    block.compression = load_pod<uint16_t>(data, offset + 2);

    size_t hdr_len = 0;
    if (block.compression == static_cast<uint16_t>(CompressionType::None)) {
        hdr_len = BLOCK_HDR_SIZE_UNCOMPRESSED;
    } else if (block.compression == static_cast<uint16_t>(CompressionType::Deflate)) {
        hdr_len = BLOCK_HDR_SIZE_COMPRESSED;
    } else {
        throw UnsupportedCompression(block.compression, offset);
    }
    if (size - offset < hdr_len) {
        throw TruncatedBlock(offset, "Truncated block header at offset " + std::to_string(offset));
    }

    block.uncompressed_size = load_pod<uint32_t>(data, offset + 4);
    size_t payload_len = block.uncompressed_size;
    if (hdr_len == BLOCK_HDR_SIZE_COMPRESSED) {
        payload_len = load_pod<uint32_t>(data, offset + 8);
    }

    const size_t params_len = params_size(block.type);
    const size_t params_start = offset + hdr_len;
    const size_t payload_start = params_start + params_len;
    const size_t needed = hdr_len + params_len + payload_len + BLOCK_CHECKSUM_SIZE;
    if (size - offset < needed) {
        std::ostringstream oss;
        oss << "Truncated " << block_type_name(block.type) << " block at offset " << offset
            << ": need " << needed - (size - offset) << " more bytes";
        throw TruncatedBlock(offset, oss.str());
    }
    const size_t payload_end = payload_start + payload_len;

    block.checksum = load_pod<uint32_t>(data, payload_end);
    Crc32 crc;
    crc.update(data + offset, payload_end - offset);
    if (crc.value() != block.checksum) {
        throw ChecksumMismatch(block.type, offset, block.checksum, crc.value());
    }

    block.params.assign(data + params_start, data + payload_start);
    block.payload.assign(data + payload_start, data + payload_end);
    block.next_offset = payload_end + BLOCK_CHECKSUM_SIZE;
    return block;
}
