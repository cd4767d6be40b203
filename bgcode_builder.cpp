#include "bgcode_builder.hpp"
#include "block.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

std::string encode_ini(const MetadataEntries& entries) {
    std::string ini;
    for (const auto& [key, value] : entries) {
        ini += key;
        ini += '=';
        ini += value;
        ini += '\n';
    }
    return ini;
}

static bool is_utf8_continuation(char c) {
    return (static_cast<uint8_t>(c) & 0xC0) == 0x80;
}

std::vector<std::string> split_gcode(const std::string& gcode, size_t max_size) {
    std::vector<std::string> chunks;
    if (max_size == 0 || gcode.size() <= max_size) {
        chunks.push_back(gcode);
        return chunks;
    }

    size_t pos = 0;
    while (pos < gcode.size()) {
        size_t len = std::min(max_size, gcode.size() - pos);
        if (pos + len < gcode.size()) {
            size_t nl = gcode.rfind('\n', pos + len - 1);
            if (nl != std::string::npos && nl >= pos) {
                len = nl - pos + 1;
            } else {
                // Hard cut: back off to a character boundary, or take the
                // whole character when the limit is smaller than it.
                size_t cut = pos + len;
                while (cut > pos && is_utf8_continuation(gcode[cut])) --cut;
                if (cut == pos) {
                    cut = pos + len;
                    while (cut < gcode.size() && is_utf8_continuation(gcode[cut])) ++cut;
                }
                len = cut - pos;
            }
        }
        chunks.push_back(gcode.substr(pos, len));
        pos += len;
    }
    return chunks;
}

static std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static void append_metadata_block(std::vector<uint8_t>& out, BlockType type, const MetadataEntries& entries) {
    append_block(out, type, CompressionType::None, MetadataParams{MetadataEncoding::INI},
                 to_bytes(encode_ini(entries)));
}

void BgcodeBuilder::add_thumbnail(Thumbnail thumbnail) {
    thumbnails.push_back(std::move(thumbnail));
}

void BgcodeBuilder::add_thumbnail(uint16_t width, uint16_t height, std::vector<uint8_t> data) {
    thumbnails.push_back({width, height, std::move(data), ThumbnailFormat::PNG});
}

size_t BgcodeBuilder::build_into(std::vector<uint8_t>& out, const std::string& gcode) const {
    const size_t start = out.size();

    BgcodeFileHeader file_hdr{};
    file_hdr.magic = BGCODE_MAGIC;
    file_hdr.version = BGCODE_VERSION;
    file_hdr.checksum_type = static_cast<uint16_t>(ChecksumType::CRC32);
    append_pod(out, file_hdr);

    // GCode must come last: readers locate PrintMetadata and SlicerMetadata
    // by seeking back past the GCode blocks.
    append_metadata_block(out, BlockType::FileMetadata, options.file_metadata);
    append_metadata_block(out, BlockType::PrinterMetadata, options.printer_metadata);

    // Image data is already compressed.
    for (const auto& thumb : thumbnails) {
        append_block(out, BlockType::Thumbnail, CompressionType::None,
                     ThumbnailParams{thumb.format, thumb.width, thumb.height}, thumb.data);
    }

    append_metadata_block(out, BlockType::PrintMetadata, options.print_metadata);
    append_metadata_block(out, BlockType::SlicerMetadata, options.slicer_metadata);

    const CompressionType gcode_compression =
        options.compress_gcode ? CompressionType::Deflate : CompressionType::None;
    for (const auto& chunk : split_gcode(gcode, options.gcode_block_size)) {
        append_block(out, BlockType::GCode, gcode_compression, GCodeParams{GCodeEncoding::None},
                     to_bytes(chunk), options.compression_level);
    }

    return out.size() - start;
}

std::vector<uint8_t> BgcodeBuilder::build(const std::string& gcode) const {
    std::vector<uint8_t> out;
    build_into(out, gcode);
    return out;
}

size_t BgcodeBuilder::write(std::ostream& out, const std::string& gcode) const {
    std::vector<uint8_t> content = build(gcode);
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("Failed to write bgcode output");
    }
    return content.size();
}

std::vector<uint8_t> encode_bgcode(const std::string& gcode, const std::vector<Thumbnail>& thumbnails,
                                   const BuildOptions& options) {
    BgcodeBuilder builder(options);
    for (const auto& thumb : thumbnails) {
        builder.add_thumbnail(thumb);
    }
    return builder.build(gcode);
}
