#include "bgcode_parser.hpp"
#include "bgcode_errors.hpp"
#include "utils.hpp"
#include <cstring>
#include <sstream>
#include <iomanip>
#include <stdexcept>

MetadataEntries parse_ini(const std::string& text) {
    MetadataEntries entries;
    for (const auto& line : split_string(text, '\n')) {
        if (line.empty()) continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            entries.emplace_back(line, "");
        } else {
            entries.emplace_back(line.substr(0, eq), line.substr(eq + 1));
        }
    }
    return entries;
}

BgcodeFileHeader read_file_header(const uint8_t* data, size_t size) {
    if (size < BGCODE_FILE_HDR_SIZE) {
        throw MalformedHeader("Data too short (" + std::to_string(size) + " bytes) to be a bgcode file");
    }
    auto hdr = load_pod<BgcodeFileHeader>(data, 0);
    if (hdr.magic != BGCODE_MAGIC) {
        throw MalformedHeader("Not a bgcode file: expected magic 'GCDE', got 0x" + bytes_to_hex(data, 4));
    }
    if (hdr.version != BGCODE_VERSION) {
        throw MalformedHeader("Unsupported bgcode version " + std::to_string(hdr.version));
    }
    if (hdr.checksum_type != static_cast<uint16_t>(ChecksumType::CRC32)) {
        throw MalformedHeader("Unsupported checksum type " + std::to_string(hdr.checksum_type));
    }
    return hdr;
}

std::string decode_gcode_block(const Block& block) {
    const auto encoding = load_pod<uint16_t>(block.params.data(), 0);
    if (encoding != static_cast<uint16_t>(GCodeEncoding::None)) {
        std::ostringstream oss;
        oss << "Unsupported GCode block encoding " << encoding << " at offset " << block.offset
            << " (MeatPack decoding is not supported)";
        throw UnsupportedEncoding(encoding, block.offset, oss.str());
    }

    std::vector<uint8_t> inflated;
    const std::vector<uint8_t>* raw = &block.payload;
    if (block.compression == static_cast<uint16_t>(CompressionType::Deflate)) {
        inflated = inflate_payload(block.payload.data(), block.payload.size(), block.uncompressed_size, block.offset);
        raw = &inflated;
    } else if (block.compression != static_cast<uint16_t>(CompressionType::None)) {
        throw UnsupportedCompression(block.compression, block.offset);
    }

    // Each block must be text on its own; blocks are never joined before decoding.
    size_t bad = find_invalid_utf8(raw->data(), raw->size());
    if (bad != std::string::npos) {
        std::ostringstream oss;
        oss << "GCode block at offset " << block.offset << " is not valid UTF-8 (payload byte " << bad
            << " = 0x" << bytes_to_hex(raw->data() + bad, 1) << ")";
        throw UnsupportedEncoding(encoding, block.offset, oss.str());
    }
    return std::string(raw->begin(), raw->end());
}

std::string bgcode_to_ascii(const uint8_t* data, size_t size) {
    read_file_header(data, size);

    std::string gcode;
    bool found = false;
    size_t pos = BGCODE_FILE_HDR_SIZE;
    while (pos < size) {
        Block block = parse_block(data, size, pos);
        if (block.type == static_cast<uint16_t>(BlockType::GCode)) {
            gcode += decode_gcode_block(block);
            found = true;
        }
        pos = block.next_offset;
    }

    if (!found) {
        throw NoPayloadBlocksFound();
    }
    return gcode;
}

std::string bgcode_to_ascii(const std::vector<uint8_t>& data) {
    return bgcode_to_ascii(data.data(), data.size());
}

BgcodeFile BgcodeFile::parse(const std::vector<uint8_t>& data) {
    return parse(data.data(), data.size());
}

BgcodeFile BgcodeFile::parse(const uint8_t* data, size_t size) {
    auto hdr = read_file_header(data, size);

    BgcodeFile file;
    file.magic = hdr.magic;
    file.version = hdr.version;
    file.checksum_type = hdr.checksum_type;
    file.size = size;

    size_t pos = BGCODE_FILE_HDR_SIZE;
    while (pos < size) {
        file.blocks.push_back(parse_block(data, size, pos));
        pos = file.blocks.back().next_offset;
    }
    return file;
}

std::string BgcodeFile::gcode() const {
    std::string gcode;
    bool found = false;
    for (const auto& block : blocks) {
        if (block.type == static_cast<uint16_t>(BlockType::GCode)) {
            gcode += decode_gcode_block(block);
            found = true;
        }
    }
    if (!found) {
        throw NoPayloadBlocksFound();
    }
    return gcode;
}

std::vector<Thumbnail> BgcodeFile::thumbnails() const {
    std::vector<Thumbnail> result;
    for (const Block* block : blocks_of_type(BlockType::Thumbnail)) {
        auto params = std::get<ThumbnailParams>(block->typed_params());
        result.push_back({params.width, params.height, block->payload, params.format});
    }
    return result;
}

std::optional<MetadataEntries> BgcodeFile::metadata(BlockType type) const {
    if (!is_metadata_block(type)) {
        throw std::invalid_argument(block_type_name(static_cast<uint16_t>(type)) + " is not a metadata block");
    }
    for (const auto& block : blocks) {
        if (block.type != static_cast<uint16_t>(type)) continue;
        if (block.compression == static_cast<uint16_t>(CompressionType::Deflate)) {
            auto raw = inflate_payload(block.payload.data(), block.payload.size(), block.uncompressed_size, block.offset);
            return parse_ini(std::string(raw.begin(), raw.end()));
        }
        return parse_ini(std::string(block.payload.begin(), block.payload.end()));
    }
    return std::nullopt;
}

std::vector<const Block*> BgcodeFile::blocks_of_type(BlockType type) const {
    std::vector<const Block*> result;
    for (const auto& block : blocks) {
        if (block.type == static_cast<uint16_t>(type)) {
            result.push_back(&block);
        }
    }
    return result;
}

bool BgcodeFile::has_canonical_order() const {
    // Expected sequence, with Thumbnail repeatable and GCode repeatable (>= 1).
    static const BlockType sequence[] = {
        BlockType::FileMetadata, BlockType::PrinterMetadata, BlockType::Thumbnail,
        BlockType::PrintMetadata, BlockType::SlicerMetadata, BlockType::GCode,
    };
    size_t stage = 0;
    size_t i = 0;
    while (stage < 6) {
        const uint16_t expected = static_cast<uint16_t>(sequence[stage]);
        const bool repeatable = sequence[stage] == BlockType::Thumbnail || sequence[stage] == BlockType::GCode;
        const bool optional = sequence[stage] == BlockType::Thumbnail;
        size_t count = 0;
        while (i < blocks.size() && blocks[i].type == expected) {
            ++i;
            ++count;
            if (!repeatable) break;
        }
        if (count == 0 && !optional) return false;
        ++stage;
    }
    return i == blocks.size();
}

void BgcodeFile::print_info(std::ostream& os) const {
    os << "BGCode Header" << std::endl;
    os << "=============" << std::endl;
    os << "magic = " << hex32(magic) << ", version = " << version
       << ", checksum_type = " << checksum_type << ", size = " << size << std::endl;
    os << "blocks = " << blocks.size() << std::endl;
    for (const auto& block : blocks) {
        os << "  Block(type=" << block_type_name(block.type)
           << ", offset=" << block.offset
           << ", compression=" << compression_name(block.compression)
           << ", uncompressed_size=" << block.uncompressed_size
           << ", stored_size=" << block.payload.size()
           << ", crc=" << hex32(block.checksum);
        if (block.type == static_cast<uint16_t>(BlockType::Thumbnail)) {
            auto params = std::get<ThumbnailParams>(block.typed_params());
            os << ", format=" << static_cast<uint16_t>(params.format)
               << ", width=" << params.width << ", height=" << params.height;
        } else {
            os << ", encoding=" << load_pod<uint16_t>(block.params.data(), 0);
        }
        os << ")" << std::endl;
    }
    os << "canonical_order = " << (has_canonical_order() ? "true" : "false") << std::endl << std::endl;
}
