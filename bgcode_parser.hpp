#ifndef BGCODE_PARSER_HPP
#define BGCODE_PARSER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "block.hpp"
#include "bgcode_builder.hpp"
#include "shared_structure.hpp"

// Parses "key=value\n" lines; lines without '=' yield an empty value.
MetadataEntries parse_ini(const std::string& text);

// Structural view of a container: header fields and every block, each one
// checksum-verified. Block order is recorded, not enforced.
class BgcodeFile {
public:
    uint32_t magic;
    uint32_t version;
    uint16_t checksum_type;
    size_t size;
    std::vector<Block> blocks;

    static BgcodeFile parse(const std::vector<uint8_t>& data);
    static BgcodeFile parse(const uint8_t* data, size_t size);

    // Concatenated G-code of all GCode blocks in file order.
    std::string gcode() const;

    std::vector<Thumbnail> thumbnails() const;

    // Entries of the first metadata block of the given type, if present.
    std::optional<MetadataEntries> metadata(BlockType type) const;

    std::vector<const Block*> blocks_of_type(BlockType type) const;

    // FileMetadata, PrinterMetadata, Thumbnail*, PrintMetadata,
    // SlicerMetadata, GCode+.
    bool has_canonical_order() const;

    void print_info(std::ostream& os) const;

private:
    BgcodeFile() = default;
};

// Validates magic, version and checksum type of the 10-byte file header.
BgcodeFileHeader read_file_header(const uint8_t* data, size_t size);

// Decodes one GCode block's payload to text.
std::string decode_gcode_block(const Block& block);

// Single pass over the container: every block is checksum-verified, GCode
// blocks are decoded as they are reached, and the first failure aborts the
// whole decode.
std::string bgcode_to_ascii(const uint8_t* data, size_t size);
std::string bgcode_to_ascii(const std::vector<uint8_t>& data);

#endif // BGCODE_PARSER_HPP
