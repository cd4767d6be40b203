#ifndef BGCODE_BUILDER_HPP
#define BGCODE_BUILDER_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "shared_structure.hpp"

// Ordered key=value entries of one metadata block.
using MetadataEntries = std::vector<std::pair<std::string, std::string>>;

struct Thumbnail {
    uint16_t width;
    uint16_t height;
    std::vector<uint8_t> data; // complete image file
    ThumbnailFormat format = ThumbnailFormat::PNG;
};

struct BuildOptions {
    MetadataEntries file_metadata{{"Producer", "bgcodetool"}};
    MetadataEntries printer_metadata;
    MetadataEntries print_metadata{{"generator", "bgcodetool"}};
    MetadataEntries slicer_metadata;

    // Some firmwares only read uncompressed GCode blocks and report any other
    // compression as a corrupt file. Enable only for readers known to inflate.
    bool compress_gcode = false;
    int compression_level = 6;

    // Maximum G-code bytes per GCode block; 0 keeps the whole text in one block.
    size_t gcode_block_size = 0;
};

// Serializes metadata entries as "key=value\n" lines.
std::string encode_ini(const MetadataEntries& entries);

// Splits G-code into chunks of at most max_size bytes, cutting after the last
// newline inside the limit when there is one and otherwise at a UTF-8
// character boundary. A chunk exceeds max_size only when a single character
// is longer than the limit. Always returns at least one (possibly empty) chunk.
std::vector<std::string> split_gcode(const std::string& gcode, size_t max_size);

class BgcodeBuilder {
private:
    BuildOptions options;
    std::vector<Thumbnail> thumbnails;

public:
    explicit BgcodeBuilder(BuildOptions opts = BuildOptions()) : options(std::move(opts)) {}

    void add_thumbnail(Thumbnail thumbnail);
    void add_thumbnail(uint16_t width, uint16_t height, std::vector<uint8_t> data);

    // Emits FileMetadata, PrinterMetadata, Thumbnail*, PrintMetadata,
    // SlicerMetadata, GCode+.
    std::vector<uint8_t> build(const std::string& gcode) const;

    // Appends the container to `out`; returns the number of bytes appended.
    size_t build_into(std::vector<uint8_t>& out, const std::string& gcode) const;

    // Writes the container to a stream; returns the number of bytes written.
    size_t write(std::ostream& out, const std::string& gcode) const;
};

std::vector<uint8_t> encode_bgcode(const std::string& gcode, const std::vector<Thumbnail>& thumbnails,
                                   const BuildOptions& options = BuildOptions());

#endif // BGCODE_BUILDER_HPP
