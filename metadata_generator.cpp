#include "metadata_generator.hpp"
#include "extractor.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

static const std::pair<const char*, BlockType> metadata_keys[] = {
    {"file_metadata", BlockType::FileMetadata},
    {"printer_metadata", BlockType::PrinterMetadata},
    {"print_metadata", BlockType::PrintMetadata},
    {"slicer_metadata", BlockType::SlicerMetadata},
};

static json entries_to_json(const MetadataEntries& entries) {
    json obj = json::object();
    for (const auto& [key, value] : entries) {
        obj[key] = value;
    }
    return obj;
}

static MetadataEntries entries_from_json(const json& obj, const std::string& name) {
    if (!obj.is_object()) {
        throw std::runtime_error("'" + name + "' must be an object of key/value pairs");
    }
    MetadataEntries entries;
    for (const auto& [key, value] : obj.items()) {
        entries.emplace_back(key, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return entries;
}

json describe_container(const BgcodeFile& file) {
    json metadata;
    metadata["version"] = file.version;
    metadata["checksum_type"] = file.checksum_type;

    for (const auto& [key, type] : metadata_keys) {
        auto entries = file.metadata(type);
        metadata[key] = entries_to_json(entries.value_or(MetadataEntries{}));
    }

    json thumbnails_json = json::array();
    auto thumbnails = file.thumbnails();
    for (size_t i = 0; i < thumbnails.size(); ++i) {
        thumbnails_json.push_back({
            {"file", thumbnail_filename(i, thumbnails[i])},
            {"format", static_cast<uint16_t>(thumbnails[i].format)},
            {"width", thumbnails[i].width},
            {"height", thumbnails[i].height}
        });
    }
    metadata["thumbnails"] = thumbnails_json;

    // A re-split with the largest block size reproduces the same cuts.
    auto gcode_blocks = file.blocks_of_type(BlockType::GCode);
    size_t block_size = 0;
    bool deflate = false;
    for (const Block* block : gcode_blocks) {
        if (gcode_blocks.size() > 1) {
            block_size = std::max<size_t>(block_size, block->uncompressed_size);
        }
        deflate = deflate || block->compression == static_cast<uint16_t>(CompressionType::Deflate);
    }
    metadata["gcode"] = {
        {"file", GCODE_FILENAME},
        {"compression", deflate ? "deflate" : "none"},
        {"blocks", gcode_blocks.size()},
        {"block_size", block_size}
    };
    return metadata;
}

void generate_metadata(const std::string& out_path, const BgcodeFile& file) {
    std::cout << "Generating metadata.json..." << std::endl;

    json metadata = describe_container(file);

    std::filesystem::path metadata_path = std::filesystem::path(out_path) / "metadata.json";
    std::ofstream out_f(metadata_path);
    if (!out_f) {
        throw std::runtime_error("Failed to open output file: " + metadata_path.string());
    }
    out_f << metadata.dump(4);
    std::cout << "Metadata saved to " << metadata_path << std::endl;
}

BuildOptions build_options_from_json(const json& meta) {
    BuildOptions options;
    for (const auto& [key, type] : metadata_keys) {
        if (!meta.contains(key)) continue;
        MetadataEntries entries = entries_from_json(meta[key], key);
        switch (type) {
            case BlockType::FileMetadata:    options.file_metadata = std::move(entries); break;
            case BlockType::PrinterMetadata: options.printer_metadata = std::move(entries); break;
            case BlockType::PrintMetadata:   options.print_metadata = std::move(entries); break;
            case BlockType::SlicerMetadata:  options.slicer_metadata = std::move(entries); break;
            default: break;
        }
    }

    if (meta.contains("gcode")) {
        const auto& gcode = meta["gcode"];
        std::string compression = gcode.value("compression", "none");
        if (compression == "deflate") {
            options.compress_gcode = true;
        } else if (compression != "none") {
            throw std::runtime_error("Unknown G-code compression: " + compression + " (expected 'none' or 'deflate')");
        }
        options.gcode_block_size = gcode.value("block_size", static_cast<size_t>(0));
        options.compression_level = gcode.value("level", options.compression_level);
    }
    return options;
}

std::vector<Thumbnail> load_thumbnails(const json& meta, const std::filesystem::path& input_dir) {
    std::vector<Thumbnail> thumbnails;
    if (!meta.contains("thumbnails")) return thumbnails;

    for (const auto& entry : meta["thumbnails"]) {
        auto path = input_dir / entry["file"].get<std::string>();
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("ERROR: Thumbnail file not found: " + path.string());
        }
        Thumbnail thumb;
        thumb.data = read_filepath(path);
        thumb.format = static_cast<ThumbnailFormat>(entry.value("format", 0u));
        thumb.width = entry["width"];
        thumb.height = entry["height"];
        thumbnails.push_back(std::move(thumb));
    }
    return thumbnails;
}
