#include "extractor.hpp"
#include "utils.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

static const char* thumbnail_extension(ThumbnailFormat format) {
    switch (format) {
        case ThumbnailFormat::PNG: return "png";
        case ThumbnailFormat::JPG: return "jpg";
        case ThumbnailFormat::QOI: return "qoi";
    }
    return "bin";
}

std::string thumbnail_filename(size_t index, const Thumbnail& thumbnail) {
    return std::string(THUMBNAILS_DIR) + "/thumbnail_" + std::to_string(index) + "_" +
           std::to_string(thumbnail.width) + "x" + std::to_string(thumbnail.height) + "." +
           thumbnail_extension(thumbnail.format);
}

void extract_gcode(const BgcodeFile& file, const std::string& out_path) {
    std::string gcode = file.gcode();
    fs::path out_file_path = fs::path(out_path) / GCODE_FILENAME;
    std::cout << "Extracting G-code (" << file.blocks_of_type(BlockType::GCode).size() << " blocks, "
              << gcode.size() << " bytes)..." << std::endl;

    std::ofstream out_f(out_file_path, std::ios::binary);
    if (!out_f) {
        throw std::runtime_error("Failed to open output file: " + out_file_path.string());
    }
    out_f.write(gcode.data(), gcode.size());
    std::cout << "Done.\n" << std::endl;
}

void extract_thumbnails(const BgcodeFile& file, const std::string& out_path) {
    auto thumbnails = file.thumbnails();
    if (thumbnails.empty()) {
        std::cout << "  No thumbnails to extract.\n" << std::endl;
        return;
    }

    fs::create_directories(fs::path(out_path) / THUMBNAILS_DIR);
    std::cout << "Extracting thumbnails..." << std::endl;
    for (size_t i = 0; i < thumbnails.size(); ++i) {
        std::string name = thumbnail_filename(i, thumbnails[i]);
        std::cout << "  extracting " << name << " (" << thumbnails[i].data.size() << " bytes)..." << std::endl;
        write_filepath(fs::path(out_path) / name, thumbnails[i].data);
    }
    std::cout << "Done.\n" << std::endl;
}

std::string thumbnails_to_gcode_comments(const std::vector<Thumbnail>& thumbnails) {
    std::string out;
    for (const auto& thumb : thumbnails) {
        if (thumb.format != ThumbnailFormat::PNG) continue;
        std::string b64 = base64_encode(thumb.data.data(), thumb.data.size());
        out += "; thumbnail begin " + std::to_string(thumb.width) + "x" + std::to_string(thumb.height) +
               " " + std::to_string(b64.size()) + "\n";
        for (size_t i = 0; i < b64.size(); i += 78) {
            out += "; " + b64.substr(i, 78) + "\n";
        }
        out += "; thumbnail end\n";
        out += ";\n";
    }
    return out;
}
