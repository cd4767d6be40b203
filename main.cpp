#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <stdexcept>
#include <algorithm>

#include "utils.hpp"
#include "bgcode_builder.hpp"
#include "bgcode_parser.hpp"
#include "png_encoder.hpp"
#include "extractor.hpp"
#include "metadata_generator.hpp"

namespace fs = std::filesystem;

void printUsage(const char* progName) {
    std::cerr << "A tool to pack and unpack binary G-code (.bgcode) files." << std::endl;
    std::cerr << "Usage: " << progName << " <command> [options]" << std::endl << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  encode     Pack a G-code text file into a bgcode file." << std::endl;
    std::cerr << "  decode     Recover the G-code text from a bgcode file." << std::endl;
    std::cerr << "  info       Print the block layout of a bgcode file." << std::endl;
    std::cerr << "  extract    Extract a bgcode file to a folder." << std::endl;
    std::cerr << "  repack     Repack an extracted folder into a bgcode file." << std::endl << std::endl;
    std::cerr << "Options for 'encode':" << std::endl;
    std::cerr << "  " << progName << " encode <gcode_file> <output_file> [options]" << std::endl;
    std::cerr << "    -t, --thumbnail <png>    Embed a PNG thumbnail (repeatable)." << std::endl;
    std::cerr << "    --preview <W>x<H>        Embed a generated placeholder preview." << std::endl;
    std::cerr << "    -c, --config <json>      Metadata and compression settings." << std::endl;
    std::cerr << "    --deflate                DEFLATE-compress the G-code blocks." << std::endl;
    std::cerr << "                             (Not readable by every firmware.)" << std::endl;
    std::cerr << "    --block-size <bytes>     Split the G-code into blocks of at most this size." << std::endl << std::endl;
    std::cerr << "Options for 'decode':" << std::endl;
    std::cerr << "  " << progName << " decode <bgcode_file> [-o <gcode_file>] [--thumbnail-comments]" << std::endl;
    std::cerr << "    -o, --output <path>      Write the G-code here instead of stdout." << std::endl;
    std::cerr << "    --thumbnail-comments     Prepend PNG thumbnails as base64 comment blocks." << std::endl << std::endl;
    std::cerr << "Options for 'extract':" << std::endl;
    std::cerr << "  " << progName << " extract <bgcode_file> -d <path>" << std::endl;
    std::cerr << "    -d, --dest <path>        The directory to extract files to." << std::endl << std::endl;
    std::cerr << "Options for 'repack':" << std::endl;
    std::cerr << "  " << progName << " repack <input_dir> <output_file>" << std::endl;
    std::cerr << "    <input_dir>              Directory containing extracted files and metadata.json." << std::endl << std::endl;
    std::cerr << "General Options:" << std::endl;
    std::cerr << "  -h, --help               Show this help message and exit." << std::endl;
}

static std::pair<uint16_t, uint16_t> parse_dimensions(const std::string& spec) {
    auto parts = split_string(spec, 'x');
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
        throw std::invalid_argument("Expected <W>x<H>, got '" + spec + "'");
    }
    unsigned long w = std::stoul(parts[0]);
    unsigned long h = std::stoul(parts[1]);
    if (w == 0 || h == 0 || w > Raster::MAX_DIMENSION || h > Raster::MAX_DIMENSION) {
        throw std::invalid_argument("Preview size out of range (1.." + std::to_string(Raster::MAX_DIMENSION) +
                                    " per side): " + spec);
    }
    return {static_cast<uint16_t>(w), static_cast<uint16_t>(h)};
}

static Thumbnail load_png_thumbnail(const fs::path& path) {
    Thumbnail thumb;
    thumb.data = read_filepath(path);
    auto [w, h] = read_png_dimensions(thumb.data);
    if (w > 0xFFFF || h > 0xFFFF) {
        throw std::invalid_argument("Thumbnail too large: " + path.string());
    }
    thumb.width = static_cast<uint16_t>(w);
    thumb.height = static_cast<uint16_t>(h);
    thumb.format = ThumbnailFormat::PNG;
    return thumb;
}

static std::string read_text_file(const fs::path& path) {
    auto bytes = read_filepath(path);
    return std::string(bytes.begin(), bytes.end());
}

static int run_encode(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::vector<Thumbnail> thumbnails;
    std::optional<std::string> config_path;
    bool deflate = false;
    std::optional<size_t> block_size;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " option requires an argument.");
            }
            return argv[++i];
        };
        if (arg == "-t" || arg == "--thumbnail") {
            thumbnails.push_back(load_png_thumbnail(next_value()));
        } else if (arg == "--preview") {
            auto [w, h] = parse_dimensions(next_value());
            thumbnails.push_back({w, h, render_placeholder_thumbnail(w, h), ThumbnailFormat::PNG});
        } else if (arg == "-c" || arg == "--config") {
            config_path = next_value();
        } else if (arg == "--deflate") {
            deflate = true;
        } else if (arg == "--block-size") {
            block_size = std::stoul(next_value());
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Error: encode expects <gcode_file> <output_file>." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    BuildOptions options;
    if (config_path.has_value()) {
        std::ifstream config_file(*config_path);
        if (!config_file) {
            throw std::runtime_error("Cannot open config file " + *config_path);
        }
        options = build_options_from_json(json::parse(config_file));
    }
    if (deflate) options.compress_gcode = true;
    if (block_size.has_value()) options.gcode_block_size = *block_size;

    std::string gcode = read_text_file(positional[0]);
    auto content = encode_bgcode(gcode, thumbnails, options);
    write_filepath(positional[1], content);

    size_t lines = std::count(gcode.begin(), gcode.end(), '\n');
    std::cout << "Wrote " << lines << " G-code lines as bgcode (" << content.size() << " bytes) -> "
              << positional[1] << std::endl;
    return 0;
}

static int run_decode(int argc, char* argv[]) {
    std::string file_path;
    std::optional<std::string> output_path;
    bool thumbnail_comments = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--thumbnail-comments") {
            thumbnail_comments = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                output_path = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " option requires an argument." << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } else {
            if (!file_path.empty()) {
                std::cerr << "Error: Multiple input files specified for decode. Only one is allowed." << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            file_path = arg;
        }
    }

    if (file_path.empty()) {
        std::cerr << "Error: Input bgcode file not specified for decode command." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    auto data = read_filepath(file_path);
    std::string gcode;
    if (thumbnail_comments) {
        auto file = BgcodeFile::parse(data);
        gcode = thumbnails_to_gcode_comments(file.thumbnails()) + file.gcode();
    } else {
        gcode = bgcode_to_ascii(data);
    }

    if (output_path.has_value()) {
        write_filepath(*output_path, std::vector<uint8_t>(gcode.begin(), gcode.end()));
        size_t lines = std::count(gcode.begin(), gcode.end(), '\n');
        std::cout << "Wrote " << lines << " lines (" << gcode.size() << " bytes) -> " << *output_path << std::endl;
    } else {
        std::cout << gcode;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Handle help options in priority
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 2) {
        std::cerr << "Error: No command specified. Use 'encode', 'decode', 'info', 'extract' or 'repack'." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    try {
        std::string command = argv[1];

        if (command == "encode") {
            return run_encode(argc, argv);
        } else if (command == "decode") {
            return run_decode(argc, argv);
        } else if (command == "info") {
            if (argc != 3) {
                std::cerr << "Error: Invalid number of arguments for info command." << std::endl;
                std::cerr << "Usage: " << argv[0] << " info <bgcode_file>" << std::endl;
                return 1;
            }
            auto file = BgcodeFile::parse(read_filepath(argv[2]));
            file.print_info(std::cout);
        } else if (command == "extract") {
            std::string file_path;
            std::optional<std::string> extract_path;

            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "-d" || arg == "--dest") {
                    if (i + 1 < argc) {
                        extract_path = argv[++i];
                    } else {
                        std::cerr << "Error: " << arg << " option requires an argument." << std::endl;
                        printUsage(argv[0]);
                        return 1;
                    }
                } else {
                    if (!file_path.empty()) {
                        std::cerr << "Error: Multiple input files specified for extract. Only one is allowed." << std::endl;
                        printUsage(argv[0]);
                        return 1;
                    }
                    file_path = arg;
                }
            }

            if (file_path.empty() || !extract_path.has_value()) {
                std::cerr << "Error: extract needs an input bgcode file and -d <path>." << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            // 1. Parse and verify every block before writing anything
            auto file = BgcodeFile::parse(read_filepath(file_path));
            file.print_info(std::cout);

            // 2. Extract the payloads and their metadata
            fs::create_directories(*extract_path);
            extract_gcode(file, *extract_path);
            extract_thumbnails(file, *extract_path);

            // 3. Generate and store metadata.json
            generate_metadata(*extract_path, file);
        } else if (command == "repack") {
            if (argc != 4) {
                std::cerr << "Error: Invalid number of arguments for repack command." << std::endl;
                std::cerr << "Usage: " << argv[0] << " repack <input_dir> <output_file>" << std::endl;
                return 1;
            }

            fs::path input_dir(argv[2]);
            fs::path output_file(argv[3]);

            auto metadata_path = input_dir / "metadata.json";
            if (!fs::exists(metadata_path)) {
                throw std::runtime_error("ERROR: metadata.json not found in '" + input_dir.string() + "'");
            }

            std::ifstream meta_file(metadata_path);
            json metadata = json::parse(meta_file);

            std::cout << "Building bgcode file..." << std::endl;
            BuildOptions options = build_options_from_json(metadata);
            auto thumbnails = load_thumbnails(metadata, input_dir);
            std::string gcode_name = GCODE_FILENAME;
            if (metadata.contains("gcode")) {
                gcode_name = metadata["gcode"].value("file", gcode_name);
            }
            std::string gcode = read_text_file(input_dir / gcode_name);

            auto content = encode_bgcode(gcode, thumbnails, options);
            write_filepath(output_file, content);
            std::cout << "bgcode file built successfully (" << content.size() << " bytes) -> "
                      << output_file.string() << std::endl;
        } else {
            std::cerr << "Error: Unknown command '" << command << "'. Use 'encode', 'decode', 'info', 'extract' or 'repack'." << std::endl;
            printUsage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
