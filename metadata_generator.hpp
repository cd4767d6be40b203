#ifndef METADATA_GENERATOR_HPP
#define METADATA_GENERATOR_HPP

#include "bgcode_parser.hpp"
#include "bgcode_builder.hpp"
#include "utils.hpp"
#include <filesystem>
#include <string>
#include <vector>

// Describes a parsed container as metadata.json content.
json describe_container(const BgcodeFile& file);

// Writes <out_path>/metadata.json.
void generate_metadata(const std::string& out_path, const BgcodeFile& file);

// Build options from a metadata.json / --config document. Missing keys keep
// their defaults.
BuildOptions build_options_from_json(const json& meta);

// Loads the thumbnails listed in meta["thumbnails"], paths relative to input_dir.
std::vector<Thumbnail> load_thumbnails(const json& meta, const std::filesystem::path& input_dir);

#endif // METADATA_GENERATOR_HPP
