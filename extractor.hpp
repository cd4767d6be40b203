#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include "bgcode_parser.hpp"
#include <string>
#include <vector>

constexpr const char* GCODE_FILENAME = "output.gcode";
constexpr const char* THUMBNAILS_DIR = "thumbnails";

// Relative path of the i-th thumbnail inside an extraction directory.
std::string thumbnail_filename(size_t index, const Thumbnail& thumbnail);

void extract_gcode(const BgcodeFile& file, const std::string& out_path);
void extract_thumbnails(const BgcodeFile& file, const std::string& out_path);

// PrusaSlicer-style "; thumbnail begin WxH <len>" comment blocks, base64 in
// 78-character lines. Non-PNG thumbnails are skipped. Empty when there is
// nothing to emit.
std::string thumbnails_to_gcode_comments(const std::vector<Thumbnail>& thumbnails);

#endif // EXTRACTOR_HPP
