#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <nlohmann/json.hpp>

// Use nlohmann::ordered_json to preserve the order of elements from metadata.json
using json = nlohmann::ordered_json;

// Converts a span of bytes to a hex string.
std::string bytes_to_hex(const uint8_t* bytes, size_t size);

// Formats a 32-bit value as 0x%08x.
std::string hex32(uint32_t value);

// Splits a string by a delimiter.
std::vector<std::string> split_string(const std::string& s, char delimiter);

// Standard base64 with '=' padding.
std::string base64_encode(const uint8_t* data, size_t size);

// Index of the first byte that does not start a well-formed UTF-8 sequence
// (overlong forms, surrogates and code points past U+10FFFF included), or
// std::string::npos when the whole span is valid.
size_t find_invalid_utf8(const uint8_t* data, size_t size);

// Reads the entire content of a file into a byte vector.
std::vector<uint8_t> read_filepath(const std::filesystem::path& path);

// Writes a byte buffer to a file, replacing it.
void write_filepath(const std::filesystem::path& path, const std::vector<uint8_t>& data);

// Appends the raw bytes of a POD value (host order, little-endian on disk).
template<typename T>
void append_pod(std::vector<uint8_t>& buffer, const T& value) {
    const auto* p = reinterpret_cast<const uint8_t*>(&value);
    buffer.insert(buffer.end(), p, p + sizeof(T));
}

// Reads a POD value at an offset; the caller bounds-checks.
template<typename T>
T load_pod(const uint8_t* data, size_t offset) {
    T value;
    std::memcpy(&value, data + offset, sizeof(T));
    return value;
}

inline void append_be32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value >> 24));
    buffer.push_back(static_cast<uint8_t>(value >> 16));
    buffer.push_back(static_cast<uint8_t>(value >> 8));
    buffer.push_back(static_cast<uint8_t>(value));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

#endif // UTILS_HPP
