#include "utils.hpp"

std::string bytes_to_hex(const uint8_t* bytes, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::string hex32(uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

std::vector<std::string> split_string(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    std::string::size_type end = 0;

    while ((end = s.find(delimiter, start)) != std::string::npos) {
        tokens.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    tokens.push_back(s.substr(start));

    return tokens;
}

std::string base64_encode(const uint8_t* data, size_t size) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((size + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(alphabet[(n >> 18) & 0x3f]);
        out.push_back(alphabet[(n >> 12) & 0x3f]);
        out.push_back(alphabet[(n >> 6) & 0x3f]);
        out.push_back(alphabet[n & 0x3f]);
    }
    if (i + 1 == size) {
        uint32_t n = data[i] << 16;
        out.push_back(alphabet[(n >> 18) & 0x3f]);
        out.push_back(alphabet[(n >> 12) & 0x3f]);
        out += "==";
    } else if (i + 2 == size) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(alphabet[(n >> 18) & 0x3f]);
        out.push_back(alphabet[(n >> 12) & 0x3f]);
        out.push_back(alphabet[(n >> 6) & 0x3f]);
        out.push_back('=');
    }
    return out;
}

size_t find_invalid_utf8(const uint8_t* data, size_t size) {
    static const uint32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};

    size_t i = 0;
    while (i < size) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return i;
        }
        if (size - i < len) {
            return i;
        }
        for (size_t k = 1; k < len; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) {
                return i;
            }
            cp = (cp << 6) | (data[i + k] & 0x3F);
        }
        if (cp < min_code_point[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return i;
        }
        i += len;
    }
    return std::string::npos;
}

std::vector<uint8_t> read_filepath(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer;
}

void write_filepath(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out_f(path, std::ios::binary | std::ios::trunc);
    if (!out_f) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    out_f.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!out_f) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}
