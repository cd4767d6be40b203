#include "png_encoder.hpp"
#include "shared_structure.hpp"
#include "utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <string>

// Appends length, tag, data and CRC32(tag + data), all big-endian.
static void write_chunk(std::vector<uint8_t>& out, const char tag[4], const uint8_t* data, size_t size) {
    append_be32(out, static_cast<uint32_t>(size));
    size_t tag_pos = out.size();
    out.insert(out.end(), tag, tag + 4);
    if (size > 0) {
        out.insert(out.end(), data, data + size);
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, out.data() + tag_pos, static_cast<uInt>(4 + size));
    append_be32(out, static_cast<uint32_t>(crc));
}

// IDAT content: a zlib stream (RFC 1950) produced in one shot.
static std::vector<uint8_t> compress_scanlines(const std::vector<uint8_t>& raw) {
    uLongf dest_len = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> out(dest_len);
    int ret = compress2(out.data(), &dest_len, raw.data(), static_cast<uLong>(raw.size()), PNG_DEFLATE_LEVEL);
    if (ret != Z_OK) {
        throw std::runtime_error("zlib compress2 failed for PNG image data (" + std::to_string(ret) + ")");
    }
    out.resize(dest_len);
    return out;
}

std::vector<uint8_t> encode_png(uint32_t width, uint32_t height, const std::vector<Rgb>& pixels) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("PNG dimensions must be non-zero");
    }
    if (pixels.size() != static_cast<size_t>(width) * height) {
        throw std::invalid_argument("Expected " + std::to_string(static_cast<size_t>(width) * height) +
                                    " pixels, got " + std::to_string(pixels.size()));
    }

    // width, height, bit depth, color type, compression, filter, interlace
    std::vector<uint8_t> ihdr;
    append_be32(ihdr, width);
    append_be32(ihdr, height);
    ihdr.push_back(8);
    ihdr.push_back(PNG_COLOR_TYPE_RGB);
    ihdr.push_back(0);
    ihdr.push_back(0);
    ihdr.push_back(0);

    // Each scanline: filter byte 0 (None) followed by RGB triples.
    std::vector<uint8_t> raw;
    raw.reserve(static_cast<size_t>(height) * (1 + static_cast<size_t>(width) * 3));
    for (uint32_t y = 0; y < height; ++y) {
        raw.push_back(0);
        for (uint32_t x = 0; x < width; ++x) {
            const Rgb& p = pixels[static_cast<size_t>(y) * width + x];
            raw.push_back(static_cast<uint8_t>(p.r & 0xFF));
            raw.push_back(static_cast<uint8_t>(p.g & 0xFF));
            raw.push_back(static_cast<uint8_t>(p.b & 0xFF));
        }
    }
    std::vector<uint8_t> idat = compress_scanlines(raw);

    std::vector<uint8_t> png(PNG_SIGNATURE, PNG_SIGNATURE + sizeof(PNG_SIGNATURE));
    write_chunk(png, "IHDR", ihdr.data(), ihdr.size());
    write_chunk(png, "IDAT", idat.data(), idat.size());
    write_chunk(png, "IEND", nullptr, 0);
    return png;
}

std::pair<uint32_t, uint32_t> read_png_dimensions(const std::vector<uint8_t>& png) {
    // signature(8) + length(4) + "IHDR"(4) + width(4) + height(4)
    if (png.size() < 24 || std::memcmp(png.data(), PNG_SIGNATURE, sizeof(PNG_SIGNATURE)) != 0) {
        throw std::invalid_argument("Not a PNG image");
    }
    if (std::memcmp(png.data() + 12, "IHDR", 4) != 0) {
        throw std::invalid_argument("PNG image does not start with an IHDR chunk");
    }
    return {load_be32(png.data() + 16), load_be32(png.data() + 20)};
}

static uint32_t checked_dimension(uint32_t value, const char* name) {
    if (value > Raster::MAX_DIMENSION) {
        throw std::invalid_argument(std::string("Raster ") + name + " " + std::to_string(value) +
                                    " exceeds the maximum of " + std::to_string(Raster::MAX_DIMENSION));
    }
    return value;
}

Raster::Raster(uint32_t width, uint32_t height, Rgb background, Rgb foreground)
    : w(checked_dimension(width, "width")), h(checked_dimension(height, "height")), fg(foreground),
      px(static_cast<size_t>(w) * h, background) {}

void Raster::set(int x, int y) {
    set(x, y, fg);
}

void Raster::set(int x, int y, Rgb color) {
    if (x >= 0 && y >= 0 && static_cast<uint32_t>(x) < w && static_cast<uint32_t>(y) < h) {
        px[static_cast<size_t>(y) * w + x] = color;
    }
}

void Raster::fill_rect(int x0, int y0, int x1, int y1) {
    fill_rect(x0, y0, x1, y1, fg);
}

void Raster::fill_rect(int x0, int y0, int x1, int y1, Rgb color) {
    const int max_x = std::min<int64_t>(x1, w);
    const int max_y = std::min<int64_t>(y1, h);
    for (int y = std::max(0, y0); y < max_y; ++y) {
        for (int x = std::max(0, x0); x < max_x; ++x) {
            px[static_cast<size_t>(y) * w + x] = color;
        }
    }
}

void Raster::line(int x0, int y0, int x1, int y1, int thick) {
    line(x0, y0, x1, y1, thick, fg);
}

void Raster::line(int x0, int y0, int x1, int y1, int thick, Rgb color) {
    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    const int ht = thick / 2;
    int err = dx - dy;
    int x = x0;
    int y = y0;
    while (true) {
        for (int tx = -ht; tx <= ht; ++tx) {
            for (int ty = -ht; ty <= ht; ++ty) {
                set(x + tx, y + ty, color);
            }
        }
        if (x == x1 && y == y1) break;
        int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
    }
}

std::vector<uint8_t> Raster::to_png() const {
    return encode_png(w, h, px);
}

std::vector<uint8_t> render_placeholder_thumbnail(uint32_t width, uint32_t height) {
    Raster r(width, height);
    const int w = static_cast<int>(width);
    const int h = static_cast<int>(height);
    const int n = std::max(2, std::min(5, h / 20));
    const int mx = std::max(1, w / 10);
    const int my = std::max(1, h / 10);
    const int thick = std::max(1, std::min(w, h) / 22);
    const double band = static_cast<double>(h - 2 * my) / n;
    for (int i = 0; i < n; ++i) {
        const double cy = my + (i + 0.5) * band;
        const int arm = std::max(1, static_cast<int>(band * 0.38));
        r.line(mx, static_cast<int>(cy), w - mx, static_cast<int>(cy - arm), thick);
        r.line(mx, static_cast<int>(cy), w - mx, static_cast<int>(cy + arm), thick);
    }
    return r.to_png();
}
