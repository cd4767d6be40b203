#ifndef PNG_ENCODER_HPP
#define PNG_ENCODER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <utility>

// Channels are int so out-of-range values from drawing code can be masked
// rather than rejected.
struct Rgb {
    int r;
    int g;
    int b;

    bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
};

// Encodes a row-major RGB grid as an 8-bit truecolor PNG (IHDR, one IDAT,
// IEND; filter type 0 on every scanline, no interlacing).
std::vector<uint8_t> encode_png(uint32_t width, uint32_t height, const std::vector<Rgb>& pixels);

// Reads width and height from the IHDR chunk of a PNG stream.
std::pair<uint32_t, uint32_t> read_png_dimensions(const std::vector<uint8_t>& png);

// Minimal pixel canvas used to draw preview thumbnails.
class Raster {
public:
    // Largest width or height a canvas may have.
    static constexpr uint32_t MAX_DIMENSION = 4096;

    static constexpr Rgb DEFAULT_BACKGROUND{30, 30, 30};
    static constexpr Rgb DEFAULT_FOREGROUND{250, 104, 49};

    // Throws std::invalid_argument past MAX_DIMENSION.
    Raster(uint32_t width, uint32_t height, Rgb background = DEFAULT_BACKGROUND,
           Rgb foreground = DEFAULT_FOREGROUND);

    uint32_t width() const { return w; }
    uint32_t height() const { return h; }
    const std::vector<Rgb>& pixels() const { return px; }
    Rgb at(uint32_t x, uint32_t y) const { return px[static_cast<std::size_t>(y) * w + x]; }

    // Out-of-canvas coordinates are ignored.
    void set(int x, int y);
    void set(int x, int y, Rgb color);

    // Half-open rectangle [x0, x1) x [y0, y1), clipped to the canvas.
    void fill_rect(int x0, int y0, int x1, int y1);
    void fill_rect(int x0, int y0, int x1, int y1, Rgb color);

    // Bresenham line; `thick` pixels wide (square pen).
    void line(int x0, int y0, int x1, int y1, int thick = 1);
    void line(int x0, int y0, int x1, int y1, int thick, Rgb color);

    std::vector<uint8_t> to_png() const;

private:
    uint32_t w;
    uint32_t h;
    Rgb fg;
    std::vector<Rgb> px;
};

// Rows of chevrons on a dark background; used when a preview is requested
// without an image.
std::vector<uint8_t> render_placeholder_thumbnail(uint32_t width, uint32_t height);

#endif // PNG_ENCODER_HPP
