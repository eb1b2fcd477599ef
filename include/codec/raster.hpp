#ifndef INKWELL_RASTER_HPP
#define INKWELL_RASTER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace inkwell::image {
    enum class PixelMode {
        Gray,
        GrayAlpha,
        Rgb,
        Rgba,
        Bilevel // one byte per pixel, 0 or 255
    };

    int channelCount(PixelMode mode);
    const char* modeName(PixelMode mode);

    struct Raster {
        int width = 0;
        int height = 0;
        PixelMode mode = PixelMode::Gray;
        std::vector<uint8_t> pixels;

        // Raw TIFF payload of the EXIF block (without the "Exif\0\0" prefix).
        std::string exif;
        int orientation = 1;

        Raster() = default;
        Raster(int w, int h, PixelMode m, uint8_t fill = 0);

        int channels() const { return channelCount(mode); }
        size_t rowBytes() const { return static_cast<size_t>(width) * channels(); }
        bool empty() const { return pixels.empty(); }

        uint8_t* row(int y) { return pixels.data() + static_cast<size_t>(y) * rowBytes(); }
        const uint8_t* row(int y) const { return pixels.data() + static_cast<size_t>(y) * rowBytes(); }

        uint8_t& at(int x, int y, int c = 0) { return row(y)[static_cast<size_t>(x) * channels() + c]; }
        uint8_t at(int x, int y, int c = 0) const { return row(y)[static_cast<size_t>(x) * channels() + c]; }
    };
}

#endif // INKWELL_RASTER_HPP
