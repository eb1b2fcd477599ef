#include <codec/raster.hpp>

namespace inkwell::image {

int channelCount(PixelMode mode) {
    switch (mode) {
        case PixelMode::Gray:
        case PixelMode::Bilevel:
            return 1;
        case PixelMode::GrayAlpha:
            return 2;
        case PixelMode::Rgb:
            return 3;
        case PixelMode::Rgba:
            return 4;
    }
    return 1;
}

const char* modeName(PixelMode mode) {
    switch (mode) {
        case PixelMode::Gray: return "L";
        case PixelMode::GrayAlpha: return "LA";
        case PixelMode::Rgb: return "RGB";
        case PixelMode::Rgba: return "RGBA";
        case PixelMode::Bilevel: return "1";
    }
    return "?";
}

Raster::Raster(int w, int h, PixelMode m, uint8_t fill)
    : width(w), height(h), mode(m),
      pixels(static_cast<size_t>(w) * static_cast<size_t>(h) * channelCount(m), fill) {}

}
