#include <pipeline/stages.hpp>
#include <codec/exif.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <vector>

namespace inkwell::pipeline {

using image::PixelMode;
using image::Raster;

static bool hasAlpha(PixelMode mode) {
    return mode == PixelMode::GrayAlpha || mode == PixelMode::Rgba;
}

static int colorChannels(const Raster& raster) {
    return raster.channels() - (hasAlpha(raster.mode) ? 1 : 0);
}

static uint8_t blend(double degenerate, double value, double factor) {
    const double temp = degenerate + factor * (value - degenerate);
    if (temp <= 0.0) return 0;
    if (temp >= 255.0) return 255;
    return static_cast<uint8_t>(temp);
}

static uint8_t luminance(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<uint8_t>((r * 19595 + g * 38470 + b * 7471 + 0x8000) >> 16);
}

void applyOrientation(Raster& raster) {
    const int orientation = raster.orientation;
    if (orientation < 2 || orientation > 8) {
        raster.orientation = 1;
        return;
    }

    const int w = raster.width;
    const int h = raster.height;
    const int channels = raster.channels();
    const bool swapsAxes = orientation >= 5;
    Raster out(swapsAxes ? h : w, swapsAxes ? w : h, raster.mode);

    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            int sx = x;
            int sy = y;
            switch (orientation) {
                case 2: sx = w - 1 - x; break;                    // mirror horizontal
                case 3: sx = w - 1 - x; sy = h - 1 - y; break;    // rotate 180
                case 4: sy = h - 1 - y; break;                    // mirror vertical
                case 5: sx = y; sy = x; break;                    // transpose
                case 6: sx = y; sy = h - 1 - x; break;            // rotate 90 CW
                case 7: sx = w - 1 - y; sy = h - 1 - x; break;    // transverse
                case 8: sx = w - 1 - y; sy = x; break;            // rotate 90 CCW
            }
            for (int c = 0; c < channels; ++c) {
                out.at(x, y, c) = raster.at(sx, sy, c);
            }
        }
    }

    LOG_DEBUG << "Applied EXIF orientation " << orientation << ": " << w << "x" << h
              << " -> " << out.width << "x" << out.height;
    raster.pixels = std::move(out.pixels);
    raster.width = out.width;
    raster.height = out.height;
    raster.orientation = 1;
    image::exif::resetOrientation(raster.exif);
}

void toGrayscale(Raster& raster) {
    switch (raster.mode) {
        case PixelMode::Gray:
            return;
        case PixelMode::Bilevel:
            raster.mode = PixelMode::Gray;
            return;
        default:
            break;
    }

    const int channels = raster.channels();
    std::vector<uint8_t> gray(static_cast<size_t>(raster.width) * raster.height);
    for (size_t i = 0, o = 0; o < gray.size(); i += channels, ++o) {
        const uint8_t* px = &raster.pixels[i];
        gray[o] = channels >= 3 ? luminance(px[0], px[1], px[2]) : px[0];
    }
    raster.pixels = std::move(gray);
    raster.mode = PixelMode::Gray;
}

void enhanceBrightness(Raster& raster, double factor) {
    if (factor == 1.0) return;
    const int channels = raster.channels();
    const int colors = colorChannels(raster);
    for (size_t i = 0; i < raster.pixels.size(); i += channels) {
        for (int c = 0; c < colors; ++c) {
            raster.pixels[i + c] = blend(0.0, raster.pixels[i + c], factor);
        }
    }
    if (raster.mode == PixelMode::Bilevel) raster.mode = PixelMode::Gray;
}

void enhanceContrast(Raster& raster, double factor) {
    if (factor == 1.0 || raster.empty()) return;
    const int channels = raster.channels();
    const int colors = colorChannels(raster);

    // the degenerate image is flat gray at the mean luminance
    uint64_t sum = 0;
    for (size_t i = 0; i < raster.pixels.size(); i += channels) {
        const uint8_t* px = &raster.pixels[i];
        sum += colors >= 3 ? luminance(px[0], px[1], px[2]) : px[0];
    }
    const size_t count = raster.pixels.size() / channels;
    const int mean = static_cast<int>(static_cast<double>(sum) / count + 0.5);

    for (size_t i = 0; i < raster.pixels.size(); i += channels) {
        for (int c = 0; c < colors; ++c) {
            raster.pixels[i + c] = blend(mean, raster.pixels[i + c], factor);
        }
    }
    if (raster.mode == PixelMode::Bilevel) raster.mode = PixelMode::Gray;
}

void enhanceSharpness(Raster& raster, double factor) {
    if (factor == 1.0) return;
    const int w = raster.width;
    const int h = raster.height;
    const int channels = raster.channels();
    const int colors = colorChannels(raster);

    // Smoothed copy with kernel [1 1 1; 1 5 1; 1 1 1] / 13. Border pixels stay as they are.
    Raster smooth = raster;
    if (w >= 3 && h >= 3) {
        for (int y = 1; y < h - 1; ++y) {
            for (int x = 1; x < w - 1; ++x) {
                for (int c = 0; c < colors; ++c) {
                    int acc = 4 * raster.at(x, y, c);
                    for (int dy = -1; dy <= 1; ++dy) {
                        for (int dx = -1; dx <= 1; ++dx) {
                            acc += raster.at(x + dx, y + dy, c);
                        }
                    }
                    smooth.at(x, y, c) = static_cast<uint8_t>(std::min(255.0, acc / 13.0 + 0.5));
                }
            }
        }
    }

    for (size_t i = 0; i < raster.pixels.size(); i += channels) {
        for (int c = 0; c < colors; ++c) {
            raster.pixels[i + c] = blend(smooth.pixels[i + c], raster.pixels[i + c], factor);
        }
    }
    if (raster.mode == PixelMode::Bilevel) raster.mode = PixelMode::Gray;
}

void applyThreshold(Raster& raster, int threshold) {
    if (raster.mode != PixelMode::Gray && raster.mode != PixelMode::Bilevel) {
        throw InvalidParameterError(std::string("threshold expects a gray image, got mode ") + image::modeName(raster.mode));
    }
    for (auto& p : raster.pixels) {
        p = p >= threshold ? 255 : 0;
    }
}

void quantizeToBilevel(Raster& raster, bool dither) {
    if (raster.mode == PixelMode::Bilevel) return;
    if (raster.mode != PixelMode::Gray) {
        throw InvalidParameterError(std::string("bilevel quantization expects a gray image, got mode ") + image::modeName(raster.mode));
    }

    if (!dither) {
        for (auto& p : raster.pixels) {
            p = p >= 128 ? 255 : 0;
        }
        raster.mode = PixelMode::Bilevel;
        return;
    }

    // Floyd-Steinberg, left to right. Errors carried in 1/16 units over two rows.
    const int w = raster.width;
    std::vector<int> current(w + 2, 0);
    std::vector<int> next(w + 2, 0);
    for (int y = 0; y < raster.height; ++y) {
        uint8_t* row = raster.row(y);
        for (int x = 0; x < w; ++x) {
            const int old = std::clamp(row[x] + current[x + 1] / 16, 0, 255);
            const int value = old >= 128 ? 255 : 0;
            const int error = old - value;
            row[x] = static_cast<uint8_t>(value);
            current[x + 2] += error * 7;
            next[x] += error * 3;
            next[x + 1] += error * 5;
            next[x + 2] += error;
        }
        std::swap(current, next);
        std::fill(next.begin(), next.end(), 0);
    }
    raster.mode = PixelMode::Bilevel;
}

}
