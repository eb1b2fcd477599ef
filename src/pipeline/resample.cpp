#include <pipeline/stages.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace inkwell::pipeline {

using image::PixelMode;
using image::Raster;

namespace {

constexpr double kLanczosSupport = 3.0;
constexpr double kPi = 3.14159265358979323846;
// same ceiling as PIL's decompression bomb error (twice MAX_IMAGE_PIXELS)
constexpr double kMaxPixels = 2.0 * 89478485;

double sinc(double x) {
    if (x == 0.0) return 1.0;
    x *= kPi;
    return std::sin(x) / x;
}

double lanczos(double x) {
    if (x > -kLanczosSupport && x < kLanczosSupport) {
        return sinc(x) * sinc(x / kLanczosSupport);
    }
    return 0.0;
}

// Per output sample: first contributing input index and its normalized weights.
struct Coefficients {
    std::vector<int> first;
    std::vector<std::vector<double>> weights;
};

Coefficients computeCoefficients(int inSize, int outSize) {
    const double scale = static_cast<double>(inSize) / outSize;
    const double filterScale = std::max(scale, 1.0);
    const double support = kLanczosSupport * filterScale;

    Coefficients coeffs;
    coeffs.first.resize(outSize);
    coeffs.weights.resize(outSize);
    for (int out = 0; out < outSize; ++out) {
        const double center = (out + 0.5) * scale;
        const int lo = std::max(static_cast<int>(center - support + 0.5), 0);
        const int hi = std::min(static_cast<int>(center + support + 0.5), inSize);

        auto& weights = coeffs.weights[out];
        double total = 0.0;
        for (int in = lo; in < hi; ++in) {
            const double weight = lanczos((in - center + 0.5) / filterScale);
            weights.push_back(weight);
            total += weight;
        }
        if (total != 0.0) {
            for (auto& weight : weights) weight /= total;
        }
        coeffs.first[out] = lo;
    }
    return coeffs;
}

uint8_t clip8(double value) {
    const long rounded = std::lround(value);
    return static_cast<uint8_t>(std::clamp(rounded, 0L, 255L));
}

Raster resampleHorizontal(const Raster& in, int outWidth) {
    const auto coeffs = computeCoefficients(in.width, outWidth);
    const int channels = in.channels();
    Raster out(outWidth, in.height, in.mode);
    for (int y = 0; y < in.height; ++y) {
        const uint8_t* src = in.row(y);
        uint8_t* dst = out.row(y);
        for (int x = 0; x < outWidth; ++x) {
            const auto& weights = coeffs.weights[x];
            const int first = coeffs.first[x];
            for (int c = 0; c < channels; ++c) {
                double acc = 0.0;
                for (size_t k = 0; k < weights.size(); ++k) {
                    acc += src[(first + k) * channels + c] * weights[k];
                }
                dst[x * channels + c] = clip8(acc);
            }
        }
    }
    return out;
}

Raster resampleVertical(const Raster& in, int outHeight) {
    const auto coeffs = computeCoefficients(in.height, outHeight);
    const size_t rowBytes = in.rowBytes();
    Raster out(in.width, outHeight, in.mode);
    for (int y = 0; y < outHeight; ++y) {
        const auto& weights = coeffs.weights[y];
        const int first = coeffs.first[y];
        uint8_t* dst = out.row(y);
        for (size_t i = 0; i < rowBytes; ++i) {
            double acc = 0.0;
            for (size_t k = 0; k < weights.size(); ++k) {
                acc += in.row(first + static_cast<int>(k))[i] * weights[k];
            }
            dst[i] = clip8(acc);
        }
    }
    return out;
}

// Python-style min(floor, ceil, key=...) clamped to 1
template <typename Key>
int roundAspect(double number, Key key) {
    const int lo = static_cast<int>(std::floor(number));
    const int hi = static_cast<int>(std::ceil(number));
    return std::max(key(hi) < key(lo) ? hi : lo, 1);
}

} // unnamed namespace

std::pair<int, int> fitDimensions(int width, int height, const FitWithin& box) {
    if (box.maxWidth >= width && box.maxHeight >= height) {
        return {width, height};
    }

    const double aspect = static_cast<double>(width) / height;
    int x = box.maxWidth;
    int y = box.maxHeight;
    if (static_cast<double>(x) / y >= aspect) {
        x = roundAspect(y * aspect, [&](int n) { return std::abs(aspect - static_cast<double>(n) / y); });
    } else {
        y = roundAspect(x / aspect, [&](int n) { return n == 0 ? 0.0 : std::abs(aspect - static_cast<double>(x) / n); });
    }
    return {x, y};
}

std::pair<int, int> scaledDimensions(int width, int height, double factor) {
    if (!std::isfinite(factor) || factor <= 0.0) {
        throw InvalidParameterError("scale factor must be a finite value > 0");
    }
    const auto scale = [factor](int size) {
        return std::max(1.0, std::round(static_cast<double>(size) * factor));
    };
    const double scaledWidth = scale(width);
    const double scaledHeight = scale(height);
    if (scaledWidth > std::numeric_limits<int>::max() || scaledHeight > std::numeric_limits<int>::max() ||
        scaledWidth * scaledHeight > kMaxPixels) {
        throw InvalidParameterError("scale factor " + std::to_string(factor) + " turns " + std::to_string(width) +
                                    "x" + std::to_string(height) + " into more than " +
                                    std::to_string(static_cast<long long>(kMaxPixels)) + " pixels");
    }
    return {static_cast<int>(scaledWidth), static_cast<int>(scaledHeight)};
}

void resample(Raster& raster, int width, int height) {
    if (width < 1 || height < 1) {
        throw InvalidParameterError("resample target must be at least 1x1");
    }
    if (width == raster.width && height == raster.height) return;

    // values between black and white appear along edges
    if (raster.mode == PixelMode::Bilevel) raster.mode = PixelMode::Gray;

    Raster out;
    if (width != raster.width) {
        out = resampleHorizontal(raster, width);
    }
    if (height != raster.height) {
        out = resampleVertical(width != raster.width ? out : raster, height);
    }
    out.exif = std::move(raster.exif);
    out.orientation = raster.orientation;
    raster = std::move(out);
}

void resizeToFit(Raster& raster, const FitWithin& box) {
    const auto [width, height] = fitDimensions(raster.width, raster.height, box);
    LOG_DEBUG << "Fit " << raster.width << "x" << raster.height << " within " << box.maxWidth << "x"
              << box.maxHeight << " -> " << width << "x" << height;
    resample(raster, width, height);
}

void resizeByScale(Raster& raster, const ScaleBy& scale) {
    const auto [width, height] = scaledDimensions(raster.width, raster.height, scale.factor);
    LOG_DEBUG << "Scale " << raster.width << "x" << raster.height << " by " << scale.factor
              << " -> " << width << "x" << height;
    resample(raster, width, height);
}

}
