#ifndef INKWELL_STAGES_HPP
#define INKWELL_STAGES_HPP

#include <codec/raster.hpp>
#include <pipeline/params.hpp>
#include <utility>

// Individual pipeline operations. Each one transforms the raster in place.
namespace inkwell::pipeline {
    /**
     * @brief Rotates/mirrors the pixels so they match the EXIF orientation,
     * then resets the orientation tag (both on the raster and inside its EXIF block).
     */
    void applyOrientation(image::Raster& raster);

    // 8-bit luminance (ITU-R 601-2). Alpha is discarded.
    void toGrayscale(image::Raster& raster);

    // Tonal enhancement: out = degenerate + factor * (in - degenerate), saturated to 0..255.
    // A factor of 1.0 leaves the raster untouched.
    void enhanceBrightness(image::Raster& raster, double factor);
    void enhanceContrast(image::Raster& raster, double factor);
    void enhanceSharpness(image::Raster& raster, double factor);

    std::pair<int, int> fitDimensions(int width, int height, const FitWithin& box);
    std::pair<int, int> scaledDimensions(int width, int height, double factor);

    /**
     * @brief Lanczos-3 resampling to an exact size. The filter support widens with the
     * reduction ratio so downscaling is antialiased.
     */
    void resample(image::Raster& raster, int width, int height);
    void resizeToFit(image::Raster& raster, const FitWithin& box);
    void resizeByScale(image::Raster& raster, const ScaleBy& scale);

    // Hard cut: p >= threshold -> 255, otherwise 0.
    void applyThreshold(image::Raster& raster, int threshold);

    // Reduces a gray raster to Bilevel, with Floyd-Steinberg error diffusion or a flat 50% cut.
    void quantizeToBilevel(image::Raster& raster, bool dither);
}

#endif // INKWELL_STAGES_HPP
