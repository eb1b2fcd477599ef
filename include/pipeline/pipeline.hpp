#ifndef INKWELL_PIPELINE_HPP
#define INKWELL_PIPELINE_HPP

#include <codec/raster.hpp>
#include <pipeline/params.hpp>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace inkwell::pipeline {
    struct Stage {
        std::string name;
        std::function<void(image::Raster&)> apply;
    };

    using StageList = std::vector<Stage>;

    /**
     * @brief Builds the ordered stage list for a parameter set.
     *
     * Fit:     orient, grayscale, brightness, contrast, sharpness, fit
     * Enlarge: orient, grayscale, brightness, contrast, scale, sharpness[, threshold, dither]
     *
     * Sharpening runs at the output resolution when enlarging; thresholding always
     * precedes the bilevel quantization.
     */
    StageList buildStages(const EnhancementParams& params);

    std::vector<std::string> stageNames(const StageList& stages);

    void runStages(const StageList& stages, image::Raster& raster);

    /**
     * @brief Decodes the source, runs the stages and writes the destination in the
     * encoding selected by its extension. Writes nothing on failure.
     * @throws InvalidParameterError, MissingSourceError or CodecError.
     */
    void processImage(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      const EnhancementParams& params);
}

#endif // INKWELL_PIPELINE_HPP
