#include <pipeline/pipeline.hpp>
#include <pipeline/encoding.hpp>
#include <pipeline/stages.hpp>
#include <codec/codec.hpp>
#include <support/errors.hpp>
#include <support/file_utils.hpp>
#include <trantor/utils/Logger.h>

namespace inkwell::pipeline {

using image::Raster;

StageList buildStages(const EnhancementParams& params) {
    const double brightness = params.brightness;
    const double contrast = params.contrast;
    const double sharpness = params.sharpness;

    StageList stages;
    stages.push_back({"orient", [](Raster& r) { applyOrientation(r); }});
    stages.push_back({"grayscale", [](Raster& r) { toGrayscale(r); }});
    stages.push_back({"brightness", [brightness](Raster& r) { enhanceBrightness(r, brightness); }});
    stages.push_back({"contrast", [contrast](Raster& r) { enhanceContrast(r, contrast); }});

    if (const auto* fit = std::get_if<FitWithin>(&params.resize)) {
        const FitWithin box = *fit;
        stages.push_back({"sharpness", [sharpness](Raster& r) { enhanceSharpness(r, sharpness); }});
        stages.push_back({"fit", [box](Raster& r) { resizeToFit(r, box); }});
        return stages;
    }

    const ScaleBy scale = std::get<ScaleBy>(params.resize);
    stages.push_back({"scale", [scale](Raster& r) { resizeByScale(r, scale); }});
    stages.push_back({"sharpness", [sharpness](Raster& r) { enhanceSharpness(r, sharpness); }});
    if (params.binarize) {
        const Binarization binarize = *params.binarize;
        stages.push_back({"threshold", [binarize](Raster& r) { applyThreshold(r, binarize.threshold); }});
        stages.push_back({"dither", [binarize](Raster& r) { quantizeToBilevel(r, binarize.dither); }});
    }
    return stages;
}

std::vector<std::string> stageNames(const StageList& stages) {
    std::vector<std::string> names;
    names.reserve(stages.size());
    for (const auto& stage : stages) names.push_back(stage.name);
    return names;
}

void runStages(const StageList& stages, Raster& raster) {
    for (const auto& stage : stages) {
        stage.apply(raster);
        LOG_TRACE << "Stage " << stage.name << ": " << raster.width << "x" << raster.height
                  << " mode " << image::modeName(raster.mode);
    }
}

static bool samePath(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (std::filesystem::exists(b, ec)) {
        return std::filesystem::equivalent(a, b, ec);
    }
    return std::filesystem::weakly_canonical(a, ec) == std::filesystem::weakly_canonical(b, ec);
}

void processImage(const std::filesystem::path& source,
                  const std::filesystem::path& destination,
                  const EnhancementParams& params) {
    params.validate();

    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        throw MissingSourceError(source.string());
    }
    if (samePath(source, destination)) {
        throw InvalidParameterError("destination must differ from the source: " + destination.string());
    }

    const auto directive = directiveFor(destination);
    if (directive.format == image::ImageFormat::Unknown) {
        throw CodecError("No encoder for output extension '" + normalizedExtension(destination) + "': " + destination.string());
    }

    Raster raster = image::decode(files::readFile(source));
    const int sourceWidth = raster.width;
    const int sourceHeight = raster.height;

    runStages(buildStages(params), raster);

    auto options = directive.options;
    if (directive.keepExif && !raster.exif.empty()) {
        options.exif = raster.exif;
    }

    files::ensureDirectory(destination.parent_path());
    files::writeFileAtomically(destination, image::encode(raster, directive.format, options));

    LOG_INFO << source.string() << " (" << sourceWidth << "x" << sourceHeight << ") -> "
             << destination.string() << " (" << raster.width << "x" << raster.height << ", "
             << image::formatName(directive.format) << ")";
}

}
