#include <pipeline/params.hpp>
#include <support/errors.hpp>
#include <cmath>
#include <sstream>

namespace inkwell::pipeline {

static void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream os;
        os << name << " must be a finite value > 0, got " << value;
        throw InvalidParameterError(os.str());
    }
}

void EnhancementParams::validate() const {
    requirePositive(brightness, "brightness");
    requirePositive(contrast, "contrast");
    requirePositive(sharpness, "sharpness");

    if (const auto* fit = std::get_if<FitWithin>(&resize)) {
        if (fit->maxWidth < 1 || fit->maxHeight < 1) {
            throw InvalidParameterError("fit box must be at least 1x1, got "
                                        + std::to_string(fit->maxWidth) + "x" + std::to_string(fit->maxHeight));
        }
    } else {
        requirePositive(std::get<ScaleBy>(resize).factor, "scale factor");
    }

    if (binarize) {
        if (!enlarges()) {
            throw InvalidParameterError("binarization is only available with scale-factor resizing");
        }
        if (binarize->threshold < 0 || binarize->threshold > 255) {
            throw InvalidParameterError("threshold must be within 0..255, got " + std::to_string(binarize->threshold));
        }
    }
}

std::string EnhancementParams::describe() const {
    std::ostringstream os;
    os << "brightness=" << brightness << " contrast=" << contrast << " sharpness=" << sharpness;
    if (const auto* fit = std::get_if<FitWithin>(&resize)) {
        os << " fit=" << fit->maxWidth << "x" << fit->maxHeight;
    } else {
        os << " scale=" << std::get<ScaleBy>(resize).factor;
    }
    if (binarize) {
        os << " threshold=" << binarize->threshold << " dither=" << (binarize->dither ? "on" : "off");
    }
    return os.str();
}

}
