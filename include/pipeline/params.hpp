#ifndef INKWELL_PARAMS_HPP
#define INKWELL_PARAMS_HPP

#include <optional>
#include <string>
#include <variant>

namespace inkwell::pipeline {
    // Shrink to fit inside the box, keeping the aspect ratio. Never enlarges.
    struct FitWithin {
        int maxWidth = 1600;
        int maxHeight = 1600;
    };

    // Multiply both dimensions by a positive factor; may enlarge.
    struct ScaleBy {
        double factor = 1.0;
    };

    using ResizeMode = std::variant<FitWithin, ScaleBy>;

    struct Binarization {
        int threshold = 128;
        bool dither = true;
    };

    struct EnhancementParams {
        double brightness = 1.2;
        double contrast = 0.9;
        double sharpness = 1.3;
        ResizeMode resize = FitWithin{};
        std::optional<Binarization> binarize;

        bool enlarges() const { return std::holds_alternative<ScaleBy>(resize); }

        /**
         * @brief Checks every value against its domain.
         * @throws InvalidParameterError naming the offending parameter.
         */
        void validate() const;

        std::string describe() const;
    };
}

#endif // INKWELL_PARAMS_HPP
