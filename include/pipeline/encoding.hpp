#ifndef INKWELL_ENCODING_HPP
#define INKWELL_ENCODING_HPP

#include <codec/codec.hpp>
#include <filesystem>
#include <string>

namespace inkwell::pipeline {
    struct EncodingDirective {
        image::ImageFormat format = image::ImageFormat::Unknown;
        image::EncodeOptions options;
        // Re-attach the source EXIF block (orientation reset) to the output.
        bool keepExif = false;
    };

    // Lowercase extension without the leading dot ("photo.JPG" -> "jpg").
    std::string normalizedExtension(const std::filesystem::path& path);

    /**
     * @brief Looks up the save options for a destination path from its extension.
     * Unknown extensions map to a directive with codec defaults.
     */
    EncodingDirective directiveFor(const std::filesystem::path& destination);
}

#endif // INKWELL_ENCODING_HPP
