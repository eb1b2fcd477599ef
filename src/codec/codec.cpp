#include <codec/codec.hpp>
#include <codec/exif.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>
#include <cstring>

namespace inkwell::image {

const char* formatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Webp: return "WebP";
        case ImageFormat::Netpbm: return "Netpbm";
        case ImageFormat::Unknown: return "unknown";
    }
    return "unknown";
}

ImageFormat sniffFormat(const std::string& data) {
    if (data.size() >= 3 && (unsigned char)data[0] == 0xFF && (unsigned char)data[1] == 0xD8 && (unsigned char)data[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    if (data.size() >= 8 && std::memcmp(data.data(), "\x89PNG\r\n\x1a\n", 8) == 0) {
        return ImageFormat::Png;
    }
    if (data.size() >= 12 && std::memcmp(data.data(), "RIFF", 4) == 0 && std::memcmp(data.data() + 8, "WEBP", 4) == 0) {
        return ImageFormat::Webp;
    }
    if (data.size() >= 2 && data[0] == 'P' && (data[1] == '4' || data[1] == '5' || data[1] == '6')) {
        return ImageFormat::Netpbm;
    }
    return ImageFormat::Unknown;
}

ImageFormat formatForExtension(const std::string& extension) {
    if (extension == "jpg" || extension == "jpeg") return ImageFormat::Jpeg;
    if (extension == "png") return ImageFormat::Png;
    if (extension == "webp") return ImageFormat::Webp;
    if (extension == "pgm" || extension == "ppm" || extension == "pbm" || extension == "pnm") return ImageFormat::Netpbm;
    return ImageFormat::Unknown;
}

Raster decode(const std::string& data) {
    Raster raster;
    const auto format = sniffFormat(data);
    switch (format) {
        case ImageFormat::Jpeg:
            raster = decodeJpeg(data);
            break;
        case ImageFormat::Png:
            raster = decodePng(data);
            break;
        case ImageFormat::Webp:
            raster = decodeWebp(data);
            break;
        case ImageFormat::Netpbm:
            raster = decodeNetpbm(data);
            break;
        case ImageFormat::Unknown:
            throw CodecError("Unrecognized image data (" + std::to_string(data.size()) + " bytes)");
    }

    if (!raster.exif.empty()) {
        raster.orientation = exif::readOrientation(raster.exif);
    }
    LOG_TRACE << "Decoded " << formatName(format) << " " << raster.width << "x" << raster.height
              << " mode " << modeName(raster.mode) << " orientation " << raster.orientation;
    return raster;
}

std::string encode(const Raster& raster, ImageFormat format, const EncodeOptions& options) {
    if (raster.width <= 0 || raster.height <= 0 || raster.empty()) {
        throw CodecError("Cannot encode an empty image");
    }
    switch (format) {
        case ImageFormat::Jpeg:
            return encodeJpeg(raster, options);
        case ImageFormat::Png:
            return encodePng(raster, options);
        case ImageFormat::Webp:
            return encodeWebp(raster, options);
        case ImageFormat::Netpbm:
            return encodeNetpbm(raster);
        case ImageFormat::Unknown:
            break;
    }
    throw CodecError("No encoder available for this output format");
}

}
