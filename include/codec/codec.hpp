#ifndef INKWELL_CODEC_HPP
#define INKWELL_CODEC_HPP

#include <codec/raster.hpp>
#include <string>

namespace inkwell::image {
    enum class ImageFormat {
        Jpeg,
        Png,
        Webp,
        Netpbm,
        Unknown
    };

    const char* formatName(ImageFormat format);

    // Codec options for one encode call. Unset values (-1, false) leave the library defaults.
    struct EncodeOptions {
        int quality = -1;
        bool fullChroma = false;
        bool optimize = false;
        int method = -1;
        bool lossless = false;
        // TIFF payload to embed as EXIF; honoured by the JPEG and WebP encoders.
        std::string exif;
    };

    /**
     * @brief Detects the container format from the leading bytes.
     */
    ImageFormat sniffFormat(const std::string& data);

    /**
     * @brief Maps a lowercase extension without the dot ("jpg", "png", ...) to a format.
     */
    ImageFormat formatForExtension(const std::string& extension);

    /**
     * @brief Decodes an encoded image. EXIF (JPEG APP1, PNG eXIf, WebP EXIF chunk) is kept on the raster
     * together with the orientation it declares; the pixels are left as stored.
     * @throws CodecError when the data is not a supported image or is corrupt.
     */
    Raster decode(const std::string& data);

    /**
     * @brief Encodes a raster in the given format.
     * @throws CodecError when the format has no encoder or the library reports a failure.
     */
    std::string encode(const Raster& raster, ImageFormat format, const EncodeOptions& options);

    Raster decodeJpeg(const std::string& data);
    std::string encodeJpeg(const Raster& raster, const EncodeOptions& options);

    Raster decodePng(const std::string& data);
    std::string encodePng(const Raster& raster, const EncodeOptions& options);

    Raster decodeWebp(const std::string& data);
    std::string encodeWebp(const Raster& raster, const EncodeOptions& options);

    // Binary Netpbm: P4 (bilevel), P5 (gray), P6 (RGB), maxval up to 255.
    Raster decodeNetpbm(const std::string& data);
    std::string encodeNetpbm(const Raster& raster);
}

#endif // INKWELL_CODEC_HPP
