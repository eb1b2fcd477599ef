#include <codec/codec.hpp>
#include <codec/exif.hpp>
#include <support/errors.hpp>
#include <turbojpeg.h>
#include <trantor/utils/Logger.h>
#include <memory>

namespace inkwell::image {

using TjHandle = std::unique_ptr<void, decltype(&tj3Destroy)>;

static TjHandle makeHandle(int initType) {
    TjHandle handle(tj3Init(initType), &tj3Destroy);
    if (!handle) {
        throw CodecError(std::string("TurboJPEG init failed: ") + tj3GetErrorStr(nullptr));
    }
    return handle;
}

Raster decodeJpeg(const std::string& data) {
    auto decompressor = makeHandle(TJINIT_DECOMPRESS);
    const auto* jpegBuf = reinterpret_cast<const unsigned char*>(data.data());

    if (tj3DecompressHeader(decompressor.get(), jpegBuf, data.size()) < 0) {
        throw CodecError(std::string("TurboJPEG DecompressHeader failed: ") + tj3GetErrorStr(decompressor.get()));
    }
    const int width = tj3Get(decompressor.get(), TJPARAM_JPEGWIDTH);
    const int height = tj3Get(decompressor.get(), TJPARAM_JPEGHEIGHT);
    const int colorspace = tj3Get(decompressor.get(), TJPARAM_COLORSPACE);
    if (width <= 0 || height <= 0) {
        throw CodecError("Invalid JPEG dimensions");
    }
    if (colorspace == TJCS_CMYK || colorspace == TJCS_YCCK) {
        throw CodecError("CMYK JPEG images are not supported");
    }

    const bool gray = colorspace == TJCS_GRAY;
    Raster raster(width, height, gray ? PixelMode::Gray : PixelMode::Rgb);
    if (tj3Decompress8(decompressor.get(), jpegBuf, data.size(), raster.pixels.data(),
                       static_cast<int>(raster.rowBytes()), gray ? TJPF_GRAY : TJPF_RGB) < 0) {
        // Recoverable warnings (e.g. truncated trailing data) still produce an image
        if (tj3GetErrorCode(decompressor.get()) == TJERR_FATAL) {
            throw CodecError(std::string("TurboJPEG Decompress failed: ") + tj3GetErrorStr(decompressor.get()));
        }
        LOG_WARN << "TurboJPEG warning: " << tj3GetErrorStr(decompressor.get());
    }

    raster.exif = exif::findExifPayload(data);
    return raster;
}

std::string encodeJpeg(const Raster& raster, const EncodeOptions& options) {
    int pixelFormat = TJPF_GRAY;
    int subsamp = TJSAMP_GRAY;
    const Raster* source = &raster;
    Raster flattened;

    switch (raster.mode) {
        case PixelMode::Gray:
        case PixelMode::Bilevel:
            break;
        case PixelMode::Rgb:
            pixelFormat = TJPF_RGB;
            subsamp = options.fullChroma ? TJSAMP_444 : TJSAMP_420;
            break;
        case PixelMode::GrayAlpha:
        case PixelMode::Rgba: {
            // JPEG has no alpha channel; drop it
            const int inChannels = raster.channels();
            const int outChannels = inChannels - 1;
            flattened = Raster(raster.width, raster.height, outChannels == 1 ? PixelMode::Gray : PixelMode::Rgb);
            for (size_t i = 0, o = 0; i < raster.pixels.size(); i += inChannels, o += outChannels) {
                for (int c = 0; c < outChannels; ++c) flattened.pixels[o + c] = raster.pixels[i + c];
            }
            source = &flattened;
            if (outChannels == 3) {
                pixelFormat = TJPF_RGB;
                subsamp = options.fullChroma ? TJSAMP_444 : TJSAMP_420;
            }
            break;
        }
    }

    auto compressor = makeHandle(TJINIT_COMPRESS);
    tj3Set(compressor.get(), TJPARAM_QUALITY, options.quality > 0 ? options.quality : 75);
    tj3Set(compressor.get(), TJPARAM_SUBSAMP, subsamp);
    tj3Set(compressor.get(), TJPARAM_OPTIMIZE, options.optimize ? 1 : 0);

    unsigned char* compressedData = nullptr;
    size_t compressedSize = 0;
    if (tj3Compress8(compressor.get(), source->pixels.data(), source->width, static_cast<int>(source->rowBytes()),
                     source->height, pixelFormat, &compressedData, &compressedSize) < 0) {
        std::string message = tj3GetErrorStr(compressor.get());
        if (compressedData) tj3Free(compressedData);
        throw CodecError("TurboJPEG Compress failed: " + message);
    }

    std::string compressedStr(reinterpret_cast<char*>(compressedData), compressedSize);
    tj3Free(compressedData);

    if (options.exif.empty()) {
        return compressedStr;
    }
    auto segment = exif::makeExifSegment(options.exif);
    if (segment.empty()) {
        LOG_WARN << "EXIF block of " << options.exif.size() << " bytes does not fit an APP1 segment, dropped";
        return compressedStr;
    }
    return exif::insertAppSegments(compressedStr, {segment});
}

}
