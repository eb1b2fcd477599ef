#include <codec/codec.hpp>
#include <support/errors.hpp>
#include <webp/decode.h>
#include <webp/demux.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <memory>
#include <string>
#include <vector>

namespace inkwell::image {

namespace {

constexpr char kExifHeader[] = {'E', 'x', 'i', 'f', '\0', '\0'};

// The EXIF chunk of an extended (VP8X) file, as a bare TIFF payload. Empty when absent.
std::string readExifChunk(const uint8_t* bytes, size_t size) {
    WebPData data = {bytes, size};
    std::unique_ptr<WebPDemuxer, decltype(&WebPDemuxDelete)> demux(WebPDemux(&data), &WebPDemuxDelete);
    if (!demux || !(WebPDemuxGetI(demux.get(), WEBP_FF_FORMAT_FLAGS) & EXIF_FLAG)) {
        return {};
    }

    WebPChunkIterator chunk;
    if (!WebPDemuxGetChunk(demux.get(), "EXIF", 1, &chunk)) {
        return {};
    }
    std::string exif(reinterpret_cast<const char*>(chunk.chunk.bytes), chunk.chunk.size);
    WebPDemuxReleaseChunkIterator(&chunk);

    // some writers keep the JPEG APP1 identifier in front of the TIFF header
    if (exif.compare(0, sizeof(kExifHeader), kExifHeader, sizeof(kExifHeader)) == 0) {
        exif.erase(0, sizeof(kExifHeader));
    }
    return exif;
}

std::string attachExifChunk(const WebPMemoryWriter& writer, const std::string& exif) {
    WebPData image = {writer.mem, writer.size};
    std::unique_ptr<WebPMux, decltype(&WebPMuxDelete)> mux(WebPMuxCreate(&image, 1), &WebPMuxDelete);
    if (!mux) {
        throw CodecError("libwebpmux: cannot parse encoded image");
    }

    WebPData chunk = {reinterpret_cast<const uint8_t*>(exif.data()), exif.size()};
    WebPMuxError err = WebPMuxSetChunk(mux.get(), "EXIF", &chunk, 1);
    if (err != WEBP_MUX_OK) {
        throw CodecError("libwebpmux: cannot add EXIF chunk (error " + std::to_string(err) + ")");
    }

    WebPData assembled;
    WebPDataInit(&assembled);
    err = WebPMuxAssemble(mux.get(), &assembled);
    if (err != WEBP_MUX_OK) {
        throw CodecError("libwebpmux: cannot assemble image (error " + std::to_string(err) + ")");
    }
    std::string out(reinterpret_cast<const char*>(assembled.bytes), assembled.size);
    WebPDataClear(&assembled);
    return out;
}

} // unnamed namespace

Raster decodeWebp(const std::string& data) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(bytes, data.size(), &features) != VP8_STATUS_OK) {
        throw CodecError("libwebp: cannot read WebP features");
    }

    Raster raster(features.width, features.height, features.has_alpha ? PixelMode::Rgba : PixelMode::Rgb);
    const auto stride = static_cast<int>(raster.rowBytes());
    const uint8_t* decoded = features.has_alpha
        ? WebPDecodeRGBAInto(bytes, data.size(), raster.pixels.data(), raster.pixels.size(), stride)
        : WebPDecodeRGBInto(bytes, data.size(), raster.pixels.data(), raster.pixels.size(), stride);
    if (decoded == nullptr) {
        throw CodecError("libwebp: decoding failed");
    }
    raster.exif = readExifChunk(bytes, data.size());
    return raster;
}

std::string encodeWebp(const Raster& raster, const EncodeOptions& options) {
    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw CodecError("libwebp: version mismatch");
    }
    if (options.quality >= 0) config.quality = static_cast<float>(options.quality);
    if (options.method >= 0) config.method = options.method;
    config.lossless = options.lossless ? 1 : 0;
    if (!WebPValidateConfig(&config)) {
        throw CodecError("libwebp: invalid encoder configuration");
    }

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        throw CodecError("libwebp: version mismatch");
    }
    std::unique_ptr<WebPPicture, decltype(&WebPPictureFree)> pictureGuard(&picture, &WebPPictureFree);
    picture.width = raster.width;
    picture.height = raster.height;
    picture.use_argb = 1;

    // WebP stores RGB(A); expand gray samples
    int imported = 0;
    if (raster.mode == PixelMode::Rgb) {
        imported = WebPPictureImportRGB(&picture, raster.pixels.data(), static_cast<int>(raster.rowBytes()));
    } else if (raster.mode == PixelMode::Rgba) {
        imported = WebPPictureImportRGBA(&picture, raster.pixels.data(), static_cast<int>(raster.rowBytes()));
    } else {
        const bool alpha = raster.mode == PixelMode::GrayAlpha;
        const int outChannels = alpha ? 4 : 3;
        std::vector<uint8_t> expanded(static_cast<size_t>(raster.width) * raster.height * outChannels);
        const int inChannels = raster.channels();
        for (size_t i = 0, o = 0; i < raster.pixels.size(); i += inChannels, o += outChannels) {
            expanded[o] = expanded[o + 1] = expanded[o + 2] = raster.pixels[i];
            if (alpha) expanded[o + 3] = raster.pixels[i + 1];
        }
        imported = alpha
            ? WebPPictureImportRGBA(&picture, expanded.data(), raster.width * outChannels)
            : WebPPictureImportRGB(&picture, expanded.data(), raster.width * outChannels);
    }
    if (!imported) {
        throw CodecError("libwebp: cannot import pixels");
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    std::unique_ptr<WebPMemoryWriter, decltype(&WebPMemoryWriterClear)> writerGuard(&writer, &WebPMemoryWriterClear);
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    if (!WebPEncode(&config, &picture)) {
        throw CodecError("libwebp: encoding failed with error " + std::to_string(picture.error_code));
    }
    if (!options.exif.empty()) {
        return attachExifChunk(writer, options.exif);
    }
    return std::string(reinterpret_cast<const char*>(writer.mem), writer.size);
}

}
