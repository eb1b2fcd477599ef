#include <codec/codec.hpp>
#include <support/errors.hpp>
#include <png.h>
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <vector>

namespace inkwell::image {

namespace {

// Number of bytes of the PNG image files signature.
constexpr size_t kPngSignatureBytes = 8;

// Reads a PNG image located in memory.
class MemReader final {
    const png_byte* current_;
    const png_byte* end_;

public:
    MemReader(const png_byte* data, size_t size) : current_(data), end_(data + size) {}

    static void read(png_structp png, png_bytep buf, png_size_t len) {
        auto* const self = static_cast<MemReader*>(png_get_io_ptr(png));
        const auto remainingBytes = static_cast<size_t>(self->end_ - self->current_);
        if (remainingBytes < len) {
            png_error(png, "read past the end of the PNG data");
        }
        std::copy_n(self->current_, len, buf);
        self->current_ += len;
    }
};

void writeToString(png_structp png, png_bytep data, png_size_t len) {
    auto* const out = static_cast<std::string*>(png_get_io_ptr(png));
    out->append(reinterpret_cast<const char*>(data), len);
}

void flushNothing(png_structp) {}

[[noreturn]] void pngErrorHandler(png_structp, png_const_charp errorMsg) {
    // The error handling routine must not return to libpng.
    throw CodecError(std::string("libpng: ") + errorMsg);
}

void pngWarningHandler(png_structp, png_const_charp msg) {
    LOG_DEBUG << "libpng warning: " << msg;
}

struct ReadGuard {
    png_structp png = nullptr;
    png_infop info = nullptr;
    ~ReadGuard() { png_destroy_read_struct(&png, info ? &info : nullptr, nullptr); }
};

struct WriteGuard {
    png_structp png = nullptr;
    png_infop info = nullptr;
    ~WriteGuard() { png_destroy_write_struct(&png, info ? &info : nullptr); }
};

PixelMode modeForChannels(int channels) {
    switch (channels) {
        case 1: return PixelMode::Gray;
        case 2: return PixelMode::GrayAlpha;
        case 3: return PixelMode::Rgb;
        case 4: return PixelMode::Rgba;
        default: throw CodecError("libpng: unsupported channel count " + std::to_string(channels));
    }
}

int colorTypeForMode(PixelMode mode) {
    switch (mode) {
        case PixelMode::Gray:
        case PixelMode::Bilevel:
            return PNG_COLOR_TYPE_GRAY;
        case PixelMode::GrayAlpha: return PNG_COLOR_TYPE_GRAY_ALPHA;
        case PixelMode::Rgb: return PNG_COLOR_TYPE_RGB;
        case PixelMode::Rgba: return PNG_COLOR_TYPE_RGB_ALPHA;
    }
    return PNG_COLOR_TYPE_GRAY;
}

} // unnamed namespace

Raster decodePng(const std::string& data) {
    const auto* bytes = reinterpret_cast<png_const_bytep>(data.data());
    if (data.size() < kPngSignatureBytes || png_sig_cmp(bytes, 0, kPngSignatureBytes) != 0) {
        throw CodecError("invalid PNG file signature");
    }

    ReadGuard guard;
    guard.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, pngErrorHandler, pngWarningHandler);
    if (guard.png == nullptr) {
        throw CodecError("cannot initialize the PNG decoding process");
    }
    guard.info = png_create_info_struct(guard.png);
    if (guard.info == nullptr) {
        throw CodecError("cannot initialize the PNG decoding process");
    }

    MemReader reader(bytes, data.size());
    png_set_read_fn(guard.png, &reader, &MemReader::read);
    png_read_info(guard.png, guard.info);

    // Normalize everything to 8 bits per channel: palette and low-depth gray are
    // expanded, tRNS becomes an alpha channel, 16-bit samples are scaled down.
    png_set_expand(guard.png);
    png_set_scale_16(guard.png);
    png_set_interlace_handling(guard.png);
    png_read_update_info(guard.png, guard.info);

    const int width = static_cast<int>(png_get_image_width(guard.png, guard.info));
    const int height = static_cast<int>(png_get_image_height(guard.png, guard.info));
    const int channels = png_get_channels(guard.png, guard.info);

    Raster raster(width, height, modeForChannels(channels));
    if (png_get_rowbytes(guard.png, guard.info) != raster.rowBytes()) {
        throw CodecError("invalid PNG image: row bytes does not match width and color type");
    }

    std::vector<png_bytep> rows(height);
    for (int y = 0; y < height; ++y) rows[y] = raster.row(y);
    png_read_image(guard.png, rows.data());
    png_read_end(guard.png, guard.info);

#ifdef PNG_eXIf_SUPPORTED
    png_uint_32 exifLength = 0;
    png_bytep exifData = nullptr;
    if (png_get_eXIf_1(guard.png, guard.info, &exifLength, &exifData) != 0 && exifData != nullptr) {
        raster.exif.assign(reinterpret_cast<const char*>(exifData), exifLength);
    }
#endif

    return raster;
}

std::string encodePng(const Raster& raster, const EncodeOptions& options) {
    std::string out;

    WriteGuard guard;
    guard.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, pngErrorHandler, pngWarningHandler);
    if (guard.png == nullptr) {
        throw CodecError("cannot initialize the PNG encoding process");
    }
    guard.info = png_create_info_struct(guard.png);
    if (guard.info == nullptr) {
        throw CodecError("cannot initialize the PNG encoding process");
    }

    png_set_write_fn(guard.png, &out, writeToString, flushNothing);

    const bool bilevel = raster.mode == PixelMode::Bilevel;
    png_set_IHDR(guard.png, guard.info, raster.width, raster.height, bilevel ? 1 : 8,
                 colorTypeForMode(raster.mode), PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    if (options.optimize) {
        png_set_compression_level(guard.png, 9);
        png_set_filter(guard.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);
    }
    png_write_info(guard.png, guard.info);

    if (bilevel) {
        // 1-bit gray, most significant bit first, set bit = white
        std::vector<png_byte> packed((raster.width + 7) / 8);
        for (int y = 0; y < raster.height; ++y) {
            std::fill(packed.begin(), packed.end(), 0);
            const uint8_t* src = raster.row(y);
            for (int x = 0; x < raster.width; ++x) {
                if (src[x] != 0) packed[x >> 3] |= static_cast<png_byte>(0x80 >> (x & 7));
            }
            png_write_row(guard.png, packed.data());
        }
    } else {
        for (int y = 0; y < raster.height; ++y) {
            png_write_row(guard.png, raster.row(y));
        }
    }
    png_write_end(guard.png, guard.info);
    return out;
}

}
