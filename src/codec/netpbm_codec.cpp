#include <codec/codec.hpp>
#include <support/errors.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace inkwell::image {

static void skipWhitespaceAndComments(std::istream& is) {
    while (true) {
        int c = is.peek();
        if (c == '#') {
            std::string dummy;
            std::getline(is, dummy);
            continue;
        }
        if (c == EOF) return;
        if (std::isspace(static_cast<unsigned char>(c))) {
            is.get();
            continue;
        }
        return;
    }
}

static int readHeaderValue(std::istream& is, const char* what) {
    skipWhitespaceAndComments(is);
    int value = 0;
    if (!(is >> value) || value <= 0) {
        throw CodecError(std::string("Invalid Netpbm ") + what);
    }
    return value;
}

Raster decodeNetpbm(const std::string& data) {
    std::istringstream is(data);

    std::string magic;
    is >> magic;
    if (magic != "P4" && magic != "P5" && magic != "P6") {
        throw CodecError("Only binary Netpbm (P4, P5, P6) is supported");
    }

    const int width = readHeaderValue(is, "width");
    const int height = readHeaderValue(is, "height");
    const int maxval = magic == "P4" ? 1 : readHeaderValue(is, "maxval");
    if (maxval > 255) {
        throw CodecError("16-bit Netpbm images are not supported");
    }
    // exactly one whitespace byte separates the header from the raster
    is.get();
    if (!is) {
        throw CodecError("Truncated Netpbm header");
    }

    const size_t offset = static_cast<size_t>(is.tellg());
    const auto* src = reinterpret_cast<const uint8_t*>(data.data()) + offset;
    const size_t available = data.size() - offset;

    if (magic == "P4") {
        const size_t rowBytes = (static_cast<size_t>(width) + 7) / 8;
        if (available < rowBytes * height) throw CodecError("Truncated PBM raster");
        Raster raster(width, height, PixelMode::Bilevel);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                const bool black = (src[y * rowBytes + (x >> 3)] >> (7 - (x & 7))) & 1;
                raster.at(x, y) = black ? 0 : 255;
            }
        }
        return raster;
    }

    Raster raster(width, height, magic == "P5" ? PixelMode::Gray : PixelMode::Rgb);
    if (available < raster.pixels.size()) throw CodecError("Truncated Netpbm raster");
    for (size_t i = 0; i < raster.pixels.size(); ++i) {
        raster.pixels[i] = maxval == 255 ? src[i] : static_cast<uint8_t>((src[i] * 255 + maxval / 2) / maxval);
    }
    return raster;
}

std::string encodeNetpbm(const Raster& raster) {
    std::ostringstream os;
    switch (raster.mode) {
        case PixelMode::Bilevel: {
            os << "P4\n" << raster.width << " " << raster.height << "\n";
            std::string packed((raster.width + 7) / 8, '\0');
            for (int y = 0; y < raster.height; ++y) {
                std::fill(packed.begin(), packed.end(), '\0');
                for (int x = 0; x < raster.width; ++x) {
                    // PBM: 1 is black
                    if (raster.at(x, y) == 0) packed[x >> 3] = static_cast<char>(packed[x >> 3] | (0x80 >> (x & 7)));
                }
                os << packed;
            }
            return os.str();
        }
        case PixelMode::Gray:
            os << "P5\n" << raster.width << " " << raster.height << "\n255\n";
            break;
        case PixelMode::Rgb:
            os << "P6\n" << raster.width << " " << raster.height << "\n255\n";
            break;
        case PixelMode::GrayAlpha:
        case PixelMode::Rgba:
            throw CodecError("Netpbm cannot store an alpha channel");
    }
    os.write(reinterpret_cast<const char*>(raster.pixels.data()), static_cast<std::streamsize>(raster.pixels.size()));
    return os.str();
}

}
