#ifndef INKWELL_TEST_HELPERS_HPP
#define INKWELL_TEST_HELPERS_HPP

#include <codec/raster.hpp>
#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

namespace inkwell::test {
    // Creates a fresh directory under the system temp dir and removes it on scope exit.
    class TempDir {
    public:
        TempDir() {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("inkwell-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return path_; }
        std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    inline image::Raster uniform(int w, int h, uint8_t value) {
        return image::Raster(w, h, image::PixelMode::Gray, value);
    }

    // Horizontal ramp with a vertical component so no two rows are equal.
    inline image::Raster gradient(int w, int h) {
        image::Raster raster(w, h, image::PixelMode::Gray);
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                raster.at(x, y) = static_cast<uint8_t>((x * 255 / (w > 1 ? w - 1 : 1) + y * 7) % 256);
            }
        }
        return raster;
    }

    // Minimal little-endian TIFF block with a single IFD0 orientation entry.
    inline std::string tiffWithOrientation(int orientation, bool littleEndian = true) {
        std::string tiff;
        auto put16 = [&](int v) {
            if (littleEndian) { tiff.push_back(static_cast<char>(v & 0xFF)); tiff.push_back(static_cast<char>((v >> 8) & 0xFF)); }
            else { tiff.push_back(static_cast<char>((v >> 8) & 0xFF)); tiff.push_back(static_cast<char>(v & 0xFF)); }
        };
        auto put32 = [&](long v) {
            if (littleEndian) { put16(static_cast<int>(v & 0xFFFF)); put16(static_cast<int>((v >> 16) & 0xFFFF)); }
            else { put16(static_cast<int>((v >> 16) & 0xFFFF)); put16(static_cast<int>(v & 0xFFFF)); }
        };
        tiff += littleEndian ? "II" : "MM";
        put16(42);
        put32(8);
        put16(1);           // one entry
        put16(0x0112);      // Orientation
        put16(3);           // SHORT
        put32(1);
        put16(orientation);
        put16(0);
        put32(0);           // no next IFD
        return tiff;
    }
}

#endif // INKWELL_TEST_HELPERS_HPP
