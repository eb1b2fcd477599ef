#ifndef INKWELL_EXIF_HPP
#define INKWELL_EXIF_HPP

#include <string>
#include <vector>

namespace inkwell::image::exif {
    constexpr int kOrientationTag = 0x0112;

    /**
     * @brief Collects the APP0..APP15 segments of a JPEG stream (marker and length included).
     * @param data The raw JPEG bytes.
     * @return The segments in file order; empty when the data is not a JPEG.
     */
    std::vector<std::string> extractAppSegments(const std::string& data);

    /**
     * @brief Inserts segments right after the SOI marker of a JPEG stream.
     */
    std::string insertAppSegments(const std::string& jpegData, const std::vector<std::string>& segments);

    // Returns the TIFF payload of the first "Exif" APP1 segment, or an empty string.
    std::string findExifPayload(const std::string& jpegData);

    // Wraps a TIFF payload into a complete APP1 segment.
    std::string makeExifSegment(const std::string& tiffPayload);

    /**
     * @brief Reads the orientation tag from IFD0 of a TIFF payload.
     * @return 1..8, or 1 when the tag is absent, out of range or the block is malformed.
     */
    int readOrientation(const std::string& tiffPayload);

    /**
     * @brief Rewrites the orientation tag in place to 1 (top-left).
     * @return true when the tag was present and has been reset.
     */
    bool resetOrientation(std::string& tiffPayload);
}

#endif // INKWELL_EXIF_HPP
