#include <codec/exif.hpp>
#include <cstdint>
#include <cstring>

namespace inkwell::image::exif {

// APP1 payload is at most 65533 bytes after the length field and the "Exif\0\0" id
static constexpr size_t kMaxSegmentPayload = 0xFFFF - 2;
static constexpr char kExifId[] = "Exif\0\0";
static constexpr size_t kExifIdSize = 6;

static uint16_t read16(const unsigned char* data, bool isLittleEndian) {
    if (isLittleEndian) return data[0] | (data[1] << 8);
    return (data[0] << 8) | data[1];
}

static uint32_t read32(const unsigned char* data, bool isLittleEndian) {
    if (isLittleEndian) return data[0] | (data[1] << 8) | (data[2] << 16) | (static_cast<uint32_t>(data[3]) << 24);
    return (static_cast<uint32_t>(data[0]) << 24) | (data[1] << 16) | (data[2] << 8) | data[3];
}

static void write16(unsigned char* data, uint16_t value, bool isLittleEndian) {
    if (isLittleEndian) {
        data[0] = value & 0xFF;
        data[1] = value >> 8;
    } else {
        data[0] = value >> 8;
        data[1] = value & 0xFF;
    }
}

// Locates the IFD0 entry holding the orientation tag. Returns the entry offset or 0.
static size_t findOrientationEntry(const unsigned char* tiffBase, size_t tiffSize, bool& isLittleEndian) {
    if (tiffSize < 8) return 0;
    if (tiffBase[0] == 'I' && tiffBase[1] == 'I') {
        isLittleEndian = true;
    } else if (tiffBase[0] == 'M' && tiffBase[1] == 'M') {
        isLittleEndian = false;
    } else {
        return 0;
    }
    if (read16(tiffBase + 2, isLittleEndian) != 42) return 0;

    uint32_t ifdOffset = read32(tiffBase + 4, isLittleEndian);
    if (ifdOffset < 8 || static_cast<size_t>(ifdOffset) + 2 > tiffSize) return 0;

    uint16_t numEntries = read16(tiffBase + ifdOffset, isLittleEndian);
    for (int i = 0; i < numEntries; ++i) {
        size_t entryOffset = static_cast<size_t>(ifdOffset) + 2 + static_cast<size_t>(i) * 12;
        if (entryOffset + 12 > tiffSize) break;

        uint16_t tag = read16(tiffBase + entryOffset, isLittleEndian);
        uint16_t type = read16(tiffBase + entryOffset + 2, isLittleEndian);
        if (tag == kOrientationTag && type == 3) { // SHORT
            return entryOffset;
        }
    }
    return 0;
}

std::vector<std::string> extractAppSegments(const std::string& data) {
    std::vector<std::string> segments;
    if (data.size() < 4) return segments;
    if ((unsigned char)data[0] != 0xFF || (unsigned char)data[1] != 0xD8) return segments;

    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if ((unsigned char)data[pos] != 0xFF) break;
        unsigned char marker = (unsigned char)data[pos+1];
        if (marker == 0xD9) break; // EOI
        if (marker == 0xDA) break; // SOS - image data follows

        unsigned int length = ((unsigned char)data[pos+2] << 8) | (unsigned char)data[pos+3];
        if (pos + 2 + length > data.size()) break;

        if (marker >= 0xE0 && marker <= 0xEF) {
            segments.push_back(data.substr(pos, 2 + length));
        }

        pos += 2 + length;
    }
    return segments;
}

std::string insertAppSegments(const std::string& jpegData, const std::vector<std::string>& segments) {
    if (jpegData.size() < 2 || segments.empty()) return jpegData;

    size_t extra = 0;
    for (const auto& seg : segments) extra += seg.size();

    std::string result;
    result.reserve(jpegData.size() + extra);
    result.append(jpegData, 0, 2); // SOI (FF D8)

    // libjpeg-turbo writes its JFIF APP0 first; keep it ahead of the EXIF block
    size_t pos = 2;
    if (jpegData.size() >= 6 && (unsigned char)jpegData[2] == 0xFF && (unsigned char)jpegData[3] == 0xE0) {
        unsigned int length = ((unsigned char)jpegData[4] << 8) | (unsigned char)jpegData[5];
        if (2 + 2 + length <= jpegData.size()) {
            result.append(jpegData, 2, 2 + length);
            pos = 2 + 2 + length;
        }
    }

    for (const auto& seg : segments) {
        result.append(seg);
    }

    result.append(jpegData, pos, std::string::npos);
    return result;
}

std::string findExifPayload(const std::string& jpegData) {
    for (const auto& seg : extractAppSegments(jpegData)) {
        if ((unsigned char)seg[1] == 0xE1 && seg.size() > 4 + kExifIdSize) {
            if (std::memcmp(&seg[4], kExifId, kExifIdSize) == 0) {
                return seg.substr(4 + kExifIdSize);
            }
        }
    }
    return {};
}

std::string makeExifSegment(const std::string& tiffPayload) {
    if (tiffPayload.empty() || tiffPayload.size() + kExifIdSize > kMaxSegmentPayload) return {};

    const size_t length = 2 + kExifIdSize + tiffPayload.size();
    std::string segment;
    segment.reserve(2 + length);
    segment.push_back(static_cast<char>(0xFF));
    segment.push_back(static_cast<char>(0xE1));
    segment.push_back(static_cast<char>((length >> 8) & 0xFF));
    segment.push_back(static_cast<char>(length & 0xFF));
    segment.append(kExifId, kExifIdSize);
    segment.append(tiffPayload);
    return segment;
}

int readOrientation(const std::string& tiffPayload) {
    const auto* tiffBase = reinterpret_cast<const unsigned char*>(tiffPayload.data());
    bool isLittleEndian = true;
    size_t entry = findOrientationEntry(tiffBase, tiffPayload.size(), isLittleEndian);
    if (entry == 0) return 1;

    // SHORT values are stored left-justified in the 4-byte value field
    int value = read16(tiffBase + entry + 8, isLittleEndian);
    if (value < 1 || value > 8) return 1;
    return value;
}

bool resetOrientation(std::string& tiffPayload) {
    auto* tiffBase = reinterpret_cast<unsigned char*>(&tiffPayload[0]);
    bool isLittleEndian = true;
    size_t entry = findOrientationEntry(tiffBase, tiffPayload.size(), isLittleEndian);
    if (entry == 0) return false;

    write16(tiffBase + entry + 8, 1, isLittleEndian);
    return true;
}

}
