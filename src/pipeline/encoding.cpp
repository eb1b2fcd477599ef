#include <pipeline/encoding.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace inkwell::pipeline {

using image::ImageFormat;

static EncodingDirective makeDirective(ImageFormat format, int quality, bool fullChroma, bool optimize,
                                       int method, bool lossless, bool keepExif) {
    EncodingDirective directive;
    directive.format = format;
    directive.options.quality = quality;
    directive.options.fullChroma = fullChroma;
    directive.options.optimize = optimize;
    directive.options.method = method;
    directive.options.lossless = lossless;
    directive.keepExif = keepExif;
    return directive;
}

static const std::map<std::string, EncodingDirective>& directives() {
    static const std::map<std::string, EncodingDirective> table = [] {
        std::map<std::string, EncodingDirective> m;
        const auto jpeg = makeDirective(ImageFormat::Jpeg, 90, true, true, -1, false, true);
        m["jpg"] = jpeg;
        m["jpeg"] = jpeg;
        m["webp"] = makeDirective(ImageFormat::Webp, 95, false, false, 6, false, false);
        m["png"] = makeDirective(ImageFormat::Png, -1, false, true, -1, true, false);
        return m;
    }();
    return table;
}

std::string normalizedExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

EncodingDirective directiveFor(const std::filesystem::path& destination) {
    const auto ext = normalizedExtension(destination);
    const auto& table = directives();
    auto it = table.find(ext);
    if (it != table.end()) {
        return it->second;
    }

    EncodingDirective defaults;
    defaults.format = image::formatForExtension(ext);
    return defaults;
}

}
