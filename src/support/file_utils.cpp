#include <support/file_utils.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace inkwell::files {

std::string readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw MissingSourceError(path.string());
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) {
        throw CodecError("Cannot open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw CodecError("Cannot read file: " + path.string());
    }
    return buffer.str();
}

void ensureDirectory(const std::filesystem::path& dir) {
    if (dir.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    // another worker may have created it in between; only a non-directory is a failure
    std::error_code statEc;
    if (std::filesystem::is_directory(dir, statEc)) {
        if (!ec) {
            LOG_TRACE << "Directory ready: " << dir.string();
        }
        return;
    }
    const auto& reason = ec ? ec : statEc;
    throw CodecError("Cannot create directory " + dir.string() + (reason ? ": " + reason.message() : ""));
}

void writeFileAtomically(const std::filesystem::path& path, const std::string& data) {
    auto tmpPath = path;
    tmpPath += ".inkwell-tmp";

    {
        std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
        if (!ofs.good()) {
            throw CodecError("Cannot write file: " + tmpPath.string());
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.close();
        if (ofs.fail()) {
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            throw CodecError("Failed writing file: " + tmpPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        throw CodecError("Cannot move " + tmpPath.string() + " to " + path.string() + ": " + ec.message());
    }
}

}
