#ifndef INKWELL_FILE_UTILS_HPP
#define INKWELL_FILE_UTILS_HPP

#include <filesystem>
#include <string>

namespace inkwell::files {
    /**
     * @brief Reads a whole file into memory.
     * @throws MissingSourceError when the path does not exist, CodecError when it cannot be read.
     */
    std::string readFile(const std::filesystem::path& path);

    /**
     * @brief Creates a directory and its parents. An existing directory is not an error,
     * including one created concurrently by another process.
     * @throws CodecError when the path exists but is not a directory or cannot be created.
     */
    void ensureDirectory(const std::filesystem::path& dir);

    /**
     * @brief Writes data to a temporary sibling file, then renames it over the destination,
     * so the destination is either fully written or left untouched.
     * @throws CodecError on any I/O failure.
     */
    void writeFileAtomically(const std::filesystem::path& path, const std::string& data);
}

#endif // INKWELL_FILE_UTILS_HPP
