#ifndef INKWELL_ERRORS_HPP
#define INKWELL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace inkwell {
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The source image path does not exist.
    class MissingSourceError : public Error {
    public:
        explicit MissingSourceError(const std::string& path)
            : Error("Input image not found: " + path), path_(path) {}

        const std::string& path() const { return path_; }

    private:
        std::string path_;
    };

    // A parameter is outside its documented domain.
    class InvalidParameterError : public Error {
    public:
        using Error::Error;
    };

    // Decode, encode or file I/O failure.
    class CodecError : public Error {
    public:
        using Error::Error;
    };
}

#endif // INKWELL_ERRORS_HPP
