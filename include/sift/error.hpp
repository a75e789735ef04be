#pragma once

#include <string>

namespace sift {

struct SiftError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        Pattern,   // a glob segment is malformed
        Walk       // a directory listing failed
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;   // pattern text or path the error refers to
    int line = 0;

    SiftError() = default;
    SiftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SiftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SiftError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sift
