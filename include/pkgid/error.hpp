#pragma once

#include <string>

namespace pkgid {

struct PkgidError {
    enum Code {
        IO,
        Parse,
        Version,
        InvalidArg,
        Config,
        NotFound,
        MalformedReference,
        AmbiguousRequirement,
        MissingIdentityFile,
        MalformedIdentityFile
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PkgidError() = default;
    PkgidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PkgidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PkgidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pkgid
