#include <pkgid/error.hpp>

namespace pkgid {

const char* PkgidError::code_name(Code c) {
    switch (c) {
        case IO:                    return "IO";
        case Parse:                 return "Parse";
        case Version:               return "Version";
        case InvalidArg:            return "InvalidArg";
        case Config:                return "Config";
        case NotFound:              return "NotFound";
        case MalformedReference:    return "MalformedReference";
        case AmbiguousRequirement:  return "AmbiguousOrMissingRequirement";
        case MissingIdentityFile:   return "MissingIdentityFile";
        case MalformedIdentityFile: return "MalformedIdentityFile";
    }
    return "Unknown";
}

std::string PkgidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace pkgid
