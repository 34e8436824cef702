#pragma once

#include <pkgid/result.hpp>
#include <map>
#include <string>

namespace pkgid {

// Scope flags, e.g. "dev=True" for the package being built and
// "zlib:build=False" for a dependency. Values are booleans.
class Scopes {
public:
    static Result<Scopes> parse(const std::string& text);

    Status set(const std::string& name, bool value);
    // false when unset
    bool get(const std::string& name) const;

    bool empty() const { return root_.empty() && packages_.empty(); }
    std::string dump() const;

private:
    std::map<std::string, bool> root_;
    std::map<std::string, std::map<std::string, bool>> packages_;
};

} // namespace pkgid
