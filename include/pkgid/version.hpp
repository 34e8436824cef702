#pragma once

#include <pkgid/result.hpp>
#include <string>
#include <vector>

namespace pkgid {

// Reference version: component[.component...][-label][+build]
// Components are free-form ("1", "2", "x"); numeric ones compare numerically.
struct Version {
    std::vector<std::string> components;
    std::string label;  // pre-release, e.g. "rc1"; empty for a release
    std::string build;  // build metadata, e.g. "20240101"; never reproducible

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    // The release identity: label and build metadata dropped
    Version stable() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
};

} // namespace pkgid
