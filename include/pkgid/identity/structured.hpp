#pragma once

#include <pkgid/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace pkgid {

// Machine-readable identity record. Scope is not part of this form.
struct StructuredIdentity {
    std::map<std::string, std::string> settings;
    std::map<std::string, std::string> full_settings;
    std::map<std::string, std::string> options;
    std::map<std::string, std::string> full_options;
    std::map<std::string, std::string> requirements;       // "requires"
    std::vector<std::string> full_requirements;            // "full_requires"

    // TOML document with keys settings, full_settings, options,
    // full_options, requires, full_requires
    std::string to_toml() const;
    static Result<StructuredIdentity> from_toml(const std::string& toml_str);

    bool operator==(const StructuredIdentity& o) const;
};

} // namespace pkgid
