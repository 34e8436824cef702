#include <pkgid/version.hpp>
#include <algorithm>
#include <cctype>

namespace pkgid {

static bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static bool valid_chars(const std::string& s, const char* extra) {
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') continue;
        bool ok = false;
        for (const char* e = extra; *e; ++e) {
            if (c == *e) { ok = true; break; }
        }
        if (!ok) return false;
    }
    return true;
}

// Three-way comparison of a single component
static int compare_component(const std::string& a, const std::string& b) {
    bool na = is_numeric(a);
    bool nb = is_numeric(b);
    // Numeric components sort before textual ones
    if (na != nb) return na ? -1 : 1;
    if (na) {
        size_t ia = a.find_first_not_of('0');
        size_t ib = b.find_first_not_of('0');
        std::string sa = ia == std::string::npos ? "" : a.substr(ia);
        std::string sb = ib == std::string::npos ? "" : b.substr(ib);
        if (sa.size() != sb.size()) return sa.size() < sb.size() ? -1 : 1;
        if (sa != sb) return sa < sb ? -1 : 1;
        // equal value, fall through so "01" and "1" still order
    }
    if (a == b) return 0;
    return a < b ? -1 : 1;
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return PkgidError{PkgidError::Version, "empty version string"};
    }

    Version v;
    std::string core = s;

    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        v.build = core.substr(plus + 1);
        core = core.substr(0, plus);
        if (v.build.empty() || !valid_chars(v.build, ".-")) {
            return PkgidError{PkgidError::Version,
                "invalid build metadata in version '" + s + "'"};
        }
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        v.label = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (v.label.empty() || !valid_chars(v.label, ".-")) {
            return PkgidError{PkgidError::Version,
                "invalid pre-release label in version '" + s + "'"};
        }
    }

    size_t start = 0;
    while (true) {
        size_t dot = core.find('.', start);
        std::string part = core.substr(start, dot == std::string::npos
                                                  ? std::string::npos
                                                  : dot - start);
        if (part.empty()) {
            return PkgidError{PkgidError::Version,
                "invalid version '" + s + "'",
                "expected format: component[.component...][-label][+build]"};
        }
        if (!valid_chars(part, "")) {
            return PkgidError{PkgidError::Version,
                "invalid character in version component '" + part +
                "' of '" + s + "'"};
        }
        v.components.push_back(part);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) s += ".";
        s += components[i];
    }
    if (!label.empty()) s += "-" + label;
    if (!build.empty()) s += "+" + build;
    return s;
}

Version Version::stable() const {
    Version v;
    v.components = components;
    return v;
}

bool Version::operator==(const Version& o) const {
    return components == o.components && label == o.label && build == o.build;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    size_t n = std::min(components.size(), o.components.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compare_component(components[i], o.components[i]);
        if (c != 0) return c < 0;
    }
    if (components.size() != o.components.size()) {
        return components.size() < o.components.size();
    }
    // Pre-release (non-empty label) < release (empty label)
    if (label != o.label) {
        if (label.empty()) return false;
        if (o.label.empty()) return true;
        return label < o.label;
    }
    return build < o.build;
}

} // namespace pkgid
