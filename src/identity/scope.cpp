#include <pkgid/identity/scope.hpp>
#include <pkgid/sections.hpp>

namespace pkgid {

static Result<bool> parse_flag(const std::string& text) {
    if (text == "True" || text == "true" || text == "1") return Result<bool>::ok(true);
    if (text == "False" || text == "false" || text == "0") return Result<bool>::ok(false);
    return PkgidError{PkgidError::Parse,
        "invalid scope value '" + text + "'", "expected True or False"};
}

static const char* flag_text(bool value) {
    return value ? "True" : "False";
}

Result<Scopes> Scopes::parse(const std::string& text) {
    Scopes result;
    for (const auto& line : content_lines(text)) {
        auto kv = split_assignment(line);
        if (kv.is_err()) return std::move(kv).error();
        auto flag = parse_flag(kv.value().second);
        if (flag.is_err()) return std::move(flag).error();
        PKGID_TRY(result.set(kv.value().first, flag.value()));
    }
    return Result<Scopes>::ok(std::move(result));
}

Status Scopes::set(const std::string& name, bool value) {
    size_t colon = name.find(':');
    if (colon == std::string::npos) {
        root_[name] = value;
        return ok_status();
    }
    std::string package = name.substr(0, colon);
    std::string scope = name.substr(colon + 1);
    if (package.empty() || scope.empty()) {
        return PkgidError{PkgidError::Parse, "invalid scope name '" + name + "'"};
    }
    packages_[package][scope] = value;
    return ok_status();
}

bool Scopes::get(const std::string& name) const {
    size_t colon = name.find(':');
    if (colon == std::string::npos) {
        auto it = root_.find(name);
        return it != root_.end() && it->second;
    }
    auto pkg = packages_.find(name.substr(0, colon));
    if (pkg == packages_.end()) return false;
    auto it = pkg->second.find(name.substr(colon + 1));
    return it != pkg->second.end() && it->second;
}

std::string Scopes::dump() const {
    std::string out;
    for (const auto& [name, value] : root_) {
        if (!out.empty()) out += "\n";
        out += name + "=" + flag_text(value);
    }
    for (const auto& [package, scopes] : packages_) {
        for (const auto& [name, value] : scopes) {
            if (!out.empty()) out += "\n";
            out += package + ":" + name + "=" + flag_text(value);
        }
    }
    return out;
}

} // namespace pkgid
