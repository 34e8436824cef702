#include <pkgid/identity/options.hpp>
#include <pkgid/sections.hpp>
#include <pkgid/sha1.hpp>
#include <vector>

namespace pkgid {

static std::string hash_values(const std::map<std::string, std::string>& values) {
    std::string buffer;
    bool first = true;
    for (const auto& [name, value] : values) {
        if (value == "None") continue;
        if (!first) buffer += "\n";
        buffer += name + "=" + value;
        first = false;
    }
    return SHA1::hash_hex(buffer);
}

Result<OptionValues> OptionValues::parse(const std::string& text) {
    OptionValues result;
    for (const auto& line : content_lines(text)) {
        auto kv = split_assignment(line);
        if (kv.is_err()) return std::move(kv).error();
        PKGID_TRY(result.set(kv.value().first, kv.value().second));
    }
    return Result<OptionValues>::ok(std::move(result));
}

Result<OptionValues> OptionValues::from_structured(
    const std::map<std::string, std::string>& data)
{
    OptionValues result;
    for (const auto& [name, value] : data) {
        PKGID_TRY(result.set(name, value));
    }
    return Result<OptionValues>::ok(std::move(result));
}

Status OptionValues::set(const std::string& name, const std::string& value) {
    size_t colon = name.find(':');
    if (colon == std::string::npos) {
        if (name.empty()) {
            return PkgidError{PkgidError::Parse, "empty option name"};
        }
        local_[name] = value;
        return ok_status();
    }
    std::string dep = name.substr(0, colon);
    std::string option = name.substr(colon + 1);
    if (dep.empty() || option.empty() || option.find(':') != std::string::npos) {
        return PkgidError{PkgidError::Parse,
            "invalid option name '" + name + "'",
            "dependency options are written dep:option"};
    }
    deps_[dep][option] = value;
    return ok_status();
}

std::optional<std::string> OptionValues::get(const std::string& name) const {
    size_t colon = name.find(':');
    if (colon == std::string::npos) {
        auto it = local_.find(name);
        if (it == local_.end()) return std::nullopt;
        return it->second;
    }
    auto dep = deps_.find(name.substr(0, colon));
    if (dep == deps_.end()) return std::nullopt;
    auto it = dep->second.find(name.substr(colon + 1));
    if (it == dep->second.end()) return std::nullopt;
    return it->second;
}

void OptionValues::clear_indirect() {
    deps_.clear();
}

std::string OptionValues::identity_hash(const RelevanceFilter& filter) const {
    std::vector<std::string> parts;
    parts.push_back(hash_values(local_));
    for (const auto& [dep, values] : deps_) {
        if (is_relevant(filter, dep)) {
            parts.push_back(hash_values(values));
        }
    }
    std::string buffer;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) buffer += "\n";
        buffer += parts[i];
    }
    return SHA1::hash_hex(buffer);
}

std::string OptionValues::dump() const {
    std::string out;
    auto append = [&](const std::string& line) {
        if (!out.empty()) out += "\n";
        out += line;
    };
    for (const auto& [name, value] : local_) {
        append(name + "=" + value);
    }
    for (const auto& [dep, values] : deps_) {
        for (const auto& [name, value] : values) {
            append(dep + ":" + name + "=" + value);
        }
    }
    return out;
}

std::map<std::string, std::string> OptionValues::to_structured() const {
    std::map<std::string, std::string> out = local_;
    for (const auto& [dep, values] : deps_) {
        for (const auto& [name, value] : values) {
            out[dep + ":" + name] = value;
        }
    }
    return out;
}

} // namespace pkgid
