#include <pkgid/identity/settings.hpp>
#include <pkgid/sections.hpp>
#include <pkgid/sha1.hpp>

namespace pkgid {

Result<SettingValues> SettingValues::parse(const std::string& text) {
    SettingValues result;
    for (const auto& line : content_lines(text)) {
        auto kv = split_assignment(line);
        if (kv.is_err()) return std::move(kv).error();
        result.values_[kv.value().first] = kv.value().second;
    }
    return Result<SettingValues>::ok(std::move(result));
}

Result<SettingValues> SettingValues::from_structured(
    const std::map<std::string, std::string>& data)
{
    SettingValues result;
    for (const auto& [name, value] : data) {
        if (name.empty()) {
            return PkgidError{PkgidError::Parse, "empty setting name"};
        }
        result.values_[name] = value;
    }
    return Result<SettingValues>::ok(std::move(result));
}

void SettingValues::set(const std::string& name, const std::string& value) {
    values_[name] = value;
}

std::optional<std::string> SettingValues::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void SettingValues::remove(const std::string& name) {
    std::string child_prefix = name + ".";
    for (auto it = values_.begin(); it != values_.end();) {
        if (it->first == name || it->first.compare(0, child_prefix.size(), child_prefix) == 0) {
            it = values_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string SettingValues::identity_hash() const {
    std::string buffer;
    bool first = true;
    for (const auto& [name, value] : values_) {
        // Adding a leading "None" value to a setting must not move existing IDs
        if (value == "None") continue;
        if (!first) buffer += "\n";
        buffer += name + "=" + value;
        first = false;
    }
    return SHA1::hash_hex(buffer);
}

std::string SettingValues::dump() const {
    std::string out;
    for (const auto& [name, value] : values_) {
        if (!out.empty()) out += "\n";
        out += name + "=" + value;
    }
    return out;
}

} // namespace pkgid
