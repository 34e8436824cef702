#pragma once

#include <pkgid/result.hpp>
#include <map>
#include <optional>
#include <string>

namespace pkgid {

// Build settings snapshot: "os=Linux", "compiler.version=9", ...
class SettingValues {
public:
    // One name=value per line; blank and '#' lines skipped
    static Result<SettingValues> parse(const std::string& text);
    static Result<SettingValues> from_structured(const std::map<std::string, std::string>& data);

    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    // Drops the setting and every "name.<sub>" child
    void remove(const std::string& name);

    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }

    // SHA-1 hex over the sorted name=value lines, "None" values skipped
    std::string identity_hash() const;
    // Sorted name=value lines
    std::string dump() const;
    std::map<std::string, std::string> to_structured() const { return values_; }

    bool operator==(const SettingValues& o) const { return values_ == o.values_; }
    bool operator!=(const SettingValues& o) const { return !(*this == o); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace pkgid
