#pragma once

#include <pkgid/result.hpp>
#include <optional>
#include <string>

namespace pkgid {

// Names a specific built package:
//   name/version[@user/channel][:package_identity]
// Immutable; totally ordered on (name, version, user, channel,
// package_identity) with an absent part sorting first.
class ComponentRef {
public:
    static Result<ComponentRef> parse(const std::string& text);

    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }
    const std::optional<std::string>& user() const { return user_; }
    const std::optional<std::string>& channel() const { return channel_; }
    const std::optional<std::string>& package_identity() const { return package_identity_; }

    // Full text; parse(to_string()) == *this
    std::string to_string() const;
    // Without the package identity
    std::string short_string() const;

    ComponentRef without_package_identity() const;

    bool operator==(const ComponentRef& o) const;
    bool operator!=(const ComponentRef& o) const;
    bool operator<(const ComponentRef& o) const;

private:
    ComponentRef() = default;

    std::string name_;
    std::string version_;
    std::optional<std::string> user_;
    std::optional<std::string> channel_;
    std::optional<std::string> package_identity_;
};

} // namespace pkgid
