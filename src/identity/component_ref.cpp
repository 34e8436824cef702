#include <pkgid/identity/component_ref.hpp>
#include <pkgid/version.hpp>
#include <cctype>
#include <tuple>

namespace pkgid {

static const char* REF_HINT =
    "expected name/version[@user/channel][:package_identity]";

static PkgidError malformed(const std::string& text, const std::string& why) {
    return PkgidError{PkgidError::MalformedReference,
        "malformed reference '" + text + "': " + why, REF_HINT};
}

// [A-Za-z0-9_][A-Za-z0-9_.+-]*
static bool valid_word(const std::string& s) {
    if (s.empty()) return false;
    unsigned char first = static_cast<unsigned char>(s[0]);
    if (!std::isalnum(first) && first != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '.' && c != '+' && c != '-') {
            return false;
        }
    }
    return true;
}

static bool valid_package_identity(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

// Splits "a/b" into exactly two non-empty parts
static bool split_pair(const std::string& s, std::string& first, std::string& second) {
    size_t slash = s.find('/');
    if (slash == std::string::npos) return false;
    if (s.find('/', slash + 1) != std::string::npos) return false;
    first = s.substr(0, slash);
    second = s.substr(slash + 1);
    return !first.empty() && !second.empty();
}

Result<ComponentRef> ComponentRef::parse(const std::string& text) {
    if (text.empty()) {
        return malformed(text, "empty reference");
    }

    ComponentRef ref;
    std::string head = text;

    size_t colon = head.find(':');
    if (colon != std::string::npos) {
        std::string pid = head.substr(colon + 1);
        head = head.substr(0, colon);
        if (!valid_package_identity(pid)) {
            return malformed(text, "invalid package identity '" + pid + "'");
        }
        ref.package_identity_ = pid;
    }

    size_t at = head.find('@');
    if (at != std::string::npos) {
        std::string user, channel;
        if (!split_pair(head.substr(at + 1), user, channel)) {
            return malformed(text, "expected user/channel after '@'");
        }
        if (!valid_word(user)) {
            return malformed(text, "invalid user '" + user + "'");
        }
        if (!valid_word(channel)) {
            return malformed(text, "invalid channel '" + channel + "'");
        }
        ref.user_ = user;
        ref.channel_ = channel;
        head = head.substr(0, at);
    }

    if (!split_pair(head, ref.name_, ref.version_)) {
        return malformed(text, "expected name/version");
    }
    if (!valid_word(ref.name_)) {
        return malformed(text, "invalid name '" + ref.name_ + "'");
    }
    auto version = Version::parse(ref.version_);
    if (version.is_err()) {
        return malformed(text, version.error().message);
    }

    return Result<ComponentRef>::ok(std::move(ref));
}

std::string ComponentRef::short_string() const {
    std::string s = name_ + "/" + version_;
    if (user_ && channel_) {
        s += "@" + *user_ + "/" + *channel_;
    }
    return s;
}

std::string ComponentRef::to_string() const {
    std::string s = short_string();
    if (package_identity_) {
        s += ":" + *package_identity_;
    }
    return s;
}

ComponentRef ComponentRef::without_package_identity() const {
    ComponentRef ref = *this;
    ref.package_identity_.reset();
    return ref;
}

bool ComponentRef::operator==(const ComponentRef& o) const {
    return std::tie(name_, version_, user_, channel_, package_identity_) ==
           std::tie(o.name_, o.version_, o.user_, o.channel_, o.package_identity_);
}

bool ComponentRef::operator!=(const ComponentRef& o) const { return !(*this == o); }

bool ComponentRef::operator<(const ComponentRef& o) const {
    return std::tie(name_, version_, user_, channel_, package_identity_) <
           std::tie(o.name_, o.version_, o.user_, o.channel_, o.package_identity_);
}

} // namespace pkgid
