#pragma once

#include <pkgid/result.hpp>
#include <pkgid/identity/relevance.hpp>
#include <map>
#include <optional>
#include <string>

namespace pkgid {

// Feature-flag snapshot. Plain names ("shared") belong to the package
// itself; "dep:name" values were set for, or inherited from, a dependency.
class OptionValues {
public:
    static Result<OptionValues> parse(const std::string& text);
    static Result<OptionValues> from_structured(const std::map<std::string, std::string>& data);

    Status set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    // Drops every dependency-scoped value
    void clear_indirect();

    bool empty() const { return local_.empty() && deps_.empty(); }

    std::string identity_hash(const RelevanceFilter& filter) const;
    std::string dump() const;
    std::map<std::string, std::string> to_structured() const;

    bool operator==(const OptionValues& o) const {
        return local_ == o.local_ && deps_ == o.deps_;
    }
    bool operator!=(const OptionValues& o) const { return !(*this == o); }

private:
    std::map<std::string, std::string> local_;
    std::map<std::string, std::map<std::string, std::string>> deps_;
};

} // namespace pkgid
