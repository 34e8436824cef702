#pragma once

#include <optional>
#include <set>
#include <string>

namespace pkgid {

// Names of the requirements that feed the package ID. Absent means every
// requirement does; names outside the set are "dev" requirements.
using RelevanceFilter = std::optional<std::set<std::string>>;

inline bool is_relevant(const RelevanceFilter& filter, const std::string& name) {
    return !filter || filter->count(name) > 0;
}

} // namespace pkgid
