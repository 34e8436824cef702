#pragma once

#include <pkgid/result.hpp>
#include <pkgid/identity/options.hpp>
#include <pkgid/identity/requirement.hpp>
#include <pkgid/identity/scope.hpp>
#include <pkgid/identity/settings.hpp>
#include <pkgid/identity/structured.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pkgid {

// Everything that decides whether a built package can be reused: pruned and
// full snapshots of settings, options and requirements, reduced on demand to
// one package ID.
//
// The package ID is computed on first use and cached. Mutating the
// snapshots afterwards leaves the cached value stale; build a new
// BuildIdentity instead.
class BuildIdentity {
public:
    static BuildIdentity create(const SettingValues& settings,
                                const OptionValues& options,
                                const std::vector<ComponentRef>& direct_requires,
                                const std::vector<ComponentRef>& indirect_requires,
                                RelevanceFilter relevance_filter = std::nullopt);

    // Parse a canonical dump; every section must be present
    static Result<BuildIdentity> parse(const std::string& text);
    static Result<BuildIdentity> load_from_path(const std::string& path);

    static Result<BuildIdentity> from_structured(const StructuredIdentity& data);
    static Result<BuildIdentity> load_structured(const std::string& path);

    // SHA-1 of settings hash, options hash and requirements hash, in that order
    const std::string& package_identity() const;
    bool has_cached_identity() const { return package_identity_.has_value(); }

    std::string canonical_dump() const;
    StructuredIdentity to_structured() const;

    Status save(const std::string& path) const;
    Status save_structured(const std::string& path) const;

    // Textual: equal canonical dumps
    bool equals(const BuildIdentity& other) const;
    bool operator==(const BuildIdentity& other) const { return equals(other); }
    bool operator!=(const BuildIdentity& other) const { return !equals(other); }

    SettingValues settings;
    SettingValues full_settings;
    OptionValues options;
    OptionValues full_options;
    RequirementSet requirements;
    RequirementManifest full_requirements;
    std::optional<Scopes> scope;
    RelevanceFilter relevance_filter;

private:
    mutable std::optional<std::string> package_identity_;
};

} // namespace pkgid
