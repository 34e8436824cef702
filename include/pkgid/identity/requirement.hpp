#pragma once

#include <pkgid/result.hpp>
#include <pkgid/identity/component_ref.hpp>
#include <pkgid/identity/relevance.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pkgid {

// Identity fields no code path fills yet; identity_line() still honors them.
struct ReservedFields {
    std::optional<std::string> user;
    std::optional<std::string> channel;
    std::optional<std::string> package_identity;
};

// Declared dependency: name and stabilized version feed the package ID
struct DirectIdentity {
    std::string name;
    std::string version;
    ReservedFields reserved;
};

// Transitive dependency: contributes nothing, so a version bump deep in the
// graph leaves the package ID alone
struct IndirectIdentity {
    ReservedFields reserved;
};

using RequirementIdentity = std::variant<DirectIdentity, IndirectIdentity>;

// One dependency's contribution to a package ID
class RequirementRecord {
public:
    static Result<RequirementRecord> parse(const std::string& ref_text, bool indirect = false);
    static RequirementRecord from_ref(const ComponentRef& ref, bool indirect = false);

    const ComponentRef& full_ref() const { return full_; }
    const std::string& full_name() const { return full_.name(); }
    const std::string& full_version() const { return full_.version(); }
    const std::optional<std::string>& full_user() const { return full_.user(); }
    const std::optional<std::string>& full_channel() const { return full_.channel(); }
    const std::optional<std::string>& full_package_identity() const {
        return full_.package_identity();
    }

    const RequirementIdentity& identity() const { return identity_; }
    bool is_indirect() const {
        return std::holds_alternative<IndirectIdentity>(identity_);
    }

    // Non-empty identity fields joined by '/'; empty for an indirect record
    std::string identity_line() const;
    // Verbatim reference text, never pruned
    std::string to_full_text() const { return full_.to_string(); }

private:
    RequirementRecord(ComponentRef full, RequirementIdentity identity)
        : full_(std::move(full)), identity_(std::move(identity)) {}

    ComponentRef full_;
    RequirementIdentity identity_;
};

// Requirement records keyed by full reference, iterated in reference order
class RequirementSet {
public:
    static RequirementSet create(const std::vector<ComponentRef>& direct,
                                 RelevanceFilter filter = std::nullopt);

    // Later calls overwrite earlier records for the same reference
    void add_indirect(const std::vector<ComponentRef>& indirect);

    std::vector<ComponentRef> all_refs() const;

    // Exactly one key whose text starts with `prefix`, else AmbiguousRequirement
    Result<RequirementRecord> lookup_by_name_prefix(const std::string& prefix) const;

    std::string identity_hash() const;
    std::string canonical_dump() const;

    // full text -> full text; the relevance filter is not part of this form
    std::map<std::string, std::string> to_structured() const;
    static Result<RequirementSet> from_structured(const std::map<std::string, std::string>& data);

    const RelevanceFilter& relevance_filter() const { return filter_; }
    const std::map<ComponentRef, RequirementRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::map<ComponentRef, RequirementRecord> records_;
    RelevanceFilter filter_;
};

// Full transitive closure for provenance; never hashed
class RequirementManifest {
public:
    RequirementManifest() = default;
    explicit RequirementManifest(const std::vector<ComponentRef>& refs);

    // One reference per line; blank lines skipped
    static Result<RequirementManifest> parse(const std::vector<std::string>& lines);
    static Result<RequirementManifest> parse(const std::string& text);

    // Appends references not already present
    void extend(const std::vector<ComponentRef>& refs);

    // Sorted full texts
    std::vector<std::string> to_structured() const;
    std::string canonical_dump() const;

    const std::vector<ComponentRef>& refs() const { return refs_; }
    size_t size() const { return refs_.size(); }
    bool empty() const { return refs_.empty(); }

private:
    std::vector<ComponentRef> refs_;
};

} // namespace pkgid
