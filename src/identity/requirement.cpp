#include <pkgid/identity/requirement.hpp>
#include <pkgid/log.hpp>
#include <pkgid/sections.hpp>
#include <pkgid/sha1.hpp>
#include <pkgid/version.hpp>
#include <algorithm>

namespace pkgid {

// ---------------------------------------------------------------------------
// RequirementRecord
// ---------------------------------------------------------------------------

static std::string stabilize(const std::string& version) {
    auto parsed = Version::parse(version);
    if (parsed.is_err()) return version;
    return parsed.value().stable().to_string();
}

RequirementRecord RequirementRecord::from_ref(const ComponentRef& ref, bool indirect) {
    if (indirect) {
        return RequirementRecord(ref, IndirectIdentity{});
    }
    DirectIdentity direct;
    direct.name = ref.name();
    direct.version = stabilize(ref.version());
    return RequirementRecord(ref, std::move(direct));
}

Result<RequirementRecord> RequirementRecord::parse(const std::string& ref_text, bool indirect) {
    auto ref = ComponentRef::parse(ref_text);
    if (ref.is_err()) return std::move(ref).error();
    return Result<RequirementRecord>::ok(from_ref(ref.value(), indirect));
}

std::string RequirementRecord::identity_line() const {
    std::vector<std::string> fields;
    auto push = [&](const std::optional<std::string>& f) {
        if (f && !f->empty()) fields.push_back(*f);
    };

    const ReservedFields* reserved = nullptr;
    if (const auto* direct = std::get_if<DirectIdentity>(&identity_)) {
        push(direct->name);
        push(direct->version);
        reserved = &direct->reserved;
    } else {
        reserved = &std::get<IndirectIdentity>(identity_).reserved;
    }
    push(reserved->user);
    push(reserved->channel);
    push(reserved->package_identity);

    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += "/";
        line += fields[i];
    }
    return line;
}

// ---------------------------------------------------------------------------
// RequirementSet
// ---------------------------------------------------------------------------

RequirementSet RequirementSet::create(const std::vector<ComponentRef>& direct,
                                      RelevanceFilter filter) {
    RequirementSet set;
    set.filter_ = std::move(filter);
    for (const auto& ref : direct) {
        set.records_.insert_or_assign(ref, RequirementRecord::from_ref(ref));
    }
    return set;
}

void RequirementSet::add_indirect(const std::vector<ComponentRef>& indirect) {
    for (const auto& ref : indirect) {
        log::trace("indirect requirement %s", ref.to_string().c_str());
        records_.insert_or_assign(ref, RequirementRecord::from_ref(ref, true));
    }
}

std::vector<ComponentRef> RequirementSet::all_refs() const {
    std::vector<ComponentRef> refs;
    refs.reserve(records_.size());
    for (const auto& [ref, record] : records_) {
        refs.push_back(ref);
    }
    return refs;
}

Result<RequirementRecord> RequirementSet::lookup_by_name_prefix(const std::string& prefix) const {
    std::vector<const RequirementRecord*> matches;
    std::string names;
    for (const auto& [ref, record] : records_) {
        std::string text = ref.to_string();
        if (text.compare(0, prefix.size(), prefix) == 0) {
            matches.push_back(&record);
            if (!names.empty()) names += ", ";
            names += text;
        }
    }

    if (matches.size() == 1) {
        return Result<RequirementRecord>::ok(*matches.front());
    }

    log::debug("requirement lookup '%s' matched %zu entries", prefix.c_str(), matches.size());
    if (matches.empty()) {
        return PkgidError{PkgidError::AmbiguousRequirement,
            "no requirement matches '" + prefix + "'"};
    }
    return PkgidError{PkgidError::AmbiguousRequirement,
        "'" + prefix + "' matches " + std::to_string(matches.size()) +
        " requirements: " + names,
        "extend the prefix with a version, e.g. '" + prefix + "/<version>'"};
}

std::string RequirementSet::identity_hash() const {
    std::string buffer;
    bool first = true;
    for (const auto& [ref, record] : records_) {
        if (!is_relevant(filter_, ref.name())) continue;
        if (!first) buffer += "\n";
        buffer += record.identity_line();
        first = false;
    }
    return SHA1::hash_hex(buffer);
}

std::string RequirementSet::canonical_dump() const {
    std::string out;
    for (const auto& [ref, record] : records_) {
        std::string line = record.identity_line();
        if (line.empty()) continue;
        if (!is_relevant(filter_, ref.name())) {
            line += " DEV";
        }
        if (!out.empty()) out += "\n";
        out += line;
    }
    return out;
}

std::map<std::string, std::string> RequirementSet::to_structured() const {
    std::map<std::string, std::string> out;
    for (const auto& [ref, record] : records_) {
        out[ref.to_string()] = record.to_full_text();
    }
    return out;
}

Result<RequirementSet> RequirementSet::from_structured(
    const std::map<std::string, std::string>& data)
{
    RequirementSet set;
    for (const auto& [key, value] : data) {
        auto ref = ComponentRef::parse(key);
        if (ref.is_err()) return std::move(ref).error();
        auto record = RequirementRecord::parse(value);
        if (record.is_err()) return std::move(record).error();
        set.records_.insert_or_assign(std::move(ref).value(), std::move(record).value());
    }
    return Result<RequirementSet>::ok(std::move(set));
}

// ---------------------------------------------------------------------------
// RequirementManifest
// ---------------------------------------------------------------------------

RequirementManifest::RequirementManifest(const std::vector<ComponentRef>& refs) {
    extend(refs);
}

Result<RequirementManifest> RequirementManifest::parse(const std::vector<std::string>& lines) {
    RequirementManifest manifest;
    for (const auto& line : lines) {
        if (line.empty()) continue;
        auto ref = ComponentRef::parse(line);
        if (ref.is_err()) return std::move(ref).error();
        manifest.extend({std::move(ref).value()});
    }
    return Result<RequirementManifest>::ok(std::move(manifest));
}

Result<RequirementManifest> RequirementManifest::parse(const std::string& text) {
    return parse(content_lines(text));
}

void RequirementManifest::extend(const std::vector<ComponentRef>& refs) {
    for (const auto& ref : refs) {
        if (std::find(refs_.begin(), refs_.end(), ref) == refs_.end()) {
            refs_.push_back(ref);
        }
    }
}

std::vector<std::string> RequirementManifest::to_structured() const {
    std::vector<ComponentRef> sorted = refs_;
    std::sort(sorted.begin(), sorted.end());
    std::vector<std::string> out;
    out.reserve(sorted.size());
    for (const auto& ref : sorted) {
        out.push_back(ref.to_string());
    }
    return out;
}

std::string RequirementManifest::canonical_dump() const {
    std::string out;
    for (const auto& text : to_structured()) {
        if (!out.empty()) out += "\n";
        out += text;
    }
    return out;
}

} // namespace pkgid
