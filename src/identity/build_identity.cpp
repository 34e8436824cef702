#include <pkgid/identity/build_identity.hpp>
#include <pkgid/log.hpp>
#include <pkgid/sections.hpp>
#include <pkgid/sha1.hpp>
#include <algorithm>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

namespace pkgid {

// Section order is part of the file format
static const std::vector<std::string> SECTIONS = {
    "settings", "requires", "options",
    "full_settings", "full_requires", "full_options", "scope"
};

static const std::string DEV_MARKER = " DEV";

static std::string indent(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string out;
    bool first = true;
    while (std::getline(stream, line)) {
        if (!first) out += "\n";
        out += "    " + line;
        first = false;
    }
    return out;
}

static Result<std::string> read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PkgidError{PkgidError::MissingIdentityFile,
            "cannot read identity file", "", path, 0};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

static Status write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return PkgidError{PkgidError::IO, "cannot write identity file", "", path, 0};
    }
    out << text;
    if (!out) {
        return PkgidError{PkgidError::IO, "failed writing identity file", "", path, 0};
    }
    return ok_status();
}

// Snapshot parse errors become format errors naming the section
template<typename T>
static Result<T> in_section(Result<T> r, const std::string& section) {
    if (r.is_ok() || r.error().code == PkgidError::MalformedReference) return r;
    return PkgidError{PkgidError::MalformedIdentityFile,
        "[" + section + "]: " + r.error().message, r.error().hint};
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BuildIdentity BuildIdentity::create(const SettingValues& settings,
                                    const OptionValues& options,
                                    const std::vector<ComponentRef>& direct_requires,
                                    const std::vector<ComponentRef>& indirect_requires,
                                    RelevanceFilter relevance_filter) {
    BuildIdentity result;
    result.full_settings = settings;
    result.settings = settings;
    result.full_options = options;
    result.options = options;
    result.options.clear_indirect();

    result.full_requirements = RequirementManifest(direct_requires);
    result.full_requirements.extend(indirect_requires);

    result.requirements = RequirementSet::create(direct_requires, relevance_filter);
    result.requirements.add_indirect(indirect_requires);

    result.scope = std::nullopt;
    result.relevance_filter = std::move(relevance_filter);

    log::debug("identity: %zu direct, %zu indirect requirements",
               direct_requires.size(), indirect_requires.size());
    return result;
}

Result<BuildIdentity> BuildIdentity::parse(const std::string& text) {
    auto parsed = SectionParser::parse(text, SECTIONS);
    if (parsed.is_err()) return std::move(parsed).error();
    const auto& parser = parsed.value();

    std::string missing = parser.first_missing(SECTIONS);
    if (!missing.empty()) {
        return PkgidError{PkgidError::MalformedIdentityFile,
            "missing section [" + missing + "]"};
    }

    BuildIdentity result;

    auto settings = in_section(SettingValues::parse(parser.get("settings")), "settings");
    if (settings.is_err()) return std::move(settings).error();
    result.settings = std::move(settings).value();

    auto full_settings = in_section(SettingValues::parse(parser.get("full_settings")),
                                    "full_settings");
    if (full_settings.is_err()) return std::move(full_settings).error();
    result.full_settings = std::move(full_settings).value();

    auto options = in_section(OptionValues::parse(parser.get("options")), "options");
    if (options.is_err()) return std::move(options).error();
    result.options = std::move(options).value();

    auto full_options = in_section(OptionValues::parse(parser.get("full_options")),
                                   "full_options");
    if (full_options.is_err()) return std::move(full_options).error();
    result.full_options = std::move(full_options).value();

    auto full_requires = RequirementManifest::parse(parser.get("full_requires"));
    if (full_requires.is_err()) return std::move(full_requires).error();
    result.full_requirements = std::move(full_requires).value();

    // Requirements are rebuilt from the full list. Each persisted line
    // claims one full requirement with that direct identity line, in
    // reference order; full requirements left unclaimed were indirect.
    std::map<std::string, int> listed;
    std::map<std::string, int> dev_listed;
    for (const auto& line : content_lines(parser.get("requires"))) {
        if (line.size() > DEV_MARKER.size() &&
            line.compare(line.size() - DEV_MARKER.size(), DEV_MARKER.size(), DEV_MARKER) == 0) {
            ++dev_listed[line.substr(0, line.size() - DEV_MARKER.size())];
        } else {
            ++listed[line];
        }
    }

    std::vector<ComponentRef> full_refs = result.full_requirements.refs();
    std::sort(full_refs.begin(), full_refs.end());

    std::vector<ComponentRef> direct;
    std::vector<ComponentRef> indirect;
    std::set<std::string> relevant_names;
    for (const auto& ref : full_refs) {
        std::string line = RequirementRecord::from_ref(ref).identity_line();
        auto it = listed.find(line);
        auto dev_it = dev_listed.find(line);
        if (it != listed.end() && it->second > 0) {
            --it->second;
            direct.push_back(ref);
            relevant_names.insert(ref.name());
        } else if (dev_it != dev_listed.end() && dev_it->second > 0) {
            --dev_it->second;
            direct.push_back(ref);
        } else {
            indirect.push_back(ref);
        }
    }

    // Only a dev-tagged line says anything about the relevance filter, and
    // only about direct requirements
    if (!dev_listed.empty()) {
        result.relevance_filter = std::move(relevant_names);
    }
    result.requirements = RequirementSet::create(direct, result.relevance_filter);
    result.requirements.add_indirect(indirect);

    auto scope = in_section(Scopes::parse(parser.get("scope")), "scope");
    if (scope.is_err()) return std::move(scope).error();
    result.scope = std::move(scope).value();

    return Result<BuildIdentity>::ok(std::move(result));
}

Result<BuildIdentity> BuildIdentity::load_from_path(const std::string& path) {
    auto text = read_text(path);
    if (text.is_err()) return std::move(text).error();
    log::debug("loading identity from %s", path.c_str());
    return parse(text.value()).with_file(path);
}

Result<BuildIdentity> BuildIdentity::from_structured(const StructuredIdentity& data) {
    BuildIdentity result;

    auto settings = SettingValues::from_structured(data.settings);
    if (settings.is_err()) return std::move(settings).error();
    result.settings = std::move(settings).value();

    auto full_settings = SettingValues::from_structured(data.full_settings);
    if (full_settings.is_err()) return std::move(full_settings).error();
    result.full_settings = std::move(full_settings).value();

    auto options = OptionValues::from_structured(data.options);
    if (options.is_err()) return std::move(options).error();
    result.options = std::move(options).value();

    auto full_options = OptionValues::from_structured(data.full_options);
    if (full_options.is_err()) return std::move(full_options).error();
    result.full_options = std::move(full_options).value();

    auto requirements = RequirementSet::from_structured(data.requirements);
    if (requirements.is_err()) return std::move(requirements).error();
    result.requirements = std::move(requirements).value();

    auto full_requires = RequirementManifest::parse(data.full_requirements);
    if (full_requires.is_err()) return std::move(full_requires).error();
    result.full_requirements = std::move(full_requires).value();

    return Result<BuildIdentity>::ok(std::move(result));
}

Result<BuildIdentity> BuildIdentity::load_structured(const std::string& path) {
    auto text = read_text(path);
    if (text.is_err()) return std::move(text).error();
    auto data = StructuredIdentity::from_toml(text.value()).with_file(path);
    if (data.is_err()) return std::move(data).error();
    return from_structured(data.value()).with_file(path);
}

// ---------------------------------------------------------------------------
// Identity and serialization
// ---------------------------------------------------------------------------

const std::string& BuildIdentity::package_identity() const {
    if (!package_identity_) {
        std::string buffer = settings.identity_hash();
        buffer += "\n";
        buffer += options.identity_hash(relevance_filter);
        buffer += "\n";
        buffer += requirements.identity_hash();
        package_identity_ = SHA1::hash_hex(buffer);
        log::debug("computed package id %s", package_identity_->c_str());
    }
    return *package_identity_;
}

std::string BuildIdentity::canonical_dump() const {
    std::vector<std::string> parts;
    parts.push_back("[settings]");
    parts.push_back(indent(settings.dump()));
    parts.push_back("\n[requires]");
    parts.push_back(indent(requirements.canonical_dump()));
    parts.push_back("\n[options]");
    parts.push_back(indent(options.dump()));
    parts.push_back("\n[full_settings]");
    parts.push_back(indent(full_settings.dump()));
    parts.push_back("\n[full_requires]");
    parts.push_back(indent(full_requirements.canonical_dump()));
    parts.push_back("\n[full_options]");
    parts.push_back(indent(full_options.dump()));
    parts.push_back("\n[scope]");
    if (scope && !scope->empty()) {
        parts.push_back(indent(scope->dump()));
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += "\n";
        out += parts[i];
    }
    return out;
}

StructuredIdentity BuildIdentity::to_structured() const {
    StructuredIdentity data;
    data.settings = settings.to_structured();
    data.full_settings = full_settings.to_structured();
    data.options = options.to_structured();
    data.full_options = full_options.to_structured();
    data.requirements = requirements.to_structured();
    data.full_requirements = full_requirements.to_structured();
    return data;
}

Status BuildIdentity::save(const std::string& path) const {
    return write_text(path, canonical_dump());
}

Status BuildIdentity::save_structured(const std::string& path) const {
    return write_text(path, to_structured().to_toml());
}

bool BuildIdentity::equals(const BuildIdentity& other) const {
    return canonical_dump() == other.canonical_dump();
}

} // namespace pkgid
