#include <pkgid/identity/inputs.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <set>
#include <sstream>

namespace pkgid {

// Scalars only; booleans and integers are rendered as text
static Result<std::string> scalar_text(const std::string& name, const toml::node& node) {
    if (auto s = node.value_exact<std::string>()) return Result<std::string>::ok(*s);
    if (auto b = node.value_exact<bool>()) return Result<std::string>::ok(*b ? "true" : "false");
    if (auto i = node.value_exact<int64_t>()) return Result<std::string>::ok(std::to_string(*i));
    return PkgidError{PkgidError::InvalidArg,
        "unsupported value for '" + name + "'",
        "use a string, boolean or integer"};
}

// [settings.compiler] version = "9"  ->  compiler.version=9
static Status flatten_settings(const toml::table& tbl, const std::string& prefix,
                               SettingValues& out) {
    for (const auto& [key, val] : tbl) {
        std::string name = prefix.empty() ? std::string(key.str())
                                          : prefix + "." + std::string(key.str());
        if (auto sub = val.as_table()) {
            PKGID_TRY(flatten_settings(*sub, name, out));
            continue;
        }
        auto text = scalar_text(name, val);
        if (text.is_err()) return std::move(text).error();
        out.set(name, text.value());
    }
    return ok_status();
}

static Result<std::vector<ComponentRef>> parse_refs(const toml::table& tbl, const char* key) {
    std::vector<ComponentRef> refs;
    auto node = tbl[key];
    if (!node) return Result<std::vector<ComponentRef>>::ok(std::move(refs));
    auto arr = node.as_array();
    if (!arr) {
        return PkgidError{PkgidError::InvalidArg,
            std::string("requires.") + key + " must be an array of references"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return PkgidError{PkgidError::InvalidArg,
                std::string("requires.") + key + " entries must be strings"};
        }
        auto ref = ComponentRef::parse(*s);
        if (ref.is_err()) return std::move(ref).error();
        refs.push_back(std::move(ref).value());
    }
    return Result<std::vector<ComponentRef>>::ok(std::move(refs));
}

Result<BuildInputs> BuildInputs::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PkgidError{PkgidError::Parse,
            std::string("inputs TOML parse error: ") + e.what()};
    }

    BuildInputs in;

    if (auto settings = doc["settings"].as_table()) {
        PKGID_TRY(flatten_settings(*settings, "", in.settings));
    }

    if (auto options = doc["options"].as_table()) {
        for (const auto& [key, val] : *options) {
            std::string name(key.str());
            if (auto dep = val.as_table()) {
                for (const auto& [dkey, dval] : *dep) {
                    std::string scoped = name + ":" + std::string(dkey.str());
                    auto text = scalar_text(scoped, dval);
                    if (text.is_err()) return std::move(text).error();
                    PKGID_TRY(in.options.set(scoped, text.value()));
                }
                continue;
            }
            auto text = scalar_text(name, val);
            if (text.is_err()) return std::move(text).error();
            PKGID_TRY(in.options.set(name, text.value()));
        }
    }

    if (auto requires_tbl = doc["requires"].as_table()) {
        auto direct = parse_refs(*requires_tbl, "direct");
        if (direct.is_err()) return std::move(direct).error();
        in.direct_requires = std::move(direct).value();

        auto indirect = parse_refs(*requires_tbl, "indirect");
        if (indirect.is_err()) return std::move(indirect).error();
        in.indirect_requires = std::move(indirect).value();

        if (auto arr = (*requires_tbl)["non_dev"].as_array()) {
            std::set<std::string> names;
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return PkgidError{PkgidError::InvalidArg,
                        "requires.non_dev entries must be package names"};
                }
                names.insert(*s);
            }
            in.relevance_filter = std::move(names);
        }
    }

    return Result<BuildInputs>::ok(std::move(in));
}

Result<BuildInputs> BuildInputs::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PkgidError{PkgidError::IO, "cannot open inputs file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return BuildInputs::parse(ss.str()).with_file(path);
}

BuildIdentity BuildInputs::to_identity() const {
    return BuildIdentity::create(settings, options, direct_requires,
                                 indirect_requires, relevance_filter);
}

} // namespace pkgid
