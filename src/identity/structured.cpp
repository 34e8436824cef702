#include <pkgid/identity/structured.hpp>
#include <toml++/toml.hpp>
#include <sstream>

namespace pkgid {

static toml::table to_table(const std::map<std::string, std::string>& values) {
    toml::table tbl;
    for (const auto& [key, value] : values) {
        tbl.insert_or_assign(key, value);
    }
    return tbl;
}

static Result<std::map<std::string, std::string>> read_table(const toml::table& doc,
                                                             const std::string& name) {
    auto tbl = doc[name].as_table();
    if (!tbl) {
        return PkgidError{PkgidError::MalformedIdentityFile,
            "structured identity has no '" + name + "' table"};
    }
    std::map<std::string, std::string> values;
    for (const auto& [key, val] : *tbl) {
        auto s = val.value<std::string>();
        if (!s) {
            return PkgidError{PkgidError::MalformedIdentityFile,
                "'" + name + "." + std::string(key.str()) + "' must be a string"};
        }
        values[std::string(key.str())] = *s;
    }
    return Result<std::map<std::string, std::string>>::ok(std::move(values));
}

std::string StructuredIdentity::to_toml() const {
    toml::table doc;
    toml::array full;
    for (const auto& ref : full_requirements) {
        full.push_back(ref);
    }
    doc.insert_or_assign("full_requires", std::move(full));
    doc.insert_or_assign("settings", to_table(settings));
    doc.insert_or_assign("full_settings", to_table(full_settings));
    doc.insert_or_assign("options", to_table(options));
    doc.insert_or_assign("full_options", to_table(full_options));
    doc.insert_or_assign("requires", to_table(requirements));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

Result<StructuredIdentity> StructuredIdentity::from_toml(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PkgidError{PkgidError::Parse,
            std::string("structured identity TOML parse error: ") + e.what()};
    }

    StructuredIdentity data;
    struct Field { const char* key; std::map<std::string, std::string>* out; };
    Field fields[] = {
        {"settings", &data.settings},
        {"full_settings", &data.full_settings},
        {"options", &data.options},
        {"full_options", &data.full_options},
        {"requires", &data.requirements},
    };
    for (auto& field : fields) {
        auto values = read_table(doc, field.key);
        if (values.is_err()) return std::move(values).error();
        *field.out = std::move(values).value();
    }

    auto arr = doc["full_requires"].as_array();
    if (!arr) {
        return PkgidError{PkgidError::MalformedIdentityFile,
            "structured identity has no 'full_requires' array"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return PkgidError{PkgidError::MalformedIdentityFile,
                "'full_requires' entries must be strings"};
        }
        data.full_requirements.push_back(*s);
    }

    return Result<StructuredIdentity>::ok(std::move(data));
}

bool StructuredIdentity::operator==(const StructuredIdentity& o) const {
    return settings == o.settings && full_settings == o.full_settings &&
           options == o.options && full_options == o.full_options &&
           requirements == o.requirements &&
           full_requirements == o.full_requirements;
}

} // namespace pkgid
