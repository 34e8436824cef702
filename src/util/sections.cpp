#include <pkgid/sections.hpp>
#include <algorithm>
#include <sstream>

namespace pkgid {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// [a-z_]{2,50}
static bool valid_section_name(const std::string& name) {
    if (name.size() < 2 || name.size() > 50) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || c == '_';
    });
}

std::vector<std::string> content_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        lines.push_back(std::move(line));
    }
    return lines;
}

Result<std::pair<std::string, std::string>> split_assignment(const std::string& line) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return PkgidError{PkgidError::Parse,
            "expected name=value, got '" + line + "'"};
    }
    std::string name = trim(line.substr(0, eq));
    if (name.empty()) {
        return PkgidError{PkgidError::Parse,
            "missing name before '=' in '" + line + "'"};
    }
    return Result<std::pair<std::string, std::string>>::ok(
        {name, trim(line.substr(eq + 1))});
}

Result<SectionParser> SectionParser::parse(const std::string& text,
                                           const std::vector<std::string>& allowed) {
    SectionParser parser;
    std::vector<std::string>* current = nullptr;

    for (const auto& line : content_lines(text)) {
        if (line[0] == '[') {
            size_t close = line.find(']');
            std::string name = close == std::string::npos
                ? std::string() : line.substr(1, close - 1);
            if (close != line.size() - 1 || !valid_section_name(name)) {
                return PkgidError{PkgidError::MalformedIdentityFile,
                    "bad section header '" + line + "'"};
            }
            if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
                return PkgidError{PkgidError::MalformedIdentityFile,
                    "unrecognized section '" + name + "'"};
            }
            current = &parser.sections_[name];
            continue;
        }
        if (!current) {
            return PkgidError{PkgidError::MalformedIdentityFile,
                "unexpected line '" + line + "' before the first section"};
        }
        current->push_back(line);
    }

    return Result<SectionParser>::ok(std::move(parser));
}

bool SectionParser::has(const std::string& name) const {
    return sections_.count(name) > 0;
}

std::string SectionParser::get(const std::string& name) const {
    auto it = sections_.find(name);
    if (it == sections_.end()) return "";
    std::string out;
    for (size_t i = 0; i < it->second.size(); ++i) {
        if (i > 0) out += "\n";
        out += it->second[i];
    }
    return out;
}

std::string SectionParser::first_missing(const std::vector<std::string>& required) const {
    for (const auto& name : required) {
        if (!has(name)) return name;
    }
    return "";
}

} // namespace pkgid
