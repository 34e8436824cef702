#pragma once

#include <pkgid/result.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pkgid {

// Ini-like text split into "[name]" sections. Lines are trimmed; blank
// lines and '#' comments are dropped.
class SectionParser {
public:
    // Fails with MalformedIdentityFile on a bad header, a section outside
    // `allowed`, or a body line before the first header.
    static Result<SectionParser> parse(const std::string& text,
                                       const std::vector<std::string>& allowed);

    bool has(const std::string& name) const;
    // Newline-joined body; empty for an absent section
    std::string get(const std::string& name) const;

    // First name of `required` with no section, empty if all are present
    std::string first_missing(const std::vector<std::string>& required) const;

private:
    std::map<std::string, std::vector<std::string>> sections_;
};

// Trimmed lines of `text`, without blank and '#' lines
std::vector<std::string> content_lines(const std::string& text);

// "name = value" split at the first '=', both sides trimmed
Result<std::pair<std::string, std::string>> split_assignment(const std::string& line);

} // namespace pkgid
