#include <pkgid/config.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pkgid {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PkgidError{PkgidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto v = (*section)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*section)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [store] section
    if (auto section = doc["store"].as_table()) {
        if (auto v = (*section)["path"].value<std::string>()) {
            cfg.store_path = std::string(*v);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return PkgidError{PkgidError::NotFound,
            "config file not found: " + path, "", path, 0};
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return PkgidError{PkgidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).with_file(path);
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (!other.store_path.empty()) {
        store_path = other.store_path;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply() const {
    log::set_level(log_level);
    // Unset color keeps the tty auto-detection
    if (log_color_set) {
        log::set_color_enabled(log_color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pkgid/config.toml";
}

} // namespace pkgid
