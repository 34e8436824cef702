#pragma once

#include <pkgid/result.hpp>
#include <pkgid/log.hpp>
#include <optional>
#include <string>

namespace pkgid {

// Layered configuration: global (~/.pkgid/config.toml) then local.
// Later layers override only the fields they set.
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    std::string store_path;

    bool log_level_set = false;
    bool log_color_set = false;

    // [log] level = "debug", color = false
    // [store] path = "/var/cache/pkgid/identities.db"
    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push the log settings into pkgid::log
    void apply() const;
};

// ~/.pkgid/config.toml, empty when no home directory is known
std::string global_config_path();

} // namespace pkgid
