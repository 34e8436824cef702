#pragma once

#include <pkgid/result.hpp>
#include <pkgid/identity/build_identity.hpp>
#include <string>
#include <vector>

namespace pkgid {

// What a build orchestrator hands over for one package, read from TOML:
//
//   [settings]
//   os = "Linux"
//   compiler = "gcc"
//   "compiler.version" = "9"      # or [settings.compiler] version = "9"
//
//   [options]
//   shared = true
//   "zlib:shared" = false         # or [options.zlib] shared = false
//
//   [requires]
//   direct = ["zlib/1.2.11@conan/stable"]
//   indirect = ["bzip2/1.0.8"]
//   non_dev = ["zlib"]            # optional; absent means all requirements count
struct BuildInputs {
    SettingValues settings;
    OptionValues options;
    std::vector<ComponentRef> direct_requires;
    std::vector<ComponentRef> indirect_requires;
    RelevanceFilter relevance_filter;

    static Result<BuildInputs> parse(const std::string& toml_str);
    static Result<BuildInputs> load(const std::string& path);

    BuildIdentity to_identity() const;
};

} // namespace pkgid
