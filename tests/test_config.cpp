#include <catch2/catch.hpp>
#include <pkgid/config.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace pkgid;

static std::string test_config_path() {
    static int counter = 0;
    return "/tmp/pkgid_test_config_" + std::to_string(getpid())
           + "_" + std::to_string(counter++) + ".toml";
}

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().log_color == true);
    REQUIRE(r.value().log_color_set);
}

TEST_CASE("parse config with store section", "[config]") {
    auto r = Config::parse(R"(
[store]
path = "/var/cache/pkgid/identities.db"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().store_path == "/var/cache/pkgid/identities.db");
    REQUIRE_FALSE(r.value().log_level_set);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Info);
    REQUIRE(r.value().store_path.empty());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::Parse);
}

TEST_CASE("parse config with unknown log level", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::Config);
}

// ===== Loading =====

TEST_CASE("load missing config is NotFound", "[config]") {
    auto path = test_config_path();
    auto r = Config::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::NotFound);
}

TEST_CASE("load config errors carry the file", "[config]") {
    auto path = test_config_path();
    {
        std::ofstream f(path);
        f << "[log]\nlevel = \"loud\"\n";
    }
    auto r = Config::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path);
    fs::remove(path);
}

// ===== Merge =====

TEST_CASE("merge only overrides fields that were set", "[config]") {
    auto base = Config::parse(R"(
[log]
level = "warn"
color = true
[store]
path = "/a.db"
)").value();
    auto over = Config::parse("[log]\nlevel = \"trace\"\n").value();

    base.merge(over);
    REQUIRE(base.log_level == log::Trace);
    REQUIRE(base.log_color == true);
    REQUIRE(base.store_path == "/a.db");
}

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse("[log]\nlevel = \"debug\"\n[store]\npath = \"/g.db\"\n").value();
    auto local = Config::parse("[store]\npath = \"/l.db\"\n").value();

    auto eff = Config::effective(global, local);
    REQUIRE(eff.log_level == log::Debug);
    REQUIRE(eff.store_path == "/l.db");
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.log_level == log::Info);
    REQUIRE_FALSE(eff.log_color_set);
}

TEST_CASE("apply pushes log settings", "[config]") {
    auto cfg = Config::parse("[log]\nlevel = \"error\"\ncolor = false\n").value();
    cfg.apply();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

TEST_CASE("global config path contains .pkgid", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".pkgid/config.toml") != std::string::npos);
    }
}
