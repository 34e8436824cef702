#include <catch2/catch.hpp>
#include <pkgid/identity/options.hpp>
#include <pkgid/identity/scope.hpp>
#include <pkgid/identity/settings.hpp>
#include <pkgid/sha1.hpp>

using namespace pkgid;

// ---------------------------------------------------------------------------
// SettingValues
// ---------------------------------------------------------------------------

TEST_CASE("settings parse and dump sorted", "[settings]") {
    auto r = SettingValues::parse("os=Linux\ncompiler=gcc\n# comment\n\ncompiler.version=9\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
    REQUIRE(r.value().dump() == "compiler=gcc\ncompiler.version=9\nos=Linux");
    REQUIRE(*r.value().get("os") == "Linux");
    REQUIRE_FALSE(r.value().get("arch").has_value());
}

TEST_CASE("settings parse rejects a line without '='", "[settings]") {
    auto r = SettingValues::parse("os=Linux\nbroken\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::Parse);
}

TEST_CASE("settings identity hash is the SHA-1 of sorted lines", "[settings]") {
    SettingValues s;
    s.set("os", "Linux");
    s.set("arch", "x86_64");
    REQUIRE(s.identity_hash() == SHA1::hash_hex("arch=x86_64\nos=Linux"));
}

TEST_CASE("settings identity hash skips None values", "[settings]") {
    SettingValues a;
    a.set("os", "Linux");
    SettingValues b = a;
    b.set("compiler.cppstd", "None");
    REQUIRE(a != b);
    REQUIRE(a.identity_hash() == b.identity_hash());
    REQUIRE(b.dump() == "compiler.cppstd=None\nos=Linux");
}

TEST_CASE("settings remove drops dotted children", "[settings]") {
    auto s = SettingValues::parse(
        "compiler=gcc\ncompiler.version=9\ncompiler.libcxx=libstdc++\ncompilerx=1\nos=Linux").value();
    s.remove("compiler");
    REQUIRE(s.dump() == "compilerx=1\nos=Linux");
}

TEST_CASE("settings structured form round-trips", "[settings]") {
    auto s = SettingValues::parse("os=Linux\nbuild_type=Release").value();
    auto back = SettingValues::from_structured(s.to_structured());
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == s);
    REQUIRE(SettingValues::from_structured({{"", "x"}}).is_err());
}

// ---------------------------------------------------------------------------
// OptionValues
// ---------------------------------------------------------------------------

TEST_CASE("options separate local and dependency values", "[options]") {
    auto r = OptionValues::parse("shared=True\nzlib:shared=False\nfPIC=True\nbzip2:build_exe=True");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().get("shared") == "True");
    REQUIRE(*r.value().get("zlib:shared") == "False");
    REQUIRE_FALSE(r.value().get("zlib:fPIC").has_value());
    REQUIRE(r.value().dump() ==
            "fPIC=True\nshared=True\nbzip2:build_exe=True\nzlib:shared=False");
}

TEST_CASE("options reject bad dependency names", "[options]") {
    OptionValues o;
    REQUIRE(o.set(":shared", "True").is_err());
    REQUIRE(o.set("zlib:", "True").is_err());
    REQUIRE(o.set("a:b:c", "True").is_err());
    REQUIRE(OptionValues::parse("=True").is_err());
}

TEST_CASE("clear_indirect keeps only local options", "[options]") {
    auto o = OptionValues::parse("shared=True\nzlib:shared=False").value();
    o.clear_indirect();
    REQUIRE(o.dump() == "shared=True");
    REQUIRE_FALSE(o.get("zlib:shared").has_value());
}

TEST_CASE("options identity hash honors the relevance filter", "[options]") {
    auto o = OptionValues::parse("shared=True\nzlib:shared=False\ngtest:shared=True").value();
    auto local_only = OptionValues::parse("shared=True").value();

    std::string all = o.identity_hash(std::nullopt);
    std::string only_zlib = o.identity_hash(std::set<std::string>{"zlib"});
    std::string none = o.identity_hash(std::set<std::string>{});

    REQUIRE(all != only_zlib);
    REQUIRE(only_zlib != none);
    REQUIRE(none == local_only.identity_hash(std::nullopt));
}

TEST_CASE("options structured form round-trips", "[options]") {
    auto o = OptionValues::parse("shared=True\nzlib:shared=False").value();
    auto data = o.to_structured();
    REQUIRE(data.at("zlib:shared") == "False");
    REQUIRE(OptionValues::from_structured(data).value() == o);
}

// ---------------------------------------------------------------------------
// Scopes
// ---------------------------------------------------------------------------

TEST_CASE("scopes parse booleans and dump canonically", "[scope]") {
    auto r = Scopes::parse("dev=true\nzlib:build=0\nbuild=False");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().get("dev"));
    REQUIRE_FALSE(r.value().get("build"));
    REQUIRE_FALSE(r.value().get("zlib:build"));
    REQUIRE(r.value().dump() == "build=False\ndev=True\nzlib:build=False");
}

TEST_CASE("scopes reject non-boolean values", "[scope]") {
    auto r = Scopes::parse("dev=maybe");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::Parse);
}

TEST_CASE("empty scopes", "[scope]") {
    auto r = Scopes::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
    REQUIRE(r.value().dump().empty());
}
