#include <catch2/catch.hpp>
#include <pkgid/identity/inputs.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace pkgid;

static const char* SAMPLE_INPUTS = R"(
[settings]
os = "Linux"
arch = "x86_64"
build_type = "Release"

[settings.compiler]
version = "9"
libcxx = "libstdc++11"

[options]
shared = false
fPIC = true

[options.zlib]
shared = true

[requires]
direct = ["zlib/1.2.11@conan/stable", "gtest/1.10.0"]
indirect = ["bzip2/1.0.8"]
non_dev = ["zlib"]
)";

TEST_CASE("parse inputs flattens nested settings", "[inputs]") {
    auto r = BuildInputs::parse(SAMPLE_INPUTS);
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().settings.get("os") == "Linux");
    REQUIRE(*r.value().settings.get("compiler.version") == "9");
    REQUIRE(*r.value().settings.get("compiler.libcxx") == "libstdc++11");
}

TEST_CASE("parse inputs renders option scalars as text", "[inputs]") {
    auto r = BuildInputs::parse(SAMPLE_INPUTS);
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().options.get("shared") == "false");
    REQUIRE(*r.value().options.get("fPIC") == "true");
    REQUIRE(*r.value().options.get("zlib:shared") == "true");
}

TEST_CASE("parse inputs reads requirements and the relevance filter", "[inputs]") {
    auto r = BuildInputs::parse(SAMPLE_INPUTS);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().direct_requires.size() == 2);
    REQUIRE(r.value().indirect_requires.size() == 1);
    REQUIRE(r.value().relevance_filter == std::set<std::string>{"zlib"});

    auto id = r.value().to_identity();
    REQUIRE(id.canonical_dump().find("gtest/1.10.0 DEV") != std::string::npos);
    REQUIRE(id.package_identity().size() == 40);
}

TEST_CASE("inputs without non_dev count every requirement", "[inputs]") {
    auto r = BuildInputs::parse("[requires]\ndirect = [\"A/1.0\"]\n");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().relevance_filter.has_value());
    REQUIRE(r.value().settings.empty());
}

TEST_CASE("inputs with integer settings", "[inputs]") {
    auto r = BuildInputs::parse("[settings]\ncppstd = 17\n");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().settings.get("cppstd") == "17");
}

TEST_CASE("inputs reject unsupported values", "[inputs]") {
    auto r = BuildInputs::parse("[settings]\nflags = [\"-O2\"]\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::InvalidArg);
}

TEST_CASE("inputs reject malformed references", "[inputs]") {
    auto r = BuildInputs::parse("[requires]\ndirect = [\"zlib\"]\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::MalformedReference);
}

TEST_CASE("inputs reject a non-array requirement list", "[inputs]") {
    auto r = BuildInputs::parse("[requires]\ndirect = \"A/1.0\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PkgidError::InvalidArg);
}

TEST_CASE("load inputs from file", "[inputs]") {
    auto path = "/tmp/pkgid_test_inputs_" + std::to_string(getpid()) + ".toml";
    {
        std::ofstream f(path);
        f << SAMPLE_INPUTS;
    }
    auto r = BuildInputs::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_identity() == BuildInputs::parse(SAMPLE_INPUTS).value().to_identity());
    fs::remove(path);

    auto missing = BuildInputs::load(path);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == PkgidError::IO);
}
