#include <catch2/catch.hpp>
#include <pkgid/identity/component_ref.hpp>
#include <algorithm>
#include <vector>

using namespace pkgid;

TEST_CASE("parse name/version", "[component_ref]") {
    auto r = ComponentRef::parse("zlib/1.2.11");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().name() == "zlib");
    REQUIRE(r.value().version() == "1.2.11");
    REQUIRE_FALSE(r.value().user().has_value());
    REQUIRE_FALSE(r.value().channel().has_value());
    REQUIRE_FALSE(r.value().package_identity().has_value());
}

TEST_CASE("parse full reference", "[component_ref]") {
    auto r = ComponentRef::parse("zlib/1.2.11@conan/stable:5ab84d6acfe1f23c4fae0ab88f26e3a396351ac9");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().user() == "conan");
    REQUIRE(*r.value().channel() == "stable");
    REQUIRE(*r.value().package_identity() == "5ab84d6acfe1f23c4fae0ab88f26e3a396351ac9");
}

TEST_CASE("to_string round-trips through parse", "[component_ref]") {
    for (const char* text : {"A/1.0", "boost/1.70.0@user/testing", "B/2.0-rc1:abc123",
                             "my_lib/1.0+b7@team/dev:0123"}) {
        auto ref = ComponentRef::parse(text);
        REQUIRE(ref.is_ok());
        REQUIRE(ref.value().to_string() == text);
        REQUIRE(ComponentRef::parse(ref.value().to_string()).value() == ref.value());
    }
}

TEST_CASE("short_string and without_package_identity drop the package id", "[component_ref]") {
    auto ref = ComponentRef::parse("zlib/1.2.11@conan/stable:abc").value();
    REQUIRE(ref.short_string() == "zlib/1.2.11@conan/stable");
    REQUIRE(ref.without_package_identity().to_string() == "zlib/1.2.11@conan/stable");
    REQUIRE(ref.without_package_identity() != ref);
}

TEST_CASE("malformed references are rejected", "[component_ref]") {
    for (const char* text : {"", "zlib", "zlib/", "/1.0", "zlib/1.0/extra",
                             "zlib/1.0@conan", "zlib/1.0@/stable", "zlib/1.0@conan/",
                             "zlib/1.0:", "zlib/1.0:abc/def", "zl ib/1.0",
                             "-zlib/1.0", "zlib/1..0"}) {
        auto r = ComponentRef::parse(text);
        INFO(text);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PkgidError::MalformedReference);
    }
}

TEST_CASE("malformed reference error carries a hint", "[component_ref]") {
    auto r = ComponentRef::parse("zlib");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("zlib") != std::string::npos);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("references are totally ordered with absent parts first", "[component_ref]") {
    std::vector<ComponentRef> refs = {
        ComponentRef::parse("B/1.0").value(),
        ComponentRef::parse("A/1.0@user/stable").value(),
        ComponentRef::parse("A/1.0:pid").value(),
        ComponentRef::parse("A/1.0").value(),
    };
    std::sort(refs.begin(), refs.end());
    REQUIRE(refs[0].to_string() == "A/1.0");
    REQUIRE(refs[1].to_string() == "A/1.0:pid");
    REQUIRE(refs[2].to_string() == "A/1.0@user/stable");
    REQUIRE(refs[3].to_string() == "B/1.0");
}
