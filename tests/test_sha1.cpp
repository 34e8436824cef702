#include <catch2/catch.hpp>
#include <pkgid/sha1.hpp>
#include <string>

using namespace pkgid;

TEST_CASE("SHA1 of empty string", "[sha1]") {
    REQUIRE(SHA1::hash_hex("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_CASE("SHA1 of 'abc'", "[sha1]") {
    REQUIRE(SHA1::hash_hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("SHA1 of 448-bit message", "[sha1]") {
    REQUIRE(SHA1::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")
            == "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST_CASE("SHA1 of pangram", "[sha1]") {
    REQUIRE(SHA1::hash_hex("The quick brown fox jumps over the lazy dog")
            == "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA1 streaming matches one-shot", "[sha1]") {
    std::string input(1000, 'x');
    SHA1 hasher;
    for (size_t i = 0; i < input.size(); i += 37) {
        hasher.update(input.substr(i, 37));
    }
    REQUIRE(SHA1::bytes_to_hex(hasher.finalize()) == SHA1::hash_hex(input));
}

TEST_CASE("SHA1 of one million 'a'", "[sha1]") {
    SHA1 hasher;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.update(chunk);
    }
    REQUIRE(SHA1::bytes_to_hex(hasher.finalize())
            == "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

TEST_CASE("SHA1 hex is 40 lower-case characters", "[sha1]") {
    auto hex = SHA1::hash_hex("os=Linux");
    REQUIRE(hex.size() == 40);
    for (char c : hex) {
        REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }
}
