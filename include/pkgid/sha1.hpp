#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace pkgid {

// SHA-1 (FIPS 180-4). Package IDs are the lower-case hex of this digest.
class SHA1 {
public:
    static constexpr size_t DIGEST_SIZE = 20;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    SHA1();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object should not be reused after this call.
    Digest finalize();

    static std::string hash_hex(const std::string& input);
    static std::string bytes_to_hex(const Digest& bytes);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 5> state_;
    uint64_t total_bytes_;
    uint8_t  buffer_[64];
    size_t   buffer_len_;
};

} // namespace pkgid
