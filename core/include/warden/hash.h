#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace warden::hash {

// Incremental SHA-256 (FIPS 180-4). Used for the audit hash chain.
class Sha256 {
public:
    Sha256();
    void update(const void* data, size_t n);
    void update(const std::string& s) { update(s.data(), s.size()); }
    std::array<uint8_t, 32> finish();

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> buf_{};
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::string sha256_hex(const std::string& s);

// Hex string of `bytes` random bytes from the kernel CSPRNG.
std::string random_hex(size_t bytes);

} // namespace warden::hash
