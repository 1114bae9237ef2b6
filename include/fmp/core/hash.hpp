#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declaration keeps OpenSSL headers out of every includer
struct evp_md_ctx_st;

namespace fmp::crypto {

constexpr std::size_t kSha256Size = 32;

using Sha256Digest = std::array<std::uint8_t, kSha256Size>;

/**
 * @brief Incremental SHA-256 (OpenSSL EVP)
 *
 * Used for chunk digests, for the content hash computed while a local merge
 * streams bytes, and for request signing.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, std::size_t len);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }
    void update(const std::string& data) { update(data.data(), data.size()); }

    // Either finish call ends the computation; further updates are invalid
    Sha256Digest finish();
    std::string finish_hex();

private:
    evp_md_ctx_st* ctx_ = nullptr;
};

std::string to_hex(const std::uint8_t* data, std::size_t len);

inline std::string to_hex(const Sha256Digest& digest) {
    return to_hex(digest.data(), digest.size());
}

Sha256Digest sha256(const void* data, std::size_t len);

std::string sha256_hex(const void* data, std::size_t len);

inline std::string sha256_hex(const std::vector<std::uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

inline std::string sha256_hex(const std::string& data) {
    return sha256_hex(data.data(), data.size());
}

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& data);

std::vector<std::uint8_t> hex_decode(const std::string& hex);

std::string base64_encode(const std::uint8_t* data, std::size_t len);

// Empty on malformed input
std::vector<std::uint8_t> base64_decode(const std::string& text);

} // namespace fmp::crypto
