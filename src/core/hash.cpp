#include "fmp/core/hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <iomanip>
#include <new>
#include <sstream>
#include <stdexcept>

namespace fmp::crypto {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw std::bad_alloc();
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed for sha256");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    EVP_DigestUpdate(ctx_, data, len);
}

Sha256Digest Sha256::finish() {
    Sha256Digest digest{};
    unsigned int out_len = 0;
    EVP_DigestFinal_ex(ctx_, digest.data(), &out_len);
    return digest;
}

std::string Sha256::finish_hex() {
    return to_hex(finish());
}

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

Sha256Digest sha256(const void* data, std::size_t len) {
    Sha256 hasher;
    hasher.update(data, len);
    return hasher.finish();
}

std::string sha256_hex(const void* data, std::size_t len) {
    return to_hex(sha256(data, len));
}

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& data) {
    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         out.data(), &out_len);
    out.resize(out_len);
    return out;
}

std::vector<std::uint8_t> hex_decode(const std::string& hex) {
    std::vector<std::uint8_t> bytes;
    if (hex.size() % 2 != 0) {
        return bytes;
    }
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const auto hi = hex[i];
        const auto lo = hex[i + 1];
        if (!std::isxdigit(static_cast<unsigned char>(hi)) || !std::isxdigit(static_cast<unsigned char>(lo))) {
            bytes.clear();
            return bytes;
        }
        bytes.push_back(static_cast<std::uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

std::string base64_encode(const std::uint8_t* data, std::size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::vector<std::uint8_t> base64_decode(const std::string& text) {
    std::vector<std::uint8_t> out;
    if (text.empty() || text.size() % 4 != 0) {
        return out;
    }
    out.resize(3 * (text.size() / 4));
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        out.clear();
        return out;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        ++padding;
    }
    if (text[text.size() - 2] == '=') {
        ++padding;
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

} // namespace fmp::crypto
