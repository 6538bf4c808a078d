#include "lob/sha256.hpp"

#include <stdexcept>

extern "C" {
#include <openssl/evp.h>
}

namespace lob {

std::string Sha256Digest::to_hex() const {
    static constexpr char HEX_CHARS[] = "0123456789abcdef";
    std::string hex(bytes.size() * 2, '0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        hex[i * 2] = HEX_CHARS[(bytes[i] >> 4) & 0x0F];
        hex[i * 2 + 1] = HEX_CHARS[bytes[i] & 0x0F];
    }
    return hex;
}

Sha256Context::Sha256Context() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr)
        throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256Context::~Sha256Context() {
    if (ctx_ != nullptr)
        EVP_MD_CTX_free(ctx_);
}

void Sha256Context::update(std::span<const uint8_t> data) {
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
}

Sha256Digest Sha256Context::finalize() {
    Sha256Digest digest;
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, digest.bytes.data(), &length) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    if (length != digest.bytes.size())
        throw std::runtime_error("Unexpected SHA-256 digest length");
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex failed");
    return digest;
}

Sha256Digest sha256(std::string_view text) {
    Sha256Context ctx;
    ctx.update(text);
    return ctx.finalize();
}

} // namespace lob
