#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

extern "C" {
typedef struct evp_md_ctx_st EVP_MD_CTX;
}

namespace lob {

struct Sha256Digest {
    std::array<uint8_t, 32> bytes{};

    bool operator==(const Sha256Digest &) const = default;

    /** @brief Lowercase hexadecimal rendering, 64 characters. */
    std::string to_hex() const;
};

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface.
 *
 * Throws std::runtime_error when OpenSSL reports a failure.
 */
class Sha256Context {
public:
    Sha256Context();
    Sha256Context(const Sha256Context &) = delete;
    Sha256Context &operator=(const Sha256Context &) = delete;
    Sha256Context(Sha256Context &&other) noexcept : ctx_(other.ctx_) {
        other.ctx_ = nullptr;
    }
    Sha256Context &operator=(Sha256Context &&) = delete;
    ~Sha256Context();

    void update(std::span<const uint8_t> data);

    void update(std::string_view text) {
        update(std::span{reinterpret_cast<const uint8_t *>(text.data()), text.size()});
    }

    /** @brief Returns the digest and resets the context for reuse. */
    Sha256Digest finalize();

private:
    EVP_MD_CTX *ctx_;
};

Sha256Digest sha256(std::string_view text);

} // namespace lob
