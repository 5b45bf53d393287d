#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace verity::crypto {

using Sha256Digest = std::array<uint8_t, 32>;

/**
 * @brief Incremental SHA-256 over the OpenSSL EVP interface.
 *
 * Used for document and passage checksums (dedup on re-ingest) and to seed the hash embedder.
 * OpenSSL failures throw std::runtime_error.
 */
class Sha256Hasher {
public:
    Sha256Hasher();

    Sha256Hasher(Sha256Hasher&&) noexcept = default;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept = default;

    // Discard buffered input and start a new digest
    void reset();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);

    // Finish the digest; the hasher is reset afterwards
    Sha256Digest finish();
    std::string finishHex();

    static Sha256Digest digest(std::string_view text);
    static std::string hex(std::string_view text);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

std::string toHex(std::span<const uint8_t> bytes);

} // namespace verity::crypto
