#include <verity/crypto/hasher.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace verity::crypto {

namespace {
void check(int rc, const char* step) {
    if (rc != 1) {
        throw std::runtime_error(std::string("SHA-256 ") + step + " failed in OpenSSL");
    }
}
} // namespace

void Sha256Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Cannot allocate an OpenSSL digest context");
    }
    reset();
}

void Sha256Hasher::reset() {
    check(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), "init");
}

void Sha256Hasher::update(std::span<const std::byte> data) {
    check(EVP_DigestUpdate(ctx_.get(), data.data(), data.size()), "update");
}

void Sha256Hasher::update(std::string_view text) {
    update(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

Sha256Digest Sha256Hasher::finish() {
    Sha256Digest out{};
    unsigned int written = 0;
    check(EVP_DigestFinal_ex(ctx_.get(), out.data(), &written), "final");
    if (written != out.size()) {
        throw std::runtime_error("SHA-256 produced an unexpected digest length");
    }
    reset();
    return out;
}

std::string Sha256Hasher::finishHex() {
    return toHex(finish());
}

Sha256Digest Sha256Hasher::digest(std::string_view text) {
    Sha256Hasher hasher;
    hasher.update(text);
    return hasher.finish();
}

std::string Sha256Hasher::hex(std::string_view text) {
    return toHex(digest(text));
}

std::string toHex(std::span<const uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(bytes.size() * 2, '0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[2 * i] = kDigits[bytes[i] >> 4];
        out[2 * i + 1] = kDigits[bytes[i] & 0x0f];
    }
    return out;
}

} // namespace verity::crypto
