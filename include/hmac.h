// include/hmac.h
#pragma once
#include "digest.h"

#include <cstddef>
#include <memory>
#include <vector>

#include <openssl/evp.h>

// HMAC (RFC 2104) keyed once and reused for many messages under that key.
// Fixed-size digests use libcrypto's "HMAC" EVP_MAC; reset() re-arms it with
// the stored key. The parameterised BLAKE2b sizes cannot be named through the
// MAC's digest parameter, so for those the ipad/opad-absorbed digest states
// are built here and copied back on reset().
class Hmac {
public:
    Hmac(DigestAlgorithm algo, const unsigned char* key, std::size_t key_len);
    Hmac(DigestAlgorithm algo, const std::vector<unsigned char>& key)
        : Hmac(algo, key.data(), key.size()) {}

    Hmac(const Hmac&) = delete;
    Hmac& operator=(const Hmac&) = delete;

    // back to the freshly keyed state; nothing from an earlier message survives
    void reset();
    void update(const unsigned char* data, std::size_t len);
    // writes size() bytes to out, which must hold at least EVP_MAX_MD_SIZE
    std::size_t final(unsigned char* out);

    std::size_t size() const noexcept { return size_; }
    DigestAlgorithm algorithm() const noexcept { return algo_; }

private:
    struct MacFree { void operator()(EVP_MAC* m) const noexcept { EVP_MAC_free(m); } };
    struct MacCtxFree { void operator()(EVP_MAC_CTX* c) const noexcept { EVP_MAC_CTX_free(c); } };
    struct MdFree { void operator()(EVP_MD* md) const noexcept { EVP_MD_free(md); } };
    struct CtxFree { void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); } };
    using MacPtr = std::unique_ptr<EVP_MAC, MacFree>;
    using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, MacCtxFree>;
    using MdPtr = std::unique_ptr<EVP_MD, MdFree>;
    using CtxPtr = std::unique_ptr<EVP_MD_CTX, CtxFree>;

    DigestAlgorithm algo_;
    std::size_t size_;

    // fixed-size digests
    MacPtr mac_;
    MacCtxPtr mac_ctx_;

    // parameterised BLAKE2b
    MdPtr md_;
    CtxPtr inner_;   // H(K ^ ipad || ...
    CtxPtr outer_;   // H(K ^ opad || ...
    CtxPtr work_;

    void init_mac(const unsigned char* key, std::size_t key_len);
    void init_sized(const unsigned char* key, std::size_t key_len);
    void init_digest(EVP_MD_CTX* ctx) const;
    void finish_digest(EVP_MD_CTX* ctx, unsigned char* out) const;
};
