#include "hmac.h"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/params.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void throw_openssl(const std::string& what) {
    std::string msg = "HMAC: " + what;
    const unsigned long code = ERR_get_error();
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += " (";
        msg += buf;
        msg += ")";
    }
    ERR_clear_error();
    throw std::runtime_error(msg);
}

// EVP_MAC_init() treats a null key as "reuse the current one", which an
// unkeyed context does not have; an empty key must still be a real pointer.
const unsigned char kEmptyKey[1] = {0};

} // namespace

Hmac::Hmac(DigestAlgorithm algo, const unsigned char* key, std::size_t key_len)
    : algo_(digest_info(algo).algo),
      size_(digest_info(algo).size)
{
    if (key == nullptr) {
        key = kEmptyKey;
        key_len = 0;
    }
    if (digest_info(algo_).sized) init_sized(key, key_len);
    else init_mac(key, key_len);
}

void Hmac::init_mac(const unsigned char* key, std::size_t key_len) {
    const DigestInfo& info = digest_info(algo_);
    mac_.reset(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr));
    if (!mac_) throw_openssl("HMAC unavailable");
    mac_ctx_.reset(EVP_MAC_CTX_new(mac_.get()));
    if (!mac_ctx_) throw_openssl("out of memory");

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST,
                                                 const_cast<char*>(info.openssl_name), 0);
    params[1] = OSSL_PARAM_construct_end();
    if (EVP_MAC_init(mac_ctx_.get(), key, key_len, params) != 1) {
        throw_openssl(std::string("HMAC-") + info.name + " unavailable");
    }
    if (EVP_MAC_CTX_get_mac_size(mac_ctx_.get()) != size_) {
        throw std::runtime_error(std::string("HMAC: unexpected output size for ") + info.name);
    }
}

void Hmac::init_sized(const unsigned char* key, std::size_t key_len) {
    const DigestInfo& info = digest_info(algo_);
    md_.reset(EVP_MD_fetch(nullptr, info.openssl_name, nullptr));
    inner_.reset(EVP_MD_CTX_new());
    outer_.reset(EVP_MD_CTX_new());
    work_.reset(EVP_MD_CTX_new());
    if (!md_) throw_openssl(std::string("digest ") + info.name + " unavailable");
    if (!inner_ || !outer_ || !work_) throw_openssl("out of memory");

    const int block = EVP_MD_get_block_size(md_.get());
    if (block <= 0) throw_openssl(std::string("digest ") + info.name + " has no block size");
    const std::size_t block_size = static_cast<std::size_t>(block);

    std::vector<unsigned char> k(block_size, 0);
    if (key_len > block_size) {
        // long keys are replaced by H(key)
        init_digest(work_.get());
        if (EVP_DigestUpdate(work_.get(), key, key_len) != 1) throw_openssl("key digest failed");
        std::vector<unsigned char> hashed(EVP_MAX_MD_SIZE);
        finish_digest(work_.get(), hashed.data());
        std::copy(hashed.begin(), hashed.begin() + static_cast<std::ptrdiff_t>(size_), k.begin());
        OPENSSL_cleanse(hashed.data(), hashed.size());
    } else if (key_len > 0) {
        std::copy(key, key + key_len, k.begin());
    }

    std::vector<unsigned char> pad(block_size);
    for (std::size_t i = 0; i < block_size; ++i) pad[i] = k[i] ^ 0x36;
    init_digest(inner_.get());
    if (EVP_DigestUpdate(inner_.get(), pad.data(), pad.size()) != 1) throw_openssl("ipad absorb failed");

    for (std::size_t i = 0; i < block_size; ++i) pad[i] = k[i] ^ 0x5c;
    init_digest(outer_.get());
    if (EVP_DigestUpdate(outer_.get(), pad.data(), pad.size()) != 1) throw_openssl("opad absorb failed");

    OPENSSL_cleanse(pad.data(), pad.size());
    OPENSSL_cleanse(k.data(), k.size());

    reset();
    // a libcrypto without variable-length BLAKE2b shows up only at final()
    unsigned char scratch[EVP_MAX_MD_SIZE];
    final(scratch);
    OPENSSL_cleanse(scratch, sizeof(scratch));
}

void Hmac::init_digest(EVP_MD_CTX* ctx) const {
    std::size_t outlen = size_;
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_size_t(OSSL_DIGEST_PARAM_SIZE, &outlen);
    params[1] = OSSL_PARAM_construct_end();
    if (EVP_DigestInit_ex2(ctx, md_.get(), params) != 1) {
        throw_openssl(std::string("digest ") + digest_info(algo_).name + " not supported by this libcrypto");
    }
}

void Hmac::finish_digest(EVP_MD_CTX* ctx, unsigned char* out) const {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out, &len) != 1) throw_openssl("digest final failed");
    // libcrypto before 3.2 ignores the BLAKE2b length parameter
    if (len != size_) {
        throw std::runtime_error(std::string("HMAC: digest ") + digest_info(algo_).name +
                                 " produced " + std::to_string(len) + " bytes, expected " +
                                 std::to_string(size_));
    }
}

void Hmac::reset() {
    if (mac_ctx_) {
        if (EVP_MAC_init(mac_ctx_.get(), nullptr, 0, nullptr) != 1) throw_openssl("re-init failed");
        return;
    }
    if (EVP_MD_CTX_copy_ex(work_.get(), inner_.get()) != 1) throw_openssl("state copy failed");
}

void Hmac::update(const unsigned char* data, std::size_t len) {
    if (mac_ctx_) {
        if (EVP_MAC_update(mac_ctx_.get(), data, len) != 1) throw_openssl("update failed");
        return;
    }
    if (EVP_DigestUpdate(work_.get(), data, len) != 1) throw_openssl("update failed");
}

std::size_t Hmac::final(unsigned char* out) {
    if (mac_ctx_) {
        std::size_t len = 0;
        if (EVP_MAC_final(mac_ctx_.get(), out, &len, EVP_MAX_MD_SIZE) != 1) throw_openssl("final failed");
        if (len != size_) throw std::runtime_error("HMAC: short MAC output");
    } else {
        unsigned char inner_hash[EVP_MAX_MD_SIZE];
        finish_digest(work_.get(), inner_hash);

        if (EVP_MD_CTX_copy_ex(work_.get(), outer_.get()) != 1) throw_openssl("state copy failed");
        if (EVP_DigestUpdate(work_.get(), inner_hash, size_) != 1) throw_openssl("update failed");
        OPENSSL_cleanse(inner_hash, sizeof(inner_hash));
        finish_digest(work_.get(), out);
    }

    // ready for the next message
    reset();
    return size_;
}
