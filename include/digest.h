// include/digest.h
#pragma once
#include <cstddef>
#include <optional>
#include <string>

// Order is part of the configuration format (numeric ids).
//
// MD5's 16-byte output is shorter than RFC 4226 truncation assumes: when the
// offset nibble exceeds 12 it is folded back with offset % 13. That rule is
// local to this library, so MD5 codes are not interoperable with any other
// TOTP implementation. Every other digest here is 20 bytes or longer and
// truncates exactly as the RFC says.
enum class DigestAlgorithm {
    SHA1,
    SHA224,
    SHA256,
    SHA384,
    SHA512,
    SHA3_224,
    SHA3_256,
    SHA3_384,
    SHA3_512,
    BLAKE2S_256,
    BLAKE2B_256,
    BLAKE2B_384,
    BLAKE2B_512,
    MD5,
};

struct DigestInfo {
    DigestAlgorithm algo;
    const char* name;           // display name, e.g. "SHA3-256"
    const char* openssl_name;   // EVP_MD_fetch name
    std::size_t size;           // output bytes
    bool sized;                 // output length passed to the digest as a parameter
};

// True for ids inside the closed set above.
bool is_supported(int algo_id) noexcept;
bool is_supported(DigestAlgorithm algo) noexcept;

// Registry lookup. Ids outside the set resolve to SHA-1.
const DigestInfo& digest_info(DigestAlgorithm algo) noexcept;
const char* digest_name(DigestAlgorithm algo) noexcept;
std::size_t digest_size(DigestAlgorithm algo) noexcept;

// "sha3-256", "SHA3_256", "blake2b256" ...; nullopt if unknown
std::optional<DigestAlgorithm> parse_digest_algorithm(const std::string& name);

// Whether the linked libcrypto can compute this digest (BLAKE2b-256/384 need
// variable-length BLAKE2b support).
bool digest_available(DigestAlgorithm algo) noexcept;
