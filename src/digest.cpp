#include "digest.h"
#include "hmac.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace {

// Strategy table, indexed by DigestAlgorithm.
const std::array<DigestInfo, 14> kDigests = {{
    {DigestAlgorithm::SHA1,        "SHA1",        "SHA1",        20, false},
    {DigestAlgorithm::SHA224,      "SHA224",      "SHA2-224",    28, false},
    {DigestAlgorithm::SHA256,      "SHA256",      "SHA2-256",    32, false},
    {DigestAlgorithm::SHA384,      "SHA384",      "SHA2-384",    48, false},
    {DigestAlgorithm::SHA512,      "SHA512",      "SHA2-512",    64, false},
    {DigestAlgorithm::SHA3_224,    "SHA3-224",    "SHA3-224",    28, false},
    {DigestAlgorithm::SHA3_256,    "SHA3-256",    "SHA3-256",    32, false},
    {DigestAlgorithm::SHA3_384,    "SHA3-384",    "SHA3-384",    48, false},
    {DigestAlgorithm::SHA3_512,    "SHA3-512",    "SHA3-512",    64, false},
    {DigestAlgorithm::BLAKE2S_256, "BLAKE2s-256", "BLAKE2S-256", 32, false},
    {DigestAlgorithm::BLAKE2B_256, "BLAKE2b-256", "BLAKE2B-512", 32, true},
    {DigestAlgorithm::BLAKE2B_384, "BLAKE2b-384", "BLAKE2B-512", 48, true},
    {DigestAlgorithm::BLAKE2B_512, "BLAKE2b-512", "BLAKE2B-512", 64, false},
    {DigestAlgorithm::MD5,         "MD5",         "MD5",         16, false},
}};

// upper-case, separators dropped: "sha3-256" -> "SHA3256"
std::string squash(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

bool is_supported(int algo_id) noexcept {
    return algo_id >= static_cast<int>(DigestAlgorithm::SHA1) &&
           algo_id <= static_cast<int>(DigestAlgorithm::MD5);
}

bool is_supported(DigestAlgorithm algo) noexcept {
    return is_supported(static_cast<int>(algo));
}

const DigestInfo& digest_info(DigestAlgorithm algo) noexcept {
    if (!is_supported(algo)) return kDigests[0];
    return kDigests[static_cast<std::size_t>(algo)];
}

const char* digest_name(DigestAlgorithm algo) noexcept {
    return digest_info(algo).name;
}

std::size_t digest_size(DigestAlgorithm algo) noexcept {
    return digest_info(algo).size;
}

std::optional<DigestAlgorithm> parse_digest_algorithm(const std::string& name) {
    const std::string key = squash(name);
    if (key.empty()) return std::nullopt;
    for (const auto& d : kDigests) {
        if (squash(d.name) == key) return d.algo;
    }
    // common aliases
    if (key == "SHA2224") return DigestAlgorithm::SHA224;
    if (key == "SHA2256") return DigestAlgorithm::SHA256;
    if (key == "SHA2384") return DigestAlgorithm::SHA384;
    if (key == "SHA2512") return DigestAlgorithm::SHA512;
    if (key == "BLAKE2S") return DigestAlgorithm::BLAKE2S_256;
    if (key == "BLAKE2B") return DigestAlgorithm::BLAKE2B_512;
    return std::nullopt;
}

bool digest_available(DigestAlgorithm algo) noexcept {
    try {
        Hmac trial(algo, nullptr, 0);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
