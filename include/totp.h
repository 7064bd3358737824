#pragma once
#include "hmac.h"
#include "scratch_pool.h"
#include "totp_config.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <openssl/evp.h>

class Logger;

// RFC 6238 time-based one-time passwords on top of RFC 4226 truncation.
// One instance is built per secret and may be shared by any number of threads.
class TOTP {
public:
    enum class Verdict { Valid, Mismatch, BadFormat };

    // defaults, empty secret
    TOTP();
    // Throws std::runtime_error if cfg.secret is not valid Base32.
    explicit TOTP(const TOTPConfig& cfg, Logger* log = nullptr,
                  ConfigPolicy policy = ConfigPolicy::Permissive);
    ~TOTP();

    TOTP(const TOTP&) = delete;
    TOTP& operator=(const TOTP&) = delete;

    std::string generate() const;
    // time_point overloads are limited to what system_clock can hold (about
    // years 1678..2262 with libstdc++'s nanosecond ticks); the int64 overloads
    // take any Unix second.
    std::string generate_for_time(std::chrono::system_clock::time_point tp) const;
    std::string generate_for_time(std::int64_t unix_seconds) const;
    // HOTP value for an explicit counter
    std::string generate_for_step(std::int64_t step) const;

    // false on mismatch and on malformed input alike
    bool validate(const std::string& code) const;
    bool validate_for_time(const std::string& code, std::chrono::system_clock::time_point tp) const;
    bool validate_for_time(const std::string& code, std::int64_t unix_seconds) const;

    Verdict check_for_time(const std::string& code, std::int64_t unix_seconds) const;

    std::int64_t time_step(std::int64_t unix_seconds) const noexcept { return unix_seconds / cfg_.period; }
    const TOTPConfig& config() const noexcept { return cfg_; }
    std::uint32_t modulus() const noexcept { return modulus_; }
    std::size_t pool_size() const noexcept { return pool_.created(); }

private:
    struct Scratch {
        Scratch(DigestAlgorithm algo, const std::vector<unsigned char>& key) : mac(algo, key) {}
        std::array<unsigned char, 8> counter{};
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        Hmac mac;
    };

    TOTPConfig cfg_;
    std::vector<unsigned char> key_;    // decoded once at construction
    std::uint32_t modulus_;             // 10^digits
    Logger* log_;
    mutable ScratchPool<Scratch> pool_;

    bool well_formed(const std::string& code) const noexcept;
    static std::int64_t unix_seconds(std::chrono::system_clock::time_point tp);
};

const char* to_string(TOTP::Verdict v) noexcept;
