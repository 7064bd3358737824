// include/totp_config.h
#pragma once
#include "digest.h"

#include <cstdint>
#include <string>

class Logger;

struct TOTPConfig {
    DigestAlgorithm algorithm = DigestAlgorithm::SHA1;
    int digits = 6;                 // 4, 5, 6 or 8
    std::int64_t period = 30;       // seconds per time step
    std::string secret;             // Base32 text, decoded once by the engine
    std::int64_t skew = 1;          // steps tolerated on either side when validating

    static TOTPConfig defaults() { return TOTPConfig{}; }

    bool operator==(const TOTPConfig& o) const {
        return algorithm == o.algorithm && digits == o.digits && period == o.period &&
               secret == o.secret && skew == o.skew;
    }
    bool operator!=(const TOTPConfig& o) const { return !(*this == o); }
};

enum class ConfigPolicy {
    Permissive,   // out-of-domain fields quietly take the default
    Strict,       // out-of-domain fields throw std::invalid_argument
};

bool valid_digits(int digits) noexcept;

// No input: the defaults.
TOTPConfig resolve_config();

// Normalizes algorithm, digits, period and skew. The secret is passed through
// untouched; decoding it is the engine's job. Pure and idempotent.
TOTPConfig resolve_config(const TOTPConfig& in,
                          ConfigPolicy policy = ConfigPolicy::Permissive,
                          Logger* log = nullptr);
