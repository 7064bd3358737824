#include "totp_config.h"
#include "logger.h"

#include <stdexcept>
#include <string>
#include <vector>

bool valid_digits(int digits) noexcept {
    return digits == 4 || digits == 5 || digits == 6 || digits == 8;
}

TOTPConfig resolve_config() {
    return TOTPConfig::defaults();
}

TOTPConfig resolve_config(const TOTPConfig& in, ConfigPolicy policy, Logger* log) {
    const TOTPConfig def = TOTPConfig::defaults();
    TOTPConfig cfg = in;
    std::vector<std::string> problems;

    if (!is_supported(cfg.algorithm)) {
        problems.push_back("algorithm id " + std::to_string(static_cast<int>(cfg.algorithm)) +
                           " is not supported");
        cfg.algorithm = def.algorithm;
    }
    if (!valid_digits(cfg.digits)) {
        problems.push_back("digits " + std::to_string(cfg.digits) + " not in {4,5,6,8}");
        cfg.digits = def.digits;
    }
    if (cfg.period <= 0) {
        problems.push_back("period " + std::to_string(cfg.period) + " must be positive");
        cfg.period = def.period;
    }
    if (cfg.skew < 0) {
        problems.push_back("skew " + std::to_string(cfg.skew) + " must not be negative");
        cfg.skew = def.skew;
    }

    if (problems.empty()) return cfg;

    if (policy == ConfigPolicy::Strict) {
        std::string msg = "TOTP config: ";
        for (std::size_t i = 0; i < problems.size(); ++i) {
            if (i) msg += "; ";
            msg += problems[i];
        }
        throw std::invalid_argument(msg);
    }

    if (log) {
        for (const auto& p : problems) log->debug_fmt("config normalized: ", p, ", using default");
    }
    return cfg;
}
