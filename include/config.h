#pragma once
#include "logger.h"
#include "totp_config.h"

#include <string>

class Config {
public:
    // Load settings from a json file
    static Config load_from_file(const std::string& path);
    // Same, from json text already in memory
    static Config parse(const std::string& json_text);

    // Accessors (read-only)
    const TOTPConfig& totp() const { return totp_; }
    ConfigPolicy policy() const { return policy_; }
    LogLevel log_level() const { return log_level_; }

private:
    // private ctor enforce factory method
    Config() = default;

    TOTPConfig totp_;
    ConfigPolicy policy_ = ConfigPolicy::Permissive;
    LogLevel log_level_ = LogLevel::INFO;
};
