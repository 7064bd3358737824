#include "config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

Config Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Config file not found: " + path);
    }
    std::ostringstream text;
    text << in.rdbuf();

    try {
        return parse(text.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

Config Config::parse(const std::string& json_text) {
    Config cfg;
    try {
        const json j = json::parse(json_text);

        if (j.contains("log_level")) {
            const auto name = j.at("log_level").get<std::string>();
            auto lvl = parse_log_level(name);
            if (!lvl) throw std::runtime_error("unknown log_level '" + name + "'");
            cfg.log_level_ = *lvl;
        }

        const json& t = j.at("totp");
        cfg.totp_.secret = t.at("secret").get<std::string>();

        if (t.contains("algorithm")) {
            const json& a = t.at("algorithm");
            if (a.is_number_integer()) {
                // numeric ids are range-checked by the resolver
                cfg.totp_.algorithm = static_cast<DigestAlgorithm>(a.get<int>());
            } else {
                const auto name = a.get<std::string>();
                auto algo = parse_digest_algorithm(name);
                if (!algo) throw std::runtime_error("unknown algorithm '" + name + "'");
                cfg.totp_.algorithm = *algo;
            }
        }
        if (t.contains("digits")) cfg.totp_.digits = t.at("digits").get<int>();
        if (t.contains("period")) cfg.totp_.period = t.at("period").get<std::int64_t>();
        if (t.contains("skew"))   cfg.totp_.skew   = t.at("skew").get<std::int64_t>();
        if (t.contains("strict") && t.at("strict").get<bool>()) {
            cfg.policy_ = ConfigPolicy::Strict;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Config: ") + e.what());
    }
    return cfg;
}
