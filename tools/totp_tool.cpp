// tools/totp_tool.cpp
#include "config.h"
#include "logger.h"
#include "totp.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

int usage() {
    std::cerr << "usage: totp_tool <config.json> generate [unix_seconds]\n"
                 "       totp_tool <config.json> validate <code> [unix_seconds]\n";
    return 2;
}

std::optional<std::int64_t> parse_time(const std::string& s) {
    try {
        std::size_t used = 0;
        const long long v = std::stoll(s, &used);
        if (used != s.size()) return std::nullopt;
        return static_cast<std::int64_t>(v);
    } catch (const std::logic_error&) { // invalid_argument / out_of_range
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) return usage();

    Logger log("totp_tool");
    try {
        const Config cfg = Config::load_from_file(argv[1]);
        log.set_level(cfg.log_level());

        const TOTP totp(cfg.totp(), &log, cfg.policy());
        const std::string cmd = argv[2];

        if (cmd == "generate" && argc <= 4) {
            if (argc == 4) {
                auto t = parse_time(argv[3]);
                if (!t) return usage();
                std::cout << totp.generate_for_time(*t) << "\n";
            } else {
                std::cout << totp.generate() << "\n";
            }
            return 0;
        }

        if (cmd == "validate" && (argc == 4 || argc == 5)) {
            const std::string code = argv[3];
            TOTP::Verdict v;
            if (argc == 5) {
                auto t = parse_time(argv[4]);
                if (!t) return usage();
                v = totp.check_for_time(code, *t);
            } else {
                const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
                v = totp.check_for_time(code, now);
            }
            if (v == TOTP::Verdict::BadFormat) log.warn("code rejected: wrong length or non-digit characters");
            std::cout << (v == TOTP::Verdict::Valid ? "valid" : "invalid") << "\n";
            return v == TOTP::Verdict::Valid ? 0 : 1;
        }
        return usage();
    } catch (const std::exception& e) {
        log.error(e.what());
        return 2;
    }
}
