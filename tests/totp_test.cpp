#include "totp.h"
#include "base32.h"
#include "logger.h"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

const std::string kSecSha1   = base32_encode("12345678901234567890");
const std::string kSecSha256 = base32_encode("12345678901234567890123456789012");
const std::string kSecSha512 =
    base32_encode("1234567890123456789012345678901234567890123456789012345678901234");

struct Vector {
    std::int64_t ts;
    const char* code;
    DigestAlgorithm algo;
    const std::string* secret;
};

// RFC 6238 appendix B
const std::vector<Vector> kRfcMatrix = {
    {59,          "94287082", DigestAlgorithm::SHA1,   &kSecSha1},
    {59,          "46119246", DigestAlgorithm::SHA256, &kSecSha256},
    {59,          "90693936", DigestAlgorithm::SHA512, &kSecSha512},
    {1111111109,  "07081804", DigestAlgorithm::SHA1,   &kSecSha1},
    {1111111109,  "68084774", DigestAlgorithm::SHA256, &kSecSha256},
    {1111111109,  "25091201", DigestAlgorithm::SHA512, &kSecSha512},
    {1111111111,  "14050471", DigestAlgorithm::SHA1,   &kSecSha1},
    {1111111111,  "67062674", DigestAlgorithm::SHA256, &kSecSha256},
    {1111111111,  "99943326", DigestAlgorithm::SHA512, &kSecSha512},
    {1234567890,  "89005924", DigestAlgorithm::SHA1,   &kSecSha1},
    {1234567890,  "91819424", DigestAlgorithm::SHA256, &kSecSha256},
    {1234567890,  "93441116", DigestAlgorithm::SHA512, &kSecSha512},
    {2000000000,  "69279037", DigestAlgorithm::SHA1,   &kSecSha1},
    {2000000000,  "90698825", DigestAlgorithm::SHA256, &kSecSha256},
    {2000000000,  "38618901", DigestAlgorithm::SHA512, &kSecSha512},
    {20000000000, "65353130", DigestAlgorithm::SHA1,   &kSecSha1},
    {20000000000, "77737706", DigestAlgorithm::SHA256, &kSecSha256},
    {20000000000, "47863826", DigestAlgorithm::SHA512, &kSecSha512},
};

// Same construction with the 20-byte seed over the remaining digests,
// cross-checked against an independent HMAC implementation.
const std::vector<Vector> kOtherDigests = {
    {59,         "45812810", DigestAlgorithm::SHA224,      &kSecSha1},
    {2000000000, "44789403", DigestAlgorithm::SHA224,      &kSecSha1},
    {59,         "46080675", DigestAlgorithm::SHA384,      &kSecSha1},
    {59,         "56587200", DigestAlgorithm::SHA3_224,    &kSecSha1},
    {59,         "09902588", DigestAlgorithm::SHA3_256,    &kSecSha1},
    {1111111109, "71160356", DigestAlgorithm::SHA3_256,    &kSecSha1},
    {59,         "52687604", DigestAlgorithm::SHA3_384,    &kSecSha1},
    {2000000000, "07158742", DigestAlgorithm::SHA3_512,    &kSecSha1},
    {59,         "46899568", DigestAlgorithm::BLAKE2S_256, &kSecSha1},
    {59,         "10409498", DigestAlgorithm::BLAKE2B_512, &kSecSha1},
    {59,         "78532013", DigestAlgorithm::MD5,         &kSecSha1},
    {2000000000, "35090484", DigestAlgorithm::MD5,         &kSecSha1},
};

const std::int64_t kClockMaxSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()).count();

TOTPConfig rfc_config(DigestAlgorithm algo, const std::string& secret, std::int64_t skew = 0) {
    TOTPConfig cfg;
    cfg.secret = secret;
    cfg.digits = 8;
    cfg.period = 30;
    cfg.skew = skew;
    cfg.algorithm = algo;
    return cfg;
}

void test_rfc_matrix() {
    for (const auto& v : kRfcMatrix) {
        TOTP totp(rfc_config(v.algo, *v.secret));
        const std::string code = totp.generate_for_time(v.ts);
        if (code != v.code) {
            std::cerr << "expected " << v.code << " got " << code << " at " << v.ts << "\n";
        }
        assert(code == v.code);
        assert(totp.validate_for_time(v.code, v.ts));
        assert(totp.check_for_time(v.code, v.ts) == TOTP::Verdict::Valid);

        // time_point overload agrees with raw seconds where system_clock can
        // hold the instant (year 2603 overflows nanosecond ticks)
        if (v.ts <= kClockMaxSeconds) {
            const auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(v.ts));
            assert(totp.generate_for_time(tp) == code);
            assert(totp.validate_for_time(v.code, tp));
        }
    }
}

void test_other_digests() {
    for (const auto& v : kOtherDigests) {
        TOTP totp(rfc_config(v.algo, *v.secret));
        assert(totp.generate_for_time(v.ts) == v.code);
        assert(totp.validate_for_time(v.code, v.ts));
    }
}

void test_skew() {
    TOTP one(rfc_config(DigestAlgorithm::SHA1, kSecSha1, 1));
    assert(one.validate_for_time("94287082", 29));   // one step early
    assert(one.validate_for_time("94287082", 59));
    assert(one.validate_for_time("94287082", 61));   // one step late
    assert(!one.validate_for_time("94287082", 91));  // two steps away
    assert(one.check_for_time("94287082", 91) == TOTP::Verdict::Mismatch);

    TOTP none(rfc_config(DigestAlgorithm::SHA1, kSecSha1, 0));
    assert(!none.validate_for_time("94287082", 29));
    assert(none.validate_for_time("94287082", 30));
    assert(!none.validate_for_time("94287082", 60));

    TOTP wide(rfc_config(DigestAlgorithm::SHA1, kSecSha1, 3));
    assert(wide.validate_for_time("94287082", 59 + 3 * 30));
    assert(!wide.validate_for_time("94287082", 59 + 4 * 30));
}

void test_window_at_int64_limits() {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    const std::int64_t min = std::numeric_limits<std::int64_t>::min();

    TOTPConfig cfg = rfc_config(DigestAlgorithm::SHA1, kSecSha1, 2);
    cfg.period = 1;
    TOTP totp(cfg);

    // the skew window stops at the ends of the counter range
    assert(totp.validate_for_time(totp.generate_for_step(max), max));
    assert(totp.validate_for_time(totp.generate_for_step(max - 2), max));
    assert(totp.validate_for_time(totp.generate_for_step(min), min));
    assert(totp.validate_for_time(totp.generate_for_step(min + 2), min));
    assert(!totp.validate_for_time(totp.generate_for_step(0), max));
}

void test_time_point_before_epoch() {
    TOTPConfig cfg = rfc_config(DigestAlgorithm::SHA1, kSecSha1);
    cfg.period = 1;
    TOTP totp(cfg);

    // -1.5 s lies in second -2, not -1
    const auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(-1500));
    assert(totp.generate_for_time(tp) == totp.generate_for_step(-2));
    assert(totp.generate_for_time(tp) == totp.generate_for_time(std::int64_t{-2}));
    assert(totp.validate_for_time(totp.generate_for_step(-2), tp));

    const auto after = std::chrono::system_clock::time_point(std::chrono::milliseconds(1500));
    assert(totp.generate_for_time(after) == totp.generate_for_step(1));
}

void test_format_rejection() {
    TOTP totp(rfc_config(DigestAlgorithm::SHA1, kSecSha1, 5));
    const std::vector<std::string> bad = {
        "", "9428708", "942870820", "9428708a", " 4287082", "94287082\n",
        "-4287082", "+4287082", "9428.082", "\xd9\xa0" "428708",
    };
    for (const auto& code : bad) {
        assert(!totp.validate_for_time(code, 59));
        assert(totp.check_for_time(code, 59) == TOTP::Verdict::BadFormat);
    }
    // right shape, wrong value
    assert(totp.check_for_time("00000000", 59) == TOTP::Verdict::Mismatch);
}

void test_digits_and_padding() {
    TOTPConfig cfg = rfc_config(DigestAlgorithm::SHA1, kSecSha1);

    cfg.digits = 6;
    TOTP six(cfg);
    assert(six.modulus() == 1000000u);
    assert(six.generate_for_time(59) == "287082");
    assert(six.generate_for_time(1111111109) == "081804");  // leading zero kept
    assert(six.validate_for_time("081804", 1111111109));
    assert(!six.validate_for_time("81804", 1111111109));

    cfg.digits = 5;
    assert(TOTP(cfg).generate_for_time(59) == "87082");
    cfg.digits = 4;
    assert(TOTP(cfg).generate_for_time(59) == "7082");

    // every code has exactly `digits` characters
    for (int d : {4, 5, 6, 8}) {
        cfg.digits = d;
        TOTP totp(cfg);
        for (std::int64_t step = 0; step < 300; ++step) {
            const std::string code = totp.generate_for_step(step);
            assert(code.size() == static_cast<std::size_t>(d));
            for (char c : code) assert(c >= '0' && c <= '9');
        }
    }
}

void test_determinism() {
    TOTP a(rfc_config(DigestAlgorithm::SHA256, kSecSha256));
    TOTP b(rfc_config(DigestAlgorithm::SHA256, kSecSha256));
    for (std::int64_t t = 0; t < 100000; t += 997) {
        const std::string first = a.generate_for_time(t);
        assert(a.generate_for_time(t) == first);
        assert(b.generate_for_time(t) == first);
    }
    // every instant of a step maps to the same code
    assert(a.generate_for_time(30) == a.generate_for_time(59));
    assert(a.time_step(59) == 1);
    assert(a.generate_for_step(1) == a.generate_for_time(59));
}

void test_md5_short_digest() {
    TOTPConfig cfg = rfc_config(DigestAlgorithm::MD5, kSecSha1);
    cfg.digits = 6;
    TOTP totp(cfg);
    // steps 0 and 2 have truncation offsets past the 16-byte digest
    assert(totp.generate_for_step(0) == "237350");
    assert(totp.generate_for_step(2) == "406228");
    for (std::int64_t step = 0; step < 500; ++step) {
        assert(totp.generate_for_step(step).size() == 6);
    }
}

void test_construction() {
    // defaults: SHA-1, 6 digits, 30 s, skew 1, empty key
    TOTP def;
    assert(def.config() == TOTPConfig::defaults());
    assert(def.generate().size() == 6);
    assert(def.validate(def.generate()) || def.validate(def.generate()));  // may straddle a step

    // invalid Base32 is fatal
    for (const std::string secret : {"not base32!", "gezdgnbvgy3tqojq", "JBSWY3DPEHPK3PX"}) {
        TOTPConfig cfg;
        cfg.secret = secret;
        bool threw = false;
        try {
            TOTP bad(cfg);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // out-of-range fields are normalized, not rejected
    TOTPConfig odd = rfc_config(DigestAlgorithm::SHA1, kSecSha1);
    odd.digits = 7;
    odd.period = 0;
    odd.skew = -5;
    odd.algorithm = static_cast<DigestAlgorithm>(42);
    TOTP normalized(odd);
    assert(normalized.config().digits == 6);
    assert(normalized.config().period == 30);
    assert(normalized.config().skew == 1);
    assert(normalized.config().algorithm == DigestAlgorithm::SHA1);
    assert(normalized.generate_for_time(59) == "287082");

    // ... unless asked to be strict
    bool threw = false;
    try {
        TOTP strict(odd, nullptr, ConfigPolicy::Strict);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void test_logging() {
    std::ostringstream sink;
    Logger log("totp_test", sink);
    log.set_level(LogLevel::TRACE);

    TOTPConfig cfg = rfc_config(DigestAlgorithm::SHA1, kSecSha1);
    cfg.skew = -1;
    TOTP totp(cfg, &log);
    assert(totp.generate_for_time(59) == "94287082");

    const std::string out = sink.str();
    assert(out.find("engine ready") != std::string::npos);
    assert(out.find("skew -1") != std::string::npos);
    assert(out.find(kSecSha1) == std::string::npos);      // key material stays out of logs
    assert(out.find("94287082") == std::string::npos);    // and so do codes

    std::ostringstream sink2;
    Logger log2("totp_test", sink2);
    TOTPConfig bad;
    bad.secret = "***";
    try {
        TOTP broken(bad, &log2);
        assert(false);
    } catch (const std::runtime_error&) {
    }
    assert(sink2.str().find("[ERROR]") != std::string::npos);
}

void test_concurrent_use() {
    const TOTP totp(rfc_config(DigestAlgorithm::SHA1, kSecSha1, 1));
    const int threads = 8;
    const int rounds = 500;
    std::vector<int> failures(threads, 0);

    std::vector<std::thread> th;
    for (int t = 0; t < threads; ++t) {
        th.emplace_back([&, t] {
            for (int i = 0; i < rounds; ++i) {
                const auto& v = kRfcMatrix[static_cast<std::size_t>((i + t) % 6) * 3];
                if (totp.generate_for_time(v.ts) != v.code) ++failures[t];
                if (!totp.validate_for_time(v.code, v.ts + 30)) ++failures[t];
            }
        });
    }
    for (auto& x : th) x.join();

    for (int f : failures) assert(f == 0);
    // grows on demand, bounded by the number of simultaneous callers
    assert(totp.pool_size() >= 1);
    assert(totp.pool_size() <= static_cast<std::size_t>(threads) + 1);
}

} // namespace

int main() {
    try {
        test_rfc_matrix();
        test_other_digests();
        test_skew();
        test_window_at_int64_limits();
        test_time_point_before_epoch();
        test_format_rejection();
        test_digits_and_padding();
        test_determinism();
        test_md5_short_digest();
        test_construction();
        test_logging();
        test_concurrent_use();
    } catch (const std::exception& e) {
        std::cerr << "totp_test exception: " << e.what() << "\n";
        return 2;
    }
    std::cout << "TOTP test passed.\n";
    return 0;
}
