#include "totp.h"
#include "base32.h"
#include "logger.h"

#include <openssl/crypto.h>

#include <limits>
#include <stdexcept>

namespace {

std::uint32_t power_of_ten(int digits) {
    std::uint32_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;
    return mod;
}

std::vector<unsigned char> decode_secret(const std::string& secret, Logger* log) {
    try {
        return base32_decode(secret);
    } catch (const std::runtime_error& e) {
        if (log) log->error(std::string("TOTP secret rejected: ") + e.what());
        throw std::runtime_error(std::string("TOTP: failed to decode Base32 secret: ") + e.what());
    }
}

// RFC 4226 section 5.3. The offset nibble can point past the end of digests
// shorter than 19 bytes (MD5); it is then folded back into range, which no
// other implementation does (see digest.h).
std::uint32_t dynamic_truncate(const unsigned char* mac, std::size_t len) {
    if (len < 4) throw std::logic_error("TOTP: digest shorter than truncation window");
    std::size_t offset = mac[len - 1] & 0x0F;
    const std::size_t max_offset = len - 4;
    if (offset > max_offset) offset %= (max_offset + 1);

    return (static_cast<std::uint32_t>(mac[offset]     & 0x7F) << 24) |
           (static_cast<std::uint32_t>(mac[offset + 1] & 0xFF) << 16) |
           (static_cast<std::uint32_t>(mac[offset + 2] & 0xFF) <<  8) |
           (static_cast<std::uint32_t>(mac[offset + 3] & 0xFF));
}

// window bounds clamp at the ends of the int64 range; b >= 0
std::int64_t saturating_add(std::int64_t a, std::int64_t b) {
    return a > std::numeric_limits<std::int64_t>::max() - b ? std::numeric_limits<std::int64_t>::max() : a + b;
}

std::int64_t saturating_sub(std::int64_t a, std::int64_t b) {
    return a < std::numeric_limits<std::int64_t>::min() + b ? std::numeric_limits<std::int64_t>::min() : a - b;
}

} // namespace

const char* to_string(TOTP::Verdict v) noexcept {
    switch (v) {
        case TOTP::Verdict::Valid:     return "valid";
        case TOTP::Verdict::Mismatch:  return "mismatch";
        case TOTP::Verdict::BadFormat: return "bad-format";
    }
    return "?";
}

TOTP::TOTP() : TOTP(TOTPConfig::defaults()) {}

TOTP::TOTP(const TOTPConfig& cfg, Logger* log, ConfigPolicy policy)
    : cfg_(resolve_config(cfg, policy, log)),
      key_(decode_secret(cfg_.secret, log)),
      modulus_(power_of_ten(cfg_.digits)),
      log_(log),
      pool_([this] {
          if (log_) log_->trace("TOTP scratch pool: new HMAC state");
          return std::make_unique<Scratch>(cfg_.algorithm, key_);
      }, 1)
{
    if (log_) {
        log_->debug_fmt("TOTP engine ready: algorithm=", digest_name(cfg_.algorithm),
                        " digits=", cfg_.digits, " period=", cfg_.period,
                        "s skew=", cfg_.skew, " key_bytes=", key_.size());
    }
}

TOTP::~TOTP() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

std::int64_t TOTP::unix_seconds(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    // whole seconds rounded down, also before the epoch
    return floor<seconds>(tp.time_since_epoch()).count();
}

std::string TOTP::generate_for_step(std::int64_t step) const {
    auto scratch = pool_.acquire();

    // counter as 8 bytes, big-endian two's complement
    std::uint64_t c = static_cast<std::uint64_t>(step);
    for (int i = 7; i >= 0; --i) {
        scratch->counter[static_cast<std::size_t>(i)] = static_cast<unsigned char>(c & 0xFF);
        c >>= 8;
    }

    scratch->mac.reset();
    scratch->mac.update(scratch->counter.data(), scratch->counter.size());
    const std::size_t len = scratch->mac.final(scratch->digest.data());

    std::uint32_t code = dynamic_truncate(scratch->digest.data(), len) % modulus_;
    OPENSSL_cleanse(scratch->digest.data(), scratch->digest.size());

    // fixed width, leading zeros kept
    std::string out(static_cast<std::size_t>(cfg_.digits), '0');
    for (std::size_t i = out.size(); i-- > 0;) {
        out[i] = static_cast<char>('0' + code % 10);
        code /= 10;
    }
    return out;
}

std::string TOTP::generate_for_time(std::int64_t unix_seconds) const {
    return generate_for_step(time_step(unix_seconds));
}

std::string TOTP::generate_for_time(std::chrono::system_clock::time_point tp) const {
    return generate_for_time(unix_seconds(tp));
}

std::string TOTP::generate() const {
    return generate_for_time(std::chrono::system_clock::now());
}

bool TOTP::well_formed(const std::string& code) const noexcept {
    if (code.size() != static_cast<std::size_t>(cfg_.digits)) return false;
    for (char ch : code) {
        if (ch < '0' || ch > '9') return false;
    }
    return true;
}

TOTP::Verdict TOTP::check_for_time(const std::string& code, std::int64_t unix_seconds) const {
    if (!well_formed(code)) return Verdict::BadFormat;

    const std::int64_t base = time_step(unix_seconds);
    const std::int64_t first = saturating_sub(base, cfg_.skew);
    const std::int64_t last = saturating_add(base, cfg_.skew);
    for (std::int64_t step = first;; ++step) {
        const std::string expected = generate_for_step(step);
        // no early exit on the first differing digit
        if (CRYPTO_memcmp(expected.data(), code.data(), expected.size()) == 0) {
            return Verdict::Valid;
        }
        if (step == last) break;
    }
    return Verdict::Mismatch;
}

bool TOTP::validate_for_time(const std::string& code, std::int64_t unix_seconds) const {
    return check_for_time(code, unix_seconds) == Verdict::Valid;
}

bool TOTP::validate_for_time(const std::string& code, std::chrono::system_clock::time_point tp) const {
    return validate_for_time(code, unix_seconds(tp));
}

bool TOTP::validate(const std::string& code) const {
    return validate_for_time(code, std::chrono::system_clock::now());
}
