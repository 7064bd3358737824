#include "base32.h"

#include <cstdint>
#include <stdexcept>

namespace {

constexpr const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int b32_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return 26 + (c - '2');
    return -1;
}

[[noreturn]] void fail(const std::string& what, std::size_t pos) {
    throw std::runtime_error("base32: " + what + " at position " + std::to_string(pos));
}

} // namespace

std::vector<unsigned char> base32_decode(const std::string& text) {
    // Line breaks are tolerated anywhere; positions in errors refer to the raw input.
    std::string in;
    std::vector<std::size_t> pos;
    in.reserve(text.size());
    pos.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' || text[i] == '\n') continue;
        in.push_back(text[i]);
        pos.push_back(i);
    }

    std::vector<unsigned char> out;
    if (in.empty()) return out;
    if (in.size() % 8 != 0) {
        fail("input length is not a multiple of 8", text.size());
    }
    out.reserve(in.size() / 8 * 5);

    for (std::size_t q = 0; q < in.size(); q += 8) {
        const bool last_quantum = (q + 8 == in.size());

        // count data characters before the first '=' in this quantum
        std::size_t data = 0;
        while (data < 8 && in[q + data] != '=') ++data;
        for (std::size_t i = data; i < 8; ++i) {
            if (in[q + i] != '=') fail("unexpected data after padding", pos[q + i]);
        }
        if (data < 8 && !last_quantum) fail("padding before end of input", pos[q + data]);

        std::size_t bytes = 0;
        switch (data) {
            case 8: bytes = 5; break;
            case 7: bytes = 4; break;
            case 5: bytes = 3; break;
            case 4: bytes = 2; break;
            case 2: bytes = 1; break;
            default: fail("illegal amount of padding", pos[q + data]);
        }

        std::uint64_t acc = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            int v = 0;
            if (i < data) {
                v = b32_val(in[q + i]);
                if (v < 0) fail("invalid character", pos[q + i]);
            }
            acc = (acc << 5) | static_cast<std::uint64_t>(v);
        }
        for (std::size_t i = 0; i < bytes; ++i) {
            out.push_back(static_cast<unsigned char>((acc >> (32 - 8 * i)) & 0xFF));
        }
    }
    return out;
}

std::string base32_encode(const unsigned char* data, std::size_t len) {
    std::string out;
    out.reserve((len + 4) / 5 * 8);

    for (std::size_t i = 0; i < len; i += 5) {
        const std::size_t n = (len - i < 5) ? len - i : 5;
        std::uint64_t acc = 0;
        for (std::size_t k = 0; k < 5; ++k) {
            acc = (acc << 8) | (k < n ? data[i + k] : 0u);
        }
        // characters that carry at least one input bit
        const std::size_t chars = (n * 8 + 4) / 5;
        for (std::size_t k = 0; k < 8; ++k) {
            if (k < chars) out.push_back(kAlphabet[(acc >> (35 - 5 * k)) & 0x1F]);
            else out.push_back('=');
        }
    }
    return out;
}

std::string base32_encode(const std::string& raw) {
    return base32_encode(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}
