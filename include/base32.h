// include/base32.h
#pragma once
#include <string>
#include <vector>

// RFC 4648 standard alphabet, '=' padded.
// Decoding is strict: upper-case only, padded to a multiple of 8 characters
// (CR/LF are skipped). Throws std::runtime_error on malformed input.
std::vector<unsigned char> base32_decode(const std::string& text);

std::string base32_encode(const unsigned char* data, std::size_t len);
std::string base32_encode(const std::string& raw);
