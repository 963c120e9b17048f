#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace resplit {
namespace hex {

// --- Functions for working with hex encoded digests ---
std::string to_hex(const unsigned char* data, size_t len);

// True if s is exactly `length` hex digits (either case)
bool is_hex(const std::string& s, size_t length);

// Lowercases a hex string, digests are always compared in lowercase
std::string normalize(const std::string& hex_s);

} // namespace hex
} // namespace resplit
