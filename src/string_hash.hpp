#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// h = h * 31 + byte over the key, wrapping mod 2^64.
std::uint64_t string_hash(std::string_view key) noexcept;

// Mask hash to the low `bits` bits; an address past the last bucket (n)
// is folded back by clearing its top bit. Requires 2^(bits-1) < n <= 2^bits.
std::size_t fold_address(std::uint64_t hash, unsigned bits, std::size_t n) noexcept;

// 64 chars of '0'/'1', most significant bit first. For debugging.
std::string bit_string(std::uint64_t word);
