#include "string_hash.hpp"

namespace
{
constexpr std::uint64_t kMultiplier = 31;
}

std::uint64_t string_hash(std::string_view key) noexcept
{
    std::uint64_t h = 0;
    for (unsigned char c : key)
        h = h * kMultiplier + c; // unsigned: wraps
    return h;
}

std::size_t fold_address(std::uint64_t hash, unsigned bits, std::size_t n) noexcept
{
    const std::uint64_t mask = (std::uint64_t{1} << bits) - 1;
    std::size_t m = static_cast<std::size_t>(hash & mask);
    if (m < n)
        return m;
    return m ^ (std::size_t{1} << (bits - 1));
}

std::string bit_string(std::uint64_t word)
{
    std::string out(64, '0');
    for (std::size_t i = 0; i < 64; ++i)
    {
        if (word & (std::uint64_t{1} << i))
            out[63 - i] = '1';
    }
    return out;
}
