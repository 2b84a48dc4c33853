#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

enum class Dist
{
    Uniform,
    Zipf
};

inline const char *dist_name(Dist d) { return d == Dist::Uniform ? "uniform" : "zipf"; }

// Decimal string keys drawn uniformly from 64-bit space.
inline std::vector<std::string>
gen_uniform(std::size_t n, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::uint64_t> d;
    std::vector<std::string> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(std::to_string(d(rng)));
    return v;
}

// Zipf(s) ranks over [1..n], rendered as short "k<rank>" strings, so hot
// keys repeat and many keys share prefixes.
inline std::vector<std::string>
gen_zipf(std::size_t n, double s = 1.2, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> cdf(n + 1, 0.0);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] /= cdf[n];

    std::vector<std::string> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        double u = U(rng);
        std::size_t k = std::lower_bound(cdf.begin(), cdf.end(), u) - cdf.begin();
        out.push_back("k" + std::to_string(k));
    }
    return out;
}

inline std::vector<std::string> gen_keys(std::size_t n, Dist dist, std::uint64_t seed)
{
    return dist == Dist::Uniform ? gen_uniform(n, seed) : gen_zipf(n, 1.2, seed);
}
