#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "datasets.hpp"
#include "linear_hash.hpp"

using StdMap = std::unordered_map<std::string, std::uint64_t>;
using LinearMap = LinearHashTable<std::uint64_t>;

// Same three calls on both maps so one workload body times either.
inline void put(LinearMap &m, const std::string &k, std::uint64_t v) { m.upsert(k, v); }
inline void put(StdMap &m, const std::string &k, std::uint64_t v) { m.insert_or_assign(k, v); }

inline std::uint64_t get(const LinearMap &m, const std::string &k)
{
    const std::uint64_t *v = m.lookup(k);
    return v ? *v : 0x1234ULL;
}
inline std::uint64_t get(const StdMap &m, const std::string &k)
{
    auto it = m.find(k);
    return it != m.end() ? it->second : 0x1234ULL;
}

inline std::uint64_t take(LinearMap &m, const std::string &k)
{
    auto v = m.remove(k);
    return v ? *v : 0x1234ULL;
}
inline std::uint64_t take(StdMap &m, const std::string &k)
{
    auto it = m.find(k);
    if (it == m.end())
        return 0x1234ULL;
    std::uint64_t v = it->second;
    m.erase(it);
    return v;
}

enum class Workload
{
    MixedLookup, // upsert all, then alternate hit / miss lookups
    Churn        // upsert all, then remove all
};

inline const char *workload_name(Workload w) { return w == Workload::MixedLookup ? "upsert+mixed_lookup" : "upsert+remove_all"; }

struct Result
{
    std::uint64_t ns;
    std::uint64_t checksum;
};

// Misses share every byte of a hit key plus a suffix.
template <class Map>
Result run_workload(Map &m, const std::vector<std::string> &keys, Workload w)
{
    std::uint64_t acc = 0;
    auto eat = [&](std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); };

    auto t0 = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < keys.size(); ++i)
        put(m, keys[i], i);
    for (std::size_t i = 0; i < keys.size(); ++i)
    {
        if (w == Workload::Churn)
            eat(take(m, keys[i]));
        else
            eat(i % 2 == 0 ? get(m, keys[i]) : get(m, keys[i] + "#"));
    }
    auto t1 = std::chrono::steady_clock::now();
    return {(std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count(), acc};
}

inline void print_csv_header()
{
    std::cout << "impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const std::string &impl, Workload w, std::size_t n, Dist dist, const std::string &params,
                      int trial, std::uint64_t seed, const Result &r)
{
    std::cout << impl << "," << workload_name(w) << "," << n << "," << dist_name(dist) << "," << params << ","
              << trial << "," << seed << "," << r.ns << "," << r.checksum << "\n";
}
