#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>

#include "linear_hash.hpp"

static std::mt19937_64 rng(12345);

// Random upsert/remove/lookup mix, checked against std::unordered_map.
static void check_against_stl(const LinearHashOptions &opts, int ops)
{
    LinearHashTable<std::uint64_t> t(opts);
    std::unordered_map<std::string, std::uint64_t> m;
    std::uniform_int_distribution<int> op(0, 3); // 0,1:upsert 2:remove 3:lookup
    std::size_t last_buckets = t.len();
    for (int i = 0; i < ops; ++i)
    {
        auto k = std::to_string(rng() & ((1ull << 14) - 1)); // collide a bit
        int o = op(rng);
        if (o <= 1)
        {
            auto v = rng();
            bool fresh = t.upsert(k, v);
            bool fresh_stl = m.insert_or_assign(k, v).second;
            assert(fresh == fresh_stl);
        }
        else if (o == 2)
        {
            auto r = t.remove(k);
            auto it = m.find(k);
            if (it == m.end())
                assert(!r.has_value());
            else
            {
                assert(r.has_value() && *r == it->second);
                m.erase(it);
            }
        }
        else
        {
            const std::uint64_t *v = t.lookup(k);
            auto it = m.find(k);
            if (v) { assert(it != m.end()); assert(*v == it->second); }
            else { assert(it == m.end()); }
        }
        assert(t.size() == m.size());
        assert(t.len() >= last_buckets);
        last_buckets = t.len();
        if (i % 1000 == 0)
            assert(t.check_invariants());
    }
    assert(t.check_invariants());
    for (auto &kv : m)
    {
        const std::uint64_t *v = t.lookup(kv.first);
        assert(v && *v == kv.second);
    }
    if (!opts.split_enabled)
        assert(t.len() == opts.initial_buckets);
}

int main()
{
    check_against_stl(LinearHashOptions{}, 60000);
    check_against_stl(LinearHashOptions{4, true}, 30000);
    check_against_stl(LinearHashOptions{16, false}, 20000);
    std::cout << "OK\n";
    return 0;
}
