#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>
#include "workloads.hpp"

// The fixed 32-bucket table degrades to long scans; keep it to small N.
static constexpr std::size_t kStaticMaxN = 65536;

struct Args
{
    std::vector<std::size_t> sizes{1024, 4096, 16384, 65536, 262144, 1048576};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;
};

static std::vector<std::size_t> parse_sizes(const std::string &v)
{
    std::vector<std::size_t> out;
    std::size_t start = 0;
    while (start <= v.size())
    {
        auto pos = v.find(',', start);
        if (pos == std::string::npos)
            pos = v.size();
        if (pos > start)
            out.push_back(std::stoull(v.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

// Throws std::invalid_argument on an unknown flag or missing value.
static Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string flag = argv[i];
        if (i + 1 >= argc)
            throw std::invalid_argument("missing value for " + flag);
        std::string v = argv[++i];
        if (flag == "--trials")
            a.trials = std::stoi(v);
        else if (flag == "--dist")
            a.dist = (v == "zipf") ? Dist::Zipf : Dist::Uniform;
        else if (flag == "--seed")
            a.seed0 = std::stoull(v);
        else if (flag == "--sizes")
            a.sizes = parse_sizes(v);
        else
            throw std::invalid_argument("unknown flag " + flag);
    }
    return a;
}

int main(int argc, char **argv)
{
    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "%s\nusage: %s [--trials N] [--dist uniform|zipf] [--seed S] [--sizes a,b,c]\n",
                     e.what(), argv[0]);
        return 2;
    }
#ifdef NDEBUG
    std::fprintf(stderr, "# build: %s %s, Release\n", __DATE__, __TIME__);
#else
    std::fprintf(stderr, "# build: %s %s, Debug\n", __DATE__, __TIME__);
#endif
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto n : a.sizes)
        {
            const std::uint64_t seed = a.seed0 + t * 1315423911ull + n;
            const auto keys = gen_keys(n, a.dist, seed);

            for (Workload w : {Workload::MixedLookup, Workload::Churn})
            {
                LinearMap lin;
                Result r = run_workload(lin, keys, w);
                print_row("linear", w, n, a.dist, "buckets=" + std::to_string(lin.len()), trial, seed, r);

                if (n <= kStaticMaxN)
                {
                    LinearHashOptions opts;
                    opts.split_enabled = false;
                    LinearMap fixed(opts);
                    print_row("static", w, n, a.dist, "buckets=32", trial, seed, run_workload(fixed, keys, w));
                }

                StdMap m;
                print_row("std::unordered_map", w, n, a.dist, "", trial, seed, run_workload(m, keys, w));
                StdMap reserved;
                reserved.reserve(n);
                print_row("std::unordered_map", w, n, a.dist, "reserve=true", trial, seed,
                          run_workload(reserved, keys, w));
            }
            ++trial;
        }
    }
    return 0;
}
