#pragma once
#include <algorithm>
#include <vector>
#include <random>
#include <cstdint>
#include <cmath>
#include <string>

enum class Dist
{
    Uniform,
    Zipf,
    Ascending,
    Descending
};

inline const char *dist_name(Dist d)
{
    switch (d)
    {
    case Dist::Zipf:
        return "zipf";
    case Dist::Ascending:
        return "ascending";
    case Dist::Descending:
        return "descending";
    default:
        return "uniform";
    }
}

inline Dist parse_dist(const std::string &s)
{
    if (s == "zipf")
        return Dist::Zipf;
    if (s == "ascending")
        return Dist::Ascending;
    if (s == "descending")
        return Dist::Descending;
    return Dist::Uniform;
}

inline std::vector<std::uint64_t>
gen_uniform(std::size_t n, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::uint64_t> d;
    std::vector<std::uint64_t> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(d(rng));
    return v;
}

// Zipf(s) ranks over [1..n]; heavy duplication exercises tie handling in the sifts.
inline std::vector<std::uint64_t>
gen_zipf(std::size_t n, double s = 1.2, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> cdf(n + 1, 0.0);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] /= cdf[n];

    std::vector<std::uint64_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        double u = U(rng);
        out.push_back((std::uint64_t)(std::lower_bound(cdf.begin(), cdf.end(), u) - cdf.begin()));
    }
    return out;
}

// Sorted inputs: ascending is the worst case for max-heap insert (every key
// sifts to the root), descending is already a valid max-heap.
inline std::vector<std::uint64_t> gen_sorted(std::size_t n, bool ascending, std::uint64_t seed = 42)
{
    auto v = gen_uniform(n, seed);
    if (ascending)
        std::sort(v.begin(), v.end());
    else
        std::sort(v.begin(), v.end(), [](std::uint64_t a, std::uint64_t b)
                  { return a > b; });
    return v;
}

inline std::vector<std::uint64_t> gen_keys(std::size_t n, Dist dist, std::uint64_t seed)
{
    switch (dist)
    {
    case Dist::Zipf:
        return gen_zipf(n, 1.2, seed);
    case Dist::Ascending:
        return gen_sorted(n, true, seed);
    case Dist::Descending:
        return gen_sorted(n, false, seed);
    default:
        return gen_uniform(n, seed);
    }
}
