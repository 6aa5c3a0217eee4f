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
    Zipf,
    Strided
};

inline const char *dist_name(Dist d)
{
    switch (d)
    {
    case Dist::Zipf:
        return "zipf";
    case Dist::Strided:
        return "strided";
    default:
        return "uniform";
    }
}

inline Dist parse_dist(const std::string &s)
{
    if (s == "zipf")
        return Dist::Zipf;
    if (s == "strided")
        return Dist::Strided;
    return Dist::Uniform;
}

inline std::vector<std::uint64_t> gen_uniform(std::size_t n, std::uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::vector<std::uint64_t> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(rng());
    return v;
}

// Zipf(s) ranks over [1..n]; repeated ranks give repeated keys, so the
// workloads see a realistic share of updates to existing entries.
inline std::vector<std::uint64_t> gen_zipf(std::size_t n, double s, std::uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> cdf(n + 1, 0.0);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] /= cdf[n];

    std::uint64_t salt = rng();
    std::vector<std::uint64_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        std::size_t k = std::lower_bound(cdf.begin(), cdf.end(), U(rng)) - cdf.begin();
        out.push_back((std::uint64_t)k * 0x9e3779b97f4a7c15ull ^ salt);
    }
    return out;
}

// Multiples of 2^20: identical low bits, so indexing depends on the
// high-to-low hash spreading alone.
inline std::vector<std::uint64_t> gen_strided(std::size_t n, std::uint64_t seed)
{
    std::vector<std::uint64_t> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back((std::uint64_t)i << 20);
    std::mt19937_64 rng(seed);
    std::shuffle(v.begin(), v.end(), rng);
    return v;
}

inline std::vector<std::uint64_t> gen_keys(std::size_t n, Dist dist, std::uint64_t seed)
{
    switch (dist)
    {
    case Dist::Zipf:
        return gen_zipf(n, 1.2, seed);
    case Dist::Strided:
        return gen_strided(n, seed);
    default:
        return gen_uniform(n, seed);
    }
}
