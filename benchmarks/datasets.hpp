#pragma once
#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// Input shapes for the heap workloads. Ascending/Descending are the
// worst and best cases for max-heap sift-up; Few has heavy duplication.
enum class Dist
{
    Uniform,
    Ascending,
    Descending,
    Few
};

inline const char *dist_name(Dist d)
{
    switch (d)
    {
    case Dist::Ascending:
        return "ascending";
    case Dist::Descending:
        return "descending";
    case Dist::Few:
        return "few";
    default:
        return "uniform";
    }
}

inline Dist parse_dist(const std::string &s)
{
    if (s == "ascending")
        return Dist::Ascending;
    if (s == "descending")
        return Dist::Descending;
    if (s == "few")
        return Dist::Few;
    return Dist::Uniform;
}

inline std::vector<std::uint64_t>
gen_keys(std::size_t n, Dist dist, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::vector<std::uint64_t> v;
    v.reserve(n);
    if (dist == Dist::Few)
    {
        std::uniform_int_distribution<std::uint64_t> d(0, 15);
        for (std::size_t i = 0; i < n; ++i)
            v.push_back(d(rng));
        return v;
    }
    std::uniform_int_distribution<std::uint64_t> d;
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(d(rng));
    if (dist == Dist::Ascending)
        std::sort(v.begin(), v.end());
    else if (dist == Dist::Descending)
        std::sort(v.begin(), v.end(), [](std::uint64_t a, std::uint64_t b)
                  { return a > b; });
    return v;
}
