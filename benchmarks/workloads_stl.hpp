#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <queue>
#include <vector>
#include "workloads.hpp" // for Row, Sink, Dist, time_ns, generators

// --- std::priority_queue ---
inline Row run_pq_stl_push_pop(std::size_t N, Dist dist, HeapMode mode, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = 0;
    if (mode == HeapMode::Max)
    {
        std::priority_queue<std::uint64_t> pq;
        ns = time_ns([&]
                     {
            for (auto k: keys) pq.push(k);
            while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    }
    else
    {
        std::priority_queue<std::uint64_t, std::vector<std::uint64_t>, std::greater<std::uint64_t>> pq;
        ns = time_ns([&]
                     {
            for (auto k: keys) pq.push(k);
            while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    }
    return Row{"heap", "stl", "insert_then_extract_all", dist_name(dist), mode_name(mode),
               N, trial, seed, ns, s.acc};
}

// --- std::make_heap / std::pop_heap ---
template <class Cmp>
inline void make_and_drain(std::vector<std::uint64_t> &v, Sink &s, Cmp cmp)
{
    std::make_heap(v.begin(), v.end(), cmp);
    while (!v.empty())
    {
        std::pop_heap(v.begin(), v.end(), cmp);
        s.eat(v.back());
        v.pop_back();
    }
}

inline Row run_make_heap_stl(std::size_t N, Dist dist, HeapMode mode, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        auto v = keys;
        if (mode == HeapMode::Max) make_and_drain(v, s, std::less<std::uint64_t>());
        else make_and_drain(v, s, std::greater<std::uint64_t>()); });
    return Row{"heap", "stl", "build_then_drain", dist_name(dist), mode_name(mode),
               N, trial, seed, ns, s.acc};
}
