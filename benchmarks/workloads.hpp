#pragma once
#include <cstdint>
#include <string>
#include <chrono>
#include <iostream>
#include <vector>

#include "datasets.hpp"
#include "../src/heap.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string ds, impl, workload, dist, params;
    std::size_t N;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

inline void print_csv_header()
{
    std::cout << "ds,impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.ds << "," << r.impl << "," << r.workload << "," << r.N << "," << r.dist << ","
              << r.params << "," << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

inline const char *mode_name(HeapMode m) { return m == HeapMode::Max ? "max" : "min"; }

// ---- Workloads ----

// insert N one at a time, then extract all
inline Row run_heap_insert_extract(std::size_t N, Dist dist, HeapMode mode, int trial, std::uint64_t seed)
{
    Sink s;
    BinaryHeap<std::uint64_t> h(mode);
    auto keys = gen_keys(N, dist, seed);

    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) h.insert(k);
        while(!h.empty()) s.eat(h.extract()); });

    return Row{"heap", "custom", "insert_then_extract_all", dist_name(dist), mode_name(mode),
               N, trial, seed, ns, s.acc};
}

// bottom-up heapify, then drain
inline Row run_heap_build(std::size_t N, Dist dist, HeapMode mode, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);

    std::uint64_t ns = time_ns([&]
                               {
        auto h = BinaryHeap<std::uint64_t>::build(keys, mode);
        while(!h.empty()) s.eat(h.extract()); });

    return Row{"heap", "custom", "build_then_drain", dist_name(dist), mode_name(mode),
               N, trial, seed, ns, s.acc};
}

// same result as run_heap_build, reached through N inserts
inline Row run_heap_insert_build(std::size_t N, Dist dist, HeapMode mode, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);

    std::uint64_t ns = time_ns([&]
                               {
        BinaryHeap<std::uint64_t> h(mode);
        h.reserve(keys.size());
        for (auto k: keys) h.insert(k);
        while(!h.empty()) s.eat(h.extract()); });

    return Row{"heap", "custom", "insert_build_then_drain", dist_name(dist), mode_name(mode),
               N, trial, seed, ns, s.acc};
}

// Each update is a linear scan, so the heap is capped at kUpdateMaxN
// elements and k = min(n, 1024) updates are timed. The row reports the
// capped size.
constexpr std::size_t kUpdateMaxN = 65536;

inline Row run_heap_update(std::size_t N, Dist dist, HeapMode mode, int trial, std::uint64_t seed)
{
    Sink s;
    if (N > kUpdateMaxN)
        N = kUpdateMaxN;
    auto keys = gen_keys(N, dist, seed);
    auto repl = gen_keys(N, Dist::Uniform, seed ^ 0x5bd1e995ull);
    auto h = BinaryHeap<std::uint64_t>::build(keys, mode);
    std::size_t k = N < 1024 ? N : 1024;

    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t i=0;i<k;++i){
            bool ok = h.update(keys[i], repl[i]);
            s.eat(ok ? h.peek() : 0x1234ULL);
        } });

    return Row{"heap", "custom", "update_scan", dist_name(dist), mode_name(mode),
               N, trial, seed, ns, s.acc};
}
