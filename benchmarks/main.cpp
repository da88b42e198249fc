#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include "workloads.hpp"
#include "workloads_stl.hpp"

static void print_metadata(){
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
}

struct Args
{
    std::vector<std::size_t> sizes{128, 1024, 8192, 65536, 524288, 4194304};
    int trials = 8;
    Dist dist = Dist::Uniform;
    HeapMode mode = HeapMode::Max;
    std::uint64_t seed0 = 42;
};

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&](std::string &out)
        { if (i+1<argc){ out = argv[++i]; } };
        if (s == "--trials")
        {
            std::string v;
            next(v);
            a.trials = std::stoi(v);
        }
        else if (s == "--dist")
        {
            std::string v;
            next(v);
            a.dist = parse_dist(v);
        }
        else if (s == "--mode")
        {
            std::string v;
            next(v);
            a.mode = (v == "min") ? HeapMode::Min : HeapMode::Max;
        }
        else if (s == "--seed")
        {
            std::string v;
            next(v);
            a.seed0 = std::stoull(v);
        }
        else if (s == "--sizes")
        {
            std::string v;
            next(v);
            a.sizes.clear();
            std::size_t start = 0;
            while (true)
            {
                auto pos = v.find(',', start);
                std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
                if (!tok.empty())
                    a.sizes.push_back(std::stoull(tok));
                if (pos == std::string::npos)
                    break;
                start = pos + 1;
            }
        }
        else
        {
            std::fprintf(stderr, "unknown option: %s\n", s.c_str());
            std::fprintf(stderr, "usage: %s [--trials N] [--dist uniform|ascending|descending|few] "
                                 "[--mode max|min] [--seed S] [--sizes a,b,c]\n"
                                 "  update_scan rows cap N at %zu\n", argv[0], kUpdateMaxN);
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e) // std::stoi/stoull on a malformed number
    {
        std::fprintf(stderr, "bad argument: %s\n", e.what());
        return 2;
    }
    print_metadata();
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            // ---- Custom ----
            print_row(run_heap_insert_extract(N, a.dist, a.mode, trial, seed));
            print_row(run_heap_build(N, a.dist, a.mode, trial, seed + 1));
            print_row(run_heap_insert_build(N, a.dist, a.mode, trial, seed + 1));
            print_row(run_heap_update(N, a.dist, a.mode, trial, seed + 2));

            // ---- STL baselines ----
            print_row(run_pq_stl_push_pop(N, a.dist, a.mode, trial, seed));
            print_row(run_make_heap_stl(N, a.dist, a.mode, trial, seed + 1));

            ++trial;
        }
    }
    return 0;
}
