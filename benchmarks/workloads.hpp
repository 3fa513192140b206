#pragma once
#include <cstdint>
#include <string>
#include <chrono>
#include <iostream>
#include <random>
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

// ---- Workloads ----

// Bottom-up heapify of N keys, then read the root.
inline Row run_build_from(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        BinaryHeap<std::uint64_t> h(std::move(keys));
        s.eat(h.peek().value_or(0)); s.eat(h.size()); });
    return Row{"heap", "custom", "build_from", dist_name(dist), "heapify", N, trial, seed, ns, s.acc};
}

// Same keys through insert(first, last): one sift-up per key.
inline Row run_build_insert(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        BinaryHeap<std::uint64_t> h;
        h.insert(keys.begin(), keys.end());
        s.eat(h.peek().value_or(0)); s.eat(h.size()); });
    return Row{"heap", "custom", "build_insert", dist_name(dist), "", N, trial, seed, ns, s.acc};
}

// Push N then drain with remove_root.
inline Row run_heap_pushpop(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    BinaryHeap<std::uint64_t> h;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) h.insert(k);
        while (auto v = h.remove_root()) s.eat(*v); });
    return Row{"heap", "custom", "push_then_pop_all", dist_name(dist), "", N, trial, seed, ns, s.acc};
}

// Heapify, then remove N/2 elements at random indices.
inline Row run_remove_at(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    BinaryHeap<std::uint64_t> h(gen_keys(N, dist, seed));
    std::mt19937_64 rng(seed ^ 0x5bd1e995ull);
    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t i = 0; i < N / 2; ++i){
            auto v = h.remove_at(rng() % h.size());
            s.eat(v.value_or(0));
        } });
    return Row{"heap", "custom", "remove_at_random", dist_name(dist), "removes=N/2", N, trial, seed, ns, s.acc};
}

// Heapify, then N replace calls at random indices with fresh keys.
inline Row run_replace(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    BinaryHeap<std::uint64_t> h(gen_keys(N, dist, seed));
    std::mt19937_64 rng(seed ^ 0xc2b2ae35ull);
    std::uint64_t ns = time_ns([&]
                               {
        if (h.empty()) return;
        for (std::size_t i = 0; i < N; ++i){
            s.eat(h.replace(rng() % h.size(), rng()) ? 1 : 0);
        }
        s.eat(h.peek().value_or(0)); });
    return Row{"heap", "custom", "replace_random", dist_name(dist), "replaces=N", N, trial, seed, ns, s.acc};
}
