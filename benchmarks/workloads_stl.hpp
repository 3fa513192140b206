#pragma once
#include <algorithm>
#include <queue>
#include <vector>
#include <cstdint>
#include <string>
#include "workloads.hpp" // for Row, Sink, Dist, time_ns, generators

// --- std::make_heap ---
inline Row run_build_stl_make_heap(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        std::make_heap(keys.begin(), keys.end());
        s.eat(keys.empty() ? 0 : keys.front()); s.eat(keys.size()); });
    return Row{"heap", "stl", "build_from", dist_name(dist), "make_heap", N, trial, seed, ns, s.acc};
}

// --- std::priority_queue ---
inline Row run_heap_stl_pushpop(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    std::priority_queue<std::uint64_t> pq;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) pq.push(k);
        while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    return Row{"heap", "stl", "push_then_pop_all", dist_name(dist), "", N, trial, seed, ns, s.acc};
}
