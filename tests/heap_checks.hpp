#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>
#include "../src/heap.hpp"

// True when no child ranks above its parent under `order`.
template <typename T, class Order>
bool satisfies_heap_property(const std::vector<T> &nodes, Order order)
{
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        std::size_t l = 2 * i + 1, r = 2 * i + 2;
        if (l < nodes.size() && order(nodes[l], nodes[i]))
            return false;
        if (r < nodes.size() && order(nodes[r], nodes[i]))
            return false;
    }
    return true;
}

inline bool is_max_heap(const std::vector<int> &nodes) { return satisfies_heap_property(nodes, std::greater<int>{}); }
inline bool is_min_heap(const std::vector<int> &nodes) { return satisfies_heap_property(nodes, std::less<int>{}); }

template <typename T>
bool same_multiset(std::vector<T> a, std::vector<T> b)
{
    if (a.size() != b.size())
        return false;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    return a == b;
}

// Drains a copy of the heap through remove_root().
template <typename T, class Compare>
std::vector<T> drain(BinaryHeap<T, Compare> h)
{
    std::vector<T> out;
    while (auto v = h.remove_root())
        out.push_back(std::move(*v));
    return out;
}
