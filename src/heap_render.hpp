#pragma once
#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include "heap.hpp"

// Diagnostic text for a heap. T must be streamable.

// Layout order, e.g. [12, 10, 5, 8, 7]
template <typename T, typename Compare>
std::string render_flat(const BinaryHeap<T, Compare> &h)
{
    std::ostringstream os;
    os << '[';
    bool first = true;
    for (const auto &v : h)
    {
        if (!first)
            os << ", ";
        os << v;
        first = false;
    }
    os << ']';
    return os.str();
}

// One line per tree level:
//   [12]
//   [10][5]
//   [8][7]
template <typename T, typename Compare>
std::string render_levels(const BinaryHeap<T, Compare> &h)
{
    if (h.empty())
        return "- Empty heap -";
    std::ostringstream os;
    std::size_t i = 0, level_end = 1; // level k spans [2^k - 1, 2^(k+1) - 1)
    for (const auto &v : h)
    {
        if (i == level_end)
        {
            os << '\n';
            level_end = 2 * level_end + 1;
        }
        os << '[' << v << ']';
        ++i;
    }
    return os.str();
}

template <typename T, typename Compare>
std::ostream &operator<<(std::ostream &os, const BinaryHeap<T, Compare> &h)
{
    return os << render_flat(h);
}
