#ifndef ORDER_SELECT_RANDOMIZED_SELECT_H
#define ORDER_SELECT_RANDOMIZED_SELECT_H

#include <cstddef>
#include <functional>
#include <iterator>
#include <random>
#include <utility>
#include <vector>
#include "partition.h"
#include "selection_error.h"

namespace order_select {

// Quickselect over the closed range [left, right] of a working vector. Leaves
// the rank-k element at index k and returns k. k must lie in the range.
template <typename T, typename URBG, typename Compare = std::less<T>>
std::ptrdiff_t rand_select(std::vector<T>& arr, std::ptrdiff_t left, std::ptrdiff_t right,
                           std::ptrdiff_t k, URBG& g, Compare comp = Compare()) {
    while (left < right) {
        std::uniform_int_distribution<std::ptrdiff_t> dist(left, right);
        std::ptrdiff_t r = partition(arr, left, right, dist(g), comp);

        if (k == r)
            return r;
        else if (k < r)
            right = r - 1;
        else
            left = r + 1;
    }
    return left;
}

// Returns the element of rank k (zero based) of seq, drawing pivots from g.
// seq is copied once; the caller's sequence is never touched.
// Throws EmptyInputError or RankOutOfRangeError.
template <typename Sequence, typename URBG,
          typename T = typename std::iterator_traits<decltype(std::begin(std::declval<const Sequence&>()))>::value_type,
          typename Compare = std::less<T>>
T randomized_select(const Sequence& seq, std::ptrdiff_t k, URBG&& g, Compare comp = Compare()) {
    check_rank(static_cast<std::size_t>(std::distance(std::begin(seq), std::end(seq))), k);
    std::vector<T> arr(std::begin(seq), std::end(seq));

    std::ptrdiff_t idx = rand_select(arr, 0, static_cast<std::ptrdiff_t>(arr.size()) - 1, k, g, comp);
    return std::move(arr[idx]);
}

// Same as above with a freshly seeded engine
template <typename Sequence>
auto randomized_select(const Sequence& seq, std::ptrdiff_t k) {
    std::random_device rd;
    std::mt19937 g(rd());
    return randomized_select(seq, k, g);
}

} // namespace order_select

#endif // ORDER_SELECT_RANDOMIZED_SELECT_H
