#ifndef ORDER_SELECT_DETERMINISTIC_SELECT_H
#define ORDER_SELECT_DETERMINISTIC_SELECT_H

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>
#include "partition.h"
#include "selection_error.h"

namespace order_select {

constexpr std::ptrdiff_t GROUP_SIZE = 5;

template <typename T, typename Compare>
std::ptrdiff_t mom_select(std::vector<T>& arr, std::ptrdiff_t left, std::ptrdiff_t right,
                          std::ptrdiff_t k, Compare comp);

// Picks the median-of-medians pivot for [left, right] and returns its index.
// Group medians are packed into [left, left + groups - 1] as they are found,
// then the median among them is selected in place, so its position is known
// without searching for its value.
template <typename T, typename Compare>
std::ptrdiff_t median_of_medians(std::vector<T>& arr, std::ptrdiff_t left, std::ptrdiff_t right,
                                 Compare comp) {
    using std::swap;
    std::ptrdiff_t groups = 0;

    for (std::ptrdiff_t l = left; l <= right; l += GROUP_SIZE) {
        std::ptrdiff_t r = std::min(l + GROUP_SIZE - 1, right);
        std::ptrdiff_t m = group_median(arr, l, r, comp);
        swap(arr[left + groups], arr[m]);
        groups++;
    }

    if (groups == 1)
        return left;

    return mom_select(arr, left, left + groups - 1, left + groups / 2, comp);
}

// Median-of-medians selection over the closed range [left, right]. Leaves the
// rank-k element at index k and returns k. Worst case O(n).
template <typename T, typename Compare>
std::ptrdiff_t mom_select(std::vector<T>& arr, std::ptrdiff_t left, std::ptrdiff_t right,
                          std::ptrdiff_t k, Compare comp) {
    while (left < right) {
        std::ptrdiff_t x = median_of_medians(arr, left, right, comp);
        std::ptrdiff_t pivot_idx = partition(arr, left, right, x, comp);
        // without this a run of equal values is peeled off one element at a time
        std::ptrdiff_t equal_end = gather_equal(arr, pivot_idx, right, comp);

        if (k < pivot_idx)
            right = pivot_idx - 1;
        else if (k > equal_end)
            left = equal_end + 1;
        else
            return k;
    }
    return left;
}

// Returns the element of rank k (zero based) of seq in worst-case linear time.
// seq is copied once; the caller's sequence is never touched.
// Throws EmptyInputError or RankOutOfRangeError.
template <typename Sequence,
          typename T = typename std::iterator_traits<decltype(std::begin(std::declval<const Sequence&>()))>::value_type,
          typename Compare = std::less<T>>
T deterministic_select(const Sequence& seq, std::ptrdiff_t k, Compare comp = Compare()) {
    check_rank(static_cast<std::size_t>(std::distance(std::begin(seq), std::end(seq))), k);
    std::vector<T> arr(std::begin(seq), std::end(seq));

    std::ptrdiff_t idx = mom_select(arr, 0, static_cast<std::ptrdiff_t>(arr.size()) - 1, k, comp);
    return std::move(arr[idx]);
}

} // namespace order_select

#endif // ORDER_SELECT_DETERMINISTIC_SELECT_H
