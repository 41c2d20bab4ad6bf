#ifndef ORDER_SELECT_PARTITION_H
#define ORDER_SELECT_PARTITION_H

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace order_select {

// Lomuto partition of the closed range [left, right] around the value at
// pivot_idx. Returns the pivot's final index p: everything before p is
// strictly less than the pivot, everything after p is greater or equal.
//
// Values equal to the pivot always land on the right, so a range of equal
// values partitions to p == left.
template <typename T, typename Compare = std::less<T>>
std::ptrdiff_t partition(std::vector<T>& arr, std::ptrdiff_t left, std::ptrdiff_t right,
                         std::ptrdiff_t pivot_idx, Compare comp = Compare()) {
    using std::swap;
    swap(arr[pivot_idx], arr[right]);
    const T& pivot = arr[right];
    std::ptrdiff_t partition_idx = left;

    for (std::ptrdiff_t i = left; i < right; i++) {
        if (comp(arr[i], pivot)) {
            swap(arr[i], arr[partition_idx]);
            partition_idx++;
        }
    }
    swap(arr[partition_idx], arr[right]);

    return partition_idx;
}

// Moves the values equal to arr[pivot_idx] found in (pivot_idx, right] next to
// the pivot and returns the index of the last one. Expects the range to be
// partitioned already, so everything after the pivot is >= it.
template <typename T, typename Compare = std::less<T>>
std::ptrdiff_t gather_equal(std::vector<T>& arr, std::ptrdiff_t pivot_idx, std::ptrdiff_t right,
                            Compare comp = Compare()) {
    using std::swap;
    std::ptrdiff_t equal_end = pivot_idx;
    for (std::ptrdiff_t i = pivot_idx + 1; i <= right; i++) {
        if (!comp(arr[pivot_idx], arr[i])) {
            equal_end++;
            swap(arr[i], arr[equal_end]);
        }
    }
    return equal_end;
}

// Sorts a group of at most 5 elements in place and returns the index of its
// median (the lower one for even sizes).
template <typename T, typename Compare = std::less<T>>
std::ptrdiff_t group_median(std::vector<T>& arr, std::ptrdiff_t left, std::ptrdiff_t right,
                            Compare comp = Compare()) {
    // insertion sort
    for (std::ptrdiff_t i = left + 1; i <= right; i++) {
        T key = std::move(arr[i]);
        std::ptrdiff_t j = i - 1;
        while (j >= left && comp(key, arr[j])) {
            arr[j + 1] = std::move(arr[j]);
            j--;
        }
        arr[j + 1] = std::move(key);
    }
    return left + (right - left) / 2;
}

} // namespace order_select

#endif // ORDER_SELECT_PARTITION_H
