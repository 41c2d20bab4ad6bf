#ifndef ORDER_SELECT_SELECTION_ERROR_H
#define ORDER_SELECT_SELECTION_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace order_select {

// Thrown when a selector is handed a sequence with no elements
class EmptyInputError : public std::invalid_argument {
public:
    EmptyInputError();
};

// Thrown when k < 0 or k >= n
class RankOutOfRangeError : public std::out_of_range {
public:
    RankOutOfRangeError(std::ptrdiff_t rank, std::size_t size);

    std::ptrdiff_t rank() const;  // Offending rank
    std::size_t size() const;     // Size of the sequence it was checked against

private:
    std::ptrdiff_t rank_;
    std::size_t size_;
};

// Precondition check shared by both selectors. Runs once, before any work.
// An empty sequence is reported as such whatever k is.
void check_rank(std::size_t size, std::ptrdiff_t k);

} // namespace order_select

#endif // ORDER_SELECT_SELECTION_ERROR_H
