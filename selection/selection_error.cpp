#include "selection_error.h"

namespace order_select {

EmptyInputError::EmptyInputError()
    : std::invalid_argument("Cannot select from an empty sequence")
{
}

RankOutOfRangeError::RankOutOfRangeError(std::ptrdiff_t rank, std::size_t size)
    : std::out_of_range("Rank " + std::to_string(rank) +
                        " is out of range for a sequence of size " + std::to_string(size))
    , rank_(rank)
    , size_(size)
{
}

std::ptrdiff_t RankOutOfRangeError::rank() const { return rank_; }
std::size_t RankOutOfRangeError::size() const { return size_; }

void check_rank(std::size_t size, std::ptrdiff_t k) {
    if (size == 0) {
        throw EmptyInputError();
    }
    if (k < 0 || static_cast<std::size_t>(k) >= size) {
        throw RankOutOfRangeError(k, size);
    }
}

} // namespace order_select
