#ifndef ORDER_SELECT_H
#define ORDER_SELECT_H

// randomized_select: expected O(n), pivots from a caller supplied engine
// deterministic_select: worst case O(n), median of medians
#include "selection_error.h"
#include "partition.h"
#include "randomized_select.h"
#include "deterministic_select.h"

#endif // ORDER_SELECT_H
