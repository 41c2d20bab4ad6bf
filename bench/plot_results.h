#ifndef ORDER_SELECT_BENCH_PLOT_RESULTS_H
#define ORDER_SELECT_BENCH_PLOT_RESULTS_H

#include <string>
#include <vector>
#include "benchmark_runner.h"

namespace order_select {
namespace bench {

// Size-vs-time curves, randomized on top and deterministic below, one line per
// distribution. Saves to output_path if it is non-empty, otherwise shows the figure.
void plot_results(const std::vector<BenchmarkResult>& results, const std::string& output_path);

} // namespace bench
} // namespace order_select

#endif // ORDER_SELECT_BENCH_PLOT_RESULTS_H
