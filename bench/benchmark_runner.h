#ifndef ORDER_SELECT_BENCH_BENCHMARK_RUNNER_H
#define ORDER_SELECT_BENCH_BENCHMARK_RUNNER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>
#include "test_cases.h"

namespace order_select {
namespace bench {

using SelectFunction = std::function<int(const std::vector<int>&, std::ptrdiff_t)>;

struct BenchmarkResult {
    int size;
    std::string distribution;
    double randomized_time;     // seconds
    double deterministic_time;  // seconds
    double ratio;               // deterministic / randomized, +inf if randomized took 0
    bool randomized_ok;         // matched the sorted reference
    bool deterministic_ok;
};

template<typename Func>
double measure_time(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    return elapsed.count();
}

// Times both selectors at k = size / 2 on every case and prints one table row
// per case to out. A selector that throws is reported and the sweep moves on
// to the next case.
std::vector<BenchmarkResult> run_test_cases(const std::vector<BenchmarkCase>& cases,
                                            const SelectFunction& randomized,
                                            const SelectFunction& deterministic,
                                            std::ostream& out);

// Same, with the library selectors; randomized pivots are drawn from g
std::vector<BenchmarkResult> run_test_cases(const std::vector<BenchmarkCase>& cases,
                                            std::mt19937& g,
                                            std::ostream& out);

void print_header(std::ostream& out);
void print_result(std::ostream& out, const BenchmarkResult& result);

} // namespace bench
} // namespace order_select

#endif // ORDER_SELECT_BENCH_BENCHMARK_RUNNER_H
