#include "benchmark_runner.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <limits>
#include <ostream>
#include "selection/deterministic_select.h"
#include "selection/randomized_select.h"

namespace order_select {
namespace bench {

void print_header(std::ostream& out) {
    out << std::left
        << std::setw(8) << "Size" << " "
        << std::setw(15) << "Distribution" << " "
        << std::setw(15) << "Randomized (s)" << " "
        << std::setw(18) << "Deterministic (s)" << " "
        << std::setw(15) << "Ratio (Det/Rand)" << "\n";
    out << std::string(80, '-') << "\n";
}

void print_result(std::ostream& out, const BenchmarkResult& result) {
    out << std::left << std::fixed
        << std::setw(8) << result.size << " "
        << std::setw(15) << result.distribution << " "
        << std::setprecision(6) << std::setw(15) << result.randomized_time << " "
        << std::setw(18) << result.deterministic_time << " "
        << std::setprecision(2) << std::setw(15) << result.ratio << "\n";
    out.unsetf(std::ios_base::floatfield);
    out << std::setprecision(6);
}

std::vector<BenchmarkResult> run_test_cases(const std::vector<BenchmarkCase>& cases,
                                            const SelectFunction& randomized,
                                            const SelectFunction& deterministic,
                                            std::ostream& out) {
    std::vector<BenchmarkResult> results;
    print_header(out);

    for (const auto& test_case : cases) {
        const std::vector<int>& arr = test_case.values;
        if (arr.empty())
            continue;

        std::ptrdiff_t k = static_cast<std::ptrdiff_t>(arr.size()) / 2;
        int rand_result = 0;
        int det_result = 0;
        double rand_time = 0.0;
        double det_time = 0.0;

        try {
            rand_time = measure_time([&] { rand_result = randomized(arr, k); });
        } catch (const std::exception& e) {
            out << "Randomized select failed for size=" << test_case.size
                << ", distribution=" << test_case.distribution << ": " << e.what() << "\n";
            continue;
        }

        try {
            det_time = measure_time([&] { det_result = deterministic(arr, k); });
        } catch (const std::exception& e) {
            out << "Deterministic select failed for size=" << test_case.size
                << ", distribution=" << test_case.distribution << ": " << e.what() << "\n";
            continue;
        }

        std::vector<int> sorted_arr = arr;
        std::sort(sorted_arr.begin(), sorted_arr.end());
        int expected = sorted_arr[k];

        if (rand_result != expected) {
            out << "Randomized result error for size=" << test_case.size
                << ", distribution=" << test_case.distribution
                << ": got " << rand_result << ", expected " << expected << "\n";
        }
        if (det_result != expected) {
            out << "Deterministic result error for size=" << test_case.size
                << ", distribution=" << test_case.distribution
                << ": got " << det_result << ", expected " << expected << "\n";
        }

        double ratio = rand_time > 0 ? det_time / rand_time : std::numeric_limits<double>::infinity();

        BenchmarkResult result{test_case.size, test_case.distribution, rand_time, det_time, ratio,
                               rand_result == expected, det_result == expected};
        print_result(out, result);
        results.push_back(result);
    }

    return results;
}

std::vector<BenchmarkResult> run_test_cases(const std::vector<BenchmarkCase>& cases,
                                            std::mt19937& g,
                                            std::ostream& out) {
    SelectFunction randomized = [&g](const std::vector<int>& arr, std::ptrdiff_t k) {
        return randomized_select(arr, k, g);
    };
    SelectFunction deterministic = [](const std::vector<int>& arr, std::ptrdiff_t k) {
        return deterministic_select(arr, k);
    };
    return run_test_cases(cases, randomized, deterministic, out);
}

} // namespace bench
} // namespace order_select
