#include <iostream>
#include <random>
#include <stdexcept>
#include "bench_options.h"
#include "benchmark_runner.h"
#include "test_cases.h"

using namespace order_select::bench;

int main(int argc, char** argv) {
    BenchOptions options;
    try {
        options = parse_options(argc, argv, false);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        show_usage(std::cerr, argv[0], false);
        return 1;
    }
    if (options.show_help) {
        show_usage(std::cout, argv[0], false);
        return 0;
    }

    std::random_device rd;
    std::mt19937 g(options.seed ? *options.seed : rd());

    std::cout << "Running Selection Algorithm Comparison..." << std::endl;
    std::vector<BenchmarkCase> cases = generate_test_cases(options.sizes, g);
    std::vector<BenchmarkResult> results = run_test_cases(cases, g, std::cout);

    int failures = 0;
    for (const auto& r : results) {
        if (!r.randomized_ok || !r.deterministic_ok)
            failures++;
    }
    std::cout << results.size() << " cases run, " << failures << " with wrong results" << std::endl;

    return failures == 0 ? 0 : 1;
}
