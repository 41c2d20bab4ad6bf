#include <iostream>
#include <random>
#include <stdexcept>
#include "bench_options.h"
#include "benchmark_runner.h"
#include "plot_results.h"
#include "test_cases.h"

using namespace order_select::bench;

int main(int argc, char** argv) {
    BenchOptions options;
    try {
        options = parse_options(argc, argv, true);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        show_usage(std::cerr, argv[0], true);
        return 1;
    }
    if (options.show_help) {
        show_usage(std::cout, argv[0], true);
        return 0;
    }

    std::random_device rd;
    std::mt19937 g(options.seed ? *options.seed : rd());

    std::cout << "Running Selection Algorithm Comparison..." << std::endl;
    std::vector<BenchmarkCase> cases = generate_test_cases(options.sizes, g);
    std::vector<BenchmarkResult> results = run_test_cases(cases, g, std::cout);

    if (results.empty()) {
        std::cout << "No results to display" << std::endl;
        return 0;
    }
    plot_results(results, options.output_path);
    return 0;
}
