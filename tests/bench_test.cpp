#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bench/bench_options.h"
#include "bench/benchmark_runner.h"
#include "bench/test_cases.h"

using namespace order_select::bench;

TEST_CASE("make_distribution shapes", "[bench][test_cases]")
{
    std::mt19937 g(4);

    SECTION("random values stay in [1, size * 10]")
    {
        std::vector<int> arr = make_distribution("random", 200, g);
        REQUIRE(arr.size() == 200u);
        REQUIRE(*std::min_element(arr.begin(), arr.end()) >= 1);
        REQUIRE(*std::max_element(arr.begin(), arr.end()) <= 2000);
    }

    SECTION("sorted and reverse sorted")
    {
        REQUIRE(make_distribution("sorted", 4, g) == std::vector<int>{1, 2, 3, 4});
        REQUIRE(make_distribution("reverse_sorted", 4, g) == std::vector<int>{4, 3, 2, 1});
    }

    SECTION("all equal")
    {
        REQUIRE(make_distribution("all_equal", 3, g) == std::vector<int>(3, ALL_EQUAL_VALUE));
    }

    SECTION("few unique values")
    {
        std::vector<int> arr = make_distribution("few_unique", 500, g);
        REQUIRE(std::all_of(arr.begin(), arr.end(), [](int x) { return x >= 1 && x <= FEW_UNIQUE_MAX; }));
    }

    SECTION("unknown names and negative sizes are rejected")
    {
        REQUIRE_THROWS_AS(make_distribution("gaussian", 10, g), std::runtime_error);
        REQUIRE_THROWS_AS(make_distribution("sorted", -1, g), std::runtime_error);
    }

    SECTION("size zero gives an empty case")
    {
        REQUIRE(make_distribution("random", 0, g).empty());
    }
}

TEST_CASE("generate_test_cases crosses sizes with distributions", "[bench][test_cases]")
{
    std::mt19937 g(10);
    std::vector<BenchmarkCase> cases = generate_test_cases({10, 20}, g);

    REQUIRE(cases.size() == 2 * DISTRIBUTIONS.size());
    for (std::size_t i = 0; i < cases.size(); i++) {
        const BenchmarkCase& c = cases[i];
        REQUIRE(c.size == (i < DISTRIBUTIONS.size() ? 10 : 20));
        REQUIRE(c.distribution == DISTRIBUTIONS[i % DISTRIBUTIONS.size()]);
        REQUIRE(c.values.size() == static_cast<std::size_t>(c.size));
    }

    SECTION("the same seed gives the same cases")
    {
        std::mt19937 a(77);
        std::mt19937 b(77);
        std::vector<BenchmarkCase> first = generate_test_cases(DEFAULT_SIZES, a);
        std::vector<BenchmarkCase> second = generate_test_cases(DEFAULT_SIZES, b);
        REQUIRE(first.size() == second.size());
        for (std::size_t i = 0; i < first.size(); i++) {
            REQUIRE(first[i].values == second[i].values);
        }
    }
}

TEST_CASE("run_test_cases times and validates both selectors", "[bench][runner]")
{
    std::mt19937 g(2);
    std::vector<BenchmarkCase> cases = generate_test_cases({100, 501}, g);
    std::ostringstream out;

    std::vector<BenchmarkResult> results = run_test_cases(cases, g, out);

    REQUIRE(results.size() == cases.size());
    for (const auto& r : results) {
        REQUIRE(r.randomized_ok);
        REQUIRE(r.deterministic_ok);
        REQUIRE(r.randomized_time >= 0.0);
        REQUIRE(r.deterministic_time >= 0.0);
        if (r.randomized_time > 0.0) {
            REQUIRE(r.ratio == r.deterministic_time / r.randomized_time);
        } else {
            REQUIRE(std::isinf(r.ratio));
        }
    }

    std::string text = out.str();
    REQUIRE(text.find("Ratio (Det/Rand)") != std::string::npos);
    REQUIRE(text.find(std::string(80, '-')) != std::string::npos);
    REQUIRE(text.find("reverse_sorted") != std::string::npos);
    REQUIRE(text.find("error") == std::string::npos);
}

TEST_CASE("a failing scenario does not stop the sweep", "[bench][runner]")
{
    std::vector<BenchmarkCase> cases = {
        {3, "sorted", {1, 2, 3}},
        {0, "random", {}},
        {4, "all_equal", {42, 42, 42, 42}},
        {5, "reverse_sorted", {5, 4, 3, 2, 1}},
    };
    std::ostringstream out;

    SECTION("a selector that throws on one case")
    {
        SelectFunction sorting = [](const std::vector<int>& arr, std::ptrdiff_t k) {
            std::vector<int> copy = arr;
            std::sort(copy.begin(), copy.end());
            return copy[k];
        };
        SelectFunction throwing = [&sorting](const std::vector<int>& arr, std::ptrdiff_t k) {
            if (arr.size() == 4)
                throw std::runtime_error("boom");
            return sorting(arr, k);
        };

        std::vector<BenchmarkResult> results = run_test_cases(cases, throwing, sorting, out);

        REQUIRE(results.size() == 2u);
        REQUIRE(results[0].distribution == "sorted");
        REQUIRE(results[1].distribution == "reverse_sorted");
        REQUIRE(out.str().find("Randomized select failed for size=4, distribution=all_equal: boom")
                != std::string::npos);
    }

    SECTION("a selector that returns the wrong value")
    {
        SelectFunction sorting = [](const std::vector<int>& arr, std::ptrdiff_t k) {
            std::vector<int> copy = arr;
            std::sort(copy.begin(), copy.end());
            return copy[k];
        };
        SelectFunction wrong = [](const std::vector<int>&, std::ptrdiff_t) { return -1; };

        std::vector<BenchmarkResult> results = run_test_cases(cases, sorting, wrong, out);

        REQUIRE(results.size() == 3u);
        for (const auto& r : results) {
            REQUIRE(r.randomized_ok);
            REQUIRE_FALSE(r.deterministic_ok);
        }
        REQUIRE(out.str().find("Deterministic result error for size=3, distribution=sorted: got -1, expected 2")
                != std::string::npos);
    }
}

TEST_CASE("parse_options", "[bench][options]")
{
    SECTION("defaults")
    {
        const char* argv[] = {"select_bench"};
        BenchOptions options = parse_options(1, argv, false);
        REQUIRE(options.sizes == DEFAULT_SIZES);
        REQUIRE_FALSE(options.seed.has_value());
        REQUIRE(options.output_path.empty());
        REQUIRE_FALSE(options.show_help);
    }

    SECTION("sizes, seed and output")
    {
        const char* argv[] = {"select_plot", "--sizes", "10,20,30", "--seed", "99", "-o", "out.png"};
        BenchOptions options = parse_options(7, argv, true);
        REQUIRE(options.sizes == std::vector<int>{10, 20, 30});
        REQUIRE(options.seed.has_value());
        REQUIRE(*options.seed == 99u);
        REQUIRE(options.output_path == "out.png");
    }

    SECTION("help")
    {
        const char* argv[] = {"select_bench", "-h"};
        REQUIRE(parse_options(2, argv, false).show_help);
    }

    SECTION("bad input")
    {
        const char* unknown[] = {"select_bench", "--verbose"};
        REQUIRE_THROWS_AS(parse_options(2, unknown, false), std::invalid_argument);

        const char* missing[] = {"select_bench", "--seed"};
        REQUIRE_THROWS_AS(parse_options(2, missing, false), std::invalid_argument);

        const char* output_not_allowed[] = {"select_bench", "--output", "x.png"};
        REQUIRE_THROWS_AS(parse_options(3, output_not_allowed, false), std::invalid_argument);

        const char* negative_seed[] = {"select_bench", "--seed", "-4"};
        REQUIRE_THROWS_AS(parse_options(3, negative_seed, false), std::invalid_argument);
    }

    SECTION("parse_sizes")
    {
        REQUIRE(parse_sizes("5") == std::vector<int>{5});
        REQUIRE_THROWS_AS(parse_sizes("0"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_sizes("-3"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_sizes("12abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_sizes("10,,20"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_sizes(""), std::invalid_argument);
    }
}
