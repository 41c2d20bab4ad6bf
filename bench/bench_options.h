#ifndef ORDER_SELECT_BENCH_BENCH_OPTIONS_H
#define ORDER_SELECT_BENCH_BENCH_OPTIONS_H

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace order_select {
namespace bench {

struct BenchOptions {
    std::vector<int> sizes;
    std::optional<std::uint32_t> seed;  // unset: seed from std::random_device
    std::string output_path;            // empty: show the figure instead of saving it
    bool show_help{false};
};

// Parses argv into options. allow_output enables --output / -o.
// Throws std::invalid_argument on an unknown flag, a missing value or a bad number.
BenchOptions parse_options(int argc, const char* const* argv, bool allow_output);

std::vector<int> parse_sizes(const std::string& text);

void show_usage(std::ostream& out, const std::string& program, bool allow_output);

} // namespace bench
} // namespace order_select

#endif // ORDER_SELECT_BENCH_BENCH_OPTIONS_H
