#include "bench_options.h"
#include <cstring>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include "test_cases.h"

namespace order_select {
namespace bench {

namespace {
    bool matches(const char* arg, const char* full, const char* alias) {
        return std::strcmp(arg, full) == 0 || (alias && std::strcmp(arg, alias) == 0);
    }

    long long parse_integer(const std::string& text, const std::string& what) {
        std::size_t used = 0;
        long long value = 0;
        try {
            value = std::stoll(text, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
        }
        if (used != text.size()) {
            throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
        }
        return value;
    }

    const char* next_value(int argc, const char* const* argv, int& i) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    }
}

std::vector<int> parse_sizes(const std::string& text) {
    std::vector<int> sizes;
    std::stringstream ss(text);
    std::string item;

    while (std::getline(ss, item, ',')) {
        long long size = parse_integer(item, "size");
        if (size <= 0 || size > 100000000) {
            throw std::invalid_argument("Size must be between 1 and 100000000: " + item);
        }
        sizes.push_back(static_cast<int>(size));
    }
    if (sizes.empty()) {
        throw std::invalid_argument("No sizes given");
    }
    return sizes;
}

BenchOptions parse_options(int argc, const char* const* argv, bool allow_output) {
    BenchOptions options;
    options.sizes = DEFAULT_SIZES;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (matches(arg, "--help", "-h")) {
            options.show_help = true;
        } else if (matches(arg, "--sizes", "-s")) {
            options.sizes = parse_sizes(next_value(argc, argv, i));
        } else if (matches(arg, "--seed", nullptr)) {
            long long seed = parse_integer(next_value(argc, argv, i), "seed");
            if (seed < 0 || seed > 0xffffffffLL) {
                throw std::invalid_argument("Seed out of range: " + std::to_string(seed));
            }
            options.seed = static_cast<std::uint32_t>(seed);
        } else if (allow_output && matches(arg, "--output", "-o")) {
            options.output_path = next_value(argc, argv, i);
        } else {
            throw std::invalid_argument(std::string("Unknown argument: ") + arg);
        }
    }
    return options;
}

void show_usage(std::ostream& out, const std::string& program, bool allow_output) {
    out << "Usage: " << program << " [options]\n"
        << "  --sizes, -s <n1,n2,...>  input sizes (default 100,500,1000,5000)\n"
        << "  --seed <n>               seed for input generation and pivots\n";
    if (allow_output) {
        out << "  --output, -o <path>      save the figure instead of showing it\n";
    }
    out << "  --help, -h               show this message\n";
}

} // namespace bench
} // namespace order_select
