#include "plot_results.h"
#include <iostream>
#include <map>
#include <matplot/matplot.h>

namespace order_select {
namespace bench {

namespace {
    struct Series {
        std::vector<double> sizes;
        std::vector<double> randomized_times;
        std::vector<double> deterministic_times;
    };

    void draw_panel(matplot::axes_handle ax,
                    const std::vector<std::string>& names,
                    const std::map<std::string, Series>& series,
                    bool deterministic) {
        matplot::hold(ax, matplot::on);
        for (const auto& name : names) {
            const Series& s = series.at(name);
            if (deterministic)
                matplot::plot(ax, s.sizes, s.deterministic_times, "s--");
            else
                matplot::plot(ax, s.sizes, s.randomized_times, "o-");
        }

        std::vector<std::string> labels;
        for (const auto& name : names) {
            labels.push_back((deterministic ? "Deterministic (" : "Randomized (") + name + ")");
        }

        matplot::xlabel(ax, "Input Size");
        matplot::ylabel(ax, "Time (seconds)");
        matplot::title(ax, deterministic ? "Deterministic Selection Algorithm Performance"
                                         : "Randomized Selection Algorithm Performance");
        matplot::legend(ax, labels);
        matplot::grid(ax, matplot::on);
    }
}

void plot_results(const std::vector<BenchmarkResult>& results, const std::string& output_path) {
    if (results.empty()) {
        std::cout << "No results to plot" << std::endl;
        return;
    }

    // distributions in first-seen order
    std::vector<std::string> names;
    std::map<std::string, Series> series;
    for (const auto& r : results) {
        auto it = series.find(r.distribution);
        if (it == series.end()) {
            names.push_back(r.distribution);
            it = series.emplace(r.distribution, Series{}).first;
        }
        it->second.sizes.push_back(r.size);
        it->second.randomized_times.push_back(r.randomized_time);
        it->second.deterministic_times.push_back(r.deterministic_time);
    }

    auto fig = matplot::figure(true);
    fig->size(1200, 800);

    draw_panel(matplot::subplot(2, 1, 0), names, series, false);
    draw_panel(matplot::subplot(2, 1, 1), names, series, true);

    if (output_path.empty()) {
        matplot::show();
    } else {
        if (fig->save(output_path))
            std::cout << "Saved plot to " << output_path << std::endl;
        else
            std::cerr << "Could not save plot to " << output_path << std::endl;
    }
}

} // namespace bench
} // namespace order_select
