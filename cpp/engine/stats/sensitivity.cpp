/*
================================================================================
Stats: Metric Summaries + Rank Correlation (Implementation)
FILE: cpp/engine/stats/sensitivity.cpp
================================================================================
*/

#include "engine/stats/sensitivity.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace procsim::stats {

std::vector<MetricSummary> summarize_metrics(const ResultTable& table) {
    const auto& names = table.metric_names();
    std::vector<OnlineStats> acc(names.size());

    for (const auto& row : table.rows()) {
        for (std::size_t j = 0; j < names.size(); ++j) {
            if (!row.failed() && row.metrics[j]) {
                acc[j].push(*row.metrics[j]);
            } else {
                acc[j].skip();
            }
        }
    }

    std::vector<MetricSummary> out;
    out.reserve(names.size());
    for (std::size_t j = 0; j < names.size(); ++j) {
        MetricSummary s;
        s.name = names[j];
        s.n = acc[j].count();
        s.missing = acc[j].missing;
        s.mean = acc[j].mean;
        s.std_sample = acc[j].stddev_sample();
        s.min_v = acc[j].min();
        s.max_v = acc[j].max();
        out.push_back(s);
    }
    return out;
}

std::vector<double> average_ranks(const std::vector<double>& x) {
    const std::size_t n = x.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) { return x[a] < x[b]; });

    std::vector<double> ranks(n, 0.0);
    std::size_t i = 0;
    while (i < n) {
        std::size_t j = i + 1;
        while (j < n && x[idx[j]] == x[idx[i]]) ++j;
        // Ties share the mean of ranks i+1 .. j.
        const double r = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
        for (std::size_t k = i; k < j; ++k) ranks[idx[k]] = r;
        i = j;
    }
    return ranks;
}

std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    const double n = static_cast<double>(x.size());
    const double mx = std::accumulate(x.begin(), x.end(), 0.0) / n;
    const double my = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (!(sxx > 0.0) || !(syy > 0.0)) return std::nullopt;

    const double r = sxy / std::sqrt(sxx * syy);
    if (!is_finite(r)) return std::nullopt;
    return clamp(r, -1.0, 1.0);
}

std::optional<double> spearman(const ResultTable& table, const std::string& parameter, const std::string& metric) {
    const auto pi = table.parameter_index(parameter);
    if (!pi) throw ValidationError("spearman: unknown parameter '" + parameter + "'");
    const auto mi = table.metric_index(metric);
    if (!mi) throw ValidationError("spearman: unknown metric '" + metric + "'");

    std::vector<double> x;
    std::vector<double> y;
    for (const auto& row : table.rows()) {
        if (row.failed() || !row.metrics[*mi] || !is_finite(*row.metrics[*mi])) continue;
        x.push_back(row.parameters[*pi]);
        y.push_back(*row.metrics[*mi]);
    }
    if (x.size() < 3) return std::nullopt;

    return pearson(average_ranks(x), average_ranks(y));
}

} // namespace procsim::stats
