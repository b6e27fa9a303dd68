// ============================================================================
// Stats: Metric Summaries + Rank Correlation
// File: sensitivity.hpp
// ============================================================================
//
// Purpose:
// - Per-metric summary over the successful rows of a ResultTable.
// - Spearman rank correlation between a parameter column and a metric column
//   (average ranks for ties) for sensitivity screening.
//
// Policy:
// - Failed rows are skipped in both; summaries count them as missing.
// - spearman() returns empty when fewer than 3 usable rows exist or either
//   column is constant.
//
// ============================================================================

#pragma once
#include "engine/evaluation/result_table.hpp"
#include "engine/stats/online_stats.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procsim::stats {

struct MetricSummary final {
    std::string name;
    std::uint64_t n = 0;
    std::uint64_t missing = 0; // failed rows plus non-finite values
    double mean = 0.0;
    double std_sample = 0.0;
    double min_v = 0.0;
    double max_v = 0.0;
};

std::vector<MetricSummary> summarize_metrics(const ResultTable& table);

// Average ranks, 1-based.
std::vector<double> average_ranks(const std::vector<double>& x);

// Pearson correlation; empty for n < 2 or zero variance.
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

// Throws ValidationError for unknown column names.
std::optional<double> spearman(const ResultTable& table, const std::string& parameter, const std::string& metric);

} // namespace procsim::stats
