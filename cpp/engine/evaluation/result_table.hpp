#pragma once
/*
================================================================================
Evaluation: Result Table
FILE: cpp/engine/evaluation/result_table.hpp

Purpose:
  - Per-sample record of a Monte Carlo campaign, in evaluation order.
  - Columns: parameters (Model order) followed by metrics.
  - A failed sample keeps its parameter values; its metric cells are empty
    and the failure message is stored.
================================================================================
*/

#include "engine/core/errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace procsim {

struct ResultRow {
  std::size_t sample_index = 0;  // row of the matrix handed to load_samples()
  std::vector<double> parameters;
  std::vector<std::optional<double>> metrics;
  std::optional<std::string> failure;

  bool failed() const noexcept { return failure.has_value(); }
};

class ResultTable {
 public:
  ResultTable() = default;
  ResultTable(std::vector<std::string> parameter_names, std::vector<std::string> metric_names)
      : parameter_names_(std::move(parameter_names)), metric_names_(std::move(metric_names)) {}

  const std::vector<std::string>& parameter_names() const noexcept { return parameter_names_; }
  const std::vector<std::string>& metric_names() const noexcept { return metric_names_; }

  std::vector<std::string> column_names() const {
    std::vector<std::string> out = parameter_names_;
    out.insert(out.end(), metric_names_.begin(), metric_names_.end());
    return out;
  }

  void append(ResultRow row) {
    if (row.parameters.size() != parameter_names_.size() || row.metrics.size() != metric_names_.size()) {
      throw ValidationError("ResultTable: row shape does not match columns");
    }
    rows_.push_back(std::move(row));
  }

  const std::vector<ResultRow>& rows() const noexcept { return rows_; }
  std::size_t size() const noexcept { return rows_.size(); }
  bool empty() const noexcept { return rows_.empty(); }
  void clear() noexcept { rows_.clear(); }

  std::size_t failed_count() const noexcept {
    std::size_t n = 0;
    for (const auto& r : rows_) n += r.failed() ? 1 : 0;
    return n;
  }

  std::optional<std::size_t> parameter_index(const std::string& name) const {
    return index_of_(parameter_names_, name);
  }
  std::optional<std::size_t> metric_index(const std::string& name) const {
    return index_of_(metric_names_, name);
  }

 private:
  static std::optional<std::size_t> index_of_(const std::vector<std::string>& v, const std::string& name) {
    for (std::size_t i = 0; i < v.size(); ++i) {
      if (v[i] == name) return i;
    }
    return std::nullopt;
  }

  std::vector<std::string> parameter_names_;
  std::vector<std::string> metric_names_;
  std::vector<ResultRow> rows_;
};

} // namespace procsim
