#pragma once
/*
================================================================================
Engine: CSV Exporter (Monte Carlo Results & Sample Matrices)
FILE: cpp/engine/exports/results_csv.hpp

Purpose:
  - Export a Model's ResultTable: one row per evaluated sample.
  - Export a sample matrix (e.g. for reproducing a campaign elsewhere).

Output format:
  sample,<parameter columns...>,<metric columns...>[,failure]
  - Failed samples keep their parameter values; metric cells read "failed".
  - Non-finite numbers export as empty cells (not "nan").

Hardening:
  - Explicit CSV escaping for names/messages with delimiters or quotes
  - Stable column ordering (Model parameter order, then metrics)
  - File writers return false on I/O error
================================================================================
*/

#include "engine/evaluation/result_table.hpp"
#include "engine/evaluation/sampler.hpp"

#include <string>
#include <vector>

namespace procsim {

struct CsvExportOptions {
  bool include_header = true;
  bool include_failure_column = true;
  char delimiter = ',';
  int precision = 6;
};

// Quote when the field contains the delimiter, a quote or a line break.
std::string csv_escape(const std::string& s, char delim);

// Empty string for NaN/Inf.
std::string csv_double(double x, int precision);

std::string results_csv_header(const ResultTable& table, const CsvExportOptions& opt = CsvExportOptions());
std::string result_to_csv_row(const ResultRow& row, const CsvExportOptions& opt = CsvExportOptions());

// Whole table as one string (header included per options).
std::string results_to_csv(const ResultTable& table, const CsvExportOptions& opt = CsvExportOptions());

bool write_results_csv_file(const ResultTable& table,
                            const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

bool write_samples_csv_file(const SampleMatrix& samples,
                            const std::vector<std::string>& column_names,
                            const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

}  // namespace procsim
