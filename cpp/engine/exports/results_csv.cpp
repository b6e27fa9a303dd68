/*
================================================================================
Engine: CSV Exporter Implementation
FILE: cpp/engine/exports/results_csv.cpp
================================================================================
*/

#include "engine/exports/results_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace procsim {

namespace {

constexpr const char* kFailedCell = "failed";

}  // namespace

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";  // Escape quote as double-quote
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (std::isnan(x) || !std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::setprecision(precision) << x;
  return oss.str();
}

std::string results_csv_header(const ResultTable& table, const CsvExportOptions& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;

  h << "sample";
  for (const auto& name : table.column_names()) h << d << csv_escape(name, d);
  if (opt.include_failure_column) h << d << "failure";
  return h.str();
}

std::string result_to_csv_row(const ResultRow& row, const CsvExportOptions& opt) {
  std::ostringstream r;
  const char d = opt.delimiter;

  r << row.sample_index;
  for (double v : row.parameters) r << d << csv_double(v, opt.precision);
  for (const auto& m : row.metrics) {
    r << d;
    if (m) r << csv_double(*m, opt.precision);
    else r << kFailedCell;
  }
  if (opt.include_failure_column) {
    r << d;
    if (row.failure) r << csv_escape(*row.failure, d);
  }
  return r.str();
}

std::string results_to_csv(const ResultTable& table, const CsvExportOptions& opt) {
  std::ostringstream out;
  if (opt.include_header) out << results_csv_header(table, opt) << "\n";
  for (const auto& row : table.rows()) out << result_to_csv_row(row, opt) << "\n";
  return out.str();
}

bool write_results_csv_file(const ResultTable& table,
                            const std::string& file_path,
                            const CsvExportOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) return false;
  ofs << results_to_csv(table, opt);
  return ofs.good();
}

bool write_samples_csv_file(const SampleMatrix& samples,
                            const std::vector<std::string>& column_names,
                            const std::string& file_path,
                            const CsvExportOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) return false;

  const char d = opt.delimiter;
  if (opt.include_header) {
    for (std::size_t j = 0; j < column_names.size(); ++j) {
      if (j > 0) ofs << d;
      ofs << csv_escape(column_names[j], d);
    }
    ofs << "\n";
  }

  for (const auto& row : samples) {
    for (std::size_t j = 0; j < row.size(); ++j) {
      if (j > 0) ofs << d;
      ofs << csv_double(row[j], opt.precision);
    }
    ofs << "\n";
  }

  return ofs.good();
}

}  // namespace procsim
