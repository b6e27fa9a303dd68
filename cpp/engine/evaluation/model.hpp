#pragma once
/*
================================================================================
Evaluation: Model (Parametric Monte Carlo Driver)
FILE: cpp/engine/evaluation/model.hpp

Purpose:
  - Bind parameters and metrics to a System and evaluate sample matrices with
    the least recomputation per sample.

Parameter order (fixed whenever a parameter is added):
  1. Coupled, most upstream element first (flattened System position)
  2. Design, cost and isolated parameters, in insertion order
  Ties keep insertion order. Sample columns follow this order.

evaluate(sample):
  - Domain check of every value before anything is mutated.
  - First sample, or first after a failure: apply every setter, then a full
    System simulate.
  - Otherwise only changed values are applied: coupled setters, then each
    changed coupled Block upstream to downstream (a Block whose target unit
    was already re-run by an earlier Block is skipped), then the changed
    design, cost and isolated parameters in column order.
  - Metrics are read and a row is appended to table().

Hardening:
  - Bulk evaluate() turns SimulationError / ParameterBoundsError into a failed
    row and continues; any other error propagates.
  - After a failure the recycle streams are emptied (configurable) so the
    next sample starts cold instead of from a diverged guess.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/evaluation/parameter.hpp"
#include "engine/evaluation/result_table.hpp"
#include "engine/evaluation/sampler.hpp"
#include "engine/flowsheet/system.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace procsim {

struct Metric {
  std::string name;
  std::string units;
  std::function<double()> getter;

  double operator()() const { return getter(); }
};

struct EvaluationSummary {
  std::size_t samples = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t iterations = 0;  // recycle iterations, nested included
};

class Model {
 public:
  explicit Model(System& system, ModelSettings settings = {});

  Model(const Model&) = delete;
  Model& operator=(const Model&) = delete;

  // Returned references stay valid for the lifetime of the Model.
  Parameter& add_parameter(std::function<void(double)> setter,
                           Element element,
                           ParameterKind kind,
                           std::optional<Distribution> distribution,
                           std::string name,
                           std::string units = {},
                           std::optional<double> baseline = std::nullopt);
  Parameter& add_parameter(ParameterSpec spec);

  Metric& add_metric(std::string name, std::function<double()> getter, std::string units = {});

  std::size_t parameter_count() const noexcept { return parameters_.size(); }
  Parameter& parameter(std::size_t i);
  const Parameter& parameter(std::size_t i) const;
  Parameter* find_parameter(const std::string& name) noexcept;

  std::size_t metric_count() const noexcept { return metrics_.size(); }
  const Metric& metric(std::size_t i) const;

  std::vector<std::string> parameter_names() const;
  std::vector<std::string> metric_names() const;

  // n x parameter_count() matrix drawn through each parameter's distribution.
  SampleMatrix sample(std::size_t n, SamplingRule rule, std::uint64_t seed) const;

  std::vector<double> baseline_sample() const;

  // Rows are reordered by coupled columns (most upstream first) so that
  // consecutive samples share upstream values; clears results.
  void load_samples(SampleMatrix samples);
  const SampleMatrix& samples() const noexcept { return samples_; }

  // sample_order()[r] = index in the matrix given to load_samples() of row r.
  const std::vector<std::size_t>& sample_order() const noexcept { return order_; }

  // Single sample; throws on failure. Returns metric values.
  std::vector<double> evaluate(const std::vector<double>& sample);

  // Every loaded sample, in loaded order.
  EvaluationSummary evaluate();

  const ResultTable& table() const noexcept { return table_; }
  void clear_results();

  System& system() noexcept { return system_; }
  const System& system() const noexcept { return system_; }
  const ModelSettings& settings() const noexcept { return settings_; }

  // Recycle iterations spent by this Model so far.
  std::size_t total_iterations() const noexcept { return iterations_; }

 private:
  SimulateAction make_action_(const ParameterSpec& spec, std::size_t& position);
  void reorder_parameters_();
  void reset_table_();

  std::vector<double> evaluate_(const std::vector<double>& sample, std::size_t index);
  void apply_all_(const std::vector<double>& sample);
  void apply_changed_(const std::vector<double>& sample);
  void handle_failure_();
  void record_failure_(const std::vector<double>& sample, std::size_t index, const std::string& msg);

  System& system_;
  ModelSettings settings_;
  std::vector<std::unique_ptr<Parameter>> parameters_;
  std::vector<std::unique_ptr<Metric>> metrics_;
  SampleMatrix samples_;
  std::vector<std::size_t> order_;
  ResultTable table_;
  bool primed_ = false;
  std::size_t iterations_ = 0;
};

} // namespace procsim
