/*
================================================================================
Evaluation: Model (Implementation)
FILE: cpp/engine/evaluation/model.cpp
================================================================================
Purpose:
  - Parameter/metric registration and the fixed column order.
  - Sample generation, coupled-column sorting of loaded samples.
  - Single and bulk evaluation with changed-parameter detection and
    Block re-simulation.

Hardening:
  - Every value is bounds-checked before any setter runs.
  - After a failure the next sample re-applies all setters on a cold recycle.
================================================================================
*/

#include "engine/evaluation/model.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <sstream>
#include <utility>

namespace procsim {

namespace {

constexpr std::size_t kUnplaced = std::numeric_limits<std::size_t>::max();

}  // namespace

Model::Model(System& system, ModelSettings settings) : system_(system), settings_(settings) {
  settings_.validate_or_throw();
}

// ----------------------------- Parameters ------------------------------------

Parameter& Model::add_parameter(std::function<void(double)> setter,
                                Element element,
                                ParameterKind kind,
                                std::optional<Distribution> distribution,
                                std::string name,
                                std::string units,
                                std::optional<double> baseline) {
  ParameterSpec spec;
  spec.setter = std::move(setter);
  spec.element = element;
  spec.kind = kind;
  spec.distribution = std::move(distribution);
  spec.name = std::move(name);
  spec.units = std::move(units);
  spec.baseline = baseline;
  return add_parameter(std::move(spec));
}

Parameter& Model::add_parameter(ParameterSpec spec) {
  if (find_parameter(spec.name) != nullptr) {
    throw ValidationError("Model: duplicate parameter name '" + spec.name + "'");
  }

  std::size_t position = kUnplaced;
  SimulateAction action = make_action_(spec, position);
  auto p = std::make_unique<Parameter>(std::move(spec), std::move(action));
  p->position_ = position;

  Parameter& ref = *p;
  parameters_.push_back(std::move(p));
  reorder_parameters_();

  samples_.clear();
  order_.clear();
  primed_ = false;
  reset_table_();

  log(LogLevel::DEBUG, std::string("model: added ") + to_string(ref.kind()) + " parameter '" + ref.name() + "'");
  return ref;
}

SimulateAction Model::make_action_(const ParameterSpec& spec, std::size_t& position) {
  const std::string where = "Model: parameter '" + spec.name + "'";
  Flowsheet& fs = system_.flowsheet();

  switch (spec.kind) {
    case ParameterKind::Isolated:
      return action::Isolated{};

    case ParameterKind::Design:
    case ParameterKind::Cost: {
      const auto* unit = std::get_if<UnitId>(&spec.element);
      if (unit == nullptr) throw ValidationError(where + ": design/cost parameters must target a unit");
      if (!system_.contains(*unit)) {
        throw ValidationError(where + ": unit '" + fs.unit(*unit).id() + "' is not part of the system");
      }
      if (spec.kind == ParameterKind::Design) return action::DesignRefresh{&fs, *unit};
      return action::CostRefresh{&fs, *unit};
    }

    case ParameterKind::Coupled: {
      action::Coupled coupled;
      if (const auto* unit = std::get_if<UnitId>(&spec.element)) {
        coupled.block = std::make_unique<Block>(system_, *unit);
      } else if (const auto* stream = std::get_if<StreamId>(&spec.element)) {
        coupled.block = std::make_unique<Block>(system_, *stream);
      } else {
        throw ValidationError(where + ": coupled parameters must target a unit or a stream");
      }
      if (coupled.block->target()) {
        position = system_.position_of(*coupled.block->target()).value_or(kUnplaced);
      }
      return coupled;
    }
  }
  PROCSIM_THROW(ErrorCode::kInternal, where + ": unknown parameter kind");
}

void Model::reorder_parameters_() {
  std::stable_sort(parameters_.begin(), parameters_.end(),
                   [](const std::unique_ptr<Parameter>& a, const std::unique_ptr<Parameter>& b) {
                     const bool ca = a->kind() == ParameterKind::Coupled;
                     const bool cb = b->kind() == ParameterKind::Coupled;
                     if (ca && cb) return a->position() < b->position();
                     // Coupled first; design, cost and isolated keep insertion order.
                     return ca && !cb;
                   });
}

Parameter& Model::parameter(std::size_t i) {
  PROCSIM_ENSURE(i < parameters_.size(), ErrorCode::kOutOfRange, "Model: parameter index out of range");
  return *parameters_[i];
}

const Parameter& Model::parameter(std::size_t i) const {
  PROCSIM_ENSURE(i < parameters_.size(), ErrorCode::kOutOfRange, "Model: parameter index out of range");
  return *parameters_[i];
}

Parameter* Model::find_parameter(const std::string& name) noexcept {
  for (auto& p : parameters_) {
    if (p->name() == name) return p.get();
  }
  return nullptr;
}

std::vector<std::string> Model::parameter_names() const {
  std::vector<std::string> out;
  out.reserve(parameters_.size());
  for (const auto& p : parameters_) out.push_back(p->name());
  return out;
}

// ----------------------------- Metrics ---------------------------------------

Metric& Model::add_metric(std::string name, std::function<double()> getter, std::string units) {
  if (name.empty()) throw ValidationError("Model: metric name is empty");
  if (!getter) throw ValidationError("Model: metric '" + name + "' has no getter");
  for (const auto& m : metrics_) {
    if (m->name == name) throw ValidationError("Model: duplicate metric name '" + name + "'");
  }
  metrics_.push_back(std::make_unique<Metric>(Metric{std::move(name), std::move(units), std::move(getter)}));
  reset_table_();
  return *metrics_.back();
}

const Metric& Model::metric(std::size_t i) const {
  PROCSIM_ENSURE(i < metrics_.size(), ErrorCode::kOutOfRange, "Model: metric index out of range");
  return *metrics_[i];
}

std::vector<std::string> Model::metric_names() const {
  std::vector<std::string> out;
  out.reserve(metrics_.size());
  for (const auto& m : metrics_) out.push_back(m->name);
  return out;
}

// ----------------------------- Samples ---------------------------------------

SampleMatrix Model::sample(std::size_t n, SamplingRule rule, std::uint64_t seed) const {
  if (parameters_.empty()) throw ValidationError("Model: no parameters to sample");
  for (const auto& p : parameters_) {
    if (!p->distribution()) throw ValidationError("Model: parameter '" + p->name() + "' has no distribution");
  }

  SampleMatrix m = unit_samples(n, parameters_.size(), rule, seed);
  for (auto& row : m) {
    for (std::size_t j = 0; j < row.size(); ++j) row[j] = parameters_[j]->distribution()->ppf(row[j]);
  }
  return m;
}

std::vector<double> Model::baseline_sample() const {
  std::vector<double> out;
  out.reserve(parameters_.size());
  for (const auto& p : parameters_) out.push_back(p->baseline());
  return out;
}

void Model::load_samples(SampleMatrix samples) {
  if (parameters_.empty()) throw ValidationError("Model: load_samples requires parameters");
  for (std::size_t r = 0; r < samples.size(); ++r) {
    if (samples[r].size() != parameters_.size()) {
      std::ostringstream oss;
      oss << "Model: sample row " << r << " has " << samples[r].size() << " value(s), expected "
          << parameters_.size();
      throw ValidationError(oss.str());
    }
    for (double v : samples[r]) {
      if (!is_finite(v)) throw ValidationError("Model: sample row " + std::to_string(r) + " is not finite");
    }
  }

  std::size_t coupled = 0;
  while (coupled < parameters_.size() && parameters_[coupled]->kind() == ParameterKind::Coupled) ++coupled;

  std::vector<std::size_t> order(samples.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return std::lexicographical_compare(samples[a].begin(), samples[a].begin() + coupled,
                                        samples[b].begin(), samples[b].begin() + coupled);
  });

  SampleMatrix sorted;
  sorted.reserve(samples.size());
  for (std::size_t i : order) sorted.push_back(std::move(samples[i]));

  samples_ = std::move(sorted);
  order_ = std::move(order);
  table_.clear();
}

// ----------------------------- Evaluation ------------------------------------

void Model::apply_all_(const std::vector<double>& sample) {
  for (std::size_t i = 0; i < parameters_.size(); ++i) parameters_[i]->set(sample[i]);
  const ConvergenceReport rep = system_.simulate();
  iterations_ += rep.total_iterations();
}

void Model::apply_changed_(const std::vector<double>& sample) {
  std::vector<char> changed(parameters_.size(), 0);
  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    const auto& prev = parameters_[i]->value();
    changed[i] = !settings_.skip_unchanged_parameters || !prev || *prev != sample[i];
  }

  // Coupled setters first, so every Block sees all new upstream values.
  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    if (changed[i] && parameters_[i]->kind() == ParameterKind::Coupled) parameters_[i]->set(sample[i]);
  }

  std::vector<const Block*> ran;
  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    Parameter& p = *parameters_[i];
    if (!changed[i] || p.kind() != ParameterKind::Coupled) continue;
    Block* block = p.block();
    if (block->empty()) continue;

    const UnitId target = *block->target();
    const bool covered = std::any_of(ran.begin(), ran.end(), [&](const Block* b) { return b->covers(target); });
    if (covered) continue;

    const ConvergenceReport rep = block->simulate();
    iterations_ += rep.total_iterations();
    ran.push_back(block);
  }

  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    Parameter& p = *parameters_[i];
    if (!changed[i] || p.kind() == ParameterKind::Coupled) continue;
    p.set(sample[i]);
    p.simulate();
  }
}

void Model::handle_failure_() {
  primed_ = false;
  for (auto& p : parameters_) p->invalidate();
  if (settings_.reset_recycles_on_failure) system_.reset_recycles();
}

std::vector<double> Model::evaluate_(const std::vector<double>& sample, std::size_t index) {
  if (sample.size() != parameters_.size()) {
    std::ostringstream oss;
    oss << "Model: sample has " << sample.size() << " value(s), expected " << parameters_.size();
    throw ValidationError(oss.str());
  }
  for (std::size_t i = 0; i < parameters_.size(); ++i) parameters_[i]->check(sample[i]);

  std::vector<double> values;
  try {
    if (!primed_) {
      apply_all_(sample);
      primed_ = true;
    } else {
      apply_changed_(sample);
    }

    values.reserve(metrics_.size());
    for (const auto& m : metrics_) values.push_back((*m)());
  } catch (const ProcsimError&) {
    handle_failure_();
    throw;
  }

  ResultRow row;
  row.sample_index = index;
  row.parameters = sample;
  row.metrics.assign(values.begin(), values.end());
  table_.append(std::move(row));
  return values;
}

std::vector<double> Model::evaluate(const std::vector<double>& sample) {
  return evaluate_(sample, table_.size());
}

void Model::record_failure_(const std::vector<double>& sample, std::size_t index, const std::string& msg) {
  ResultRow row;
  row.sample_index = index;
  row.parameters = sample;
  row.metrics.assign(metrics_.size(), std::nullopt);
  row.failure = msg.empty() ? std::string("failed") : msg;
  table_.append(std::move(row));

  std::ostringstream oss;
  oss << "model: sample " << index << " failed: " << msg;
  log(LogLevel::WARN, oss.str());
}

EvaluationSummary Model::evaluate() {
  if (samples_.empty()) throw ValidationError("Model: no samples loaded");

  EvaluationSummary s;
  s.samples = samples_.size();
  const std::size_t it0 = iterations_;

  for (std::size_t r = 0; r < samples_.size(); ++r) {
    try {
      evaluate_(samples_[r], order_[r]);
      ++s.succeeded;
    } catch (const SimulationError& e) {
      record_failure_(samples_[r], order_[r], e.what());
      ++s.failed;
    } catch (const ParameterBoundsError& e) {
      record_failure_(samples_[r], order_[r], e.what());
      ++s.failed;
    }

    if (log_enabled(LogLevel::DEBUG)) {
      std::ostringstream oss;
      oss << "model: sample " << (r + 1) << "/" << s.samples << " done";
      log(LogLevel::DEBUG, oss.str());
    }
  }
  s.iterations = iterations_ - it0;

  std::ostringstream oss;
  oss << "model: evaluated " << s.samples << " sample(s): " << s.succeeded << " succeeded, "
      << s.failed << " failed, " << s.iterations << " recycle iteration(s)";
  log(s.failed > 0 ? LogLevel::WARN : LogLevel::INFO, oss.str());
  return s;
}

void Model::clear_results() { table_.clear(); }

void Model::reset_table_() { table_ = ResultTable(parameter_names(), metric_names()); }

} // namespace procsim
