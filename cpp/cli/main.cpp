/*
================================================================================
CLI: Main Entry Point (procsim_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line driver for the procsim engine on a built-in demo plant:

      raw_feed -> T1 (feed tank) -> [ M1 -> R1 -> S1 ] -> H1 -> product_hot
                                     ^            |
                                     +- recycle --+

    A -> B conversion reactor inside a recycle loop, product heater after it.

Usage:
  procsim_cli [command] [options]

Commands:
  simulate                     Converge the plant and print streams/results
  evaluate [N] [rule] [csv]    Monte Carlo campaign (rule: random|lhs|halton)
  help                         Show help message

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures
  - Deterministic output (fixed seed)
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/evaluation/model.hpp"
#include "engine/exports/results_csv.hpp"
#include "engine/flowsheet/flowsheet.hpp"
#include "engine/flowsheet/system.hpp"
#include "engine/flowsheet/units.hpp"
#include "engine/stats/sensitivity.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace procsim;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
procsim_cli - recycle-converging flowsheet engine with Monte Carlo evaluation

Usage:
  procsim_cli [command] [options] [--debug | --log-level=<level>]

  --log-level accepts debug, info, warn or error; --debug is short for
  --log-level=debug.

Commands:
  simulate                     Converge the demo plant and print the results
  evaluate [N] [rule] [csv]    Run N samples (default 100) with the given
                               sampling rule (random | lhs | halton, default
                               lhs); optionally write the results to csv
  help                         Show this help message

Examples:
  procsim_cli simulate
  procsim_cli evaluate 500 halton results.csv
  procsim_cli evaluate 50 random --log-level=warn

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

// -----------------------------
// Demo plant
// -----------------------------
struct DemoPlant {
  std::unique_ptr<Flowsheet> fs;
  std::unique_ptr<System> system;

  std::size_t A = 0;
  std::size_t B = 0;

  StreamId raw_feed{};
  StreamId recycle{};
  StreamId product{};
  StreamId product_hot{};

  UnitId T1{};
  UnitId M1{};
  UnitId R1{};
  UnitId S1{};
  UnitId H1{};

  ConversionReactor* reactor = nullptr;
  Splitter* splitter = nullptr;
};

DemoPlant build_demo_plant(const ConvergenceSettings& settings) {
  DemoPlant p;
  p.fs = std::make_unique<Flowsheet>(std::vector<std::string>{"A", "B"});
  Flowsheet& fs = *p.fs;
  p.A = fs.streams().component_index("A");
  p.B = fs.streams().component_index("B");

  p.raw_feed = fs.add_feed("raw_feed", {{"A", 100.0}});
  const StreamId feed = fs.add_stream("feed");
  p.recycle = fs.add_stream("recycle");
  const StreamId mixed = fs.add_stream("mixed");
  const StreamId reacted = fs.add_stream("reacted");
  p.product = fs.add_stream("product");
  p.product_hot = fs.add_stream("product_hot");
  fs.stream(p.product_hot).price = 1.5;

  fs.add_unit<PassThrough>("T1", p.raw_feed, feed);
  fs.add_unit<Mixer>("M1", std::vector<StreamId>{feed, p.recycle}, mixed);
  p.reactor = &fs.add_unit<ConversionReactor>("R1", mixed, reacted, p.A, p.B, 0.6);
  p.splitter = &fs.add_unit<Splitter>("S1", reacted, p.product, p.recycle, 0.7);
  fs.add_unit<Heater>("H1", p.product, p.product_hot, 350.0);

  p.T1 = fs.unit_id("T1");
  p.M1 = fs.unit_id("M1");
  p.R1 = fs.unit_id(*p.reactor);
  p.S1 = fs.unit_id(*p.splitter);
  p.H1 = fs.unit_id("H1");

  Network loop{"reaction_loop", {p.M1, p.R1, p.S1}, p.recycle};
  Network plant{"plant", {p.T1, loop, p.H1}};
  p.system = std::make_unique<System>(fs, plant, settings);
  return p;
}

void print_streams(const Flowsheet& fs) {
  const StreamTable& st = fs.streams();
  std::cout << std::left << std::setw(14) << "stream";
  for (const auto& c : st.components()) std::cout << std::right << std::setw(12) << c;
  std::cout << std::setw(12) << "total" << std::setw(10) << "T [K]" << "\n";

  for (std::size_t i = 0; i < st.size(); ++i) {
    const Stream& s = st.at(StreamId{i});
    std::cout << std::left << std::setw(14) << s.name << std::right << std::fixed << std::setprecision(3);
    for (double f : s.flows) std::cout << std::setw(12) << f;
    std::cout << std::setw(12) << s.total_flow() << std::setw(10) << std::setprecision(2) << s.T << "\n";
  }
  std::cout.unsetf(std::ios::fixed);
}

void print_results(const Unit& u) {
  for (const auto& [k, v] : u.design_results()) std::cout << "  " << u.id() << " " << k << ": " << v << "\n";
  for (const auto& [k, v] : u.cost_results()) std::cout << "  " << u.id() << " " << k << ": " << v << "\n";
}

int cmd_simulate() {
  std::cout << "=== Demo Plant Simulation ===\n";

  try {
    EngineSettings settings = EngineSettings::defaults();
    DemoPlant p = build_demo_plant(settings.convergence);

    const ConvergenceReport rep = p.system->simulate();

    std::cout << "System: " << p.system->id() << "\n";
    std::cout << "Method: " << to_string(settings.convergence.relaxation_method) << "\n";
    std::cout << "Recycle iterations (nested): " << rep.total_iterations() << "\n\n";
    print_streams(*p.fs);

    std::cout << "\nDesign / cost:\n";
    print_results(p.fs->unit(p.R1));
    print_results(p.fs->unit(p.H1));
    std::cout << "\nSimulation: SUCCESS\n";
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_evaluate(std::size_t n, SamplingRule rule, const std::string& csv_path) {
  std::cout << "=== Monte Carlo Evaluation ===\n";

  try {
    EngineSettings settings = EngineSettings::defaults();
    DemoPlant p = build_demo_plant(settings.convergence);
    Flowsheet& fs = *p.fs;
    ConversionReactor& reactor = *p.reactor;
    Splitter& splitter = *p.splitter;

    Model model(*p.system, settings.model);

    model.add_parameter([&fs, &p](double v) { fs.stream(p.raw_feed).flows[p.A] = v; },
                        p.raw_feed, ParameterKind::Coupled, Distribution::uniform(80.0, 120.0),
                        "feed_rate", "kg/h");
    model.add_parameter([&reactor](double v) { reactor.set_conversion(v); },
                        p.R1, ParameterKind::Coupled, Distribution::triangular(0.5, 0.6, 0.7),
                        "conversion", "-");
    model.add_parameter([&splitter](double v) { splitter.set_split(1.0 - v); },
                        p.S1, ParameterKind::Coupled, Distribution::uniform(0.2, 0.4),
                        "recycle_fraction", "-", 0.3);
    model.add_parameter([&reactor](double v) { reactor.set_residence_time(v); },
                        p.R1, ParameterKind::Design, Distribution::uniform(0.5, 2.0),
                        "residence_time", "h");
    model.add_parameter([&reactor](double v) { reactor.set_cost_factor(v); },
                        p.R1, ParameterKind::Cost, Distribution::uniform(0.8, 1.2),
                        "reactor_cost_factor", "-");
    model.add_parameter([&fs, &p](double v) { fs.stream(p.product_hot).price = v; },
                        std::monostate{}, ParameterKind::Isolated, Distribution::uniform(1.0, 2.0),
                        "product_price", "USD/kg");

    model.add_metric("product_B", [&fs, &p] { return fs.stream(p.product_hot).flows[p.B]; }, "kg/h");
    model.add_metric("recycle_flow", [&fs, &p] { return fs.stream(p.recycle).total_flow(); }, "kg/h");
    model.add_metric("reactor_cost", [&reactor] { return reactor.purchase_cost(); }, "USD");
    model.add_metric("product_value", [&fs, &p] { return fs.stream(p.product_hot).cost(); }, "USD/h");

    model.load_samples(model.sample(n, rule, 1));
    const EvaluationSummary s = model.evaluate();

    std::cout << "Samples: " << s.samples << " (" << to_string(rule) << ")\n";
    std::cout << "Succeeded: " << s.succeeded << "\n";
    std::cout << "Failed: " << s.failed << "\n";
    std::cout << "Recycle iterations: " << s.iterations << "\n\n";

    std::cout << "Metric summary (mean / std / min / max, missing):\n";
    for (const auto& m : stats::summarize_metrics(model.table())) {
      std::cout << "  " << std::left << std::setw(14) << m.name << std::right
                << m.mean << " / " << m.std_sample << " / " << m.min_v << " / " << m.max_v
                << ", " << m.missing << "\n";
    }

    std::cout << "\nSpearman rank correlation:\n";
    for (const auto& param : model.parameter_names()) {
      std::cout << "  " << std::left << std::setw(20) << param << std::right;
      for (const auto& metric : model.metric_names()) {
        const auto rho = stats::spearman(model.table(), param, metric);
        std::cout << " " << metric << "=";
        if (rho) std::cout << std::fixed << std::setprecision(3) << *rho;
        else std::cout << "n/a";
        std::cout.unsetf(std::ios::fixed);
      }
      std::cout << "\n";
    }

    if (!csv_path.empty()) {
      if (!write_results_csv_file(model.table(), csv_path)) {
        std::cerr << "Failed to write CSV: " << csv_path << "\n";
        return ExitCode::IO_ERROR;
      }
      std::cout << "\nWrote " << csv_path << "\n";
    }

    std::cout << "\nEvaluation: " << (s.failed == 0 ? "SUCCESS" : "COMPLETED WITH FAILURES") << "\n";
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int main(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--debug") {
      set_log_level(LogLevel::DEBUG);
      continue;
    }
    if (a.rfind("--log-level=", 0) == 0) {
      const auto lvl = parse_log_level(a.substr(12));
      if (!lvl) {
        std::cerr << "Unknown log level: " << a.substr(12) << "\n";
        return ExitCode::INVALID_ARGS;
      }
      set_log_level(*lvl);
      continue;
    }
    args.push_back(a);
  }

  const std::string cmd = args.empty() ? "help" : args[0];

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd == "simulate") {
    return cmd_simulate();
  }

  if (cmd == "evaluate") {
    std::size_t n = 100;
    SamplingRule rule = SamplingRule::LatinHypercube;
    std::string csv;

    if (args.size() >= 2) {
      char* end = nullptr;
      const long long v = std::strtoll(args[1].c_str(), &end, 10);
      if (end == args[1].c_str() || *end != '\0' || v < 1) {
        std::cerr << "Invalid sample count: " << args[1] << "\n";
        return ExitCode::INVALID_ARGS;
      }
      n = static_cast<std::size_t>(v);
    }
    if (args.size() >= 3) {
      const auto r = parse_sampling_rule(args[2]);
      if (!r) {
        std::cerr << "Unknown sampling rule: " << args[2] << "\n";
        return ExitCode::INVALID_ARGS;
      }
      rule = *r;
    }
    if (args.size() >= 4) csv = args[3];

    return cmd_evaluate(n, rule, csv);
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'procsim_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
