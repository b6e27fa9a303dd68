#include <gtest/gtest.h>

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"
#include "engine/flowsheet/system.hpp"
#include "test_plants.hpp"

#include <memory>
#include <string>

using namespace procsim;
using namespace procsim::test_plants;

namespace {

ConvergenceSettings scenario_settings()
{
    ConvergenceSettings s;
    s.relative_flow_tolerance = 1e-3;
    s.max_iterations = 50;
    return s;
}

}  // namespace

TEST(system, acyclic_chain_runs_each_unit_once)
{
    Chain c = make_chain();
    const ConvergenceReport rep = c.system->converge();

    EXPECT_TRUE(rep.converged);
    EXPECT_EQ(rep.iterations, 0u);
    EXPECT_EQ(c.fs->unit(c.P1).run_count(), 1u);
    EXPECT_EQ(c.fs->unit(c.P2).run_count(), 1u);
    EXPECT_EQ(c.fs->unit(c.P3).run_count(), 1u);
    EXPECT_DOUBLE_EQ(c.fs->stream(c.out).flows[0], 10.0);
    EXPECT_DOUBLE_EQ(c.fs->stream(c.out).T, 320.0);
}

TEST(system, reaction_loop_reaches_analytic_recycle)
{
    ReactionLoop p = make_reaction_loop(scenario_settings());
    const ConvergenceReport rep = p.system->simulate();

    EXPECT_TRUE(rep.converged);
    EXPECT_EQ(rep.iterations, 0u);      // the plant itself has no recycle
    EXPECT_GT(rep.inner_iterations, 1u); // the nested loop does
    EXPECT_LE(rep.inner_iterations, 50u);

    const Stream& rec = p.fs->stream(p.recycle);
    EXPECT_NEAR(rec.flows[p.A], 13.636, 0.05);
    EXPECT_NEAR(rec.flows[p.B], 29.221, 0.1);
    EXPECT_NEAR(rec.total_flow(), 42.857, 0.1);

    // Overall mass balance: everything fed leaves through the product.
    EXPECT_NEAR(p.fs->stream(p.product_hot).total_flow(), 100.0, 0.1);
    EXPECT_NEAR(p.fs->stream(p.product_hot).flows[p.B], 68.18, 0.1);
}

TEST(system, cold_start_is_deterministic)
{
    ReactionLoop p = make_reaction_loop(scenario_settings());
    const ConvergenceReport first = p.system->simulate();
    const auto rec_first = p.fs->stream(p.recycle).flows;

    p.system->reset_recycles();
    EXPECT_TRUE(p.fs->stream(p.recycle).is_empty());

    const ConvergenceReport second = p.system->simulate();
    EXPECT_EQ(first.total_iterations(), second.total_iterations());
    EXPECT_DOUBLE_EQ(rec_first[p.A], p.fs->stream(p.recycle).flows[p.A]);
    EXPECT_DOUBLE_EQ(rec_first[p.B], p.fs->stream(p.recycle).flows[p.B]);
}

TEST(system, warm_start_needs_fewer_iterations)
{
    ReactionLoop p = make_reaction_loop(scenario_settings());
    const ConvergenceReport cold = p.system->converge();
    const ConvergenceReport warm = p.system->converge();

    EXPECT_LT(warm.total_iterations(), cold.total_iterations());
    EXPECT_EQ(p.system->total_iterations(), cold.total_iterations() + warm.total_iterations());
}

TEST(system, non_convergent_loop_raises_convergence_failure)
{
    ConvergenceSettings s = scenario_settings();
    s.max_iterations = 2;
    // Everything recycles: the loop inventory grows by the feed every pass.
    ReactionLoop p = make_reaction_loop(s, 1.0);

    try {
        p.system->converge();
        FAIL() << "expected ConvergenceFailure";
    } catch (const ConvergenceFailure& e) {
        EXPECT_EQ(e.system_id(), "reaction_loop");
        EXPECT_EQ(e.iterations(), 2u);
        EXPECT_GT(e.flow_error(), s.relative_flow_tolerance);
    }
    const System* loop = p.system->elements()[1].subsystem;
    ASSERT_NE(loop, nullptr);
    EXPECT_FALSE(loop->last_report().converged);
    EXPECT_EQ(loop->last_report().iterations, 2u);
}

TEST(system, time_limit_stops_a_slow_loop)
{
    ConvergenceSettings s;
    s.relative_flow_tolerance = 1e-9;
    s.flow_tolerance = 1e-9;
    s.max_iterations = 1000000;
    s.time_limit_s = 1e-3;
    // The inventory grows by the feed every pass; only the deadline ends it.
    ReactionLoop p = make_reaction_loop(s, 1.0);

    try {
        p.system->converge();
        FAIL() << "expected ConvergenceFailure";
    } catch (const ConvergenceFailure& e) {
        EXPECT_EQ(e.system_id(), "reaction_loop");
        EXPECT_GE(e.iterations(), 1u);
        EXPECT_LT(e.iterations(), 1000000u);
        EXPECT_NE(std::string(e.what()).find("time limit"), std::string::npos);
    }
}

TEST(system, convergence_failure_is_a_simulation_error)
{
    ConvergenceSettings s = scenario_settings();
    s.max_iterations = 1;
    ReactionLoop p = make_reaction_loop(s);
    EXPECT_THROW(p.system->converge(), SimulationError);
}

TEST(system, flat_and_nested_loops_agree)
{
    ReactionLoop nested = make_reaction_loop(scenario_settings());
    ReactionLoop flat = make_flat_reaction_loop(scenario_settings());
    nested.system->converge();
    const ConvergenceReport rep = flat.system->converge();

    EXPECT_GT(rep.iterations, 1u);
    EXPECT_EQ(rep.inner_iterations, 0u);
    EXPECT_NEAR(nested.fs->stream(nested.recycle).total_flow(),
                flat.fs->stream(flat.recycle).total_flow(), 0.1);
}

TEST(system, accelerators_reach_the_same_fixed_point)
{
    for (ConvergenceMethod m : {ConvergenceMethod::FixedPoint, ConvergenceMethod::Wegstein, ConvergenceMethod::Aitken}) {
        ConvergenceSettings s = scenario_settings();
        s.relaxation_method = m;
        ReactionLoop p = make_reaction_loop(s);
        const ConvergenceReport rep = p.system->converge();
        EXPECT_TRUE(rep.converged) << to_string(m);
        EXPECT_NEAR(p.fs->stream(p.recycle).flows[p.A], 13.636, 0.05) << to_string(m);
        EXPECT_NEAR(p.fs->stream(p.recycle).flows[p.B], 29.221, 0.1) << to_string(m);
    }
}

TEST(system, damped_fixed_point_converges)
{
    ConvergenceSettings s = scenario_settings();
    s.relaxation_factor = 0.7;
    ReactionLoop p = make_reaction_loop(s);
    EXPECT_TRUE(p.system->converge().converged);
    EXPECT_NEAR(p.fs->stream(p.recycle).total_flow(), 42.857, 0.15);
}

TEST(system, simulate_refreshes_design_and_cost)
{
    ReactionLoop p = make_reaction_loop(scenario_settings());
    p.system->simulate();

    const Unit& r = p.fs->unit(p.R1);
    const double V = p.fs->stream(p.reacted).total_flow() / 1000.0 * 1.0 / 0.9;
    EXPECT_NEAR(r.design_results().at("Volume [m3]"), V, 1e-9);
    EXPECT_GT(r.purchase_cost(), 0.0);
    EXPECT_GT(p.fs->unit(p.H1).design_results().at("Duty [kW]"), 0.0);
}

TEST(system, exposes_flattened_order)
{
    ReactionLoop p = make_reaction_loop();
    const auto& units = p.system->units();
    ASSERT_EQ(units.size(), 5u);
    EXPECT_EQ(units[0], p.T1);
    EXPECT_EQ(units[1], p.M1);
    EXPECT_EQ(units[4], p.H1);
    EXPECT_EQ(p.system->position_of(p.S1), 3u);
    EXPECT_FALSE(p.system->recycle().has_value());
    EXPECT_EQ(p.system->elements().size(), 3u);
    EXPECT_EQ(p.system->element_units(1).size(), 3u);
}

TEST(system_topology, rejects_out_of_order_path)
{
    ReactionLoop p = make_reaction_loop();
    Network loop{"loop", {p.M1, p.R1, p.S1}, p.recycle};
    EXPECT_THROW(System(*p.fs, Network{"bad", {loop, p.T1, p.H1}}), ValidationError);
}

TEST(system_topology, rejects_undeclared_recycle)
{
    ReactionLoop p = make_reaction_loop();
    EXPECT_THROW(System(*p.fs, Network{"bad", {p.M1, p.R1, p.S1}}), ValidationError);
}

TEST(system_topology, rejects_forward_edge_as_recycle)
{
    ReactionLoop p = make_reaction_loop();
    EXPECT_THROW(System(*p.fs, Network{"bad", {p.M1, p.R1, p.S1}, p.mixed}), ValidationError);
}

TEST(system_topology, rejects_recycle_produced_outside)
{
    ReactionLoop p = make_reaction_loop();
    EXPECT_THROW(System(*p.fs, Network{"bad", {p.R1, p.S1}, p.feed}), ValidationError);
}

TEST(system_topology, rejects_duplicate_units_and_empty_path)
{
    ReactionLoop p = make_reaction_loop();
    EXPECT_THROW(System(*p.fs, Network{"bad", {p.T1, p.T1}}), ValidationError);
    EXPECT_THROW(System(*p.fs, Network{"empty", {}}), ValidationError);
}

TEST(system_topology, rejects_invalid_settings)
{
    ReactionLoop p = make_reaction_loop();
    ConvergenceSettings s;
    s.max_iterations = 0;
    EXPECT_THROW(p.system->set_settings(s), ValidationError);

    s = ConvergenceSettings{};
    s.relaxation_factor = 1.5;
    EXPECT_THROW(System(*p.fs, Network{"chain", {p.T1}}, s), ValidationError);
}
