#include <gtest/gtest.h>

#include "engine/core/errors.hpp"
#include "engine/flowsheet/block.hpp"
#include "test_plants.hpp"

using namespace procsim;
using namespace procsim::test_plants;

TEST(block, downstream_unit_gives_acyclic_tail)
{
    ReactionLoop p = make_reaction_loop();
    p.system->simulate();

    Block b(*p.system, p.H1);
    EXPECT_FALSE(b.empty());
    EXPECT_FALSE(b.has_recycle());
    ASSERT_EQ(b.units().size(), 1u);
    EXPECT_EQ(b.units()[0], p.H1);
    EXPECT_EQ(b.target(), p.H1);

    const std::size_t t1_runs = p.fs->unit(p.T1).run_count();
    const std::size_t h1_runs = p.fs->unit(p.H1).run_count();
    const ConvergenceReport rep = b.simulate();
    EXPECT_TRUE(rep.converged);
    EXPECT_EQ(rep.total_iterations(), 0u);
    EXPECT_EQ(p.fs->unit(p.T1).run_count(), t1_runs);
    EXPECT_EQ(p.fs->unit(p.H1).run_count(), h1_runs + 1);
}

TEST(block, nested_loop_is_kept_whole)
{
    ReactionLoop p = make_reaction_loop();
    Block b(*p.system, p.R1);

    // The loop element (M1, R1, S1) plus everything downstream; T1 is upstream.
    EXPECT_FALSE(b.covers(p.T1));
    EXPECT_TRUE(b.covers(p.M1));
    EXPECT_TRUE(b.covers(p.R1));
    EXPECT_TRUE(b.covers(p.S1));
    EXPECT_TRUE(b.covers(p.H1));
    // The recycle belongs to the nested system, not to the Block.
    EXPECT_FALSE(b.has_recycle());
}

TEST(block, recycle_edge_pulls_in_the_loop)
{
    ReactionLoop p = make_flat_reaction_loop();
    Block b(*p.system, p.S1);

    EXPECT_TRUE(b.has_recycle());
    ASSERT_EQ(b.units().size(), 4u);
    EXPECT_EQ(b.units()[0], p.M1);
    EXPECT_EQ(b.units()[1], p.R1);
    EXPECT_EQ(b.units()[2], p.S1);
    EXPECT_EQ(b.units()[3], p.H1);
    EXPECT_FALSE(b.covers(p.T1));
}

TEST(block, stream_target_maps_to_its_consumer)
{
    ReactionLoop p = make_reaction_loop();
    Block feed(*p.system, p.raw_feed);
    EXPECT_EQ(feed.target(), p.T1);
    EXPECT_EQ(feed.units().size(), 5u);

    Block vent(*p.system, p.vent);
    EXPECT_TRUE(vent.empty());
    EXPECT_TRUE(vent.units().empty());
    EXPECT_FALSE(vent.target().has_value());
    EXPECT_TRUE(vent.simulate().converged);
}

TEST(block, unit_outside_the_system_is_rejected)
{
    ReactionLoop p = make_reaction_loop();
    System tail(*p.fs, Network{"tail", {p.H1}});
    EXPECT_THROW(Block(tail, p.R1), ValidationError);
}

TEST(block, matches_full_simulation_after_a_change)
{
    ConvergenceSettings s;
    s.relative_flow_tolerance = 1e-6;
    s.max_iterations = 200;

    // Re-simulate only the Block after the change.
    ReactionLoop p = make_flat_reaction_loop(s);
    p.system->simulate();
    Block b(*p.system, p.R1);
    p.reactor->set_conversion(0.5);
    b.simulate();

    // Reference: fresh plant at the new conversion.
    ReactionLoop ref = make_flat_reaction_loop(s);
    ref.reactor->set_conversion(0.5);
    ref.system->simulate();

    for (StreamId id : {p.recycle, p.product, p.product_hot}) {
        const Stream& a = p.fs->stream(id);
        const Stream& r = ref.fs->stream(id);
        EXPECT_NEAR(a.flows[p.A], r.flows[p.A], 1e-3) << a.name;
        EXPECT_NEAR(a.flows[p.B], r.flows[p.B], 1e-3) << a.name;
        EXPECT_NEAR(a.T, r.T, 1e-6) << a.name;
    }
    EXPECT_NEAR(p.fs->unit(p.R1).purchase_cost(), ref.fs->unit(p.R1).purchase_cost(), 1.0);
}

TEST(block, follows_parent_settings)
{
    ReactionLoop p = make_flat_reaction_loop();
    Block b(*p.system, p.M1);
    p.system->simulate();

    // Feed is populated; a cold recycle cannot settle in one pass.
    p.reactor->set_conversion(0.9);
    p.system->reset_recycles();

    ConvergenceSettings s;
    s.max_iterations = 1;
    p.system->set_settings(s);
    EXPECT_THROW(b.simulate(), ConvergenceFailure);

    p.system->set_settings(ConvergenceSettings{});
    p.system->reset_recycles();
    EXPECT_TRUE(b.simulate().converged);
}
