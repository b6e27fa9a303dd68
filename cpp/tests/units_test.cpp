#include <gtest/gtest.h>

#include "engine/core/errors.hpp"
#include "engine/flowsheet/flowsheet.hpp"
#include "engine/flowsheet/units.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace procsim;

TEST(units, mixer_sums_inlets)
{
    Flowsheet fs({"A", "B"});
    const StreamId a = fs.add_stream("a", {1.0, 2.0});
    const StreamId b = fs.add_stream("b", {3.0, 4.0});
    const StreamId m = fs.add_stream("m");
    Mixer& mixer = fs.add_unit<Mixer>("M1", std::vector<StreamId>{a, b}, m);

    mixer.run(fs.streams());
    EXPECT_DOUBLE_EQ(fs.stream(m).flows[0], 4.0);
    EXPECT_DOUBLE_EQ(fs.stream(m).flows[1], 6.0);
    EXPECT_EQ(mixer.run_count(), 1u);
}

TEST(units, splitter_uniform_and_per_component)
{
    Flowsheet fs({"A", "B"});
    const StreamId in = fs.add_stream("in", {10.0, 20.0});
    const StreamId top = fs.add_stream("top");
    const StreamId bottom = fs.add_stream("bottom");
    Splitter& s = fs.add_unit<Splitter>("S1", in, top, bottom, 0.25);

    s.run(fs.streams());
    EXPECT_DOUBLE_EQ(fs.stream(top).flows[0], 2.5);
    EXPECT_DOUBLE_EQ(fs.stream(bottom).flows[1], 15.0);

    s.set_splits({1.0, 0.0});
    s.run(fs.streams());
    EXPECT_DOUBLE_EQ(fs.stream(top).flows[0], 10.0);
    EXPECT_DOUBLE_EQ(fs.stream(top).flows[1], 0.0);
    EXPECT_DOUBLE_EQ(fs.stream(bottom).flows[1], 20.0);

    EXPECT_THROW(s.set_split(1.5), ValidationError);
    EXPECT_THROW(s.set_splits({}), ValidationError);
}

TEST(units, reactor_converts_and_sizes)
{
    Flowsheet fs({"A", "B"});
    const StreamId in = fs.add_stream("in", {100.0, 0.0});
    const StreamId out = fs.add_stream("out");
    ReactorDesignBasis basis;
    basis.residence_time_h = 2.0;
    ConversionReactor& r = fs.add_unit<ConversionReactor>("R1", in, out, 0, 1, 0.6, basis);

    r.run(fs.streams());
    EXPECT_DOUBLE_EQ(fs.stream(out).flows[0], 40.0);
    EXPECT_DOUBLE_EQ(fs.stream(out).flows[1], 60.0);

    r.summarize(fs.streams());
    // 100 kg/h / 1000 kg/m3 * 2 h / 0.9
    const double V = 0.1 * 2.0 / 0.9;
    EXPECT_NEAR(r.design_results().at("Volume [m3]"), V, 1e-12);
    EXPECT_NEAR(r.cost_results().at("Reactor [USD]"), 1.0e6 * std::pow(V / 100.0, 0.6), 1e-6);
    EXPECT_NEAR(r.purchase_cost(), r.cost_results().at("Reactor [USD]"), 1e-9);

    r.set_cost_factor(2.0);
    r.cost();
    EXPECT_NEAR(r.purchase_cost(), 2.0e6 * std::pow(V / 100.0, 0.6), 1e-6);
}

TEST(units, reactor_setters_reject_out_of_domain)
{
    Flowsheet fs({"A", "B"});
    const StreamId in = fs.add_stream("in", {1.0, 0.0});
    const StreamId out = fs.add_stream("out");
    ConversionReactor& r = fs.add_unit<ConversionReactor>("R1", in, out, 0, 1, 0.5);

    EXPECT_THROW(r.set_conversion(-0.1), ValidationError);
    EXPECT_THROW(r.set_conversion(1.1), ValidationError);
    EXPECT_THROW(r.set_residence_time(0.0), ValidationError);
    EXPECT_THROW(r.set_cost_factor(-1.0), ValidationError);
    EXPECT_DOUBLE_EQ(r.conversion(), 0.5);
}

TEST(units, heater_sets_temperature_and_duty)
{
    Flowsheet fs({"water"});
    const StreamId in = fs.add_stream("in", {3600.0});
    const StreamId out = fs.add_stream("out");
    Heater& h = fs.add_unit<Heater>("H1", in, out, 308.15, 4.0);

    h.run(fs.streams());
    h.summarize(fs.streams());
    EXPECT_DOUBLE_EQ(fs.stream(out).T, 308.15);
    // 3600 kg/h * 4 kJ/kgK * 10 K / 3600
    EXPECT_NEAR(h.design_results().at("Duty [kW]"), 40.0, 1e-9);
    EXPECT_THROW(h.set_outlet_temperature(-5.0), ValidationError);
}

TEST(units, infeasible_outlet_is_reported_with_unit_id)
{
    Flowsheet fs({"A"});
    const StreamId in = fs.add_stream("in", {1.0});
    const StreamId out = fs.add_stream("out");
    PassThrough& p = fs.add_unit<PassThrough>("P1", in, out);

    fs.stream(in).flows[0] = -1.0;
    try {
        p.run(fs.streams());
        FAIL() << "expected InfeasibleStateError";
    } catch (const InfeasibleStateError& e) {
        EXPECT_NE(std::string(e.what()).find("P1"), std::string::npos);
    }
}
