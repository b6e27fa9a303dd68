#include <gtest/gtest.h>

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/evaluation/parameter.hpp"
#include "test_plants.hpp"

#include <limits>
#include <memory>
#include <string>
#include <utility>

using namespace procsim;
using namespace procsim::test_plants;

namespace {

ParameterSpec isolated_spec(double* target)
{
    ParameterSpec spec;
    spec.name = "price";
    spec.units = "USD/kg";
    spec.setter = [target](double v) { *target = v; };
    spec.getter = [target]() { return *target; };
    spec.kind = ParameterKind::Isolated;
    spec.bounds = Bounds{0.0, 10.0};
    return spec;
}

}  // namespace

TEST(parameter, out_of_bounds_value_is_rejected_before_the_setter)
{
    double price = 1.0;
    Parameter p(isolated_spec(&price), action::Isolated{});

    try {
        p.set(12.0);
        FAIL() << "expected ParameterBoundsError";
    } catch (const ParameterBoundsError& e) {
        EXPECT_EQ(e.parameter(), "price");
        EXPECT_DOUBLE_EQ(e.value(), 12.0);
    }
    EXPECT_DOUBLE_EQ(price, 1.0);
    EXPECT_FALSE(p.value().has_value());

    EXPECT_THROW(p.check(std::numeric_limits<double>::quiet_NaN()), ParameterBoundsError);

    p.set(2.5);
    EXPECT_DOUBLE_EQ(price, 2.5);
    ASSERT_TRUE(p.value().has_value());
    EXPECT_DOUBLE_EQ(*p.value(), 2.5);

    p.invalidate();
    EXPECT_FALSE(p.value().has_value());
    EXPECT_DOUBLE_EQ(*p.current(), 2.5);
}

TEST(parameter, baseline_resolution_order)
{
    double price = 3.0;

    ParameterSpec explicit_baseline = isolated_spec(&price);
    explicit_baseline.baseline = 4.0;
    EXPECT_DOUBLE_EQ(Parameter(std::move(explicit_baseline), action::Isolated{}).baseline(), 4.0);

    // Falls back to the getter.
    EXPECT_DOUBLE_EQ(Parameter(isolated_spec(&price), action::Isolated{}).baseline(), 3.0);

    // Then to the distribution mean.
    ParameterSpec from_distribution = isolated_spec(&price);
    from_distribution.getter = nullptr;
    from_distribution.distribution = Distribution::uniform(2.0, 6.0);
    EXPECT_DOUBLE_EQ(Parameter(std::move(from_distribution), action::Isolated{}).baseline(), 4.0);

    ParameterSpec nothing = isolated_spec(&price);
    nothing.getter = nullptr;
    EXPECT_THROW((Parameter(std::move(nothing), action::Isolated{})), ValidationError);
}

TEST(parameter, construction_rejects_inconsistent_specs)
{
    double price = 1.0;

    ParameterSpec wide = isolated_spec(&price);
    wide.distribution = Distribution::uniform(5.0, 20.0);
    EXPECT_THROW((Parameter(std::move(wide), action::Isolated{})), ValidationError);

    ParameterSpec outside = isolated_spec(&price);
    outside.baseline = -1.0;
    EXPECT_THROW((Parameter(std::move(outside), action::Isolated{})), ValidationError);

    ParameterSpec unnamed = isolated_spec(&price);
    unnamed.name.clear();
    EXPECT_THROW((Parameter(std::move(unnamed), action::Isolated{})), ValidationError);

    ParameterSpec no_setter = isolated_spec(&price);
    no_setter.setter = nullptr;
    EXPECT_THROW((Parameter(std::move(no_setter), action::Isolated{})), ValidationError);

    ParameterSpec bad_bounds = isolated_spec(&price);
    bad_bounds.bounds = Bounds{2.0, 1.0};
    EXPECT_THROW((Parameter(std::move(bad_bounds), action::Isolated{})), ValidationError);

    ParameterSpec mismatched = isolated_spec(&price);
    mismatched.kind = ParameterKind::Design;
    try {
        Parameter bad(std::move(mismatched), action::Isolated{});
        FAIL() << "expected procsim::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvariant);
        EXPECT_EQ(std::string(e.site().file).find("parameter.cpp") != std::string::npos, true);
        EXPECT_EQ(std::string(e.what()).rfind("procsim[invariant]: Parameter 'price'", 0), 0u);
    }
}

TEST(parameter, setter_rejection_becomes_bounds_error)
{
    ReactionLoop p = make_reaction_loop();

    ParameterSpec spec;
    spec.name = "residence_time";
    spec.setter = [r = p.reactor](double v) { r->set_residence_time(v); };
    spec.getter = [r = p.reactor]() { return r->basis().residence_time_h; };
    spec.kind = ParameterKind::Design;
    spec.element = p.R1;
    Parameter param(std::move(spec), action::DesignRefresh{p.fs.get(), p.R1});

    EXPECT_THROW(param.set(0.0), ParameterBoundsError);
    EXPECT_FALSE(param.value().has_value());
}

TEST(parameter, design_refresh_leaves_streams_untouched)
{
    ReactionLoop p = make_reaction_loop();
    p.system->simulate();
    const auto before = p.fs->streams().snapshot();
    const double volume = p.fs->unit(p.R1).design_results().at("Volume [m3]");

    ParameterSpec spec;
    spec.name = "residence_time";
    spec.setter = [r = p.reactor](double v) { r->set_residence_time(v); };
    spec.getter = [r = p.reactor]() { return r->basis().residence_time_h; };
    spec.kind = ParameterKind::Design;
    spec.element = p.R1;
    Parameter param(std::move(spec), action::DesignRefresh{p.fs.get(), p.R1});

    const std::size_t r1_runs = p.fs->unit(p.R1).run_count();
    param(2.0);
    EXPECT_NEAR(p.fs->unit(p.R1).design_results().at("Volume [m3]"), 2.0 * volume, 1e-9);
    EXPECT_EQ(p.fs->unit(p.R1).run_count(), r1_runs);
    const auto after = p.fs->streams().snapshot();
    ASSERT_EQ(after.size(), before.size());
    for (std::size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].flows, before[i].flows) << after[i].name;
        EXPECT_DOUBLE_EQ(after[i].T, before[i].T) << after[i].name;
    }
    EXPECT_EQ(param.block(), nullptr);
}

TEST(parameter, cost_refresh_recosts_only)
{
    ReactionLoop p = make_reaction_loop();
    p.system->simulate();
    const double cost = p.fs->unit(p.R1).purchase_cost();
    const double volume = p.fs->unit(p.R1).design_results().at("Volume [m3]");

    ParameterSpec spec;
    spec.name = "cost_factor";
    spec.setter = [r = p.reactor](double v) { r->set_cost_factor(v); };
    spec.kind = ParameterKind::Cost;
    spec.element = p.R1;
    spec.baseline = 1.0;
    Parameter param(std::move(spec), action::CostRefresh{p.fs.get(), p.R1});

    const ConvergenceReport rep = param.simulate();
    EXPECT_TRUE(rep.converged);
    param(1.5);
    EXPECT_NEAR(p.fs->unit(p.R1).purchase_cost(), 1.5 * cost, 1e-6);
    EXPECT_DOUBLE_EQ(p.fs->unit(p.R1).design_results().at("Volume [m3]"), volume);
}

TEST(parameter, coupled_parameter_reconverges_its_block)
{
    ReactionLoop p = make_flat_reaction_loop();
    p.system->simulate();
    const double b_before = p.fs->stream(p.product_hot).flows[p.B];

    ParameterSpec spec;
    spec.name = "conversion";
    spec.setter = [r = p.reactor](double v) { r->set_conversion(v); };
    spec.getter = [r = p.reactor]() { return r->conversion(); };
    spec.kind = ParameterKind::Coupled;
    spec.element = p.R1;
    spec.bounds = Bounds{0.0, 1.0};
    Parameter param(std::move(spec), action::Coupled{std::make_unique<Block>(*p.system, p.R1)});

    ASSERT_NE(param.block(), nullptr);
    EXPECT_TRUE(param.block()->has_recycle());

    param.set(0.4);
    const ConvergenceReport rep = param.simulate();
    EXPECT_TRUE(rep.converged);
    EXPECT_GT(rep.iterations, 0u);
    EXPECT_LT(p.fs->stream(p.product_hot).flows[p.B], b_before);
}

TEST(parameter, kind_names)
{
    EXPECT_STREQ(to_string(ParameterKind::Coupled), "coupled");
    EXPECT_STREQ(to_string(ParameterKind::Isolated), "isolated");
}
