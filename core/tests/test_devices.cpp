#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "schemasim/device.hpp"
#include "schemasim/node_table.hpp"
#include <cmath>

using namespace schemasim;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

// Minimal connection context backed by a node table
class TestContext : public ConnectContext {
public:
    NodeTable nodes;

    bool has_node(NodeIndex node) const override { return nodes.contains(node); }
    NodeIndex create_internal(const std::string& owner) override {
        return nodes.create_internal(owner);
    }
    const Inductor* find_inductor(const std::string& /*name*/) const override { return nullptr; }
};

Vector state(std::initializer_list<Real> values) {
    Vector x(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (Real v : values) x(i++) = v;
    return x;
}

}  // namespace

TEST_CASE("Device parameter validation", "[devices]") {
    SECTION("Resistor") {
        CHECK_THROWS_AS(Resistor(1, 0, 0.0), ParameterError);
        CHECK_THROWS_AS(Resistor(1, 0, std::nan("")), ParameterError);
        CHECK_NOTHROW(Resistor(1, 0, -50.0));
    }

    SECTION("Capacitor and inductor") {
        CHECK_THROWS_AS(Capacitor(1, 0, 0.0), ParameterError);
        CHECK_THROWS_AS(Capacitor(1, 0, -1e-6), ParameterError);
        CHECK_THROWS_AS(Inductor(1, 0, 0.0), ParameterError);
        CHECK_THROWS_AS(Inductor(1, 0, Inductor::Params{1e-3, -1.0, std::nullopt}), ParameterError);
    }

    SECTION("Sources") {
        CHECK_THROWS_AS(CurrentSource(1, 0, CurrentSource::Params{Stimulus(1.0), -10.0}),
                        ParameterError);
        CHECK_NOTHROW(VoltageSource(1, 0, Stimulus(5.0)));
    }

    SECTION("Diode") {
        Diode::Params p;
        p.saturation_current = 0.0;
        CHECK_THROWS_AS(Diode(1, 0, p), ParameterError);
        p = Diode::Params{};
        p.emission_coefficient = -1.0;
        CHECK_THROWS_AS(Diode(1, 0, p), ParameterError);
    }

    SECTION("Coupled inductor") {
        CHECK_THROWS_AS(CoupledInductor("L1", "L2", 0.0), ParameterError);
        CHECK_THROWS_AS(CoupledInductor("L1", "L2", 1.5), ParameterError);
        CHECK_THROWS_AS(CoupledInductor("L1", "L1", 0.5), ParameterError);
        CHECK_NOTHROW(CoupledInductor("L1", "L2", 1.0));
    }

    SECTION("Controlled devices") {
        CHECK_THROWS_AS(Vcvs(1, 0, 2, 0, std::nan("")), ParameterError);
        CHECK_THROWS_AS(Vcvs(1, 0, 2, 0, Vcvs::Params{1.0, {{0.0, 1.0}, {0.0, 2.0}}, std::nullopt}),
                        ParameterError);
        CHECK_THROWS_AS(Vcvs(1, 0, 2, 0, Vcvs::Params{1.0, {}, -1.0}), ParameterError);
        CHECK_NOTHROW(Vcvs(1, 0, 2, 0, -3.0));

        VoltageControlledSwitch::Params p;
        p.on_resistance = 0.0;
        CHECK_THROWS_AS(VoltageControlledSwitch(1, 0, 2, 0, p), ParameterError);
        p = VoltageControlledSwitch::Params{};
        p.off_resistance = p.on_resistance;
        CHECK_THROWS_AS(VoltageControlledSwitch(1, 0, 2, 0, p), ParameterError);
        p = VoltageControlledSwitch::Params{};
        p.hysteresis = -0.1;
        CHECK_THROWS_AS(VoltageControlledSwitch(1, 0, 2, 0, p), ParameterError);
        CHECK_NOTHROW(VoltageControlledSwitch(1, 0, 2, 0));
    }

    SECTION("Negative node index") {
        CHECK_THROWS_AS(Resistor(-1, 0, 100.0), ParameterError);
    }
}

TEST_CASE("Device connection", "[devices]") {
    TestContext ctx;
    ctx.nodes.node("a");

    SECTION("Missing node is a floating port") {
        Resistor r(1, 7, 100.0);
        r.set_name("R1");
        try {
            r.connect(ctx);
            FAIL("expected FloatingPortError");
        } catch (const FloatingPortError& e) {
            CHECK(e.device() == "R1");
            CHECK(e.port() == 1);
        }
    }

    SECTION("Sources allocate one internal branch node") {
        VoltageSource v(1, 0, Stimulus(1.0));
        v.set_name("V1");
        v.connect(ctx);
        CHECK(v.nodes().size() == 3);
        CHECK(v.port_count() == 2);
        CHECK(v.internal_count() == 1);
        CHECK(ctx.nodes.is_internal(v.branch_node()));
    }
}

TEST_CASE("Device stamps", "[devices]") {
    TestContext ctx;
    const NodeIndex a = ctx.nodes.node("a");
    const NodeIndex b = ctx.nodes.node("b");
    const Real dt = 1e-6;

    SECTION("Resistor conductance") {
        Resistor r(a, b, 200.0);
        r.connect(ctx);
        r.initialize(dt);
        const Matrix& J = r.jacobian();
        CHECK_THAT(J(0, 0), WithinRel(5e-3, 1e-12));
        CHECK_THAT(J(0, 1), WithinRel(-5e-3, 1e-12));
        CHECK_THAT(J(1, 0), WithinRel(-5e-3, 1e-12));
        CHECK_THAT(J(1, 1), WithinRel(5e-3, 1e-12));

        Vector x = state({0.0, 3.0, 1.0});
        CHECK_THAT(r.branch_current(x), WithinRel(0.01, 1e-12));
        CHECK_THAT(r.terminal_current(1, x), WithinRel(-0.01, 1e-12));
    }

    SECTION("Capacitor companion model") {
        Capacitor c(a, b, 1e-6);
        c.connect(ctx);
        c.initialize(dt);
        CHECK_THAT(c.jacobian()(0, 0), WithinRel(1.0, 1e-12));

        Vector x_prev = state({0.0, 2.0, 0.5});
        Vector x = state({0.0, 0.0, 0.0});
        c.update(StepContext{dt, dt, false, x, x_prev});
        CHECK_THAT(c.rhs()(0), WithinRel(1.5, 1e-12));
        CHECK_THAT(c.rhs()(1), WithinRel(-1.5, 1e-12));
    }

    SECTION("Capacitor initial voltage seeds the first solve") {
        Capacitor c(a, b, Capacitor::Params{2e-6, 3.0});
        c.connect(ctx);
        c.initialize(dt);
        Vector zero = Vector::Zero(3);
        c.update(StepContext{dt, 0.0, true, zero, zero});
        CHECK_THAT(c.rhs()(0), WithinRel(6.0, 1e-12));
    }

    SECTION("Inductor branch equation") {
        Inductor l(a, b, Inductor::Params{1e-3, 2.0, std::nullopt});
        l.connect(ctx);
        l.initialize(dt);
        const Matrix& J = l.jacobian();
        CHECK(J(0, 2) == 1.0);
        CHECK(J(1, 2) == -1.0);
        CHECK(J(2, 0) == 1.0);
        CHECK(J(2, 1) == -1.0);
        CHECK_THAT(J(2, 2), WithinRel(-(2.0 + 1e3), 1e-12));

        const NodeIndex branch = l.branch_node();
        Vector x_prev = Vector::Zero(4);
        x_prev(branch) = 0.25;
        l.update(StepContext{dt, dt, false, x_prev, x_prev});
        CHECK_THAT(l.rhs()(2), WithinRel(-1e3 * 0.25, 1e-12));
    }

    SECTION("Voltage source follows its stimulus") {
        VoltageSource v(a, b, Stimulus(PwlWaveform{{{0.0, 0.0}, {1e-3, 10.0}}}));
        v.connect(ctx);
        v.initialize(dt);
        Vector x = Vector::Zero(4);
        v.update(StepContext{dt, 0.5e-3, false, x, x});
        CHECK_THAT(v.rhs()(2), WithinRel(5.0, 1e-12));
    }

    SECTION("Current source pushes current from n+ to n-") {
        CurrentSource i(a, b, CurrentSource::Params{Stimulus(2.0), 100.0});
        i.connect(ctx);
        i.initialize(dt);
        CHECK(i.rhs()(0) == -2.0);
        CHECK(i.rhs()(1) == 2.0);
        CHECK_THAT(i.jacobian()(0, 0), WithinRel(0.01, 1e-12));
    }

    SECTION("Diode linearization") {
        Diode d(a, b);
        d.connect(ctx);
        d.initialize(dt);

        const Real v = 0.6;
        Vector x = state({0.0, v, 0.0});
        d.update(StepContext{dt, 0.0, false, x, x});

        const Real nvt = 25.85e-3;
        const Real g = 1e-14 / nvt * std::exp(v / nvt);
        const Real i = 1e-14 * (std::exp(v / nvt) - 1.0);
        CHECK_THAT(d.jacobian()(0, 0), WithinRel(g, 1e-9));
        CHECK_THAT(d.rhs()(1), WithinRel(i - g * v, 1e-9));
        // The linearized stamp reproduces I(V) at the linearization point
        CHECK_THAT(d.branch_current(x), WithinRel(i, 1e-9));
    }

    SECTION("Diode exponential is clamped") {
        Diode d(a, b);
        CHECK(std::isfinite(d.current(100.0)));
        CHECK(d.conductance(100.0) == d.conductance(0.8));
        CHECK(d.current(-5.0) < 0.0);
    }

    SECTION("Large voltage clamp still keeps the exponential finite") {
        Diode::Params p;
        p.max_voltage = 30.0;
        Diode d(a, b, p);
        CHECK_THAT(d.clamp_voltage(), WithinRel(Diode::max_exponent * 25.85e-3, 1e-12));
        CHECK(std::isfinite(d.current(30.0)));
        CHECK(std::isfinite(d.conductance(30.0)));
        CHECK(d.conductance(50.0) == d.conductance(d.clamp_voltage()));

        d.connect(ctx);
        d.initialize(dt);
        Vector x = state({0.0, 50.0, 0.0});
        d.update(StepContext{dt, 0.0, false, x, x});
        CHECK(d.jacobian().allFinite());
        CHECK(d.rhs().allFinite());
    }

    SECTION("VCVS branch row ties the output to the control voltage") {
        const NodeIndex c = ctx.nodes.node("c");
        Vcvs e(a, ground_node, c, b, 4.0);
        e.connect(ctx);
        e.initialize(dt);
        REQUIRE(e.nodes().size() == 5);
        const Matrix& J = e.jacobian();
        CHECK(J(0, 4) == 1.0);
        CHECK(J(1, 4) == -1.0);
        CHECK(J(4, 0) == 1.0);
        CHECK(J(4, 1) == -1.0);
        CHECK(J(4, 2) == -4.0);
        CHECK(J(4, 3) == 4.0);
        // Control terminals draw no current
        CHECK(J(2, 4) == 0.0);
        CHECK(J(3, 4) == 0.0);
    }

    SECTION("VCVS table gain and output limit") {
        Vcvs::Params p;
        p.gain_table = {{-1.0, 0.0}, {0.0, 0.0}, {1.0, 10.0}};
        p.limit = 4.0;
        Vcvs e(a, ground_node, b, ground_node, p);
        CHECK(e.effective_gain(-5.0) == 0.0);
        CHECK_THAT(e.effective_gain(0.2), WithinRel(2.0, 1e-12));   // 0.4 V out
        CHECK_THAT(e.effective_gain(0.8), WithinRel(5.0, 1e-12));   // 6.4 V capped to 4 V
        CHECK_THAT(e.effective_gain(3.0), WithinRel(4.0 / 3.0, 1e-12));

        e.connect(ctx);
        e.initialize(dt);
        CHECK(e.gain() == 0.0);
        Vector x = state({0.0, 0.0, 0.5, 0.0});
        e.update(StepContext{dt, dt, false, x, x});
        CHECK_THAT(e.gain(), WithinRel(5.0, 1e-12));
        CHECK_THAT(e.jacobian()(4, 2), WithinRel(-5.0, 1e-12));
    }

    SECTION("Switch follows its control voltage with hysteresis") {
        const NodeIndex c = ctx.nodes.node("c");
        VoltageControlledSwitch::Params p;
        p.on_resistance = 0.5;
        p.off_resistance = 1e3;
        p.threshold = 1.0;
        p.hysteresis = 0.2;
        VoltageControlledSwitch sw(a, b, c, ground_node, p);
        sw.connect(ctx);
        sw.initialize(dt);
        CHECK_FALSE(sw.is_on());
        CHECK_THAT(sw.jacobian()(0, 0), WithinRel(1e-3, 1e-12));

        auto drive = [&](Real time, Real vc) {
            Vector x = state({0.0, 0.0, 0.0, vc});
            sw.update(StepContext{dt, time, false, x, x});
        };

        drive(1 * dt, 1.1);  // inside the band, stays open
        CHECK_FALSE(sw.is_on());
        drive(2 * dt, 1.25);
        CHECK(sw.is_on());
        CHECK_THAT(sw.jacobian()(0, 0), WithinRel(2.0, 1e-12));
        CHECK_THAT(sw.jacobian()(0, 1), WithinRel(-2.0, 1e-12));
        drive(3 * dt, 0.9);  // inside the band, stays closed
        CHECK(sw.is_on());
        drive(4 * dt, 0.7);
        CHECK_FALSE(sw.is_on());
    }

    SECTION("Voltage probe observes without stamping") {
        VoltageProbe p(a, b);
        p.connect(ctx);
        p.initialize(dt);
        CHECK(p.jacobian().isZero());
        Vector x = state({0.0, 4.0, 1.5});
        CHECK(p.measure(x) == 2.5);
    }
}
