#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "schemasim/netlist.hpp"
#include "schemasim/mna.hpp"

#include <cmath>

using namespace schemasim;
using Catch::Matchers::WithinRel;

namespace {

SubcircuitDefinition make_divider() {
    SubcircuitDefinition def("divider", {"in", "out"});
    const NodeIndex in = def.node("in");
    const NodeIndex out = def.node("out");
    const NodeIndex mid = def.node("mid");
    def.add_device("R1", Resistor(in, mid, 1000.0));
    def.add_device("R2", Resistor(mid, out, 1000.0));
    def.add_device("R3", Resistor(out, ground_node, 2000.0));
    return def;
}

}  // namespace

TEST_CASE("Netlist device registration", "[netlist]") {
    Netlist netlist("divider");
    const NodeIndex in = netlist.add_node("in");
    const NodeIndex out = netlist.add_node("out");

    netlist.add_device("V1", VoltageSource(in, ground_node, Stimulus(10.0)));
    netlist.add_device("R1", Resistor(in, out, 1000.0));
    netlist.add_device("R2", Resistor(out, ground_node, 1000.0));

    CHECK(netlist.title() == "divider");
    CHECK(netlist.device_count() == 3);
    CHECK(netlist.device_name(1) == "R1");
    CHECK(base_of(netlist.device(1)).name() == "R1");
    CHECK(netlist.node("out") == out);
    CHECK(netlist.node("gnd") == ground_node);
    CHECK_THROWS_AS(netlist.node("missing"), SimulationError);

    SECTION("duplicate names are rejected") {
        CHECK_THROWS_AS(netlist.add_device("R1", Resistor(in, out, 10.0)), ParameterError);
    }

    SECTION("empty names are rejected") {
        CHECK_THROWS_AS(netlist.add_device("", Resistor(in, out, 10.0)), ParameterError);
    }

    SECTION("build allocates branch nodes and freezes the node table") {
        netlist.build();
        CHECK(netlist.built());
        CHECK(netlist.nodes().size() == 4);
        CHECK(netlist.nodes().frozen());
        CHECK_THROWS_AS(netlist.add_device("R3", Resistor(in, out, 10.0)), SimulationError);
    }

    SECTION("validate") {
        std::string error;
        CHECK(netlist.validate(error));
        CHECK(error.empty());
    }
}

TEST_CASE("Netlist validation failures", "[netlist]") {
    std::string error;

    SECTION("empty circuit") {
        Netlist netlist;
        CHECK_FALSE(netlist.validate(error));
        CHECK(error == "Circuit has no components");
    }

    SECTION("no ground reference") {
        Netlist netlist;
        const NodeIndex a = netlist.add_node("a");
        const NodeIndex b = netlist.add_node("b");
        netlist.add_device("R1", Resistor(a, b, 10.0));
        CHECK_FALSE(netlist.validate(error));
        CHECK(error == "Circuit has no ground reference");
    }

    SECTION("unknown node is a floating port at build time") {
        Netlist netlist;
        netlist.add_node("a");
        netlist.add_device("R1", Resistor(1, 5, 10.0));
        CHECK_FALSE(netlist.validate(error));
        CHECK_THROWS_AS(netlist.build(), FloatingPortError);
    }
}

TEST_CASE("Netlist finds nodes without a path to ground", "[netlist]") {
    Netlist netlist;
    const NodeIndex in = netlist.add_node("in");
    const NodeIndex cap = netlist.add_node("cap");
    netlist.add_device("V1", VoltageSource(in, ground_node, Stimulus(1.0)));
    netlist.add_device("C1", Capacitor(in, cap, 1e-6));
    netlist.add_device("R1", Resistor(cap, ground_node, 1e3));

    SECTION("capacitors and sources conduct") {
        netlist.initialize(1e-6);
        CHECK_FALSE(netlist.floating_node());
        std::string error;
        CHECK(netlist.validate(error));
    }

    SECTION("a voltage probe does not anchor the node it observes") {
        const NodeIndex sensed = netlist.add_node("sensed");
        netlist.add_device("VP", VoltageProbe(sensed, in));
        std::string error;
        CHECK(netlist.validate(error));  // stamps not seeded yet

        netlist.initialize(1e-6);
        REQUIRE(netlist.floating_node());
        CHECK(*netlist.floating_node() == sensed);
        CHECK_FALSE(netlist.validate(error));
        CHECK(error == "Node 'sensed' has no conducting path to ground");
    }
}

TEST_CASE("Netlist assembles a Kirchhoff-consistent system", "[netlist][mna]") {
    Netlist netlist;
    const NodeIndex in = netlist.add_node("in");
    const NodeIndex out = netlist.add_node("out");
    netlist.add_device("V1", VoltageSource(in, ground_node, Stimulus(9.0)));
    netlist.add_device("R1", Resistor(in, out, 2000.0));
    netlist.add_device("R2", Resistor(out, ground_node, 1000.0));
    netlist.initialize(1e-6);

    MNAAssembler assembler(netlist);
    CHECK(assembler.variable_count() == 3);

    SparseMatrix A;
    Vector b;
    assembler.assemble(A, b);
    REQUIRE(A.rows() == 3);
    REQUIRE(A.cols() == 3);

    LinearSolver solver;
    Vector y;
    REQUIRE(solver.solve(A, b, y) == SolverStatus::Success);

    // Unknown k is node k + 1
    CHECK_THAT(y(in - 1), WithinRel(9.0, 1e-12));
    CHECK_THAT(y(out - 1), WithinRel(3.0, 1e-12));

    // Source current flows from n+ through the source to n-
    const auto* v1 = std::get_if<VoltageSource>(netlist.find("V1"));
    REQUIRE(v1);
    CHECK_THAT(y(v1->branch_node() - 1), WithinRel(-3e-3, 1e-9));
}

TEST_CASE("Netlist flattens subcircuit instances", "[netlist][subcircuit]") {
    Netlist netlist;
    netlist.add_subcircuit(make_divider());

    const NodeIndex a = netlist.add_node("a");
    const NodeIndex b = netlist.add_node("b");
    netlist.add_device("V1", VoltageSource(a, ground_node, Stimulus(4.0)));
    netlist.add_device("X1", SubcircuitInstance({a, b}, "divider"));

    REQUIRE(netlist.instances().size() == 1);
    CHECK(netlist.instances()[0].first == "X1");
    CHECK(netlist.instances()[0].second == "divider");

    REQUIRE(netlist.device_count() == 4);
    CHECK(netlist.find("X1") == nullptr);
    REQUIRE(netlist.find("X1_R1") != nullptr);
    REQUIRE(netlist.find("X1_R3") != nullptr);

    const auto mid = netlist.nodes().find("X1.mid");
    REQUIRE(mid);

    const DeviceBase& r1 = base_of(*netlist.find("X1_R1"));
    CHECK(r1.port_node(0) == a);
    CHECK(r1.port_node(1) == *mid);
    CHECK(base_of(*netlist.find("X1_R3")).port_node(1) == ground_node);
    CHECK(base_of(*netlist.find("X1_R2")).port_node(1) == b);

    SECTION("two instances get distinct internal nodes") {
        const NodeIndex c = netlist.add_node("c");
        netlist.add_device("X2", SubcircuitInstance({a, c}, "divider"));
        const auto mid2 = netlist.nodes().find("X2.mid");
        REQUIRE(mid2);
        CHECK(*mid2 != *mid);
    }

    SECTION("flattened node labels are reserved") {
        CHECK_THROWS_AS(netlist.add_node("X1.mid"), ParameterError);
        CHECK(netlist.nodes().find("X1.mid") == mid);
    }

    SECTION("user node named like a flattened node") {
        netlist.add_node("X3.mid");
        CHECK_THROWS_AS(netlist.add_device("X3", SubcircuitInstance({a, b}, "divider")),
                        ParameterError);
    }

    SECTION("instance names collide with devices") {
        CHECK_THROWS_AS(netlist.add_device("X1", Resistor(a, b, 1.0)), ParameterError);
    }
}

TEST_CASE("Netlist subcircuit errors", "[netlist][subcircuit]") {
    Netlist netlist;
    const NodeIndex a = netlist.add_node("a");

    SECTION("unknown definition") {
        CHECK_THROWS_AS(netlist.add_device("X1", SubcircuitInstance({a, ground_node}, "nope")),
                        ParameterError);
    }

    SECTION("port count mismatch") {
        netlist.add_subcircuit(make_divider());
        CHECK_THROWS_AS(netlist.add_device("X1", SubcircuitInstance({a}, "divider")),
                        ParameterError);
    }

    SECTION("definition registered twice") {
        netlist.add_subcircuit(make_divider());
        CHECK_THROWS_AS(netlist.add_subcircuit(make_divider()), ParameterError);
    }

    SECTION("ground cannot be a port") {
        CHECK_THROWS_AS(SubcircuitDefinition("bad", {"in", "gnd"}), ParameterError);
    }

    SECTION("recursive definition") {
        SubcircuitDefinition loop("loop", {"p"});
        loop.add_device("X", SubcircuitInstance({loop.node("p")}, "loop"));
        netlist.add_subcircuit(std::move(loop));
        CHECK_THROWS_AS(netlist.add_device("X1", SubcircuitInstance({a}, "loop")), ParameterError);
    }
}

TEST_CASE("Netlist resolves coupled inductors inside subcircuits", "[netlist][subcircuit]") {
    SubcircuitDefinition xfmr("xfmr", {"p", "s"});
    const NodeIndex p = xfmr.node("p");
    const NodeIndex s = xfmr.node("s");
    xfmr.add_device("LP", Inductor(p, ground_node, 1e-3));
    xfmr.add_device("LS", Inductor(s, ground_node, 4e-3));
    xfmr.add_device("K1", CoupledInductor("LP", "LS", 0.5));

    Netlist netlist;
    netlist.add_subcircuit(std::move(xfmr));
    const NodeIndex in = netlist.add_node("in");
    const NodeIndex out = netlist.add_node("out");
    netlist.add_device("XT", SubcircuitInstance({in, out}, "xfmr"));

    const auto* k = std::get_if<CoupledInductor>(netlist.find("XT_K1"));
    REQUIRE(k);
    CHECK(k->params().inductor1 == "XT_LP");
    CHECK(k->params().inductor2 == "XT_LS");

    netlist.build();
    CHECK_THAT(k->mutual_inductance(), WithinRel(0.5 * std::sqrt(4e-6), 1e-12));

    const auto* lp = std::get_if<Inductor>(netlist.find("XT_LP"));
    REQUIRE(lp);
    CHECK(k->nodes()[0] == lp->branch_node());
}

TEST_CASE("Coupled inductor with an unknown inductor fails to build", "[netlist]") {
    Netlist netlist;
    const NodeIndex a = netlist.add_node("a");
    netlist.add_device("L1", Inductor(a, ground_node, 1e-3));
    netlist.add_device("K1", CoupledInductor("L1", "L9", 0.9));
    CHECK_THROWS_AS(netlist.build(), ParameterError);
}
