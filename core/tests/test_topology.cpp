#include <catch2/catch_test_macros.hpp>
#include "schemasim/topology.hpp"
#include "schemasim/errors.hpp"

#include <algorithm>
#include <numeric>

using namespace schemasim;

namespace {

// Divider schematic: V1(+) -- R1 -- R2 -- GND, V1(-) -- GND
struct DividerSchematic {
    SchematicGraph graph;
    SchematicDeviceId v1, r1, r2, gnd;

    DividerSchematic() {
        v1 = graph.add_device("V1", 2);
        r1 = graph.add_device("R1", 2);
        r2 = graph.add_device("R2", 2);
        gnd = graph.add_ground_symbol("GND1");

        auto v1p = graph.add_port(v1, 0);
        auto v1n = graph.add_port(v1, 1);
        auto r1a = graph.add_port(r1, 0);
        auto r1b = graph.add_port(r1, 1);
        auto r2a = graph.add_port(r2, 0);
        auto r2b = graph.add_port(r2, 1);
        auto g = *graph.port(gnd, 0);

        graph.add_connector({v1p, r1a});
        graph.add_connector({r1b, r2a});
        graph.add_connector({r2b, g});
        graph.add_connector({v1n, g});
    }
};

}  // namespace

TEST_CASE("Topology extraction of a divider", "[topology]") {
    DividerSchematic s;
    Topology topo = TopologyExtractor().extract(s.graph);

    REQUIRE(topo.devices.size() == 3);  // ground symbol excluded
    CHECK(topo.nodes.size() == 3);

    const ExtractedDevice* v1 = topo.find("V1");
    const ExtractedDevice* r1 = topo.find("R1");
    const ExtractedDevice* r2 = topo.find("R2");
    REQUIRE(v1);
    REQUIRE(r1);
    REQUIRE(r2);
    CHECK(topo.find("GND1") == nullptr);

    CHECK(v1->nodes[1] == ground_node);
    CHECK(r2->nodes[1] == ground_node);
    CHECK(v1->nodes[0] == r1->nodes[0]);
    CHECK(r1->nodes[1] == r2->nodes[0]);
    CHECK(r1->nodes[0] != r1->nodes[1]);
    CHECK(r1->nodes[0] != ground_node);

    NetPartition expected{
        {{"GND1", 0}, {"R2", 1}, {"V1", 1}},
        {{"R1", 0}, {"V1", 0}},
        {{"R1", 1}, {"R2", 0}},
    };
    CHECK(topo.partition() == expected);
}

TEST_CASE("Topology partition does not depend on connector order", "[topology]") {
    DividerSchematic s;
    const NetPartition reference = TopologyExtractor().extract(s.graph).partition();

    std::vector<Connector> connectors = s.graph.connectors();
    std::vector<std::size_t> order(connectors.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    do {
        SchematicGraph shuffled;
        for (const auto& device : s.graph.devices()) {
            shuffled.add_device(device.name, device.port_count, device.role);
        }
        for (const auto& point : s.graph.points()) {
            if (point.is_port()) {
                shuffled.add_port(*point.device, point.port, point.is_ground);
            } else {
                shuffled.add_bend_point();
            }
        }
        for (std::size_t i : order) {
            shuffled.add_connector(connectors[i].points);
        }
        CHECK(TopologyExtractor().extract(shuffled).partition() == reference);
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_CASE("Topology joins wires through bend points", "[topology]") {
    SchematicGraph g;
    auto r1 = g.add_device("R1", 2);
    auto r2 = g.add_device("R2", 2);
    auto r3 = g.add_device("R3", 2);
    auto bend = g.add_bend_point();

    g.add_connector({g.add_port(r1, 1), bend});
    g.add_connector({bend, g.add_port(r2, 0)});
    g.add_connector({bend, g.add_port(r3, 0)});
    g.add_connector({g.add_port(r1, 0), g.add_port(r2, 1), g.add_port(r3, 1)});

    Topology topo = TopologyExtractor().extract(g);
    const NodeIndex joint = topo.find("R1")->nodes[1];
    CHECK(topo.find("R2")->nodes[0] == joint);
    CHECK(topo.find("R3")->nodes[0] == joint);
    CHECK(joint != topo.find("R1")->nodes[0]);
    CHECK(topo.partition().size() == 2);
}

TEST_CASE("Topology unifies all grounds into node 0", "[topology]") {
    SchematicGraph g;
    auto r1 = g.add_device("R1", 2);
    auto r2 = g.add_device("R2", 2);
    auto g1 = g.add_ground_symbol("GND1");
    auto g2 = g.add_ground_symbol("GND2");

    auto mid_a = g.add_port(r1, 1);
    auto mid_b = g.add_port(r2, 0);
    g.add_connector({mid_a, mid_b});
    g.add_connector({g.add_port(r1, 0), *g.port(g1, 0)});
    g.add_connector({g.add_port(r2, 1), *g.port(g2, 0)});

    Topology topo = TopologyExtractor().extract(g);
    CHECK(topo.find("R1")->nodes[0] == ground_node);
    CHECK(topo.find("R2")->nodes[1] == ground_node);
    CHECK(topo.nodes.size() == 2);
    CHECK(topo.nets[0].count({"GND1", 0}) == 1);
    CHECK(topo.nets[0].count({"GND2", 0}) == 1);
}

TEST_CASE("Topology unconnected ports", "[topology]") {
    SchematicGraph g;
    auto r1 = g.add_device("R1", 2);
    auto a = g.add_port(r1, 0);
    g.add_port(r1, 1);  // never wired
    auto gnd = g.add_ground_symbol("GND");
    g.add_connector({a, *g.port(gnd, 0)});

    SECTION("ground themselves by default") {
        Topology topo = TopologyExtractor().extract(g);
        CHECK(topo.find("R1")->nodes[1] == ground_node);
    }

    SECTION("are floating when grounding is disabled") {
        TopologyExtractor extractor(ExtractionOptions{false});
        try {
            (void)extractor.extract(g);
            FAIL("expected FloatingPortError");
        } catch (const FloatingPortError& e) {
            CHECK(e.device() == "R1");
            CHECK(e.port() == 1);
        }
    }
}

TEST_CASE("Topology rejects malformed graphs", "[topology]") {
    SchematicGraph g;
    auto r1 = g.add_device("R1", 2);

    SECTION("port index out of range") {
        CHECK_THROWS_AS(g.add_port(r1, 2), ParameterError);
    }

    SECTION("port declared twice") {
        g.add_port(r1, 0);
        CHECK_THROWS_AS(g.add_port(r1, 0), ParameterError);
    }

    SECTION("connector to an unknown point") {
        CHECK_THROWS_AS(g.add_connector({42}), ParameterError);
    }

    SECTION("undeclared port") {
        auto a = g.add_port(r1, 0);
        auto gnd = g.add_ground_symbol("GND");
        g.add_connector({a, *g.port(gnd, 0)});
        CHECK_THROWS_AS(TopologyExtractor().extract(g), FloatingPortError);
    }

    SECTION("duplicate device names") {
        g.add_device("R1", 2);
        CHECK_THROWS_AS(TopologyExtractor().extract(g), ParameterError);
    }
}
