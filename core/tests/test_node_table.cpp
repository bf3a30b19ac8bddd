#include <catch2/catch_test_macros.hpp>
#include "schemasim/errors.hpp"
#include "schemasim/node_table.hpp"

using namespace schemasim;

TEST_CASE("Node table ground aliases", "[nodes]") {
    NodeTable nodes;
    CHECK(nodes.size() == 1);
    CHECK(nodes.node("0") == ground_node);
    CHECK(nodes.node("gnd") == ground_node);
    CHECK(nodes.node("GND") == ground_node);
    CHECK(nodes.node("ground") == ground_node);
    CHECK(nodes.size() == 1);
    CHECK(NodeTable::is_ground_label("gnd"));
    CHECK_FALSE(NodeTable::is_ground_label("out"));
}

TEST_CASE("Node table allocation", "[nodes]") {
    NodeTable nodes;

    SECTION("Labels get sequential indices once") {
        NodeIndex in = nodes.node("in");
        NodeIndex out = nodes.node("out");
        CHECK(in == 1);
        CHECK(out == 2);
        CHECK(nodes.node("in") == in);
        CHECK(nodes.name(out) == "out");
        CHECK(nodes.unknown_count() == 2);
        REQUIRE(nodes.find("out").has_value());
        CHECK_FALSE(nodes.find("missing").has_value());
    }

    SECTION("Internal nodes are unique and excluded from external nodes") {
        nodes.node("a");
        NodeIndex b1 = nodes.create_internal("V1");
        NodeIndex b2 = nodes.create_internal("V1");
        CHECK(b1 != b2);
        CHECK(nodes.is_internal(b1));
        CHECK_FALSE(nodes.is_internal(1));
        CHECK(nodes.external_nodes() == std::vector<NodeIndex>{1});
    }

    SECTION("Frozen table rejects new nodes") {
        nodes.node("a");
        nodes.freeze();
        CHECK(nodes.node("a") == 1);
        CHECK_THROWS_AS(nodes.node("b"), SimulationError);
        CHECK_THROWS_AS(nodes.create_internal("L1"), SimulationError);
    }

    SECTION("Invalid lookups") {
        CHECK_THROWS_AS(nodes.node(""), ParameterError);
        CHECK_THROWS_AS(nodes.name(42), SimulationError);
        CHECK_FALSE(nodes.contains(-1));
    }
}
