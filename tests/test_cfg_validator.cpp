#include <catch2/catch.hpp>
#include <trellis/cfg_validator.hpp>
#include <trellis/cfg_assembler.hpp>

using namespace trellis;
using nlohmann::json;

static GraphRecord validate_json(const char* text) {
    return validate_cfg(graph_record_from_json(json::parse(text)));
}

TEST_CASE("validate of an empty record fills graph defaults", "[cfg_validator]") {
    auto r = validate_cfg(GraphRecord{});
    REQUIRE(r.nodes.has_value());
    REQUIRE(r.nodes->empty());
    REQUIRE(r.edges.has_value());
    REQUIRE(r.edges->empty());
    REQUIRE(r.complexity == 1);
    REQUIRE(r.num_paths == 1);
    REQUIRE(r.nesting_depth == 0);
}

TEST_CASE("validate numbers missing node ids from one", "[cfg_validator]") {
    auto r = validate_json(R"({"nodes": [{}, {"id": "x"}, {}, {}, {}]})");
    const auto& nodes = *r.nodes;
    REQUIRE(nodes.size() == 5);
    REQUIRE(nodes[0].id == "node1");
    REQUIRE(nodes[0].label == "Node 1");
    REQUIRE(nodes[1].id == "x");
    REQUIRE(nodes[1].label == "Node 2");
    REQUIRE(nodes[4].id == "node5");
    REQUIRE(nodes[4].label == "Node 5");
}

TEST_CASE("validate skips default ids the model already used", "[cfg_validator]") {
    auto r = validate_json(R"({
        "nodes": [{"id": "node2", "type": "START"}, {"type": "END"}, {"id": "node3"}, {}],
        "edges": [{"from": "node2", "to": "node2"}]
    })");
    const auto& nodes = *r.nodes;
    REQUIRE(nodes.size() == 4);
    REQUIRE(nodes[0].id == "node2");
    REQUIRE(nodes[1].id == "node4");
    REQUIRE(nodes[1].label == "Node 2");
    REQUIRE(nodes[2].id == "node3");
    REQUIRE(nodes[3].id == "node5");

    auto cfg = to_entity(r);
    REQUIRE(cfg.is_ok());
    REQUIRE(cfg.value().node_count() == 4);
}

TEST_CASE("validate keeps the first node of a repeated id", "[cfg_validator]") {
    auto r = validate_json(R"({
        "nodes": [{"id": "a", "label": "first"}, {"id": "b"}, {"id": "a", "label": "second"}],
        "edges": [{"from": "a", "to": "b"}]
    })");
    const auto& nodes = *r.nodes;
    REQUIRE(nodes.size() == 2);
    REQUIRE(nodes[0].label == "first");
    REQUIRE(nodes[1].id == "b");

    auto cfg = to_entity(r);
    REQUIRE(cfg.is_ok());
    REQUIRE(cfg.value().successors("a") == std::vector<std::string>{"b"});
}

TEST_CASE("validate defaults node type and next nodes, not condition", "[cfg_validator]") {
    auto r = validate_json(R"({"nodes": [{"id": "a", "label": "keep"}]})");
    const auto& n = (*r.nodes)[0];
    REQUIRE(n.type == NodeType::Process);
    REQUIRE(n.label == "keep");
    REQUIRE(n.next_node_ids.has_value());
    REQUIRE(n.next_node_ids->empty());
    REQUIRE_FALSE(n.condition.has_value());
}

TEST_CASE("validate keeps an empty condition distinct from absent", "[cfg_validator]") {
    auto r = validate_json(R"({"nodes": [{"id": "a", "condition": ""}]})");
    REQUIRE((*r.nodes)[0].condition == std::string());
}

TEST_CASE("validate drops edges without both endpoints", "[cfg_validator]") {
    auto r = validate_json(R"({
        "nodes": [{"id": "a"}, {"id": "b"}],
        "edges": [
            {"from": "a", "to": "b"},
            {"from": "a"},
            {"to": "b", "label": "x"},
            {"from": "", "to": "b"},
            {"from": "b", "to": "a", "label": "back"}
        ]
    })");
    const auto& edges = *r.edges;
    REQUIRE(edges.size() == 2);
    REQUIRE(edges[0] == EdgeRecord{std::string("a"), std::string("b"), std::string("")});
    REQUIRE(edges[1] == EdgeRecord{std::string("b"), std::string("a"), std::string("back")});
}

TEST_CASE("validate leaves dangling references for the assembler", "[cfg_validator]") {
    auto r = validate_json(R"({"nodes": [{"id": "a"}], "edges": [{"from": "a", "to": "ghost"}]})");
    REQUIRE(r.edges->size() == 1);
    REQUIRE((*r.edges)[0].to == "ghost");
}

TEST_CASE("validate keeps present metrics", "[cfg_validator]") {
    auto r = validate_json(R"({"complexity": 5, "num_paths": 8, "nesting_depth": 3})");
    REQUIRE(r.complexity == 5);
    REQUIRE(r.num_paths == 8);
    REQUIRE(r.nesting_depth == 3);
}

TEST_CASE("validate is idempotent", "[cfg_validator]") {
    auto once = validate_json(R"({"nodes": [{}, {"type": "END"}], "edges": [{"from": "node1", "to": "node2"}, {}]})");
    REQUIRE(validate_cfg(once) == once);
}
