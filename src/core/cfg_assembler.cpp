#include <trellis/cfg_assembler.hpp>

namespace trellis {

Result<Cfg> to_entity(const GraphRecord& validated) {
    Cfg cfg;

    if (validated.nodes) {
        for (const auto& n : *validated.nodes) {
            CfgNode node;
            node.id = n.id.value_or("");
            node.type = n.type.value_or(NodeType::Process);
            node.label = n.label.value_or("");
            node.next_node_ids = n.next_node_ids.value_or(std::vector<std::string>{});
            node.condition = n.condition;
            TRELLIS_TRY(cfg.add_node(std::move(node)));
        }
    }

    if (validated.edges) {
        for (const auto& e : *validated.edges) {
            TRELLIS_TRY(cfg.add_edge(e.from.value_or(""), e.to.value_or(""),
                                     e.label.value_or("")));
        }
    }

    CfgMetrics m;
    m.complexity = validated.complexity.value_or(1);
    m.num_paths = validated.num_paths.value_or(1);
    m.nesting_depth = validated.nesting_depth.value_or(0);
    cfg.set_metrics(m);

    return Result<Cfg>::ok(std::move(cfg));
}

GraphRecord to_record(const Cfg& cfg) {
    GraphRecord r;

    std::vector<NodeRecord> nodes;
    nodes.reserve(cfg.node_count());
    for (const auto& n : cfg.nodes()) {
        nodes.push_back(NodeRecord{n.id, n.type, n.label, n.next_node_ids, n.condition});
    }
    r.nodes = std::move(nodes);

    std::vector<EdgeRecord> edges;
    for (auto& e : cfg.edges()) {
        edges.push_back(EdgeRecord{std::move(e.from), std::move(e.to), std::move(e.label)});
    }
    r.edges = std::move(edges);

    r.complexity = cfg.metrics().complexity;
    r.num_paths = cfg.metrics().num_paths;
    r.nesting_depth = cfg.metrics().nesting_depth;
    return r;
}

Cfg fallback_cfg(const std::string& subject) {
    GraphRecord r;
    r.nodes = std::vector<NodeRecord>{
        {std::string("node1"), NodeType::Start, std::string("Start"),
         std::vector<std::string>{"node2"}, std::nullopt},
        {std::string("node2"), NodeType::Process, "Error parsing " + subject,
         std::vector<std::string>{"node3"}, std::nullopt},
        {std::string("node3"), NodeType::End, std::string("End"),
         std::vector<std::string>{}, std::nullopt},
    };
    r.edges = std::vector<EdgeRecord>{
        {std::string("node1"), std::string("node2"), std::string()},
        {std::string("node2"), std::string("node3"), std::string()},
    };
    r.complexity = 1;
    r.num_paths = 1;
    r.nesting_depth = 0;

    // The fixed chain is always consistent
    return to_entity(r).value_or(Cfg{});
}

} // namespace trellis
