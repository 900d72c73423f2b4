#include <trellis/cfg_validator.hpp>
#include <trellis/log.hpp>
#include <unordered_set>

namespace trellis {

GraphRecord validate_cfg(GraphRecord raw) {
    if (!raw.nodes) raw.nodes.emplace();
    if (!raw.edges) raw.edges.emplace();
    if (!raw.complexity) raw.complexity = 1;
    if (!raw.num_paths) raw.num_paths = 1;
    if (!raw.nesting_depth) raw.nesting_depth = 0;

    auto& nodes = *raw.nodes;
    std::unordered_set<std::string> taken;
    for (const auto& node : nodes) {
        if (node.id) taken.insert(*node.id);
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        auto& node = nodes[i];
        std::string ordinal = std::to_string(i + 1);
        if (!node.id) {
            // node{i+1}, or the next node{k} the model has not used
            size_t k = i + 1;
            while (taken.count("node" + std::to_string(k))) ++k;
            node.id = "node" + std::to_string(k);
            taken.insert(*node.id);
        }
        if (!node.type) node.type = NodeType::Process;
        if (!node.label) node.label = "Node " + ordinal;
        if (!node.next_node_ids) node.next_node_ids.emplace();
    }

    // A repeated id keeps its first node; edges naming it resolve there
    std::unordered_set<std::string> seen;
    std::vector<NodeRecord> unique;
    unique.reserve(nodes.size());
    for (auto& node : nodes) {
        if (seen.insert(*node.id).second) unique.push_back(std::move(node));
    }
    if (unique.size() != nodes.size()) {
        log::debug("dropped %zu node(s) with a repeated id", nodes.size() - unique.size());
    }
    raw.nodes = std::move(unique);

    std::vector<EdgeRecord> kept;
    kept.reserve(raw.edges->size());
    for (auto& edge : *raw.edges) {
        std::string from = edge.from.value_or("");
        std::string to = edge.to.value_or("");
        if (from.empty() || to.empty()) continue;
        kept.push_back(EdgeRecord{std::move(from), std::move(to),
                                  edge.label.value_or("")});
    }

    size_t dropped = raw.edges->size() - kept.size();
    if (dropped > 0) {
        log::debug("dropped %zu edge(s) without both endpoints", dropped);
    }
    raw.edges = std::move(kept);
    return raw;
}

} // namespace trellis
