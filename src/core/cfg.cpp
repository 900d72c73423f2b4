#include <trellis/cfg.hpp>
#include <cctype>

namespace trellis {

const char* node_type_name(NodeType t) {
    switch (t) {
        case NodeType::Start:        return "START";
        case NodeType::End:          return "END";
        case NodeType::Process:      return "PROCESS";
        case NodeType::Decision:     return "DECISION";
        case NodeType::Loop:         return "LOOP";
        case NodeType::FunctionCall: return "FUNCTION_CALL";
        case NodeType::Return:       return "RETURN";
    }
    return "PROCESS";
}

std::optional<NodeType> parse_node_type(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '-') {
            key += '_';
        } else {
            key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }

    static const NodeType all[] = {
        NodeType::Start, NodeType::End, NodeType::Process, NodeType::Decision,
        NodeType::Loop, NodeType::FunctionCall, NodeType::Return
    };
    for (NodeType t : all) {
        if (key == node_type_name(t)) return t;
    }
    return std::nullopt;
}

bool CfgNode::operator==(const CfgNode& other) const {
    return id == other.id && type == other.type && label == other.label
        && next_node_ids == other.next_node_ids && condition == other.condition;
}

bool CfgEdge::operator==(const CfgEdge& other) const {
    return from == other.from && to == other.to && label == other.label;
}

bool CfgMetrics::operator==(const CfgMetrics& other) const {
    return complexity == other.complexity && num_paths == other.num_paths
        && nesting_depth == other.nesting_depth;
}

Status Cfg::add_node(CfgNode node) {
    if (index_.count(node.id)) {
        return TrellisError{TrellisError::Structural,
            "duplicate node id '" + node.id + "'"};
    }
    std::string id = node.id;
    index_.emplace(std::move(id), graph_.add_node(std::move(node)));
    return ok_status();
}

Status Cfg::add_edge(const std::string& from, const std::string& to, std::string label) {
    auto f = find(from);
    auto t = find(to);
    if (!f || !t) {
        return TrellisError{TrellisError::Structural,
            "edge " + from + " -> " + to + " references unknown node '"
                + (f ? to : from) + "'",
            "the graph record is internally inconsistent"};
    }
    graph_.add_edge(*f, *t, std::move(label));
    return ok_status();
}

std::vector<CfgEdge> Cfg::edges() const {
    std::vector<CfgEdge> out;
    out.reserve(graph_.edge_count());
    for (const auto& e : graph_.edges()) {
        out.push_back({graph_.node(e.from).id, graph_.node(e.to).id, e.data});
    }
    return out;
}

std::optional<Cfg::NodeIndex> Cfg::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Cfg::successors(const std::string& id) const {
    std::vector<std::string> out;
    auto idx = find(id);
    if (!idx) return out;
    for (NodeIndex s : graph_.successors(*idx)) {
        out.push_back(graph_.node(s).id);
    }
    return out;
}

std::vector<std::string> Cfg::predecessors(const std::string& id) const {
    std::vector<std::string> out;
    auto idx = find(id);
    if (!idx) return out;
    for (NodeIndex p : graph_.predecessors(*idx)) {
        out.push_back(graph_.node(p).id);
    }
    return out;
}

std::vector<std::string> Cfg::unreachable_nodes() const {
    std::vector<NodeIndex> starts;
    for (NodeIndex i = 0; i < graph_.node_count(); ++i) {
        if (graph_.node(i).type == NodeType::Start) starts.push_back(i);
    }

    auto seen = graph_.reachable_from(starts);
    std::vector<std::string> out;
    for (NodeIndex i = 0; i < seen.size(); ++i) {
        if (!seen[i]) out.push_back(graph_.node(i).id);
    }
    return out;
}

bool Cfg::operator==(const Cfg& other) const {
    return nodes() == other.nodes() && edges() == other.edges()
        && metrics_ == other.metrics_;
}

} // namespace trellis
