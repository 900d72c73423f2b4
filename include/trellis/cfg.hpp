#pragma once

#include <trellis/graph.hpp>
#include <trellis/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

enum class NodeType {
    Start,
    End,
    Process,
    Decision,
    Loop,
    FunctionCall,
    Return
};

// "START", "END", "PROCESS", "DECISION", "LOOP", "FUNCTION_CALL", "RETURN"
const char* node_type_name(NodeType t);

// Case-insensitive; spaces and hyphens count as underscores
std::optional<NodeType> parse_node_type(const std::string& name);

struct CfgNode {
    std::string id;
    NodeType type = NodeType::Process;
    std::string label;
    std::vector<std::string> next_node_ids;
    std::optional<std::string> condition;   // only meaningful for Decision

    bool operator==(const CfgNode& other) const;
    bool operator!=(const CfgNode& other) const { return !(*this == other); }
};

struct CfgEdge {
    std::string from;
    std::string to;
    std::string label;      // empty for unconditional fall-through

    bool operator==(const CfgEdge& other) const;
    bool operator!=(const CfgEdge& other) const { return !(*this == other); }
};

// Summary metrics supplied with the graph, not derived from it
struct CfgMetrics {
    int64_t complexity = 1;     // cyclomatic complexity
    int64_t num_paths = 1;
    int64_t nesting_depth = 0;

    bool operator==(const CfgMetrics& other) const;
};

// Control-flow graph. Node ids are unique and every edge endpoint names an
// existing node; add_node/add_edge refuse anything else.
class Cfg {
public:
    using NodeIndex = Graph<CfgNode, std::string>::NodeId;

    // Structural error on a duplicate id
    Status add_node(CfgNode node);

    // Structural error when either endpoint is unknown
    Status add_edge(const std::string& from, const std::string& to, std::string label = {});

    size_t node_count() const { return graph_.node_count(); }
    size_t edge_count() const { return graph_.edge_count(); }

    const std::vector<CfgNode>& nodes() const { return graph_.nodes(); }
    std::vector<CfgEdge> edges() const;

    std::optional<NodeIndex> find(const std::string& id) const;
    const CfgNode& node(NodeIndex idx) const { return graph_.node(idx); }

    // Ids of nodes reached by one edge from `id`, in edge order
    std::vector<std::string> successors(const std::string& id) const;
    std::vector<std::string> predecessors(const std::string& id) const;

    // Nodes not reachable from any START node. With no START node every node
    // is unreachable.
    std::vector<std::string> unreachable_nodes() const;

    const CfgMetrics& metrics() const { return metrics_; }
    void set_metrics(const CfgMetrics& m) { metrics_ = m; }

    bool operator==(const Cfg& other) const;
    bool operator!=(const Cfg& other) const { return !(*this == other); }

private:
    Graph<CfgNode, std::string> graph_;
    std::unordered_map<std::string, NodeIndex> index_;
    CfgMetrics metrics_;
};

} // namespace trellis
