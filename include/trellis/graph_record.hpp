#pragma once

#include <trellis/cfg.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// Wire/disk form of a graph. Every field may be missing on input; the
// validator turns a record into one where all fields are present.
//
// JSON keys:
//   graph: nodes, edges, complexity, num_paths, nesting_depth
//   node:  id, type, label, next_nodes, condition
//   edge:  from, to, label

struct NodeRecord {
    std::optional<std::string> id;
    std::optional<NodeType> type;
    std::optional<std::string> label;
    std::optional<std::vector<std::string>> next_node_ids;
    std::optional<std::string> condition;   // absent means "not a decision"

    bool operator==(const NodeRecord& other) const;
};

struct EdgeRecord {
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> label;

    bool operator==(const EdgeRecord& other) const;
};

struct GraphRecord {
    std::optional<std::vector<NodeRecord>> nodes;
    std::optional<std::vector<EdgeRecord>> edges;
    std::optional<int64_t> complexity;
    std::optional<int64_t> num_paths;
    std::optional<int64_t> nesting_depth;

    bool operator==(const GraphRecord& other) const;
};

// Lenient reader. Never fails: a missing key, a value of the wrong JSON type
// or an unknown node type reads as absent. Numeric ids are accepted and
// rendered as decimal strings. A non-object document gives an empty record.
GraphRecord graph_record_from_json(const nlohmann::json& doc);

// Absent fields are omitted, except `condition`, which is written as null.
nlohmann::json graph_record_to_json(const GraphRecord& record);

} // namespace trellis
