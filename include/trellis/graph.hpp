#pragma once

#include <trellis/result.hpp>
#include <queue>
#include <vector>

namespace trellis {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed multigraph with adjacency lists.
// Edges are kept in insertion order so a graph can be serialized back
// exactly as it was built.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;
    using EdgeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        out_.push_back({});
        in_.push_back({});
        return id;
    }

    EdgeId add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        EdgeId id = edges_.size();
        edges_.push_back({from, to, std::move(data)});
        out_[from].push_back(id);
        in_[to].push_back(id);
        return id;
    }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    const std::vector<NodeData>& nodes() const { return nodes_; }

    const std::vector<Edge>& edges() const { return edges_; }

    // Targets of a node's outgoing edges, in insertion order
    std::vector<NodeId> successors(NodeId id) const {
        std::vector<NodeId> out;
        out.reserve(out_[id].size());
        for (EdgeId e : out_[id]) out.push_back(edges_[e].to);
        return out;
    }

    std::vector<NodeId> predecessors(NodeId id) const {
        std::vector<NodeId> out;
        out.reserve(in_[id].size());
        for (EdgeId e : in_[id]) out.push_back(edges_[e].from);
        return out;
    }

    // BFS from every root; result[i] is true when node i was reached
    std::vector<bool> reachable_from(const std::vector<NodeId>& roots) const {
        std::vector<bool> seen(nodes_.size(), false);
        std::queue<NodeId> q;
        for (NodeId r : roots) {
            if (r < nodes_.size() && !seen[r]) {
                seen[r] = true;
                q.push(r);
            }
        }
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            for (EdgeId e : out_[u]) {
                NodeId v = edges_[e].to;
                if (!seen[v]) {
                    seen[v] = true;
                    q.push(v);
                }
            }
        }
        return seen;
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<Edge> edges_;
    std::vector<std::vector<EdgeId>> out_;
    std::vector<std::vector<EdgeId>> in_;
};

} // namespace trellis
