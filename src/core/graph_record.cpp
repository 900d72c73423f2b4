#include <trellis/graph_record.hpp>
#include <cmath>
#include <cstdint>

namespace trellis {

using nlohmann::json;

bool NodeRecord::operator==(const NodeRecord& other) const {
    return id == other.id && type == other.type && label == other.label
        && next_node_ids == other.next_node_ids && condition == other.condition;
}

bool EdgeRecord::operator==(const EdgeRecord& other) const {
    return from == other.from && to == other.to && label == other.label;
}

bool GraphRecord::operator==(const GraphRecord& other) const {
    return nodes == other.nodes && edges == other.edges
        && complexity == other.complexity && num_paths == other.num_paths
        && nesting_depth == other.nesting_depth;
}

// ---------------------------------------------------------------------------
// Field readers
// ---------------------------------------------------------------------------

static const json* field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

static std::optional<std::string> read_string(const json& obj, const char* key) {
    const json* v = field(obj, key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

// Node ids are strings, but models sometimes emit bare integers
static std::optional<std::string> read_id(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return v.dump();
    return std::nullopt;
}

static std::optional<std::string> read_id(const json& obj, const char* key) {
    const json* v = field(obj, key);
    if (!v) return std::nullopt;
    return read_id(*v);
}

static std::optional<int64_t> read_int(const json& obj, const char* key) {
    const json* v = field(obj, key);
    if (!v) return std::nullopt;
    if (v->is_number_unsigned()) {
        uint64_t u = v->get<uint64_t>();
        if (u > static_cast<uint64_t>(INT64_MAX)) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) {
        // 2^63 is exact as a double; anything at or past it does not fit
        constexpr double limit = 9223372036854775808.0;
        double d = v->get<double>();
        if (std::isfinite(d) && std::trunc(d) == d && d >= -limit && d < limit) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

static NodeRecord read_node(const json& obj) {
    NodeRecord n;
    if (!obj.is_object()) return n;

    n.id = read_id(obj, "id");
    if (auto t = read_string(obj, "type")) {
        n.type = parse_node_type(*t);
    }
    n.label = read_string(obj, "label");
    n.condition = read_string(obj, "condition");

    if (const json* next = field(obj, "next_nodes"); next && next->is_array()) {
        std::vector<std::string> ids;
        for (const auto& item : *next) {
            if (auto id = read_id(item)) ids.push_back(std::move(*id));
        }
        n.next_node_ids = std::move(ids);
    }
    return n;
}

static EdgeRecord read_edge(const json& obj) {
    EdgeRecord e;
    if (!obj.is_object()) return e;
    e.from = read_id(obj, "from");
    e.to = read_id(obj, "to");
    e.label = read_string(obj, "label");
    return e;
}

GraphRecord graph_record_from_json(const json& doc) {
    GraphRecord r;
    if (!doc.is_object()) return r;

    if (const json* nodes = field(doc, "nodes"); nodes && nodes->is_array()) {
        std::vector<NodeRecord> out;
        out.reserve(nodes->size());
        for (const auto& n : *nodes) out.push_back(read_node(n));
        r.nodes = std::move(out);
    }
    if (const json* edges = field(doc, "edges"); edges && edges->is_array()) {
        std::vector<EdgeRecord> out;
        out.reserve(edges->size());
        for (const auto& e : *edges) out.push_back(read_edge(e));
        r.edges = std::move(out);
    }
    r.complexity = read_int(doc, "complexity");
    r.num_paths = read_int(doc, "num_paths");
    r.nesting_depth = read_int(doc, "nesting_depth");
    return r;
}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

json graph_record_to_json(const GraphRecord& record) {
    json doc = json::object();

    if (record.nodes) {
        json nodes = json::array();
        for (const auto& n : *record.nodes) {
            json node = json::object();
            if (n.id) node["id"] = *n.id;
            if (n.type) node["type"] = node_type_name(*n.type);
            if (n.label) node["label"] = *n.label;
            if (n.next_node_ids) node["next_nodes"] = *n.next_node_ids;
            node["condition"] = n.condition ? json(*n.condition) : json(nullptr);
            nodes.push_back(std::move(node));
        }
        doc["nodes"] = std::move(nodes);
    }
    if (record.edges) {
        json edges = json::array();
        for (const auto& e : *record.edges) {
            json edge = json::object();
            if (e.from) edge["from"] = *e.from;
            if (e.to) edge["to"] = *e.to;
            if (e.label) edge["label"] = *e.label;
            edges.push_back(std::move(edge));
        }
        doc["edges"] = std::move(edges);
    }
    if (record.complexity) doc["complexity"] = *record.complexity;
    if (record.num_paths) doc["num_paths"] = *record.num_paths;
    if (record.nesting_depth) doc["nesting_depth"] = *record.nesting_depth;
    return doc;
}

} // namespace trellis
