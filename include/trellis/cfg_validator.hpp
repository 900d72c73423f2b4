#pragma once

#include <trellis/graph_record.hpp>

namespace trellis {

// Repair a raw graph record so every field is present. Never fails.
//
//   nodes -> [], edges -> [], complexity -> 1, num_paths -> 1,
//   nesting_depth -> 0
//   node i: id -> "node{i+1}" (or the next node{k} not already in use),
//           type -> PROCESS, label -> "Node {i+1}", next_nodes -> [],
//           condition stays absent
//   a node repeating an earlier node's id is dropped
//   edge:   label -> ""; an edge with a missing or empty endpoint is dropped
//
// Dangling references are left alone; the assembler rejects them.
GraphRecord validate_cfg(GraphRecord raw);

} // namespace trellis
