#pragma once

#include <trellis/cfg.hpp>
#include <trellis/graph_record.hpp>
#include <trellis/result.hpp>

namespace trellis {

// Build the typed graph from a validated record. Fails with Structural when
// an edge names a node id that is not in `nodes`, or when two nodes share an
// id. Validation repairs missing fields, never references, so this is the one
// step that can still fail for fresh and cached records alike.
Result<Cfg> to_entity(const GraphRecord& validated);

// Inverse of to_entity: for a validated record r,
// to_record(to_entity(r).value()) == r.
GraphRecord to_record(const Cfg& cfg);

// START -> PROCESS("Error parsing <subject>") -> END, metrics 1/1/0.
// Returned when the collaborator's answer cannot be parsed at all.
Cfg fallback_cfg(const std::string& subject);

} // namespace trellis
