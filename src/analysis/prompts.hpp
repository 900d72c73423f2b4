#pragma once

namespace trellis::prompts {

inline constexpr const char* PSEUDOCODE_TO_CFG =
    "You convert pseudocode into a control flow graph.\n"
    "Answer with a single JSON object and nothing else:\n"
    "{\n"
    "  \"nodes\": [{\"id\": \"node1\", \"type\": \"START\", \"label\": \"...\",\n"
    "             \"next_nodes\": [\"node2\"], \"condition\": null}],\n"
    "  \"edges\": [{\"from\": \"node1\", \"to\": \"node2\", \"label\": \"\"}],\n"
    "  \"complexity\": 1, \"num_paths\": 1, \"nesting_depth\": 0\n"
    "}\n"
    "Node types: START, END, PROCESS, DECISION, LOOP, FUNCTION_CALL, RETURN.\n"
    "DECISION nodes carry their test in \"condition\"; their outgoing edges are\n"
    "labelled \"true\" / \"false\". complexity is the cyclomatic complexity.";

inline constexpr const char* FLOWCHART_TO_CFG =
    "The attached image is a flowchart. Convert it into a control flow graph.\n"
    "Answer with a single JSON object and nothing else, using the shape:\n"
    "{\"nodes\": [{\"id\", \"type\", \"label\", \"next_nodes\", \"condition\"}],\n"
    " \"edges\": [{\"from\", \"to\", \"label\"}],\n"
    " \"complexity\", \"num_paths\", \"nesting_depth\"}\n"
    "Node types: START, END, PROCESS, DECISION, LOOP, FUNCTION_CALL, RETURN.";

inline constexpr const char* ANALYZE_PROBLEM =
    "Analyze the programming problem below. Answer with a single JSON object:\n"
    "{\"requirements\": [...], \"inputs\": [...], \"outputs\": [...],\n"
    " \"edge_cases\": [...], \"expected_structure\": {\"loops\": n,\n"
    " \"decisions\": n, \"functions\": n}, \"difficulty\": \"easy|medium|hard\"}";

inline constexpr const char* COMPARE_CFGS =
    "Two solutions to the same problem are given as control flow graphs.\n"
    "Judge which one is better with respect to correctness, structure and\n"
    "simplicity. Answer with a single JSON object:\n"
    "{\"better_solution\": 1 or 2, \"scores\": {\"solution1\": 0-100,\n"
    " \"solution2\": 0-100}, \"reasoning\": \"...\",\n"
    " \"strengths\": {\"solution1\": [...], \"solution2\": [...]},\n"
    " \"weaknesses\": {\"solution1\": [...], \"solution2\": [...]}}";

} // namespace trellis::prompts
