#include <trellis/cfg_comparator.hpp>
#include <trellis/cache_key.hpp>
#include <trellis/cfg_assembler.hpp>
#include <trellis/graph_record.hpp>
#include "prompts.hpp"

namespace trellis {

bool StructuralMetrics::operator==(const StructuralMetrics& other) const {
    return num_nodes == other.num_nodes && num_edges == other.num_edges &&
           complexity == other.complexity && num_paths == other.num_paths &&
           nesting_depth == other.nesting_depth;
}

StructuralMetrics structural_metrics(const Cfg& cfg) {
    StructuralMetrics m;
    m.num_nodes = static_cast<int64_t>(cfg.node_count());
    m.num_edges = static_cast<int64_t>(cfg.edge_count());
    m.complexity = cfg.metrics().complexity;
    m.num_paths = cfg.metrics().num_paths;
    m.nesting_depth = cfg.metrics().nesting_depth;
    return m;
}

nlohmann::json metrics_to_json(const StructuralMetrics& m) {
    return nlohmann::json{
        {"num_nodes", m.num_nodes},
        {"num_edges", m.num_edges},
        {"complexity", m.complexity},
        {"num_paths", m.num_paths},
        {"nesting_depth", m.nesting_depth},
    };
}

Result<nlohmann::json> CfgComparator::compare_cfgs(const Cfg& cfg1, const Cfg& cfg2,
                                                   const nlohmann::json& problem_analysis) {
    nlohmann::json doc1 = graph_record_to_json(to_record(cfg1));
    nlohmann::json doc2 = graph_record_to_json(to_record(cfg2));

    std::vector<std::string> parts{
        canonical_json(doc1),
        canonical_json(doc2),
        canonical_json(problem_analysis),
    };

    return cache_.get_or_compute_document("compare_cfgs", parts,
        [&]() -> Result<std::string> {
            nlohmann::json metrics{
                {"cfg1", metrics_to_json(structural_metrics(cfg1))},
                {"cfg2", metrics_to_json(structural_metrics(cfg2))},
            };
            std::string prompt = std::string(prompts::COMPARE_CFGS)
                + "\n\nProblem Analysis:\n" + problem_analysis.dump(2)
                + "\n\nSolution 1 CFG:\n" + doc1.dump(2)
                + "\n\nSolution 2 CFG:\n" + doc2.dump(2)
                + "\n\nStructural Metrics:\n" + metrics.dump(2)
                + "\n\nCompare these solutions and determine which is better.";
            return client_.invoke(prompt, std::nullopt);
        });
}

} // namespace trellis
