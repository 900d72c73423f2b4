#pragma once

#include <trellis/analysis_cache.hpp>
#include <trellis/cfg.hpp>
#include <trellis/inference.hpp>
#include <trellis/result.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>

namespace trellis {

// Size and shape figures sent to the model next to each graph
struct StructuralMetrics {
    int64_t num_nodes = 0;
    int64_t num_edges = 0;
    int64_t complexity = 1;
    int64_t num_paths = 1;
    int64_t nesting_depth = 0;

    bool operator==(const StructuralMetrics& other) const;
};

StructuralMetrics structural_metrics(const Cfg& cfg);

// {"num_nodes", "num_edges", "complexity", "num_paths", "nesting_depth"}
nlohmann::json metrics_to_json(const StructuralMetrics& m);

// Asks the model which of two solutions is better. The verdict is cached on
// the canonical form of both graphs plus the problem analysis.
class CfgComparator {
public:
    CfgComparator(AnalysisCache& cache, InferenceClient& client)
        : cache_(cache), client_(client) {}

    Result<nlohmann::json> compare_cfgs(const Cfg& cfg1, const Cfg& cfg2,
                                        const nlohmann::json& problem_analysis);

private:
    AnalysisCache& cache_;
    InferenceClient& client_;
};

} // namespace trellis
