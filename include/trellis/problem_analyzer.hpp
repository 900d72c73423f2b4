#pragma once

#include <trellis/analysis_cache.hpp>
#include <trellis/inference.hpp>
#include <trellis/result.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace trellis {

// Extracts requirements and expected structure from a problem statement.
// The answer is an opaque JSON object; MalformedResponse when the model does
// not return one.
class ProblemAnalyzer {
public:
    ProblemAnalyzer(AnalysisCache& cache, InferenceClient& client)
        : cache_(cache), client_(client) {}

    Result<nlohmann::json> analyze_problem(const std::string& statement);

private:
    AnalysisCache& cache_;
    InferenceClient& client_;
};

} // namespace trellis
