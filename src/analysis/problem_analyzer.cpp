#include <trellis/problem_analyzer.hpp>
#include "prompts.hpp"

namespace trellis {

Result<nlohmann::json> ProblemAnalyzer::analyze_problem(const std::string& statement) {
    return cache_.get_or_compute_document("analyze_problem", {statement},
        [&]() -> Result<std::string> {
            std::string prompt = std::string(prompts::ANALYZE_PROBLEM)
                + "\n\nProblem Statement:\n" + statement;
            return client_.invoke(prompt, std::nullopt);
        });
}

} // namespace trellis
