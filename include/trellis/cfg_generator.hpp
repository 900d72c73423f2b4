#pragma once

#include <trellis/analysis_cache.hpp>
#include <trellis/cfg.hpp>
#include <trellis/inference.hpp>
#include <trellis/result.hpp>
#include <string>

namespace trellis {

// Builds control-flow graphs from pseudocode or a flowchart image by asking
// the model, with answers cached through AnalysisCache.
class CfgGenerator {
public:
    CfgGenerator(AnalysisCache& cache, InferenceClient& client)
        : cache_(cache), client_(client) {}

    // Keyed on normalize_code(pseudocode), so comment/whitespace/case edits
    // reuse the cached graph.
    Result<Cfg> pseudocode_to_cfg(const std::string& pseudocode);

    // `image_base64` may carry a "data:<mime>;base64," prefix. Keyed on the
    // text exactly as given. InvalidArg when the payload is not base64.
    Result<Cfg> flowchart_to_cfg(const std::string& image_base64);

private:
    AnalysisCache& cache_;
    InferenceClient& client_;
};

} // namespace trellis
