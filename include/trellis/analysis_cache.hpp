#pragma once

#include <trellis/cfg.hpp>
#include <trellis/response_cache.hpp>
#include <trellis/result.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace trellis {

// Runs the collaborator and returns its raw answer text
using ComputeFn = std::function<Result<std::string>()>;

// Cache-aware boundary in front of the model collaborator.
//
// get_or_compute:
//   key = cache_key(call_type, parts)
//   hit  -> validate -> assemble
//   miss -> compute -> parse -> validate -> assemble -> store
// Unparsable answers give fallback_cfg() and are not stored. Transport errors
// from `compute` and Structural errors from assembly reach the caller; neither
// is stored.
class AnalysisCache {
public:
    explicit AnalysisCache(ResponseCache store);

    Result<Cfg> get_or_compute(const std::string& call_type,
                               const std::vector<std::string>& parts,
                               const ComputeFn& compute);

    // Same flow for free-form JSON answers. There is no fallback document,
    // so MalformedResponse is returned as is.
    Result<nlohmann::json> get_or_compute_document(const std::string& call_type,
                                                   const std::vector<std::string>& parts,
                                                   const ComputeFn& compute);

    Result<CacheStats> cache_stats() { return store_.stats(); }
    int64_t cache_sweep() { return store_.sweep(); }

    ResponseCache& store() { return store_; }

private:
    ResponseCache store_;
};

// "pseudocode_to_cfg" -> "pseudocode"; used in the fallback node label
std::string fallback_subject(const std::string& call_type);

} // namespace trellis
