#include <trellis/analysis_cache.hpp>
#include <trellis/cache_key.hpp>
#include <trellis/cfg_assembler.hpp>
#include <trellis/cfg_validator.hpp>
#include <trellis/graph_record.hpp>
#include <trellis/json_response.hpp>
#include <trellis/log.hpp>

namespace trellis {

std::string fallback_subject(const std::string& call_type) {
    auto pos = call_type.find("_to_");
    if (pos == std::string::npos || pos == 0) return call_type;
    return call_type.substr(0, pos);
}

AnalysisCache::AnalysisCache(ResponseCache store)
    : store_(std::move(store)) {}

Result<Cfg> AnalysisCache::get_or_compute(const std::string& call_type,
                                          const std::vector<std::string>& parts,
                                          const ComputeFn& compute) {
    std::string key = cache_key(call_type, parts);

    if (auto cached = store_.get(call_type, key)) {
        GraphRecord record = validate_cfg(graph_record_from_json(*cached));
        return to_entity(record);
    }

    auto raw = compute();
    TRELLIS_TRY(raw);

    auto doc = parse_json_response(raw.value());
    if (doc.is_err()) {
        log::warn("%s: %s; returning fallback graph", call_type.c_str(),
                  doc.error().message.c_str());
        return Result<Cfg>::ok(fallback_cfg(fallback_subject(call_type)));
    }

    GraphRecord record = validate_cfg(graph_record_from_json(doc.value()));
    auto cfg = to_entity(record);
    if (cfg.is_err()) {
        log::warn("%s: %s; not caching", call_type.c_str(),
                  cfg.error().message.c_str());
        return cfg;
    }

    store_.set(call_type, key, graph_record_to_json(record));
    return cfg;
}

Result<nlohmann::json> AnalysisCache::get_or_compute_document(
        const std::string& call_type,
        const std::vector<std::string>& parts,
        const ComputeFn& compute) {
    std::string key = cache_key(call_type, parts);

    if (auto cached = store_.get(call_type, key)) {
        return Result<nlohmann::json>::ok(std::move(*cached));
    }

    auto raw = compute();
    TRELLIS_TRY(raw);

    auto doc = parse_json_response(raw.value());
    TRELLIS_TRY(doc);

    store_.set(call_type, key, doc.value());
    return doc;
}

} // namespace trellis
