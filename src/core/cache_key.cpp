#include <trellis/cache_key.hpp>
#include <trellis/sha256.hpp>

namespace trellis {

std::string cache_key(const std::string& call_type,
                      const std::vector<std::string>& parts) {
    Sha256 ctx;
    ctx.update(call_type);
    ctx.update(CACHE_KEY_SEPARATOR);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) ctx.update(CACHE_KEY_SEPARATOR);
        ctx.update(parts[i]);
    }
    return Sha256::to_hex(ctx.finalize());
}

std::string canonical_json(const nlohmann::json& doc) {
    // nlohmann::json objects are std::map backed, so keys come out sorted.
    // Invalid UTF-8 is replaced rather than thrown on.
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string short_hash(const std::string& content_hash) {
    return content_hash.substr(0, 12);
}

} // namespace trellis
