#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace trellis {

// Separator placed between the call type and each content part
inline constexpr const char* CACHE_KEY_SEPARATOR = "||";

// Deterministic fingerprint: SHA-256 of
//   call_type + "||" + parts[0] + "||" + parts[1] ...
// as 64 lowercase hex characters.
std::string cache_key(const std::string& call_type,
                      const std::vector<std::string>& parts);

// Stable serialization for structured key parts: object keys sorted,
// no insignificant whitespace. Equal documents always give equal strings.
std::string canonical_json(const nlohmann::json& doc);

// Short prefix of a hash for log lines
std::string short_hash(const std::string& content_hash);

} // namespace trellis
