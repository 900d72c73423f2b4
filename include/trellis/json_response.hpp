#pragma once

#include <trellis/result.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace trellis {

// Extract the JSON object from a model answer. Accepts the bare object, an
// object wrapped in a Markdown code fence (```json ... ``` or ``` ... ```), or
// prose around a single {...} span. Anything else is MalformedResponse.
Result<nlohmann::json> parse_json_response(const std::string& text);

} // namespace trellis
