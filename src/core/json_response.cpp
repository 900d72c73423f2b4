#include <trellis/json_response.hpp>

namespace trellis {

using nlohmann::json;

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// ```json\n{...}\n```  ->  {...}
static std::string strip_code_fence(const std::string& text) {
    if (text.rfind("```", 0) != 0) return text;

    size_t body = text.find('\n');
    if (body == std::string::npos) return text;
    size_t close = text.rfind("```");
    if (close == std::string::npos || close <= body) {
        return trim(text.substr(body + 1));
    }
    return trim(text.substr(body + 1, close - body - 1));
}

static bool parse_object(const std::string& text, json& out) {
    out = json::parse(text, nullptr, false);
    return !out.is_discarded() && out.is_object();
}

Result<json> parse_json_response(const std::string& text) {
    std::string body = strip_code_fence(trim(text));

    json doc;
    if (parse_object(body, doc)) {
        return Result<json>::ok(std::move(doc));
    }

    // Prose before or after the object
    size_t open = body.find('{');
    size_t close = body.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        if (parse_object(body.substr(open, close - open + 1), doc)) {
            return Result<json>::ok(std::move(doc));
        }
    }

    std::string preview = body.substr(0, 80);
    return TrellisError{TrellisError::MalformedResponse,
        "response is not a JSON object: " + preview,
        "the model answered with something other than the requested JSON"};
}

} // namespace trellis
