#include <trellis/error.hpp>

namespace trellis {

const char* TrellisError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Config:            return "Config";
        case NotFound:          return "NotFound";
        case InvalidArg:        return "InvalidArg";
        case Storage:           return "Storage";
        case Transport:         return "Transport";
        case MalformedResponse: return "MalformedResponse";
        case Structural:        return "Structural";
    }
    return "Unknown";
}

std::string TrellisError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace trellis
