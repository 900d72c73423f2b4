#pragma once

#include <string>

namespace trellis {

struct TrellisError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        Storage,            // SQLite fault inside the response cache
        Transport,          // inference collaborator failed or timed out
        MalformedResponse,  // collaborator text is not a JSON object
        Structural          // edge references a node id that does not exist
    };

    Code code;
    std::string message;
    std::string hint;

    TrellisError() = default;
    TrellisError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TrellisError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace trellis
