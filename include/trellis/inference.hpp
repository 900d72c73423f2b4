#pragma once

#include <trellis/config.hpp>
#include <trellis/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// Binary input sent alongside a prompt (e.g. a flowchart image)
struct Attachment {
    std::string mime_type;
    std::vector<uint8_t> data;
};

// The model collaborator. Returns the raw answer text; failures are
// Transport errors and are never retried here.
class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    virtual Result<std::string> invoke(const std::string& prompt,
                                       const std::optional<Attachment>& attachment) = 0;
};

// Runs `settings.command` with the prompt on stdin and reads the answer from
// stdout. An attachment is written to a temporary file whose path is appended
// as the last argument; the file is removed when the call returns.
class CommandInferenceClient : public InferenceClient {
public:
    explicit CommandInferenceClient(InferenceSettings settings);

    Result<std::string> invoke(const std::string& prompt,
                               const std::optional<Attachment>& attachment) override;

    const InferenceSettings& settings() const { return settings_; }

private:
    InferenceSettings settings_;
};

} // namespace trellis
