#pragma once

#include <trellis/result.hpp>
#include <string>
#include <vector>

namespace trellis {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run `args[0]` with `stdin_data` on its stdin, capturing stdout and stderr.
// The child is killed once `timeout_seconds` elapse.
// Errors: InvalidArg for empty args, IO for pipe/fork failures,
// Transport on timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& stdin_data,
                                  int timeout_seconds);

} // namespace trellis
