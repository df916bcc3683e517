#pragma once

#include <chartsmith/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace chartsmith {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Extra environment variables set in the child only
using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout. A non-zero exit code is
// reported through CommandResult, not as an error.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const EnvOverrides& env = {});

// "helm package /x --destination /y", for messages
std::string join_command(const std::vector<std::string>& args);

// Last non-empty line of the command's stderr (or stdout when stderr is empty)
std::string failure_summary(const CommandResult& result);

} // namespace chartsmith
