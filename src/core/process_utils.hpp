#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace relpack::core {

// Result of one `/bin/sh -c` invocation. `exit_code` is the decoded exit
// status when the child exited normally, otherwise the raw wait status.
struct CommandResult {
  int exit_code = -1;
  std::string output;
};

// Single-quotes `arg` for POSIX shells so paths and tags with spaces or
// metacharacters survive command composition.
std::string ShellQuote(std::string_view arg);

// Joins already-quoted arguments into one command line.
std::string JoinCommand(const std::vector<std::string>& quoted_args);

// Runs `command` and waits for it. Returns false only when the shell could
// not be started; a non-zero exit is reported through `result.exit_code`.
bool RunCommand(const std::string& command, CommandResult& result, std::string& error);

// Same as RunCommand but captures stdout into `result.output`.
bool RunCommandCapture(const std::string& command, CommandResult& result, std::string& error);

// Same as RunCommand but feeds `input` to the child's stdin. Used for
// secrets so they never appear on a command line.
bool RunCommandWithInput(const std::string& command, std::string_view input,
                         CommandResult& result, std::string& error);

} // namespace relpack::core
