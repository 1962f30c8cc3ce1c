#include "core/process_utils.hpp"

#include <cstdio>
#include <cstdlib>

#include <sys/wait.h>

namespace relpack::core {

namespace {

int DecodeWaitStatus(int raw_status) {
  if (WIFEXITED(raw_status)) {
    return WEXITSTATUS(raw_status);
  }
  return raw_status;
}

} // namespace

std::string ShellQuote(std::string_view arg) {
  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}

std::string JoinCommand(const std::vector<std::string>& quoted_args) {
  std::string command;
  for (const auto& arg : quoted_args) {
    if (!command.empty()) {
      command.push_back(' ');
    }
    command += arg;
  }
  return command;
}

bool RunCommand(const std::string& command, CommandResult& result, std::string& error) {
  error.clear();
  result = CommandResult{};
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command";
    return false;
  }
  result.exit_code = DecodeWaitStatus(raw_status);
  return true;
}

bool RunCommandCapture(const std::string& command, CommandResult& result, std::string& error) {
  error.clear();
  result = CommandResult{};
  FILE* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute shell command";
    return false;
  }

  char buffer[4096];
  std::size_t read_count = 0;
  while ((read_count = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0U) {
    result.output.append(buffer, read_count);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect shell command status";
    return false;
  }
  result.exit_code = DecodeWaitStatus(raw_status);
  return true;
}

bool RunCommandWithInput(const std::string& command, std::string_view input,
                         CommandResult& result, std::string& error) {
  error.clear();
  result = CommandResult{};
  FILE* pipe = popen(command.c_str(), "w");
  if (pipe == nullptr) {
    error = "failed to execute shell command";
    return false;
  }

  const std::size_t written = std::fwrite(input.data(), 1, input.size(), pipe);
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect shell command status";
    return false;
  }
  if (written != input.size()) {
    error = "failed to write command input";
    return false;
  }
  result.exit_code = DecodeWaitStatus(raw_status);
  return true;
}

} // namespace relpack::core
