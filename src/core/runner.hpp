// core/runner.hpp - External command execution
#pragma once

#include <string>
#include <vector>

namespace converge {

struct CommandOutput {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  // exec() itself failed; the tool is not installed or not on PATH
  bool spawn_failed = false;

  bool success() const { return !spawn_failed && exit_code == 0; }
};

// Every external tool call goes through a runner so tests can script them.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  // Captures stdout and stderr
  virtual CommandOutput run(const std::string &cmd,
                            const std::vector<std::string> &args) = 0;

  // Inherits the terminal; returns the exit code
  virtual int run_interactive(const std::string &cmd,
                              const std::vector<std::string> &args) = 0;
};

class ProcessRunner : public CommandRunner {
public:
  CommandOutput run(const std::string &cmd,
                    const std::vector<std::string> &args) override;
  int run_interactive(const std::string &cmd,
                      const std::vector<std::string> &args) override;
};

std::string format_command(const std::string &cmd,
                           const std::vector<std::string> &args);

} // namespace converge
