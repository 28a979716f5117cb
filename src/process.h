#pragma once

#include "venv_commands.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace venvy {

using process_env_t = std::unordered_map<std::string, std::string>;

struct process_result {
  int exit_code;
  std::optional<int> signal;
  std::string output;  // stdout and stderr lines in arrival order, newline-terminated
};

struct process_run_cfg {
  std::function<void(std::string_view)> on_output_line;
  process_env_t env;
};

process_env_t process_getenv();

// Fork and exec `argv` directly (no shell). A bare argv[0] is resolved on PATH.
// Exec failure in the child surfaces as exit code 127.
process_result process_run(command_t const &argv, process_run_cfg const &cfg);

// Collaborator that runs one command to completion and reports its status.
class process_executor {
 public:
  virtual ~process_executor() = default;
  virtual process_result execute(command_t const &cmd) = 0;

 protected:
  process_executor() = default;
};

// Runs commands with the current environment, streaming output to the debug log.
class posix_process_executor : public process_executor {
 public:
  process_result execute(command_t const &cmd) override;
};

// A spawned command exited non-zero (or died by signal) during a provisioning stage.
class execution_error : public std::runtime_error {
 public:
  execution_error(std::string stage, command_t command, process_result result);

  std::string const &stage() const { return stage_; }
  command_t const &command() const { return command_; }
  int exit_code() const { return result_.exit_code; }
  std::string const &output() const { return result_.output; }

 private:
  std::string stage_;
  command_t command_;
  process_result result_;
};

}  // namespace venvy
