#include "process.h"

#include "tui.h"
#include "util.h"

#include <utility>

namespace venvy {

namespace {

std::string format_execution_error(std::string const &stage,
                                   command_t const &command,
                                   process_result const &result) {
  std::string msg{ stage + " failed: '" + util_join_tokens(command) + "' " };
  if (result.signal) {
    msg += "terminated by signal " + std::to_string(*result.signal);
  } else {
    msg += "exited with status " + std::to_string(result.exit_code);
  }
  if (!result.output.empty()) { msg += "\n" + result.output; }
  return msg;
}

}  // namespace

execution_error::execution_error(std::string stage,
                                 command_t command,
                                 process_result result)
    : std::runtime_error{ format_execution_error(stage, command, result) },
      stage_{ std::move(stage) },
      command_{ std::move(command) },
      result_{ std::move(result) } {}

process_result posix_process_executor::execute(command_t const &cmd) {
  tui::debug("exec: %s", util_join_tokens(cmd).c_str());

  process_run_cfg const cfg{ .on_output_line =
                                 [](std::string_view line) {
                                   tui::debug("  | %.*s",
                                              static_cast<int>(line.size()),
                                              line.data());
                                 },
                             .env = process_getenv() };

  auto result{ process_run(cmd, cfg) };
  tui::debug("exec: exit status %d", result.exit_code);
  return result;
}

}  // namespace venvy
