#include "provision.h"

#include "util.h"

#include <utility>

namespace venvy {

namespace {

constexpr char kIndexConfigFilename[]{ "pip.conf" };
constexpr char kSandboxPython[]{ "python" };

void run_stage(char const *stage, command_t cmd, process_executor &executor) {
  auto result{ executor.execute(cmd) };
  if (result.exit_code != 0 || result.signal) {
    throw execution_error{ stage, std::move(cmd), std::move(result) };
  }
}

std::optional<requirement_source> select_requirement_source(provision_request const &req) {
  if (req.requirements && !req.requirements->empty()) {
    return requirement_list{ *req.requirements };
  }
  if (req.requirements_file_path && !req.requirements_file_path->empty()) {
    return requirements_file{ *req.requirements_file_path };
  }
  return std::nullopt;
}

}  // namespace

std::filesystem::path prepare_virtualenv(provision_request const &req,
                                         process_executor &executor) {
  if (req.requirements && req.requirements_file_path) {
    throw invalid_request_error{
      "either requirements or requirements_file_path may be given, but not both"
    };
  }

  if (req.index_urls) {
    // pip.conf is placed before venv runs, so the directory may not exist yet
    std::filesystem::create_directories(req.sandbox_path);
    util_write_file_atomic(req.sandbox_path / kIndexConfigFilename,
                           index_config_build(*req.index_urls));
  }

  run_stage("create",
            command_build_create(req.interpreter_path,
                                 req.sandbox_path,
                                 req.inherit_system_packages),
            executor);

  if (auto const source{ select_requirement_source(req) }) {
    run_stage("install",
              command_build_install(req.sandbox_path,
                                    req.installer,
                                    req.install_options,
                                    *source),
              executor);
  }

  return command_sandbox_bin(req.sandbox_path, kSandboxPython);
}

}  // namespace venvy
