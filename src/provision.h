#pragma once

#include "process.h"
#include "venv_commands.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace venvy {

struct provision_request {
  std::filesystem::path sandbox_path;

  // nullopt: create the venv with command_default_interpreter()
  std::optional<std::filesystem::path> interpreter_path;

  // Pass --system-site-packages to venv
  bool inherit_system_packages{ false };

  // Mutually exclusive with requirements_file_path. An empty list installs nothing.
  std::optional<std::vector<std::string>> requirements;

  // Mutually exclusive with requirements. An empty string installs nothing.
  std::optional<std::string> requirements_file_path;

  // Inserted after "install", before the requirements
  std::vector<std::string> install_options;

  // nullopt: leave index configuration alone (system pip config applies).
  // Empty: write a pip.conf that disables index lookup.
  std::optional<std::vector<std::string>> index_urls;

  installer_kind installer{ installer_kind::pip };
};

// Rejected before anything is written or spawned.
class invalid_request_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Validate, write pip.conf, create the venv, install requirements. Returns
// <sandbox>/bin/python. Throws invalid_request_error or execution_error; a partially
// created sandbox is left for the caller to remove.
std::filesystem::path prepare_virtualenv(provision_request const &req,
                                         process_executor &executor);

}  // namespace venvy
