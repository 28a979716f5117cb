#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace venvy {

// One executable invocation: argv[0] followed by its arguments. Tokens are passed to
// execve as-is and never joined into a shell string.
using command_t = std::vector<std::string>;

enum class installer_kind { pip, uv };

// nullopt/empty -> pip. Unknown names throw std::invalid_argument.
installer_kind installer_parse(std::optional<std::string_view> value);
char const *installer_name(installer_kind kind);

struct requirement_list {
  std::vector<std::string> names;
};

struct requirements_file {
  std::string path;
};

using requirement_source = std::variant<requirement_list, requirements_file>;

// VENVY_PYTHON, then python3 on PATH, then python on PATH. Throws if none is found.
std::filesystem::path command_default_interpreter();

// [python, -m, venv, sandbox] (+ --system-site-packages)
command_t command_build_create(std::optional<std::filesystem::path> const &interpreter,
                               std::filesystem::path const &sandbox_path,
                               bool inherit_system_packages);

// [<sandbox>/bin/uv, pip, install, ...] or [<sandbox>/bin/pip, install, ...] followed by
// the options and then either the requirement names or "-r <file>". Mutual exclusivity of
// the two sources is the caller's concern.
command_t command_build_install(std::filesystem::path const &sandbox_path,
                                installer_kind installer,
                                std::vector<std::string> const &install_options,
                                requirement_source const &source);

std::filesystem::path command_sandbox_bin(std::filesystem::path const &sandbox_path,
                                          std::string_view name);

// pip.conf content. Empty url list produces an explicit no-index directive.
std::string index_config_build(std::vector<std::string> const &index_urls);

}  // namespace venvy
