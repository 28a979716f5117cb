#include "venv_commands.h"

#include "platform.h"
#include "util.h"

#include <stdexcept>

namespace venvy {

installer_kind installer_parse(std::optional<std::string_view> value) {
  if (!value || value->empty()) { return installer_kind::pip; }
  if (*value == "pip") { return installer_kind::pip; }
  if (*value == "uv") { return installer_kind::uv; }
  throw std::invalid_argument("installer must be 'pip' or 'uv', got '" +
                              std::string{ *value } + "'");
}

char const *installer_name(installer_kind kind) {
  switch (kind) {
    case installer_kind::pip: return "pip";
    case installer_kind::uv: return "uv";
  }
  throw std::invalid_argument("installer_name: unknown installer");
}

std::filesystem::path command_default_interpreter() {
  if (auto const env_python{ platform::env_var_get("VENVY_PYTHON") }) {
    return std::filesystem::path{ *env_python };
  }

  for (char const *candidate : { "python3", "python" }) {
    if (auto found{ platform::find_executable(candidate) }) { return *found; }
  }

  throw std::runtime_error(
      "no python interpreter found on PATH (pass --python or set VENVY_PYTHON)");
}

command_t command_build_create(std::optional<std::filesystem::path> const &interpreter,
                               std::filesystem::path const &sandbox_path,
                               bool inherit_system_packages) {
  auto const python{ interpreter ? *interpreter : command_default_interpreter() };

  command_t cmd{ python.string(), "-m", "venv", sandbox_path.string() };
  if (inherit_system_packages) { cmd.emplace_back("--system-site-packages"); }
  return cmd;
}

std::filesystem::path command_sandbox_bin(std::filesystem::path const &sandbox_path,
                                          std::string_view name) {
  return sandbox_path / "bin" / std::filesystem::path{ name };
}

command_t command_build_install(std::filesystem::path const &sandbox_path,
                                installer_kind installer,
                                std::vector<std::string> const &install_options,
                                requirement_source const &source) {
  command_t cmd{ command_sandbox_bin(sandbox_path, installer_name(installer)).string() };
  if (installer == installer_kind::uv) { cmd.emplace_back("pip"); }
  cmd.emplace_back("install");
  cmd.insert(cmd.end(), install_options.begin(), install_options.end());

  std::visit(match{ [&cmd](requirement_list const &list) {
                     cmd.insert(cmd.end(), list.names.begin(), list.names.end());
                   },
                    [&cmd](requirements_file const &file) {
                      cmd.emplace_back("-r");
                      cmd.push_back(file.path);
                    } },
             source);

  return cmd;
}

std::string index_config_build(std::vector<std::string> const &index_urls) {
  std::string content{ "[global]\n" };

  if (index_urls.empty()) {
    content += "no-index = true";
    return content;
  }

  content += "index-url = " + index_urls.front();
  if (index_urls.size() > 1) {
    content += "\nextra-index-url =";
    for (auto it{ index_urls.begin() + 1 }; it != index_urls.end(); ++it) {
      content += ' ';
      content += *it;
    }
  }

  return content;
}

}  // namespace venvy
