#include "cmd_provision.h"

#include "process.h"
#include "request_file.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace venvy {

provision_request cmd_provision_build_request(cmd_provision::cfg const &cfg) {
  provision_request req{};
  if (cfg.request_path) { req = provision_request_load(*cfg.request_path); }

  if (!cfg.sandbox.empty()) { req.sandbox_path = cfg.sandbox; }
  if (req.sandbox_path.empty()) {
    throw std::runtime_error("provision: no sandbox path given");
  }

  if (cfg.python) { req.interpreter_path = std::filesystem::path{ *cfg.python }; }
  if (cfg.system_site_packages) { req.inherit_system_packages = true; }

  if (!cfg.requirements.empty() || cfg.requirements_file) {
    req.requirements.reset();
    req.requirements_file_path.reset();
    if (!cfg.requirements.empty()) { req.requirements = cfg.requirements; }
    if (cfg.requirements_file) { req.requirements_file_path = cfg.requirements_file; }
  }

  if (!cfg.install_options.empty()) { req.install_options = cfg.install_options; }

  if (cfg.no_index) {
    req.index_urls = std::vector<std::string>{};
  } else if (!cfg.index_urls.empty()) {
    req.index_urls = cfg.index_urls;
  }

  if (cfg.installer) { req.installer = installer_parse(*cfg.installer); }

  return req;
}

cmd_provision::cmd_provision(cmd_provision::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_provision::execute() {
  auto const req{ cmd_provision_build_request(cfg_) };
  tui::debug("provision: sandbox %s, installer %s",
             req.sandbox_path.c_str(),
             installer_name(req.installer));

  posix_process_executor executor;
  auto const python{ prepare_virtualenv(req, executor) };
  tui::print_stdout("%s\n", python.c_str());
}

}  // namespace venvy
