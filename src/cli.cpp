#include "cli.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace venvy {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "venvy - sandbox environment provisioner and script renderer" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag("--verbose",
               verbose,
               "Enable decorated verbose logging (prefix output with timestamp and level)");

  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;

  // Version subcommand
  auto *version{ app.add_subcommand("version", "Show version information") };
  version->callback([&cmd_cfg] { cmd_cfg = cmd_version::cfg{}; });

  // Provision subcommand
  cmd_provision::cfg provision_cfg{};
  auto *provision{ app.add_subcommand(
      "provision",
      "Create a virtualenv, install requirements, print its interpreter path") };
  provision->add_option("sandbox",
                        provision_cfg.sandbox,
                        "Sandbox directory (required unless --request sets it)");
  provision->add_option("--request", provision_cfg.request_path, "Lua request file")
      ->check(CLI::ExistingFile);
  provision->add_option("--python",
                        provision_cfg.python,
                        "Interpreter used to create the virtualenv");
  provision->add_flag("--system-site-packages",
                      provision_cfg.system_site_packages,
                      "Give the virtualenv access to system site-packages");
  auto *requirement_opt{ provision->add_option("--requirement",
                                               provision_cfg.requirements,
                                               "Requirement to install (repeatable)") };
  provision
      ->add_option("--requirements-file",
                   provision_cfg.requirements_file,
                   "Requirements file to install")
      ->excludes(requirement_opt);
  provision->add_option("--install-option",
                        provision_cfg.install_options,
                        "Extra installer option (repeatable)");
  auto *index_url_opt{ provision->add_option("--index-url",
                                             provision_cfg.index_urls,
                                             "Package index URL; the first is primary "
                                             "(repeatable)") };
  provision->add_flag("--no-index", provision_cfg.no_index, "Disable package index lookup")
      ->excludes(index_url_opt);
  provision
      ->add_option("--installer", provision_cfg.installer, "Package installer (pip or uv)")
      ->check(CLI::IsMember({ "pip", "uv" }));
  provision->callback([&cmd_cfg, &provision_cfg] { cmd_cfg = provision_cfg; });

  // Render subcommand
  cmd_render::cfg render_cfg{};
  auto *render{ app.add_subcommand("render", "Render a script template to a file") };
  render->add_option("template", render_cfg.template_name, "Template name under the root")
      ->required();
  render->add_option("output", render_cfg.output_path, "Output file")->required();
  render->add_option("--context", render_cfg.context_path, "Lua context file")
      ->required()
      ->check(CLI::ExistingFile);
  render->add_flag("--native", render_cfg.native, "Keep the evaluated value's type");
  render->add_option("--template-root", render_cfg.template_root, "Template directory")
      ->check(CLI::ExistingDirectory);
  render->callback([&cmd_cfg, &render_cfg] { cmd_cfg = render_cfg; });

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag_short || version_flag_long) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace venvy
