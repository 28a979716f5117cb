#pragma once

#include "cmd.h"
#include "provision.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace venvy {

class cmd_provision : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_provision> {
    std::optional<std::filesystem::path> request_path;  // --request
    std::string sandbox;
    std::optional<std::string> python;
    bool system_site_packages{ false };
    std::vector<std::string> requirements;
    std::optional<std::string> requirements_file;
    std::vector<std::string> install_options;
    std::vector<std::string> index_urls;
    bool no_index{ false };
    std::optional<std::string> installer;
  };

  explicit cmd_provision(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// Starts from the --request file (if any) and applies command-line values on top. A
// requirement source given on the command line replaces both sources from the file.
provision_request cmd_provision_build_request(cmd_provision::cfg const &cfg);

}  // namespace venvy
