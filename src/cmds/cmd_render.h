#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>

namespace venvy {

class cmd_render : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_render> {
    std::string template_name;
    std::filesystem::path output_path;
    std::filesystem::path context_path;
    bool native{ false };
    std::optional<std::filesystem::path> template_root;
  };

  explicit cmd_render(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace venvy
