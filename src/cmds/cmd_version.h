#pragma once

#include "cmd.h"

namespace venvy {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  explicit cmd_version(cfg cfg);

  void execute() override;

 private:
  cfg cfg_;
};

}  // namespace venvy
