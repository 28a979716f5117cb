#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI/CLI.hpp"
#include "sol/sol.hpp"

#include <utility>

#ifndef VENVY_VERSION_STR
#error "VENVY_VERSION_STR must be defined by the build system"
#endif

namespace venvy {

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("venvy version %s (%s)",
            VENVY_VERSION_STR,
            platform::get_exe_path().string().c_str());
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace venvy
