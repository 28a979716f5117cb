#include "cmd_render.h"

#include "request_file.h"
#include "script_writer.h"
#include "tui.h"

#include <utility>

namespace venvy {

cmd_render::cmd_render(cmd_render::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_render::execute() {
  render_request const req{ .template_name = cfg_.template_name,
                            .context = template_context_load(cfg_.context_path),
                            .output_path = cfg_.output_path,
                            .native_mode = cfg_.native,
                            .template_root = cfg_.template_root };

  tui::debug("render: %s -> %s",
             req.template_name.c_str(),
             req.output_path.string().c_str());
  write_script(req);
  tui::info("wrote %s", req.output_path.string().c_str());
}

}  // namespace venvy
