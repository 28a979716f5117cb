#pragma once

#include "template_engine.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace venvy {

constexpr char kDefaultScriptTemplate[]{ "python_virtualenv_script.py.tmpl" };

struct render_request {
  std::string template_name;
  template_context context;
  std::filesystem::path output_path;
  bool native_mode{ false };

  // nullopt: script_template_root()
  std::optional<std::filesystem::path> template_root;
};

// VENVY_TEMPLATE_ROOT if set, else the template directory baked in at build time.
std::filesystem::path script_template_root();

// Reads <root>/<name>. Names with ".." segments or absolute names are rejected.
compiled_template script_load_template(std::filesystem::path const &root,
                                       std::string_view name);

// Autoescape applies to .html and .xml templates.
bool script_autoescape_for(std::string_view template_name);

// Render in memory, then atomically replace output_path with the text form of the result.
// On any failure output_path is left as it was.
template_value write_script(render_request const &req);

}  // namespace venvy
