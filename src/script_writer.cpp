#include "script_writer.h"

#include "platform.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <system_error>

#ifndef VENVY_TEMPLATE_DIR
#error "VENVY_TEMPLATE_DIR must be defined by the build system"
#endif

namespace venvy {

namespace {

bool ends_with_ci(std::string_view s, std::string_view suffix) {
  if (s.size() < suffix.size()) { return false; }
  return std::equal(suffix.begin(), suffix.end(), s.end() - suffix.size(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

}  // namespace

std::filesystem::path script_template_root() {
  if (auto const env_root{ platform::env_var_get("VENVY_TEMPLATE_ROOT") }) {
    return std::filesystem::path{ *env_root };
  }
  return std::filesystem::path{ VENVY_TEMPLATE_DIR };
}

compiled_template script_load_template(std::filesystem::path const &root,
                                       std::string_view name) {
  std::filesystem::path const relative{ name };
  if (name.empty() || relative.is_absolute() || relative.has_root_path()) {
    throw template_not_found_error("template not found: '" + std::string{ name } + "'");
  }
  for (auto const &part : relative) {
    if (part == "..") {
      throw template_not_found_error("template not found: '" + std::string{ name } +
                                     "' (escapes template root)");
    }
  }

  auto const path{ root / relative };
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw template_not_found_error("template not found: '" + std::string{ name } +
                                   "' under " + root.string());
  }

  return template_compile(std::string{ name }, util_load_text_file(path));
}

bool script_autoescape_for(std::string_view template_name) {
  return ends_with_ci(template_name, ".html") || ends_with_ci(template_name, ".xml");
}

template_value write_script(render_request const &req) {
  auto const root{ req.template_root ? *req.template_root : script_template_root() };
  auto const tmpl{ script_load_template(root, req.template_name) };

  render_options const opts{
    .mode = req.native_mode ? render_mode::native : render_mode::plain,
    .autoescape = !req.native_mode && script_autoescape_for(req.template_name),
  };

  auto rendered{ template_render(tmpl, req.context, opts) };
  util_write_file_atomic(req.output_path, template_value_to_text(rendered));
  return rendered;
}

}  // namespace venvy
