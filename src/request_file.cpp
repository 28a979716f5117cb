#include "request_file.h"

#include "sol_util.h"
#include "template_lua.h"

#include <stdexcept>
#include <utility>

namespace venvy {

provision_request provision_request_load(std::filesystem::path const &path) {
  auto lua{ sol_util_make_lua_state() };
  sol::table const tbl{ sol_util_run_file_for_table(*lua, path) };
  std::string const ctx{ path.string() };

  provision_request req{
    .sandbox_path = sol_util_get_required<std::string>(tbl, "sandbox", ctx),
    .interpreter_path = std::nullopt,
    .inherit_system_packages =
        sol_util_get_or_default<bool>(tbl, "system_site_packages", false, ctx),
    .requirements = sol_util_get_string_array(tbl, "requirements", ctx),
    .requirements_file_path = sol_util_get_optional<std::string>(tbl, "requirements_file", ctx),
    .install_options = sol_util_get_string_array(tbl, "install_options", ctx).value_or(
        std::vector<std::string>{}),
    .index_urls = sol_util_get_string_array(tbl, "index_urls", ctx),
    .installer = installer_parse(sol_util_get_optional<std::string>(tbl, "installer", ctx)),
  };

  if (auto python{ sol_util_get_optional<std::string>(tbl, "python", ctx) }) {
    req.interpreter_path = std::filesystem::path{ std::move(*python) };
  }

  if (req.sandbox_path.empty()) { throw std::runtime_error(ctx + ": sandbox is empty"); }

  return req;
}

template_context template_context_load(std::filesystem::path const &path) {
  auto lua{ sol_util_make_lua_state() };
  sol::table const tbl{ sol_util_run_file_for_table(*lua, path) };

  template_value value{ template_value_from_lua(sol::make_object(*lua, tbl)) };
  if (auto *map{ std::get_if<template_map>(&value.v) }) { return std::move(*map); }

  auto const *list{ std::get_if<template_list>(&value.v) };
  if (list && list->empty()) { return {}; }

  throw std::runtime_error(path.string() + ": context must be a table with string keys");
}

}  // namespace venvy
