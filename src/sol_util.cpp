#include "sol_util.h"

#include <stdexcept>

namespace venvy {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

sol::table sol_util_run_file_for_table(sol::state &lua, std::filesystem::path const &path) {
  sol::protected_function_result result{
    lua.safe_script_file(path.string(), sol::script_pass_on_error)
  };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(path.string() + ": " + err.what());
  }

  sol::object const returned{ result.get<sol::object>() };
  if (returned.get_type() != sol::type::table) {
    throw std::runtime_error(path.string() + ": must return a table");
  }
  return returned.as<sol::table>();
}

std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context) {
  auto const arr{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!arr) { return std::nullopt; }

  std::vector<std::string> result;
  size_t const n{ arr->size() };
  result.reserve(n);
  for (size_t i{ 1 }; i <= n; ++i) {
    sol::object const item{ arr->get<sol::object>(i) };
    if (item.get_type() != sol::type::string) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

}  // namespace venvy
