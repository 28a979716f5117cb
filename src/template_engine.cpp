#include "template_engine.h"
#include "template_lua.h"

#include "util.h"

#include "sol/sol.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace venvy {

template_value::template_value() = default;

template_value::template_value(variant_t var) : v{ std::move(var) } {}

bool template_value::is_nil() const { return std::holds_alternative<std::monostate>(v); }

bool template_value::is_string() const { return std::holds_alternative<std::string>(v); }

bool operator==(template_value const &lhs, template_value const &rhs) {
  return lhs.v == rhs.v;
}

template_undefined_error::template_undefined_error(std::string name,
                                                   std::string const &template_name)
    : template_error{ "template '" + template_name + "': '" + name + "' is undefined" },
      name_{ std::move(name) } {}

namespace {

constexpr int kMaxValueDepth{ 64 };

constexpr std::array kBuiltins{ "error",  "math",  "next",     "pairs",    "select",
                                "string", "table", "tonumber", "tostring", "type" };

// ipairs over raw slots: the stock one goes through __index and would hit the strict
// handler one past the end of every list.
constexpr char kRawIpairsLua[]{ R"lua(
local rawget = rawget
return function(t)
  return function(tbl, i)
    i = i + 1
    local v = rawget(tbl, i)
    if v ~= nil then return i, v end
  end, t, 0
end
)lua" };

constexpr std::array<std::string_view, 22> kLuaKeywords{
  "and",   "break", "do",   "else", "elseif", "end",    "false", "for",
  "function", "goto", "if", "in",   "local",  "nil",    "not",   "or",
  "repeat", "return", "then", "true", "until", "while"
};

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

void trim_trailing_space(std::string &s) {
  while (!s.empty() && is_space(s.back())) { s.pop_back(); }
}

std::string_view trim_leading_space(std::string_view s) {
  while (!s.empty() && is_space(s.front())) { s.remove_prefix(1); }
  return s;
}

bool is_blank(std::string_view s) { return trim_leading_space(s).empty(); }

// Position of the next "{{", "{%" or "{#", or npos.
size_t find_tag_open(std::string_view source, size_t pos) {
  while ((pos = source.find('{', pos)) != std::string_view::npos) {
    if (pos + 1 < source.size()) {
      char const next{ source[pos + 1] };
      if (next == '{' || next == '%' || next == '#') { return pos; }
    }
    ++pos;
  }
  return std::string_view::npos;
}

size_t line_of(std::string_view source, size_t pos) {
  return 1 + static_cast<size_t>(std::count(source.begin(), source.begin() + pos, '\n'));
}

bool is_identifier(std::string_view s) {
  if (s.empty()) { return false; }
  auto const ident_char{ [](char c, bool first) {
    bool const alpha{ (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' };
    return first ? alpha : (alpha || (c >= '0' && c <= '9'));
  } };
  if (!ident_char(s.front(), true)) { return false; }
  if (!std::all_of(s.begin() + 1, s.end(), [&](char c) { return ident_char(c, false); })) {
    return false;
  }
  return std::find(kLuaKeywords.begin(), kLuaKeywords.end(), s) == kLuaKeywords.end();
}

std::string quote_lua_string(std::string_view s) {
  std::string out{ "\"" };
  for (char const ch : s) {
    auto const c{ static_cast<unsigned char>(ch) };
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buf[8];
          std::snprintf(buf, sizeof buf, "\\%03u", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
  return out;
}

// Lua's own number formatting: %.14g, with ".0" when the result reads as an integer.
std::string format_number(double d) {
  if (std::isnan(d)) { return std::signbit(d) ? "-nan" : "nan"; }
  if (std::isinf(d)) { return d > 0 ? "inf" : "-inf"; }

  char buf[64];
  std::snprintf(buf, sizeof buf, "%.14g", d);
  std::string s{ buf };
  if (s.find_first_not_of("-0123456789") == std::string::npos) { s += ".0"; }
  return s;
}

std::string scalar_text(std::monostate) { return "nil"; }
std::string scalar_text(bool b) { return b ? "true" : "false"; }
std::string scalar_text(std::int64_t i) { return std::to_string(i); }
std::string scalar_text(double d) { return format_number(d); }

void append_literal(std::string &out, template_value const &value) {
  std::visit(match{ [&out](std::string const &s) { out += quote_lua_string(s); },
                    [&out](template_list const &list) {
                      out.push_back('{');
                      for (size_t i{ 0 }; i < list.size(); ++i) {
                        if (i > 0) { out += ", "; }
                        append_literal(out, list[i]);
                      }
                      out.push_back('}');
                    },
                    [&out](template_map const &map) {
                      out.push_back('{');
                      bool first{ true };
                      for (auto const &[key, item] : map) {
                        if (!first) { out += ", "; }
                        first = false;
                        if (is_identifier(key)) {
                          out += key;
                        } else {
                          out += "[" + quote_lua_string(key) + "]";
                        }
                        out += " = ";
                        append_literal(out, item);
                      }
                      out.push_back('}');
                    },
                    [&out](auto const &scalar) { out += scalar_text(scalar); } },
             value.v);
}

struct safe_text {
  std::string text;
};

struct output_piece {
  std::optional<size_t> text_index;  // literal template text, else an expression value
  template_value value;
  bool safe;
};

struct render_session {
  std::vector<output_piece> pieces;
  std::optional<std::string> undefined_name;
};

std::optional<std::int64_t> integer_key(sol::object const &key) {
  if (key.get_type() != sol::type::number) { return std::nullopt; }
  lua_State *L{ key.lua_state() };
  key.push(L);
  std::optional<std::int64_t> result;
  if (lua_isinteger(L, -1)) { result = static_cast<std::int64_t>(lua_tointeger(L, -1)); }
  lua_pop(L, 1);
  return result;
}

std::string describe_key(sol::object const &key) {
  if (key.get_type() == sol::type::string) { return key.as<std::string>(); }
  if (auto const i{ integer_key(key) }) { return "[" + std::to_string(*i) + "]"; }
  return "<" + sol::type_name(key.lua_state(), key.get_type()) + " key>";
}

template_value value_from_lua(sol::object const &obj, int depth);

template_value table_from_lua(sol::table const &tbl, int depth) {
  std::vector<std::pair<sol::object, sol::object>> entries;
  for (auto const &kv : tbl) { entries.emplace_back(kv.first, kv.second); }

  std::vector<std::int64_t> indices;
  indices.reserve(entries.size());
  for (auto const &[key, item] : entries) {
    auto const index{ integer_key(key) };
    if (!index) { break; }
    indices.push_back(*index);
  }

  if (indices.size() == entries.size()) {
    std::sort(indices.begin(), indices.end());
    bool sequence{ true };
    for (size_t i{ 0 }; i < indices.size(); ++i) {
      if (indices[i] != static_cast<std::int64_t>(i + 1)) { sequence = false; }
    }

    if (sequence) {
      template_list list(entries.size());
      for (auto const &[key, item] : entries) {
        list[static_cast<size_t>(*integer_key(key) - 1)] = value_from_lua(item, depth + 1);
      }
      return template_value{ std::move(list) };
    }
  }

  template_map map;
  for (auto const &[key, item] : entries) {
    if (key.get_type() != sol::type::string) {
      throw template_error(
          "cannot render a table mixing non-string keys with a non-sequence layout");
    }
    map.emplace(key.as<std::string>(), value_from_lua(item, depth + 1));
  }
  return template_value{ std::move(map) };
}

template_value value_from_lua(sol::object const &obj, int depth) {
  if (depth > kMaxValueDepth) {
    throw template_error("value nesting exceeds " + std::to_string(kMaxValueDepth) +
                         " levels (cyclic table?)");
  }

  switch (obj.get_type()) {
    case sol::type::none:
    case sol::type::lua_nil: return template_value{};
    case sol::type::boolean: return template_value{ obj.as<bool>() };
    case sol::type::number: {
      if (auto const i{ integer_key(obj) }) { return template_value{ *i }; }
      return template_value{ obj.as<double>() };
    }
    case sol::type::string: return template_value{ obj.as<std::string>() };
    case sol::type::table: return table_from_lua(obj.as<sol::table>(), depth);
    case sol::type::userdata:
      if (obj.is<safe_text>()) { return template_value{ obj.as<safe_text>().text }; }
      break;
    default: break;
  }

  throw template_error("cannot render a " +
                       sol::type_name(obj.lua_state(), obj.get_type()) + " value");
}

// Lists and maps become tables with the strict metatable; entries bound to nil are
// recorded in nil_keys[table] so that reading them yields nil rather than an undefined
// error.
sol::object value_to_lua(sol::state_view lua,
                         template_value const &value,
                         sol::table const &strict_mt,
                         sol::table nil_keys) {
  return std::visit(
      match{ [&](std::monostate) { return sol::make_object(lua, sol::lua_nil); },
             [&](bool b) { return sol::make_object(lua, b); },
             [&](std::int64_t i) { return sol::make_object(lua, i); },
             [&](double d) { return sol::make_object(lua, d); },
             [&](std::string const &s) { return sol::make_object(lua, s); },
             [&](template_list const &list) {
               sol::table t{ lua.create_table(static_cast<int>(list.size()), 0) };
               sol::table nil_indices{ lua.create_table() };
               for (size_t i{ 0 }; i < list.size(); ++i) {
                 if (list[i].is_nil()) {
                   nil_indices.raw_set(i + 1, true);
                 } else {
                   t.raw_set(i + 1, value_to_lua(lua, list[i], strict_mt, nil_keys));
                 }
               }
               nil_keys.raw_set(t, nil_indices);
               t[sol::metatable_key] = strict_mt;
               return sol::make_object(lua, t);
             },
             [&](template_map const &map) {
               sol::table t{ lua.create_table(0, static_cast<int>(map.size())) };
               sol::table nil_names{ lua.create_table() };
               for (auto const &[key, item] : map) {
                 if (item.is_nil()) {
                   nil_names.raw_set(key, true);
                 } else {
                   t.raw_set(key, value_to_lua(lua, item, strict_mt, nil_keys));
                 }
               }
               nil_keys.raw_set(t, nil_names);
               t[sol::metatable_key] = strict_mt;
               return sol::make_object(lua, t);
             } },
      value.v);
}

}  // namespace

compiled_template template_compile(std::string name, std::string_view source) {
  // A single final newline belongs to the file, not to the template output.
  if (source.ends_with("\r\n")) {
    source.remove_suffix(2);
  } else if (source.ends_with('\n')) {
    source.remove_suffix(1);
  }

  compiled_template result{ .name = std::move(name),
                            .text_segments = {},
                            .lua_source = "local __emit, __value = ...\n" };

  std::string pending_text;
  auto const flush_text{ [&] {
    if (pending_text.empty()) { return; }
    result.text_segments.push_back(std::move(pending_text));
    pending_text.clear();
    result.lua_source += "__emit(" + std::to_string(result.text_segments.size()) + ")\n";
  } };

  bool trim_next{ false };
  size_t pos{ 0 };
  while (pos < source.size()) {
    size_t const open{ find_tag_open(source, pos) };
    std::string_view text{ source.substr(pos, open == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : open - pos) };
    if (trim_next) {
      text = trim_leading_space(text);
      trim_next = false;
    }
    pending_text.append(text);
    if (open == std::string_view::npos) { break; }

    char const kind{ source[open + 1] };
    std::string_view const close{ kind == '{' ? "}}" : (kind == '%' ? "%}" : "#}") };

    size_t body_start{ open + 2 };
    if (body_start < source.size() && source[body_start] == '-') {
      trim_trailing_space(pending_text);
      ++body_start;
    }

    size_t const close_pos{ source.find(close, body_start) };
    if (close_pos == std::string_view::npos) {
      throw template_syntax_error("template '" + result.name + "': unterminated '" +
                                  std::string{ source.substr(open, 2) } + "' at line " +
                                  std::to_string(line_of(source, open)));
    }

    size_t body_end{ close_pos };
    if (body_end > body_start && source[body_end - 1] == '-') {
      trim_next = true;
      --body_end;
    }

    std::string_view const body{ source.substr(body_start, body_end - body_start) };
    pos = close_pos + close.size();

    if (kind == '#') { continue; }

    flush_text();
    if (kind == '{') {
      if (is_blank(body)) {
        throw template_syntax_error("template '" + result.name +
                                    "': empty expression at line " +
                                    std::to_string(line_of(source, open)));
      }
      result.lua_source += "__value((" + std::string{ body } + "))\n";
    } else {
      result.lua_source += std::string{ body } + "\n";
    }
  }
  flush_text();

  sol::state lua;
  sol::load_result loaded{ lua.load(result.lua_source, "=" + result.name) };
  if (!loaded.valid()) {
    sol::error err = loaded;
    throw template_syntax_error("template '" + result.name + "': " + err.what());
  }

  return result;
}

template_value template_render(compiled_template const &tmpl,
                               template_context const &context,
                               render_options const &opts) {
  render_session session;  // outlives the Lua state and the closures referencing it

  sol::state lua;
  lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  lua.new_usertype<safe_text>("venvy_safe_text", sol::no_constructor);

  sol::table builtins{ lua.create_table() };
  for (char const *name : kBuiltins) { builtins.raw_set(name, lua.get<sol::object>(name)); }
  sol::object const raw_ipairs = lua.script(kRawIpairsLua, "=venvy_ipairs");
  builtins.raw_set("ipairs", raw_ipairs);
  builtins.raw_set("safe", [](sol::object value) {
    return safe_text{ template_value_to_text(value_from_lua(value, 0)) };
  });

  sol::table nil_keys{ lua.create_table() };

  auto const make_strict_index{ [&session, &lua, nil_keys](std::optional<sol::table>
                                                               fallback) {
    return [&session, &lua, nil_keys, fallback](sol::table self,
                                               sol::object key) -> sol::object {
      if (fallback) {
        sol::object found{ fallback->raw_get<sol::object>(key) };
        if (found.valid() && found.get_type() != sol::type::lua_nil) { return found; }
      }

      sol::object const declared{ nil_keys.raw_get<sol::object>(self) };
      if (declared.get_type() == sol::type::table &&
          declared.as<sol::table>().raw_get<sol::object>(key).get_type() ==
              sol::type::boolean) {
        return sol::make_object(lua, sol::lua_nil);
      }

      session.undefined_name = describe_key(key);
      throw std::runtime_error("'" + *session.undefined_name + "' is undefined");
    };
  } };

  sol::table strict_mt{ lua.create_table() };
  strict_mt[sol::meta_function::index] = make_strict_index(std::nullopt);

  sol::environment env{ lua, sol::create };
  sol::table context_nil_names{ lua.create_table() };
  for (auto const &[name, value] : context) {
    if (value.is_nil()) {
      context_nil_names.raw_set(name, true);
    } else {
      env.raw_set(name, value_to_lua(lua, value, strict_mt, nil_keys));
    }
  }
  nil_keys.raw_set(env, context_nil_names);

  sol::table env_mt{ lua.create_table() };
  env_mt[sol::meta_function::index] = make_strict_index(builtins);
  env[sol::metatable_key] = env_mt;

  sol::load_result loaded{ lua.load(tmpl.lua_source, "=" + tmpl.name) };
  if (!loaded.valid()) {
    sol::error err = loaded;
    throw template_syntax_error("template '" + tmpl.name + "': " + err.what());
  }
  sol::protected_function chunk{ loaded.get<sol::protected_function>() };
  sol::set_environment(env, chunk);

  auto const emit_text{ [&session, &tmpl](size_t index) {
    if (index == 0 || index > tmpl.text_segments.size()) {
      throw std::out_of_range("text segment index out of range");
    }
    session.pieces.push_back(
        output_piece{ .text_index = index - 1, .value = {}, .safe = false });
  } };

  auto const emit_value{ [&session](sol::object value) {
    if (value.is<safe_text>()) {
      session.pieces.push_back(
          output_piece{ .text_index = std::nullopt,
                        .value = template_value{ value.as<safe_text>().text },
                        .safe = true });
      return;
    }
    session.pieces.push_back(output_piece{ .text_index = std::nullopt,
                                           .value = value_from_lua(value, 0),
                                           .safe = false });
  } };

  sol::protected_function_result run{ chunk(emit_text, emit_value) };
  if (!run.valid()) {
    if (session.undefined_name) {
      throw template_undefined_error(*session.undefined_name, tmpl.name);
    }
    sol::error err = run;
    throw template_error("template '" + tmpl.name + "': " + err.what());
  }

  auto const piece_text{ [&tmpl](output_piece const &piece, bool escape) {
    if (piece.text_index) { return tmpl.text_segments[*piece.text_index]; }
    auto text{ template_value_to_text(piece.value) };
    return (escape && !piece.safe) ? template_escape_html(text) : text;
  } };

  if (opts.mode == render_mode::native) {
    if (session.pieces.empty()) { return template_value{}; }

    auto &front{ session.pieces.front() };
    if (session.pieces.size() == 1 && !front.text_index) {
      if (auto *s{ std::get_if<std::string>(&front.value.v) }) {
        return template_parse_literal(std::move(*s));
      }
      return std::move(front.value);
    }

    std::string joined;
    for (auto const &piece : session.pieces) { joined += piece_text(piece, false); }
    return template_parse_literal(std::move(joined));
  }

  std::string out;
  for (auto const &piece : session.pieces) { out += piece_text(piece, opts.autoescape); }
  return template_value{ std::move(out) };
}

template_value template_value_from_lua(sol::object const &obj) {
  return value_from_lua(obj, 0);
}

std::string template_value_to_text(template_value const &value) {
  if (auto const *s{ std::get_if<std::string>(&value.v) }) { return *s; }
  std::string out;
  append_literal(out, value);
  return out;
}

std::string template_escape_html(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char const c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&#34;"; break;
      case '\'': out += "&#39;"; break;
      default: out.push_back(c);
    }
  }
  return out;
}

template_value template_parse_literal(std::string text) {
  if (text == "true") { return template_value{ true }; }
  if (text == "false") { return template_value{ false }; }
  if (text == "nil") { return template_value{}; }

  if (!text.empty()) {
    char const *const begin{ text.data() };
    char const *const end{ text.data() + text.size() };

    std::int64_t i{};
    if (auto const [ptr, ec]{ std::from_chars(begin, end, i) };
        ec == std::errc{} && ptr == end) {
      return template_value{ i };
    }

    if (text.find_first_of(".eE") != std::string::npos) {
      double d{};
      if (auto const [ptr, ec]{ std::from_chars(begin, end, d) };
          ec == std::errc{} && ptr == end) {
        return template_value{ d };
      }
    }
  }

  return template_value{ std::move(text) };
}

}  // namespace venvy
