#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace venvy {

struct template_value;
using template_list = std::vector<template_value>;
using template_map = std::map<std::string, template_value>;

// Variables visible to a template, keyed by global name.
using template_context = template_map;

struct template_value {
  using variant_t = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 template_list,
                                 template_map>;
  variant_t v;

  template_value();
  explicit template_value(variant_t var);

  bool is_nil() const;
  bool is_string() const;
};

bool operator==(template_value const &lhs, template_value const &rhs);

class template_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class template_not_found_error : public template_error {
 public:
  using template_error::template_error;
};

class template_syntax_error : public template_error {
 public:
  using template_error::template_error;
};

// A referenced variable (or map key) has no binding in the context.
class template_undefined_error : public template_error {
 public:
  template_undefined_error(std::string name, std::string const &template_name);
  std::string const &name() const { return name_; }

 private:
  std::string name_;
};

enum class render_mode { plain, native };

struct render_options {
  render_mode mode{ render_mode::plain };
  bool autoescape{ false };  // plain mode only
};

// Template source split into literal text and a Lua chunk that emits it.
//   {{ expr }}  Lua expression, interpolated
//   {% stmt %}  Lua statement(s), e.g. "for _, a in ipairs(args) do" ... "end"
//   {# text #}  comment
// A '-' just inside a delimiter ({{- ... -}}) trims whitespace on that side.
struct compiled_template {
  std::string name;
  std::vector<std::string> text_segments;
  std::string lua_source;
};

// Throws template_syntax_error on unterminated tags, empty expressions or Lua syntax
// errors.
compiled_template template_compile(std::string name, std::string_view source);

// Evaluates the whole template in memory. Plain mode returns a string value; native mode
// returns the single expression's value, or the concatenated output parsed as a literal.
template_value template_render(compiled_template const &tmpl,
                               template_context const &context,
                               render_options const &opts);

// Text form used for plain-mode interpolation and for writing native results.
std::string template_value_to_text(template_value const &value);

std::string template_escape_html(std::string_view text);

// "true"/"false"/"nil", decimal integers and floats become typed values; anything else
// is returned as the original string.
template_value template_parse_literal(std::string text);

}  // namespace venvy
