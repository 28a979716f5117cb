#include "template_engine.h"

#include "doctest/doctest.h"

#include <cstdint>
#include <string>

namespace {

using venvy::template_context;
using venvy::template_list;
using venvy::template_map;
using venvy::template_value;

template_value str(char const *s) { return template_value{ std::string{ s } }; }
template_value num(std::int64_t i) { return template_value{ i }; }

std::string render_plain(std::string_view source,
                         template_context const &ctx,
                         bool autoescape = false) {
  auto const tmpl{ venvy::template_compile("test.tmpl", source) };
  auto const result{ venvy::template_render(
      tmpl,
      ctx,
      { .mode = venvy::render_mode::plain, .autoescape = autoescape }) };
  REQUIRE(result.is_string());
  return std::get<std::string>(result.v);
}

template_value render_native(std::string_view source, template_context const &ctx) {
  auto const tmpl{ venvy::template_compile("test.tmpl", source) };
  return venvy::template_render(tmpl,
                                ctx,
                                { .mode = venvy::render_mode::native, .autoescape = false });
}

}  // namespace

TEST_CASE("template_render interpolates variables") {
  CHECK(render_plain("Hello {{ name }}!", { { "name", str("world") } }) == "Hello world!");
  CHECK(render_plain("no tags at all", {}) == "no tags at all");
  CHECK(render_plain("", {}) == "");
}

TEST_CASE("template_render text form of scalars") {
  template_context const ctx{ { "i", num(3) },
                              { "f", template_value{ 2.5 } },
                              { "whole", template_value{ 1.0 } },
                              { "yes", template_value{ true } } };
  CHECK(render_plain("{{ i }} {{ f }} {{ whole }} {{ yes }}", ctx) == "3 2.5 1.0 true");
  CHECK(render_plain("{{ i + 4 }}", ctx) == "7");
}

TEST_CASE("template_render text form of tables") {
  template_context const ctx{
    { "items", template_value{ template_list{ num(1), str("x") } } },
    { "cfg", template_value{ template_map{ { "b", num(2) }, { "a", num(1) } } } },
  };
  CHECK(render_plain("{{ items }}", ctx) == "{1, \"x\"}");
  CHECK(render_plain("{{ cfg }}", ctx) == "{a = 1, b = 2}");
}

TEST_CASE("template_render statements and loops") {
  template_context const ctx{
    { "args", template_value{ template_list{ str("x"), str("y") } } },
    { "flag", template_value{ false } },
  };
  CHECK(render_plain("{% for _, a in ipairs(args) do %}[{{ a }}]{% end %}", ctx) ==
        "[x][y]");
  CHECK(render_plain("{% if flag then %}on{% else %}off{% end %}", ctx) == "off");
  CHECK(render_plain("{{ #args }} {{ string.upper(args[1]) }}", ctx) == "2 X");
}

TEST_CASE("template_render map member access") {
  template_context const ctx{
    { "cfg", template_value{ template_map{ { "name", str("demo") } } } },
  };
  CHECK(render_plain("{{ cfg.name }}", ctx) == "demo");
}

TEST_CASE("template_render comments and whitespace trimming") {
  CHECK(render_plain("a{# ignored #}b", {}) == "ab");
  CHECK(render_plain("a  {{- x -}}  b", { { "x", str("X") } }) == "aXb");
  CHECK(render_plain("line1\n{%- if true then -%}\n  line2\n{%- end %}", {}) ==
        "line1line2");
  CHECK(render_plain("{#- header -#}\nbody", {}) == "body");
}

TEST_CASE("template_render is strict about undefined names") {
  SUBCASE("top-level variable") {
    try {
      render_plain("value: {{ missing }}", {});
      FAIL("expected template_undefined_error");
    } catch (venvy::template_undefined_error const &e) {
      CHECK(e.name() == "missing");
      CHECK(std::string{ e.what() }.find("test.tmpl") != std::string::npos);
    }
  }

  SUBCASE("inside a condition") {
    CHECK_THROWS_AS(render_plain("{% if missing then %}x{% end %}", {}),
                    venvy::template_undefined_error);
  }

  SUBCASE("map member") {
    template_context const ctx{
      { "cfg", template_value{ template_map{ { "name", str("demo") } } } },
    };
    try {
      render_plain("{{ cfg.other }}", ctx);
      FAIL("expected template_undefined_error");
    } catch (venvy::template_undefined_error const &e) { CHECK(e.name() == "other"); }
  }

  SUBCASE("library not exposed to templates") {
    CHECK_THROWS_AS(render_plain("{{ os }}", {}), venvy::template_undefined_error);
  }
}

TEST_CASE("template_render is strict about list indices") {
  template_context const ctx{
    { "args", template_value{ template_list{ str("x"), template_value{}, str("z") } } },
  };

  try {
    render_plain("{{ args[9] }}", ctx);
    FAIL("expected template_undefined_error");
  } catch (venvy::template_undefined_error const &e) { CHECK(e.name() == "[9]"); }

  CHECK(render_plain("{{ args[1] }}{{ args[3] }}", ctx) == "xz");
  CHECK(render_plain("{{ args[2] == nil }}", ctx) == "true");
  CHECK(render_plain("{% for i, a in ipairs(args) do %}{{ i }}{{ a }}{% end %}", ctx) ==
        "1x");
}

TEST_CASE("template_compile drops one final newline") {
  CHECK(render_plain("a\n", {}) == "a");
  CHECK(render_plain("a\r\n", {}) == "a");
  CHECK(render_plain("a\n\n", {}) == "a\n");
  CHECK(render_native("{{ n }}\n", { { "n", num(5) } }) == num(5));
}

TEST_CASE("template_render names bound to nil are defined") {
  template_context const ctx{ { "nothing", template_value{} } };
  CHECK(render_plain("{{ nothing == nil }}", ctx) == "true");
  CHECK(render_plain("{% if nothing then %}set{% else %}unset{% end %}", ctx) == "unset");
}

TEST_CASE("template_render reports Lua runtime errors") {
  CHECK_THROWS_AS(render_plain("{{ error('boom') }}", {}), venvy::template_error);
  try {
    render_plain("{{ error('boom') }}", {});
  } catch (venvy::template_undefined_error const &) {
    FAIL("runtime error must not be reported as undefined");
  } catch (venvy::template_error const &e) {
    CHECK(std::string{ e.what() }.find("boom") != std::string::npos);
  }
}

TEST_CASE("template_render autoescape") {
  template_context const ctx{ { "s", str("<a href='x'>&\"</a>") } };

  CHECK(render_plain("<p>{{ s }}</p>", ctx, true) ==
        "<p>&lt;a href=&#39;x&#39;&gt;&amp;&#34;&lt;/a&gt;</p>");
  CHECK(render_plain("{{ safe(s) }}", ctx, true) == "<a href='x'>&\"</a>");
  CHECK(render_plain("{{ s }}", ctx, false) == "<a href='x'>&\"</a>");
}

TEST_CASE("template_render is deterministic") {
  template_context const ctx{
    { "m", template_value{ template_map{ { "z", num(1) }, { "a", num(2) }, { "k", num(3) } } } },
  };
  auto const first{ render_plain("{% for k, v in pairs(m) do %}{{ k }}{% end %}|{{ m }}",
                                 ctx) };
  CHECK(first.substr(first.find('|')) == "|{a = 2, k = 3, z = 1}");
  auto const second{ render_plain("{{ m }}", ctx) };
  CHECK(second == render_plain("{{ m }}", ctx));
}

TEST_CASE("template_render native mode keeps types") {
  template_context const ctx{
    { "n", num(5) },
    { "items", template_value{ template_list{ str("a"), str("b") } } },
    { "a", num(1) },
    { "b", num(2) },
  };

  CHECK(render_native("{{ n }}", ctx) == num(5));
  CHECK(render_native("{{ items }}", ctx) ==
        template_value{ template_list{ str("a"), str("b") } });
  CHECK(render_native("{{ n * 1.5 }}", ctx) == template_value{ 7.5 });
  CHECK(render_native("{{ '42' }}", ctx) == num(42));
  CHECK(render_native("{{ a }}-{{ b }}", ctx) == str("1-2"));
  CHECK(render_native("{{ a }}{{ b }}", ctx) == num(12));
  CHECK(render_native("true", ctx) == template_value{ true });
  CHECK(render_native("{{ {} }}", ctx) == template_value{ template_list{} });
  CHECK(render_native("", ctx).is_nil());
}

TEST_CASE("template_compile reports syntax errors") {
  CHECK_THROWS_AS(venvy::template_compile("t", "{{ x "), venvy::template_syntax_error);
  CHECK_THROWS_AS(venvy::template_compile("t", "{% if x then %}"),
                  venvy::template_syntax_error);
  CHECK_THROWS_AS(venvy::template_compile("t", "{{   }}"), venvy::template_syntax_error);
  CHECK_THROWS_AS(venvy::template_compile("t", "{# open comment"),
                  venvy::template_syntax_error);
  CHECK_NOTHROW(venvy::template_compile("t", "a { b } {c}"));
}

TEST_CASE("template_escape_html") {
  CHECK(venvy::template_escape_html("plain") == "plain");
  CHECK(venvy::template_escape_html("<'\"&>") == "&lt;&#39;&#34;&amp;&gt;");
}

TEST_CASE("template_parse_literal") {
  CHECK(venvy::template_parse_literal("true") == template_value{ true });
  CHECK(venvy::template_parse_literal("false") == template_value{ false });
  CHECK(venvy::template_parse_literal("nil").is_nil());
  CHECK(venvy::template_parse_literal("12") == num(12));
  CHECK(venvy::template_parse_literal("-3") == num(-3));
  CHECK(venvy::template_parse_literal("1.5") == template_value{ 1.5 });
  CHECK(venvy::template_parse_literal("1e3") == template_value{ 1000.0 });
  CHECK(venvy::template_parse_literal("abc") == str("abc"));
  CHECK(venvy::template_parse_literal("12abc") == str("12abc"));
  CHECK(venvy::template_parse_literal("") == str(""));
}

TEST_CASE("template_value_to_text") {
  CHECK(venvy::template_value_to_text(str("as is")) == "as is");
  CHECK(venvy::template_value_to_text(template_value{}) == "nil");
  CHECK(venvy::template_value_to_text(num(-7)) == "-7");
  CHECK(venvy::template_value_to_text(template_value{ template_map{
            { "key with space", str("v") } } }) == "{[\"key with space\"] = \"v\"}");
}
