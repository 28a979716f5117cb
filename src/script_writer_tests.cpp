#include "script_writer.h"

#include "platform.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace {

using venvy::template_map;
using venvy::template_value;

template_value str(char const *s) { return template_value{ std::string{ s } }; }

struct template_dir {
  std::filesystem::path root;

  template_dir() {
    static std::atomic<int> counter{ 0 };
    root = std::filesystem::temp_directory_path() /
           ("venvy-script-writer-test-" + std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "templates");
    std::filesystem::create_directories(root / "out");
  }

  ~template_dir() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  std::filesystem::path templates() const { return root / "templates"; }
  std::filesystem::path out(char const *name) const { return root / "out" / name; }

  void add(char const *name, std::string const &body) const {
    auto const path{ templates() / name };
    std::filesystem::create_directories(path.parent_path());
    std::ofstream{ path, std::ios::binary } << body;
  }
};

std::string read_file(std::filesystem::path const &path) {
  std::ifstream in{ path, std::ios::binary };
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

struct template_root_env_guard {
  std::optional<std::string> saved{ venvy::platform::env_var_get("VENVY_TEMPLATE_ROOT") };
  ~template_root_env_guard() {
    if (saved) {
      venvy::platform::env_var_set("VENVY_TEMPLATE_ROOT", saved->c_str());
    } else {
      venvy::platform::env_var_unset("VENVY_TEMPLATE_ROOT");
    }
  }
};

}  // namespace

TEST_CASE_FIXTURE(template_dir, "write_script renders and writes the output file") {
  add("hello.py.tmpl", "print({{ message }})\nprint('done')\n");

  auto const result{ venvy::write_script({ .template_name = "hello.py.tmpl",
                                           .context = { { "message", str("'hi'") } },
                                           .output_path = out("hello.py"),
                                           .native_mode = false,
                                           .template_root = templates() }) };

  CHECK(result == str("print('hi')\nprint('done')"));
  CHECK(read_file(out("hello.py")) == "print('hi')\nprint('done')");
}

TEST_CASE_FIXTURE(template_dir, "write_script overwrites an existing output") {
  add("t.tmpl", "new {{ v }}");
  std::ofstream{ out("t.txt") } << "old content";

  venvy::write_script({ .template_name = "t.tmpl",
                        .context = { { "v", template_value{ std::int64_t{ 2 } } } },
                        .output_path = out("t.txt"),
                        .native_mode = false,
                        .template_root = templates() });

  CHECK(read_file(out("t.txt")) == "new 2");
}

TEST_CASE_FIXTURE(template_dir, "write_script undefined variable writes nothing") {
  add("t.tmpl", "{{ present }} {{ absent }}");

  venvy::render_request const req{ .template_name = "t.tmpl",
                                   .context = { { "present", str("x") } },
                                   .output_path = out("t.txt"),
                                   .native_mode = false,
                                   .template_root = templates() };

  SUBCASE("no existing file") {
    CHECK_THROWS_AS(venvy::write_script(req), venvy::template_undefined_error);
    CHECK_FALSE(std::filesystem::exists(out("t.txt")));
  }

  SUBCASE("existing file left untouched") {
    std::ofstream{ out("t.txt") } << "previous";
    CHECK_THROWS_AS(venvy::write_script(req), venvy::template_undefined_error);
    CHECK(read_file(out("t.txt")) == "previous");
  }

  CHECK(std::filesystem::is_empty(root / "out") == !std::filesystem::exists(out("t.txt")));
}

TEST_CASE_FIXTURE(template_dir, "write_script native mode writes the value's text") {
  add("n.tmpl", "{{ count * 2 }}");
  add("list.tmpl", "{{ items }}");

  auto const n{ venvy::write_script({ .template_name = "n.tmpl",
                                      .context = { { "count",
                                                     template_value{ std::int64_t{ 21 } } } },
                                      .output_path = out("n.txt"),
                                      .native_mode = true,
                                      .template_root = templates() }) };
  CHECK(n == template_value{ std::int64_t{ 42 } });
  CHECK(read_file(out("n.txt")) == "42");

  auto const list{ venvy::write_script(
      { .template_name = "list.tmpl",
        .context = { { "items",
                       template_value{ venvy::template_list{ str("a"), str("b") } } } },
        .output_path = out("list.txt"),
        .native_mode = true,
        .template_root = templates() }) };
  CHECK(std::holds_alternative<venvy::template_list>(list.v));
  CHECK(read_file(out("list.txt")) == "{\"a\", \"b\"}");
}

TEST_CASE_FIXTURE(template_dir, "write_script native mode ignores the file's final newline") {
  add("answer.tmpl", "{{ n }}\n");
  add("answer_crlf.tmpl", "{{ n }}\r\n");
  add("two_lines.tmpl", "{{ n }}\n\n");
  venvy::template_map const ctx{ { "n", template_value{ std::int64_t{ 42 } } } };

  auto render{ [&](char const *name, bool native) {
    return venvy::write_script({ .template_name = name,
                                 .context = ctx,
                                 .output_path = out("answer.txt"),
                                 .native_mode = native,
                                 .template_root = templates() });
  } };

  CHECK(render("answer.tmpl", true) == template_value{ std::int64_t{ 42 } });
  CHECK(read_file(out("answer.txt")) == "42");
  CHECK(render("answer_crlf.tmpl", true) == template_value{ std::int64_t{ 42 } });
  CHECK(render("answer.tmpl", false) == str("42"));
  CHECK(render("two_lines.tmpl", false) == str("42\n"));
}

TEST_CASE_FIXTURE(template_dir, "write_script autoescapes html and xml templates") {
  add("page.html", "<b>{{ v }}</b>");
  add("feed.XML", "<v>{{ v }}</v>");
  add("script.py.tmpl", "{{ v }}");
  template_map const ctx{ { "v", str("a<b") } };

  auto render{ [&](char const *name) {
    return std::get<std::string>(venvy::write_script({ .template_name = name,
                                                       .context = ctx,
                                                       .output_path = out("o"),
                                                       .native_mode = false,
                                                       .template_root = templates() })
                                     .v);
  } };

  CHECK(render("page.html") == "<b>a&lt;b</b>");
  CHECK(render("feed.XML") == "<v>a&lt;b</v>");
  CHECK(render("script.py.tmpl") == "a<b");
}

TEST_CASE_FIXTURE(template_dir, "write_script resolves templates under the root only") {
  add("sub/inner.tmpl", "inner");
  std::ofstream{ root / "outside.tmpl" } << "outside";

  auto request{ [&](std::string name) {
    return venvy::render_request{ .template_name = std::move(name),
                                  .context = {},
                                  .output_path = out("o"),
                                  .native_mode = false,
                                  .template_root = templates() };
  } };

  CHECK(venvy::write_script(request("sub/inner.tmpl")) == str("inner"));
  CHECK_THROWS_AS(venvy::write_script(request("../outside.tmpl")),
                  venvy::template_not_found_error);
  CHECK_THROWS_AS(venvy::write_script(request("sub/../../outside.tmpl")),
                  venvy::template_not_found_error);
  CHECK_THROWS_AS(venvy::write_script(request((root / "outside.tmpl").string())),
                  venvy::template_not_found_error);
  CHECK_THROWS_AS(venvy::write_script(request("missing.tmpl")),
                  venvy::template_not_found_error);
  CHECK_THROWS_AS(venvy::write_script(request("sub")), venvy::template_not_found_error);
  CHECK_THROWS_AS(venvy::write_script(request("")), venvy::template_not_found_error);
}

TEST_CASE_FIXTURE(template_dir, "write_script uses VENVY_TEMPLATE_ROOT when no root given") {
  template_root_env_guard guard;
  venvy::platform::env_var_set("VENVY_TEMPLATE_ROOT", templates().c_str());
  add("env.tmpl", "from env");

  CHECK(venvy::script_template_root() == templates());
  venvy::write_script({ .template_name = "env.tmpl",
                        .context = {},
                        .output_path = out("env.txt"),
                        .native_mode = false,
                        .template_root = std::nullopt });
  CHECK(read_file(out("env.txt")) == "from env");
}

TEST_CASE_FIXTURE(template_dir, "default python script template renders") {
  template_root_env_guard guard;
  venvy::platform::env_var_unset("VENVY_TEMPLATE_ROOT");

  template_map const ctx{
    { "callable_name", str("add") },
    { "callable_source", str("def add(a, b):\n    return a + b") },
    { "serializer", str("json") },
    { "use_string_args", template_value{ true } },
  };

  auto const result{ venvy::write_script({ .template_name = venvy::kDefaultScriptTemplate,
                                           .context = ctx,
                                           .output_path = out("script.py"),
                                           .native_mode = false,
                                           .template_root = std::nullopt }) };

  auto const text{ read_file(out("script.py")) };
  CHECK(result == template_value{ text });
  CHECK(text.rfind("from __future__ import annotations\n", 0) == 0);
  CHECK(text.find("import json\n") != std::string::npos);
  CHECK(text.find("def add(a, b):\n    return a + b\n") != std::string::npos);
  CHECK(text.find("open(sys.argv[1], \"r\")") != std::string::npos);
  CHECK(text.find("open(sys.argv[2], \"w\")") != std::string::npos);
  CHECK(text.find("string_args = []") != std::string::npos);
  CHECK(text.find("result = add(*arg_dict[\"args\"], **arg_dict[\"kwargs\"])") !=
        std::string::npos);
  CHECK(text.find("{{") == std::string::npos);
  CHECK(text.find("{%") == std::string::npos);

  SUBCASE("pickle uses binary mode and omits string args") {
    template_map pickle_ctx{ ctx };
    pickle_ctx["serializer"] = str("pickle");
    pickle_ctx["use_string_args"] = template_value{ false };
    venvy::write_script({ .template_name = venvy::kDefaultScriptTemplate,
                          .context = pickle_ctx,
                          .output_path = out("pickled.py"),
                          .native_mode = false,
                          .template_root = std::nullopt });
    auto const pickled{ read_file(out("pickled.py")) };
    CHECK(pickled.find("open(sys.argv[1], \"rb\")") != std::string::npos);
    CHECK(pickled.find("pickle.dump(result, f)") != std::string::npos);
    CHECK(pickled.find("string_args") == std::string::npos);
  }

  SUBCASE("missing context variable") {
    template_map partial{ ctx };
    partial.erase("callable_name");
    CHECK_THROWS_AS(venvy::write_script({ .template_name = venvy::kDefaultScriptTemplate,
                                          .context = partial,
                                          .output_path = out("partial.py"),
                                          .native_mode = false,
                                          .template_root = std::nullopt }),
                    venvy::template_undefined_error);
    CHECK_FALSE(std::filesystem::exists(out("partial.py")));
  }
}

TEST_CASE("script_autoescape_for") {
  CHECK(venvy::script_autoescape_for("a.html"));
  CHECK(venvy::script_autoescape_for("a.HTML"));
  CHECK(venvy::script_autoescape_for("dir/feed.xml"));
  CHECK_FALSE(venvy::script_autoescape_for("a.py.tmpl"));
  CHECK_FALSE(venvy::script_autoescape_for("html"));
  CHECK_FALSE(venvy::script_autoescape_for("a.xhtml.j2"));
}
