// Copyright (c) 2026 The stache authors. All rights reserved.

#include <filesystem>
#include <string>
#include <vector>

#include "stache/environment.hpp"

#include "test-common.hpp"

using json = stache::json;

TEST_CASE("loading") {
  stache::Environment env {test_file_directory};
  const json data {{"title", "T"}, {"body", "B"}};

  SUBCASE("files") {
    CHECK(env.render_file("header.mustache", data) == "<h1>T</h1>");
    CHECK(env.render_file("page.mustache", data) == "<h1>T</h1><p>B</p>");
  }

  SUBCASE("missing files") {
    CHECK_THROWS_AS(env.parse_file("does-not-exist.mustache"), stache::FileError);
    const std::string message = "[stache.exception.file_error] failed accessing file at '" + test_file_directory + "does-not-exist.mustache'";
    CHECK_THROWS_WITH(env.parse_file("does-not-exist.mustache"), message.c_str());
  }

  SUBCASE("partials are embedded at parse time") {
    const auto tmpl = env.parse_file("page.mustache");
    REQUIRE(tmpl.root.nodes.size() >= 1);

    const auto partial = dynamic_cast<const stache::PartialNode*>(tmpl.root.nodes[0].get());
    REQUIRE(partial != nullptr);
    CHECK(partial->name == "header");
    CHECK(partial->path.filename() == "header.mustache");
    REQUIRE(partial->partial != nullptr);
    CHECK(partial->partial->content == "<h1>{{title}}</h1>");
  }
}

TEST_CASE("partials") {
  stache::Environment env {test_file_directory};

  SUBCASE("file name lookup") {
    CHECK(env.render_file("uses_footer.mustache") == "plain footer");
    CHECK(env.render_file("list_page.mustache", json {{"items", {"a", "b"}}}) == "<ul><li>a</li><li>b</li></ul>");
    CHECK(env.render("{{>header}}", json {{"title", "x"}}) == "<h1>x</h1>");
  }

  SUBCASE("nested directories") {
    CHECK(env.render_file("includes_nested.mustache", json {{"name", "N"}}) == "[inner N]");
  }

  SUBCASE("partials share the context chain") {
    const json data {{"people", json::array({{{"name", "a"}}, {{"name", "b"}}})}};
    CHECK(env.render_file("people.mustache", data) == "a;b;");
  }

  SUBCASE("partials start with the default delimiters") {
    CHECK(env.render_file("delimiters.mustache", json {{"title", "T"}}) == "<h1>T</h1> T");
  }

  SUBCASE("custom extensions") {
    CHECK_THROWS_WITH(env.parse("{{>card}}"), "line 1: could not find partial card");

    env.set_partial_extensions({".tpl"});
    CHECK(env.render("{{>card}}", json {{"id", 7}}) == "card 7");
  }

  SUBCASE("working directory fallback") {
    const auto previous_path = std::filesystem::current_path();
    std::filesystem::current_path(test_file_directory);

    // Neither header nor items exist in nested/, only in the working directory
    stache::Environment nested_env {test_file_directory + "nested"};
    CHECK(nested_env.render("{{>header}}|{{>items}}", json {{"title", "x"}, {"items", {1}}}) == "<h1>x</h1>|<li>1</li>");
    CHECK(nested_env.render("{{>footer}}") == "plain footer");

    const auto tmpl = nested_env.parse("{{>header}}");
    std::filesystem::current_path(previous_path);

    const auto partial = dynamic_cast<const stache::PartialNode*>(tmpl.root.nodes[0].get());
    REQUIRE(partial != nullptr);
    CHECK(partial->path == std::filesystem::path("header.mustache"));
  }

  SUBCASE("working directory search disabled") {
    stache::Environment nested_env {test_file_directory + "nested"};
    nested_env.set_search_working_directory(false);
    CHECK(nested_env.render("{{>inner}}", json {{"name", "x"}}) == "inner x");
    CHECK_THROWS_WITH(nested_env.parse("{{>header}}"), "line 1: could not find partial header");
  }

  SUBCASE("recursion") {
    CHECK_THROWS_WITH(env.parse_file("recursive.mustache"), "line 1: recursive partial recursive");
    CHECK_THROWS_WITH(env.parse_file("ping.mustache"), "line 1: recursive partial ping");
    CHECK_THROWS_AS(env.parse("{{>recursive}}"), stache::ParseError);
  }

  SUBCASE("errors inside partials") {
    CHECK_THROWS_WITH(env.parse_file("includes_broken.mustache"), "line 1: section open has no closing tag");
  }

  SUBCASE("instrumentation") {
    std::vector<std::string> partials;
    env.set_instrumentation_callback([&partials](const stache::InstrumentationData& data) {
      if (data.event == stache::InstrumentationEvent::PartialStart) {
        partials.push_back(data.name);
      }
    });

    CHECK(env.render_file("includes_nested.mustache", json {{"name", "N"}}) == "[inner N]");
    REQUIRE(partials.size() == 2);
    CHECK(partials[0] == "nested/outer");
    CHECK(partials[1] == "inner");
  }
}

TEST_CASE("layouts") {
  stache::Environment env {test_file_directory};
  const json data {{"title", "T"}, {"body", "B"}};

  SUBCASE("environment") {
    const auto tmpl = env.parse_file("page.mustache");
    const auto layout = env.parse_file("layout.mustache");
    CHECK(env.render_in_layout(tmpl, layout, data) == "<html><h1>T</h1><p>B</p><title>T</title></html>");
  }

  SUBCASE("content shadows the data") {
    const auto tmpl = env.parse("{{content}}!");
    const auto layout = env.parse("[{{content}}]");
    CHECK(env.render_in_layout(tmpl, layout, json {{"content", "c"}}) == "[c!]");
  }

  SUBCASE("all contexts reach the layout") {
    const auto tmpl = env.parse("{{a}}");
    const auto layout = env.parse("{{{content}}}{{b}}");
    CHECK(env.render_in_layout(tmpl, layout, json {{"a", "1"}}, json {{"b", "2"}}) == "12");
  }
}

TEST_CASE("convenience functions") {
  const json data {{"title", "T"}, {"body", "B"}, {"a", "<x>"}};

  SUBCASE("render") {
    CHECK(stache::render("Hello {{a}}", data) == "Hello &lt;x&gt;");
    CHECK(stache::render("{{#a}}") == "line 1: section a has no closing tag");
    CHECK(stache::render("x\n{{/a}}") == "line 2: unmatched close tag: a");
  }

  SUBCASE("render in layout") {
    CHECK(stache::render_in_layout("{{{a}}}", "<{{{content}}}>", data) == "<<x>>");
    CHECK(stache::render_in_layout("{{a}}", "<{{content}}>", data) == "<&amp;lt;x&amp;gt;>");
    CHECK(stache::render_in_layout("{{a}}", "{{#content}}", data) == "line 1: section content has no closing tag");
  }

  SUBCASE("files") {
    CHECK(stache::render_file(test_file_directory + "page.mustache", data) == "<h1>T</h1><p>B</p>");
    CHECK(stache::render_file_in_layout(test_file_directory + "page.mustache", test_file_directory + "layout.mustache", data) ==
          "<html><h1>T</h1><p>B</p><title>T</title></html>");
    CHECK(stache::render_file(test_file_directory + "broken.mustache") == "line 1: section open has no closing tag");
    CHECK(stache::render_file(test_file_directory + "recursive.mustache") == "line 1: recursive partial recursive");

    const std::string missing = stache::render_file(test_file_directory + "does-not-exist.mustache");
    CHECK(missing.rfind("[stache.exception.file_error]", 0) == 0);
  }
}
