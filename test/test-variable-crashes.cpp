// Copyright (c) 2026 The stache authors. All rights reserved.

#include <memory>
#include <stdexcept>

#include "stache/environment.hpp"

#include "test-common.hpp"

TEST_CASE("variable crash tests - missing nested properties") {
  stache::Environment env;

  stache::json data;
  data["good"] = stache::json::object();
  data["good"]["exists"] = "value";
  data["user"] = stache::json::object();
  data["user"]["name"] = "Alice";
  data["user"]["profile"] = stache::json::object();
  data["user"]["profile"]["age"] = 30;

  SUBCASE("single level missing property") {
    CHECK_NOTHROW(env.render("{{ good.bad }}", data));
    CHECK(env.render("{{ good.bad }}", data) == "");
    CHECK(env.render("{{ user.email }}", data) == "");
  }

  SUBCASE("double nested missing property") {
    CHECK(env.render("{{ good.bad.bad }}", data) == "");
    CHECK(env.render("{{ user.profile.missing }}", data) == "");
    CHECK(env.render("{{ user.profile.age }}", data) == "30");
  }

  SUBCASE("very deep nested missing properties") {
    CHECK(env.render("{{ a.b.c.d.e.f.g }}", data) == "");
    CHECK(env.render("{{ good.x.y.z.w.q }}", data) == "");
  }

  SUBCASE("mixed existing and missing properties in chain") {
    CHECK(env.render("{{ user.name.length }}", data) == "");
    CHECK(env.render("{{ user.profile.age.toString }}", data) == "");
    CHECK(env.render("{{ good.exists.nested.deep }}", data) == "");
  }

  SUBCASE("array-like access") {
    CHECK(env.render("{{ good.bad.0 }}", data) == "");
    CHECK(env.render("{{ missing.items.0.name }}", data) == "");
  }

  SUBCASE("missing nested properties in sections") {
    CHECK(env.render("{{#good.bad.bad}}yes{{/good.bad.bad}}{{^good.bad.bad}}no{{/good.bad.bad}}", data) == "no");
    CHECK(env.render("{{#good.bad.items}}{{.}}{{/good.bad.items}}Done", data) == "Done");
  }

  SUBCASE("missing names are not lookup failures") {
    CHECK(env.render("{{ good.bad }}{{#x.y}}{{/x.y}}", data) == "");
    CHECK(env.get_last_render_errors().empty());
  }
}

TEST_CASE("variable crash tests - edge cases with null and empty values") {
  stache::Environment env;

  stache::json data;
  data["empty_obj"] = stache::json::object();
  data["null_val"] = nullptr;
  data["empty_array"] = stache::json::array();
  data["number"] = 42;
  data["string"] = "hello";
  data["boolean"] = true;

  SUBCASE("properties of empty and null values") {
    CHECK(env.render("{{ empty_obj.property }}", data) == "");
    CHECK(env.render("{{ null_val.a.b.c }}", data) == "");
    CHECK(env.render("{{ empty_array.length }}", data) == "");
  }

  SUBCASE("properties of primitives") {
    CHECK(env.render("{{ number.property }}", data) == "");
    CHECK(env.render("{{ string.nested.deep }}", data) == "");
    CHECK(env.render("{{ boolean.x.y.z }}", data) == "");
    CHECK(env.render("{{ number.0 }}", data) == "");
  }

  SUBCASE("null and empty records") {
    const stache::ValueMap values {{"nobody", std::shared_ptr<const stache::Record> {}}, {"list", stache::ValueList {}}};
    CHECK(env.render("{{ nobody.name }}{{ list.first }}", values) == "");
    CHECK(env.render("{{#nobody}}x{{/nobody}}{{#list}}y{{/list}}", values) == "");
  }
}

TEST_CASE("variable crash tests - failing lookups") {
  stache::Environment env;

  const stache::ValueMap data {
      {"broken", []() -> stache::Value { throw std::runtime_error("gone"); }},
      {"user", stache::ValueMap {{"name", "Alice"}}},
  };

  CHECK_NOTHROW(env.render("{{ broken.deep.name }}", data));
  CHECK(env.render("{{ user.name }}{{ broken.deep.name }}{{ user.name }}", data) == "AliceAlice");
  REQUIRE(env.get_last_render_errors().size() == 1);
  CHECK(env.get_last_render_errors()[0].name == "broken");
}

TEST_CASE("variable crash tests - stress test with many levels") {
  stache::Environment env;

  stache::json data;
  data["root"] = stache::json::object();

  CHECK(env.render("{{ root.a.b.c.d.e.f.g.h.i.j }}", data) == "");
  CHECK(env.render("{{ root.l1.l2.l3.l4.l5.l6.l7.l8.l9.l10.l11.l12.l13.l14.l15 }}", data) == "");
  CHECK(env.render("{{ a.b.c.d.e }}\n{{ x.y.z.w.q }}\n", data) == "\n\n");
}
