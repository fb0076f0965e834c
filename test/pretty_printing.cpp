#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ast_pretty_printer.hpp>
#include <builder.hpp>

using namespace syntax;

namespace
{

// "[name ...]" as a markup node
spanned<node> call_node(builder& b, const char* name, expr_args args = {})
{ return b.embed(b.call(ident(name), std::move(args))); }

}

TEST_CASE( "Nested calls in content print as chains", "[pretty][chain]" ) {
  builder b;

  // [v [f]], [v {[f]}], [v][[f]] and [v | f] all build this call
  auto v = b.call(ident("v"), { b.positional(b.content({ call_node(b, "f") })) });
  const auto& v_call = std::get<expr_call>(v.v.data);

    SECTION( "embedded in markup" ) {
      REQUIRE(pretty(tree { b.embed(v) }) == "[v | f]");
    }

    SECTION( "as content expression" ) {
      printer p;
      pretty_content_expr(tree { b.embed(v) }, p);
      REQUIRE(p.finish() == "[v | f]");
    }

    SECTION( "through the bracket renderer" ) {
      printer p;
      pretty_bracket_call(v_call, p, false);
      REQUIRE(p.finish() == "[v | f]");
    }

    SECTION( "as continuation of a chain" ) {
      printer p;
      pretty_bracket_call(v_call, p, true);
      REQUIRE(p.finish() == " | v | f]");
    }

    SECTION( "in expression context" ) {
      // the parenthesized call keeps its content argument
      REQUIRE(pretty(v.v) == "v([f])");
      REQUIRE(pretty(b.dict({ b.pair(ident("func"), b.content({ b.embed(v) })) }).v) == "(func: [v | f])");
    }

    SECTION( "three links" ) {
      auto c = b.call(ident("a"), { b.positional(b.content({ b.embed(v) })) });
      REQUIRE(pretty(tree { b.embed(c) }) == "[a | v | f]");
    }
}

TEST_CASE( "Bracket calls", "[pretty][call]" ) {
  builder b;

    SECTION( "without arguments" ) {
      REQUIRE(pretty(tree { call_node(b, "f") }) == "[f]");
    }

    SECTION( "with a body" ) {
      REQUIRE(pretty(tree { call_node(b, "v", { b.positional(b.content({ b.text("Hi") })) }) }) == "[v][Hi]");
    }

    SECTION( "head arguments before a chain" ) {
      REQUIRE(pretty(tree { call_node(b, "v", {
              b.positional(b.integer(1)),
              b.positional(b.content({ call_node(b, "f") })),
            }) }) == "[v 1 | f]");
    }

    SECTION( "head arguments before a body" ) {
      REQUIRE(pretty(tree { call_node(b, "v", {
              b.positional(b.id(ident("a"))),
              b.keyword(ident("size"), b.length(12.0, length_unit::pt)),
              b.positional(b.content({ b.text("Hi") })),
            }) }) == "[v a, size: 12pt][Hi]");
    }

    SECTION( "chain ending in a body" ) {
      auto f = call_node(b, "f", { b.positional(b.content({ b.text("Hi") })) });
      REQUIRE(pretty(tree { call_node(b, "v", { b.positional(b.content({ f })) }) }) == "[v | f][Hi]");
    }

    SECTION( "body with more than a call" ) {
      auto body = b.content({ call_node(b, "f"), b.space(), b.text("x") });
      REQUIRE(pretty(tree { call_node(b, "v", { b.positional(body) }) }) == "[v][[f] x]");
    }

    SECTION( "trailing argument that is not content" ) {
      REQUIRE(pretty(tree { call_node(b, "v", {
              b.positional(b.content({ call_node(b, "f") })),
              b.positional(b.integer(1)),
            }) }) == "[v [f], 1]");

      auto call = b.call(ident("v"), { b.positional(b.integer(1)), b.positional(b.integer(2)) });
      REQUIRE(pretty(tree { b.embed(call) }) == "[v 1, 2]");
      REQUIRE(pretty(call.v) == "v(1, 2)");
    }
}

TEST_CASE( "Expressions", "[pretty][expr]" ) {
  builder b;

    SECTION( "operators" ) {
      auto neg2 = b.unary(unop::neg, b.integer(2));
      auto call = b.call(ident("func"), { b.positional(neg2) });
      REQUIRE(pretty(b.binary(b.integer(1), binop::add, call).v) == "1 + func(-2)");

      REQUIRE(pretty(b.binary(b.id(ident("a")), binop::sub, b.id(ident("b"))).v) == "a - b");
      REQUIRE(pretty(b.binary(b.id(ident("a")), binop::mul, b.id(ident("b"))).v) == "a * b");
      REQUIRE(pretty(b.binary(b.id(ident("a")), binop::div, b.id(ident("b"))).v) == "a / b");
      REQUIRE(pretty(b.unary(unop::neg, b.unary(unop::neg, b.id(ident("x")))).v) == "--x");
    }

    SECTION( "grouping is left to the tree" ) {
      auto sum = b.binary(b.integer(1), binop::add, b.integer(2));
      REQUIRE(pretty(b.binary(sum, binop::mul, b.integer(3)).v) == "1 + 2 * 3");
    }

    SECTION( "arrays" ) {
      REQUIRE(pretty(b.array({ b.unary(unop::neg, b.integer(5)) }).v) == "(-5,)");
      REQUIRE(pretty(b.array({ b.integer(1), b.integer(2), b.integer(3) }).v) == "(1, 2, 3)");
      REQUIRE(pretty(b.array({}).v) == "()");
    }

    SECTION( "dictionaries" ) {
      REQUIRE(pretty(b.dict({}).v) == "(:)");
      REQUIRE(pretty(b.dict({ b.pair(ident("percent"), b.percent(5.0)) }).v) == "(percent: 5%)");
      REQUIRE(pretty(b.dict({ b.pair(ident("a"), b.integer(1)), b.pair(ident("a"), b.integer(2)) }).v) == "(a: 1, a: 2)");
    }

    SECTION( "content" ) {
      REQUIRE(pretty(b.dict({ b.pair(ident("func"), b.content({ call_node(b, "f") })) }).v) == "(func: [f])");
      REQUIRE(pretty(b.dict({ b.pair(ident("body"), b.content({ b.text("Hi") })) }).v) == "(body: {Hi})");
      REQUIRE(pretty(b.content({}).v) == "{}");
    }

    SECTION( "calls" ) {
      REQUIRE(pretty(b.call(ident("f")).v) == "f()");
      REQUIRE(pretty(b.call(ident("rgb"), { b.positional(b.str("x")), b.keyword(ident("alpha"), b.floating(0.5)) }).v)
          == "rgb(\"x\", alpha: 0.5)");
    }
}

TEST_CASE( "Expressions embedded in markup", "[pretty][markup]" ) {
  builder b;

  REQUIRE(pretty(tree { b.embed(b.integer(1)) }) == "{1}");
  REQUIRE(pretty(tree { b.embed(b.dict({})) }) == "{(:)}");
  REQUIRE(pretty(tree { b.embed(b.content({ b.text("Hi") })) }) == "Hi");
  REQUIRE(pretty(tree { b.text("a"), b.embed(b.id(ident("x"))), b.text("b") }) == "a{x}b");
}

TEST_CASE( "Markup nodes", "[pretty][markup]" ) {
  builder b;

    SECTION( "text and toggles" ) {
      tree t {
        b.text("Hello"), b.space(), b.strong(), b.text("world"), b.strong(), b.parbreak(),
        b.emph(), b.text("x"), b.emph(), b.linebreak(),
      };
      REQUIRE(pretty(t) == "Hello *world*\n\n_x_\\");
    }

    SECTION( "headings" ) {
      REQUIRE(pretty(tree { b.heading(0, { b.space(), b.text("Intro") }) }) == "# Intro");
      REQUIRE(pretty(tree { b.heading(2, { b.space(), b.text("Intro") }) }) == "### Intro");
    }

    SECTION( "raw" ) {
      REQUIRE(pretty(tree { b.raw(std::nullopt, { "x" }, false) }) == "`x`");
      REQUIRE(pretty(tree { b.raw(ident("rust"), { "let x;" }, false) }) == "```rust let x;```");
      REQUIRE(pretty(tree { b.raw(std::nullopt, { "a", "b" }, true) }) == "```\na\nb\n```");
      REQUIRE(pretty(tree { b.raw(std::nullopt, { "x`" }, false) }) == "``` x` ```");
      REQUIRE(pretty(tree { b.raw(std::nullopt, { "a ```` b" }, false) }) == "````` a ```` b`````");
    }
}

TEST_CASE( "Spans do not change the output", "[pretty]" ) {
  builder b(symbol("mod"));

  auto first = b.at(source_range { symbol("mod"), 1, 1, 4, 1 }).call(ident("f"), { b.positional(b.integer(1)) });
  auto second = b.at(source_range { symbol("mod"), 7, 3, 9, 3 }).call(ident("f"), { b.positional(b.integer(1)) });

  REQUIRE(first == second);
  REQUIRE(pretty(first.v) == pretty(second.v));
}
