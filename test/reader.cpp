#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ast_pretty_printer.hpp>
#include <stream_lookup.hpp>
#include <diagnostic.hpp>
#include <ast_json.hpp>
#include <builder.hpp>
#include <reader.hpp>
#include <driver.hpp>
#include <config.hpp>

#include <string>

using namespace syntax;

namespace
{

std::optional<document> load(std::string_view json)
{
  stream_lookup.write_test(json);
  return ast_reader::read("TESTSTREAM");
}

std::string print(const document& doc)
{
  if(auto* nodes = std::get_if<tree>(&doc))
    return pretty(*nodes);
  return pretty(std::get<spanned<expr>>(doc).v);
}

}

TEST_CASE( "Documents are read from JSON", "[reader]" ) {

    SECTION( "markup" ) {
      diagnostic.reset();
      auto doc = load(R"([
        { "kind": "text", "text": "See" },
        { "kind": "space" },
        { "kind": "expr", "expr": { "kind": "call", "name": "v", "args": [
          { "kind": "content", "nodes": [ { "kind": "expr", "expr": { "kind": "call", "name": "f" } } ] }
        ] } }
      ])");

      REQUIRE(doc.has_value());
      REQUIRE(diagnostic.empty());
      REQUIRE(std::holds_alternative<tree>(*doc));
      REQUIRE(print(*doc) == "See [v | f]");
    }

    SECTION( "expression" ) {
      diagnostic.reset();
      auto doc = load(R"({ "kind": "binary", "op": "add",
        "lhs": { "kind": "int", "value": 1 },
        "rhs": { "kind": "call", "name": "func", "args": [
          { "kind": "unary", "op": "neg", "operand": { "kind": "int", "value": 2 } }
        ] } })");

      REQUIRE(doc.has_value());
      REQUIRE(std::holds_alternative<spanned<expr>>(*doc));
      REQUIRE(print(*doc) == "1 + func(-2)");
    }

    SECTION( "named arguments and literals" ) {
      diagnostic.reset();
      auto doc = load(R"({ "kind": "call", "name": "box", "args": [
          { "kind": "named", "name": "width", "value": { "kind": "length", "value": 2.50, "unit": "cm" } },
          { "kind": "named", "name": "fill", "value": { "kind": "color", "value": "#FFF" } },
          { "kind": "named", "name": "scale", "value": { "kind": "percent", "value": 50 } },
          { "kind": "named", "name": "label", "value": { "kind": "str", "value": "a\"b" } },
          { "kind": "float", "value": 1e2 },
          { "kind": "bool", "value": true },
          { "kind": "none" }
        ] })");

      REQUIRE(doc.has_value());
      REQUIRE(print(*doc) == R"(box(width: 2.5cm, fill: #ffffff, scale: 50%, label: "a\"b", 100, true, none))");
    }

    SECTION( "headings and raw" ) {
      diagnostic.reset();
      auto doc = load(R"([
        { "kind": "heading", "level": 1, "contents": [ { "kind": "space" }, { "kind": "text", "text": "Usage" } ] },
        { "kind": "parbreak" },
        { "kind": "raw", "lang": "rust", "lines": [ "fn main() {}" ], "block": true }
      ])");

      REQUIRE(doc.has_value());
      REQUIRE(print(*doc) == "## Usage\n\n```rust\nfn main() {}\n```");
    }

    SECTION( "spans" ) {
      diagnostic.reset();
      auto doc = load(R"([ { "kind": "text", "text": "x",
        "span": { "module": "doc.typ", "col_beg": 3, "row_beg": 2, "col_end": 4, "row_end": 2 } } ])");

      REQUIRE(doc.has_value());
      auto& span = std::get<tree>(*doc).front().span;
      REQUIRE(span.module.get_string() == "doc.typ");
      REQUIRE(span.column_beg == 3);
      REQUIRE(span.row_beg == 2);
      REQUIRE(span.column_end == 4);
      REQUIRE(span.row_end == 2);
    }
}

TEST_CASE( "Malformed documents are rejected", "[reader][diagnostics]" ) {

    SECTION( "invalid json" ) {
      diagnostic.reset();
      REQUIRE_FALSE(load("[ { \"kind\": ").has_value());
      REQUIRE(diagnostic.error_code() == 1);
    }

    SECTION( "neither tree nor expression" ) {
      diagnostic.reset();
      REQUIRE_FALSE(load("42").has_value());
      REQUIRE(diagnostic.error_code() == 1);
    }

    SECTION( "unknown kinds" ) {
      diagnostic.reset();
      REQUIRE_FALSE(load(R"([ { "kind": "table" } ])").has_value());
      REQUIRE_FALSE(diagnostic.empty());

      diagnostic.reset();
      REQUIRE_FALSE(load(R"({ "kind": "lambda" })").has_value());
      REQUIRE_FALSE(diagnostic.empty());
    }

    SECTION( "invalid values" ) {
      diagnostic.reset();
      REQUIRE_FALSE(load(R"({ "kind": "ident", "name": "1x" })").has_value());
      REQUIRE_FALSE(load(R"({ "kind": "ident", "name": "" })").has_value());
      REQUIRE_FALSE(load(R"({ "kind": "color", "value": "#ggg" })").has_value());
      REQUIRE_FALSE(load(R"({ "kind": "length", "value": 1, "unit": "px" })").has_value());
      REQUIRE_FALSE(load(R"({ "kind": "binary", "op": "pow", "lhs": { "kind": "none" }, "rhs": { "kind": "none" } })").has_value());
      REQUIRE_FALSE(load(R"([ { "kind": "heading", "level": 256, "contents": [] } ])").has_value());
      REQUIRE_FALSE(load(R"({ "kind": "int", "value": 1.5 })").has_value());
      REQUIRE(diagnostic.error_code() == 1);
    }

    SECTION( "heading levels" ) {
      diagnostic.reset();
      REQUIRE(load(R"([ { "kind": "heading", "level": 255, "contents": [] } ])").has_value());
      REQUIRE_FALSE(load(R"([ { "kind": "heading", "level": -1, "contents": [] } ])").has_value());

      diagnostic.reset();
      REQUIRE_FALSE(load(R"([ { "kind": "heading", "level": 18446744073709551615, "contents": [] } ])").has_value());
      auto msgs = diagnostic.messages();
      REQUIRE(msgs.size() == 1);
      REQUIRE(msgs.front()["message"].get<std::string>().find("18446744073709551615") != std::string::npos);
    }

    SECTION( "identifiers" ) {
      REQUIRE(is_identifier("v"));
      REQUIRE(is_identifier("_x"));
      REQUIRE(is_identifier("my-func2"));
      REQUIRE_FALSE(is_identifier(""));
      REQUIRE_FALSE(is_identifier("-x"));
      REQUIRE_FALSE(is_identifier("a b"));
    }

    SECTION( "all problems are reported" ) {
      diagnostic.reset();
      REQUIRE_FALSE(load(R"([ { "kind": "text" }, { "kind": "nope" }, { "kind": "heading", "contents": [] } ])").has_value());
      REQUIRE(diagnostic.messages().size() == 3);
    }

    SECTION( "duplicate dictionary keys only warn" ) {
      diagnostic.reset();
      auto doc = load(R"({ "kind": "dict", "items": [
        { "name": "a", "value": { "kind": "int", "value": 1 } },
        { "name": "a", "value": { "kind": "int", "value": 2 } }
      ] })");

      REQUIRE(doc.has_value());
      REQUIRE(print(*doc) == "(a: 1, a: 2)");
      REQUIRE(diagnostic.error_code() == 0);
      REQUIRE_FALSE(diagnostic.empty());
    }
}

TEST_CASE( "Nesting depth is bounded", "[reader]" ) {
  const auto nested = [](std::size_t depth)
    {
      std::string json;
      for(std::size_t i = 0; i < depth; ++i)
        json += R"({ "kind": "unary", "op": "neg", "operand": )";
      json += R"({ "kind": "int", "value": 1 })";
      json += std::string(depth, '}');
      return json;
    };

  const auto max_depth = config.max_depth;

    SECTION( "within the limit" ) {
      diagnostic.reset();
      config.max_depth = 256;
      auto doc = load(nested(100));
      REQUIRE(doc.has_value());
      REQUIRE(print(*doc) == std::string(100, '-') + "1");
    }

    SECTION( "beyond the limit" ) {
      diagnostic.reset();
      config.max_depth = 8;
      REQUIRE_FALSE(load(nested(20)).has_value());
      REQUIRE(diagnostic.error_code() == 1);
    }

  config.max_depth = max_depth;
}

TEST_CASE( "Dumped trees read back unchanged", "[reader][json]" ) {
  diagnostic.reset();

  builder b(symbol("dump"));
  b.at(source_range { symbol("dump"), 1, 1, 5, 1 });
  auto chain = b.call(ident("v"), { b.positional(b.integer(1)), b.positional(b.content({ b.embed(b.call(ident("f"))) })) });

  b.at(source_range { symbol("dump"), 6, 1, 20, 1 });
  tree original {
    b.embed(chain),
    b.space(),
    b.embed(b.dict({ b.pair(ident("k"), b.array({ b.floating(0.25) })) })),
    b.raw(std::nullopt, { "x`" }, false),
  };

  auto doc = ast_reader::read_json(dump(original, true), symbol("dump"));
  REQUIRE(doc.has_value());
  REQUIRE(std::get<tree>(*doc) == original);
  REQUIRE(std::get<tree>(*doc).front().span.column_beg == 6);
  REQUIRE(std::get<tree>(*doc).front().span.column_end == 20);

  // printing is a fixed point
  const std::string printed = pretty(original);
  REQUIRE(printed == "[v 1 | f] {(k: (0.25,))}``` x` ```");
  REQUIRE(print(*doc) == printed);
}

TEST_CASE( "Modules are processed by the driver", "[driver]" ) {
  const auto emit_class = config.emit_class;

    SECTION( "pretty" ) {
      diagnostic.reset();
      config.emit_class = emit_classes::pretty;
      stream_lookup.write_test(R"([ { "kind": "expr", "expr": { "kind": "call", "name": "f" } } ])");
      REQUIRE(driver::run("TESTSTREAM") == std::optional<std::string>("[f]\n"));
    }

    SECTION( "json" ) {
      diagnostic.reset();
      config.emit_class = emit_classes::json;
      stream_lookup.write_test(R"({ "kind": "array", "items": [ { "kind": "int", "value": 3 } ] })");
      auto out = driver::run("TESTSTREAM");
      REQUIRE(out.has_value());

      auto doc = ast_reader::read_json(nlohmann::json::parse(*out), symbol("TESTSTREAM"));
      REQUIRE(doc.has_value());
      REQUIRE(print(*doc) == "(3,)");
    }

    SECTION( "missing module" ) {
      diagnostic.reset();
      config.emit_class = emit_classes::pretty;
      REQUIRE_FALSE(driver::run("does/not/exist.json").has_value());
      REQUIRE(diagnostic.error_code() == 1);
    }

  config.emit_class = emit_class;
}
