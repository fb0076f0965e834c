#pragma once

#include <length_unit.hpp>
#include <ast.hpp>

#include <nlohmann/json.hpp>

// JSON interchange form of syntax trees. Each expression and node is an object
// tagged with "kind", see reader.hpp for the loading side.

NLOHMANN_JSON_SERIALIZE_ENUM( length_unit, {
  { length_unit::pt, "pt" },
  { length_unit::mm, "mm" },
  { length_unit::cm, "cm" },
  { length_unit::in, "in" },
})

namespace syntax
{

NLOHMANN_JSON_SERIALIZE_ENUM( unop, {
  { unop::neg, "neg" },
})

NLOHMANN_JSON_SERIALIZE_ENUM( binop, {
  { binop::add, "add" },
  { binop::sub, "sub" },
  { binop::mul, "mul" },
  { binop::div, "div" },
})

void to_json(nlohmann::json& j, const expr& e);
void to_json(nlohmann::json& j, const argument& arg);
void to_json(nlohmann::json& j, const named& pair);
void to_json(nlohmann::json& j, const node& n);

// Like to_json, but also records the span of every node.
nlohmann::json dump(const tree& nodes, bool with_spans);
nlohmann::json dump(const spanned<expr>& e, bool with_spans);

}
