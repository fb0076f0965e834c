#pragma once

#include <length_unit.hpp>
#include <spanned.hpp>
#include <symbol.hpp>
#include <color.hpp>
#include <box.hpp>

#include <optional>
#include <variant>
#include <cstdint>
#include <string>
#include <vector>

namespace syntax
{

using ident = symbol;

struct expr;
struct node;
struct argument;
struct named;

// Markup content: `*Hello* there!`
using tree = span_vec<node>;

// The arguments of a call: `12, draw: false`.
// For a bracketed call with a body the body is the last positional argument.
using expr_args = std::vector<argument>;

enum class unop : std::int_fast8_t
{
  neg,
};

enum class binop : std::int_fast8_t
{
  add,
  sub,
  mul,
  div,
};

// `none`
struct expr_none
{  };

// `12pt`, `3cm`
struct expr_length
{
  double value;
  length_unit unit;
};

// `50%`, stored as 50.0
struct expr_percent
{
  double value;
};

// `"hello!"`, already unescaped
struct expr_str
{
  std::string value;
};

// `[foo ...]`, `foo(...)`
struct expr_call
{
  spanned<ident> name;
  spanned<expr_args> args;
};

// `-x`
struct expr_unary
{
  spanned<unop> op;
  box<spanned<expr>> operand;
};

// `a + b`
struct expr_binary
{
  box<spanned<expr>> lhs;
  spanned<binop> op;
  box<spanned<expr>> rhs;
};

// `(1, "hi", 12cm)`
struct expr_array
{
  span_vec<expr> items;
};

// `(color: #f79143, pattern: dashed)`, keys need not be unique
struct expr_dict
{
  std::vector<named> items;
};

// `{*Hello* there!}`
struct expr_content
{
  tree nodes;
};

struct expr
{
  using data_type = std::variant<
    expr_none,
    ident,
    bool,
    std::int64_t,
    double,
    expr_length,
    expr_percent,
    rgba_color,
    expr_str,
    expr_call,
    expr_unary,
    expr_binary,
    expr_array,
    expr_dict,
    expr_content
  >;

  data_type data;
};

// `pattern: dashed`
struct named
{
  spanned<ident> name;
  spanned<expr> value;
};

// `12` or `draw: false`
struct argument
{
  std::variant<spanned<expr>, named> data;
};

struct node_text
{
  std::string text;
};

struct node_space {  };
struct node_linebreak {  };
struct node_parbreak {  };

// toggles
struct node_strong {  };
struct node_emph {  };

// `# Introduction`, level 0 is a single '#'
struct node_heading
{
  spanned<std::uint8_t> level;
  tree contents;
};

// `` `code` ``, ```` ```rust fn main() {}``` ````
struct node_raw
{
  std::optional<ident> lang;
  std::vector<std::string> lines;
  bool block { false };
};

struct node
{
  using data_type = std::variant<
    node_text,
    node_space,
    node_linebreak,
    node_parbreak,
    node_strong,
    node_emph,
    node_heading,
    node_raw,
    expr
  >;

  data_type data;
};

bool operator==(const expr_none&, const expr_none&);
bool operator==(const expr_length& a, const expr_length& b);
bool operator==(const expr_percent& a, const expr_percent& b);
bool operator==(const expr_str& a, const expr_str& b);
bool operator==(const expr_call& a, const expr_call& b);
bool operator==(const expr_unary& a, const expr_unary& b);
bool operator==(const expr_binary& a, const expr_binary& b);
bool operator==(const expr_array& a, const expr_array& b);
bool operator==(const expr_dict& a, const expr_dict& b);
bool operator==(const expr_content& a, const expr_content& b);
bool operator==(const expr& a, const expr& b);
bool operator==(const named& a, const named& b);
bool operator==(const argument& a, const argument& b);

bool operator==(const node_text& a, const node_text& b);
bool operator==(const node_space&, const node_space&);
bool operator==(const node_linebreak&, const node_linebreak&);
bool operator==(const node_parbreak&, const node_parbreak&);
bool operator==(const node_strong&, const node_strong&);
bool operator==(const node_emph&, const node_emph&);
bool operator==(const node_heading& a, const node_heading& b);
bool operator==(const node_raw& a, const node_raw& b);
bool operator==(const node& a, const node& b);

inline bool operator!=(const expr& a, const expr& b) { return !(a == b); }
inline bool operator!=(const node& a, const node& b) { return !(a == b); }

}
