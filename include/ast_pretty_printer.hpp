#pragma once

#include <printer.hpp>
#include <ast.hpp>

#include <string>

namespace syntax
{

// Writes the canonical surface syntax of a node into `p`.
// Reading the output back and printing it again yields the same text.
void pretty(const expr& e, printer& p);
void pretty(const expr_call& call, printer& p);
void pretty(const expr_args& args, printer& p);
void pretty(const argument& arg, printer& p);
void pretty(const named& pair, printer& p);
void pretty(const expr_unary& unary, printer& p);
void pretty(const expr_binary& binary, printer& p);
void pretty(unop op, printer& p);
void pretty(binop op, printer& p);
void pretty(const expr_array& array, printer& p);
void pretty(const expr_dict& dict, printer& p);

void pretty(const tree& nodes, printer& p);
void pretty(const node& n, printer& p);
void pretty(const node_heading& heading, printer& p);
void pretty(const node_raw& raw, printer& p);

// Content in an expression context: `{...}`, or just the bracketed call if
// the content is nothing but a single call.
//   "(call: {[f]})" => "(call: [f])"
void pretty_content_expr(const tree& content, printer& p);

// An expression embedded in markup: calls take the bracket form, content is
// inlined and anything else gets wrapped in braces.
void pretty_expr_node(const expr& e, printer& p);

// A call in bracket form. A trailing content argument becomes the body, or,
// if that content is itself a single call, a chain.
//   "[v {Hi}]" => "[v][Hi]"
//   "[v][[f]]" => "[v | f]"
// With `chained` set the call continues a chain and opens with " | " instead of "[".
void pretty_bracket_call(const expr_call& call, printer& p, bool chained);

template<typename T>
std::string pretty(const T& item)
{
  printer p;
  pretty(item, p);
  return p.finish();
}

}
