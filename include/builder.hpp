#pragma once

#include <ast.hpp>

namespace syntax
{

// Constructs syntax tree nodes. Every node is stamped with the range set by `at`.
struct builder
{
  builder() = default;
  explicit builder(symbol module);

  builder& at(const source_range& range);
  const source_range& range() const { return cur; }

  spanned<expr> none();
  spanned<expr> id(ident name);
  spanned<expr> boolean(bool value);
  spanned<expr> integer(std::int64_t value);
  spanned<expr> floating(double value);
  spanned<expr> length(double value, length_unit unit);
  spanned<expr> percent(double value);
  spanned<expr> color(rgba_color value);
  spanned<expr> str(std::string value);

  spanned<expr> call(ident name, expr_args args = {});
  spanned<expr> unary(unop op, spanned<expr> operand);
  spanned<expr> binary(spanned<expr> lhs, binop op, spanned<expr> rhs);
  spanned<expr> array(span_vec<expr> items);
  spanned<expr> dict(std::vector<named> items);
  spanned<expr> content(tree nodes);

  argument positional(spanned<expr> value);
  argument keyword(ident name, spanned<expr> value);
  named pair(ident name, spanned<expr> value);

  spanned<node> text(std::string text);
  spanned<node> space();
  spanned<node> linebreak();
  spanned<node> parbreak();
  spanned<node> strong();
  spanned<node> emph();
  spanned<node> heading(std::uint8_t level, tree contents);
  spanned<node> raw(std::optional<ident> lang, std::vector<std::string> lines, bool block);
  spanned<node> embed(spanned<expr> e);
private:
  template<typename T>
  spanned<T> mk(T value) const
  { return spanned<T> { std::move(value), cur }; }
private:
  source_range cur;
};

}
