#include <builder.hpp>

namespace syntax
{

builder::builder(symbol module)
  : cur(module, 0, 0, 0, 0)
{  }

builder& builder::at(const source_range& range)
{
  cur = range;
  return *this;
}

spanned<expr> builder::none()
{ return mk(expr { expr_none {} }); }

spanned<expr> builder::id(ident name)
{ return mk(expr { name }); }

spanned<expr> builder::boolean(bool value)
{ return mk(expr { value }); }

spanned<expr> builder::integer(std::int64_t value)
{ return mk(expr { value }); }

spanned<expr> builder::floating(double value)
{ return mk(expr { value }); }

spanned<expr> builder::length(double value, length_unit unit)
{ return mk(expr { expr_length { value, unit } }); }

spanned<expr> builder::percent(double value)
{ return mk(expr { expr_percent { value } }); }

spanned<expr> builder::color(rgba_color value)
{ return mk(expr { value }); }

spanned<expr> builder::str(std::string value)
{ return mk(expr { expr_str { std::move(value) } }); }

spanned<expr> builder::call(ident name, expr_args args)
{ return mk(expr { expr_call { mk(name), mk(std::move(args)) } }); }

spanned<expr> builder::unary(unop op, spanned<expr> operand)
{ return mk(expr { expr_unary { mk(op), std::move(operand) } }); }

spanned<expr> builder::binary(spanned<expr> lhs, binop op, spanned<expr> rhs)
{ return mk(expr { expr_binary { std::move(lhs), mk(op), std::move(rhs) } }); }

spanned<expr> builder::array(span_vec<expr> items)
{ return mk(expr { expr_array { std::move(items) } }); }

spanned<expr> builder::dict(std::vector<named> items)
{ return mk(expr { expr_dict { std::move(items) } }); }

spanned<expr> builder::content(tree nodes)
{ return mk(expr { expr_content { std::move(nodes) } }); }

argument builder::positional(spanned<expr> value)
{ return argument { std::move(value) }; }

argument builder::keyword(ident name, spanned<expr> value)
{ return argument { pair(name, std::move(value)) }; }

named builder::pair(ident name, spanned<expr> value)
{ return named { mk(name), std::move(value) }; }

spanned<node> builder::text(std::string text)
{ return mk(node { node_text { std::move(text) } }); }

spanned<node> builder::space()
{ return mk(node { node_space {} }); }

spanned<node> builder::linebreak()
{ return mk(node { node_linebreak {} }); }

spanned<node> builder::parbreak()
{ return mk(node { node_parbreak {} }); }

spanned<node> builder::strong()
{ return mk(node { node_strong {} }); }

spanned<node> builder::emph()
{ return mk(node { node_emph {} }); }

spanned<node> builder::heading(std::uint8_t level, tree contents)
{ return mk(node { node_heading { mk(level), std::move(contents) } }); }

spanned<node> builder::raw(std::optional<ident> lang, std::vector<std::string> lines, bool block)
{ return mk(node { node_raw { std::move(lang), std::move(lines), block } }); }

spanned<node> builder::embed(spanned<expr> e)
{ return mk(node { std::move(e.v) }); }

}
