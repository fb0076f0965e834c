#include <ast_pretty_printer.hpp>
#include <tmp.hpp>

#include <algorithm>
#include <iterator>

namespace syntax
{

namespace
{

// The content of a call's last argument, if that is positional content.
const expr_content* trailing_content(const expr_args& args)
{
  if(args.empty())
    return nullptr;

  auto* pos = std::get_if<spanned<expr>>(&args.back().data);
  if(pos == nullptr)
    return nullptr;

  return std::get_if<expr_content>(&pos->v.data);
}

// The call, if `nodes` consists of exactly one call expression.
const expr_call* single_call(const tree& nodes)
{
  if(nodes.size() != 1)
    return nullptr;

  auto* e = std::get_if<expr>(&nodes.front().v.data);
  if(e == nullptr)
    return nullptr;

  return std::get_if<expr_call>(&e->data);
}

}

void pretty(const expr& e, printer& p)
{
  std::visit(base_visitor {
    [&p](const expr_none&)         { p.push_str("none"); },
    [&p](const ident& id)          { p.push_str(id.get_string()); },
    [&p](bool v)                   { p.push_str(v ? "true" : "false"); },
    [&p](std::int64_t v)           { p.write("{}", v); },
    [&p](double v)                 { p.write_float(v); },
    [&p](const expr_length& len)   { p.write_float(len.value); p.push_str(to_string(len.unit)); },
    [&p](const expr_percent& pct)  { p.write_float(pct.value); p.push('%'); },
    [&p](const rgba_color& color)  { p.push_str(color.to_string()); },
    [&p](const expr_str& str)      { p.write_escaped(str.value); },
    [&p](const expr_call& call)    { pretty(call, p); },
    [&p](const expr_unary& unary)  { pretty(unary, p); },
    [&p](const expr_binary& bin)   { pretty(bin, p); },
    [&p](const expr_array& array)  { pretty(array, p); },
    [&p](const expr_dict& dict)    { pretty(dict, p); },
    [&p](const expr_content& cont) { pretty_content_expr(cont.nodes, p); },
  }, e.data);
}

void pretty_content_expr(const tree& content, printer& p)
{
  if(const expr_call* call = single_call(content))
  {
    pretty_bracket_call(*call, p, false);
    return;
  }
  p.push('{');
  pretty(content, p);
  p.push('}');
}

void pretty(const expr_call& call, printer& p)
{
  p.push_str(call.name.v.get_string());
  p.push('(');
  pretty(call.args.v, p);
  p.push(')');
}

void pretty_bracket_call(const expr_call& call, printer& p, bool chained)
{
  if(chained)
    p.push_str(" | ");
  else
    p.push('[');

  p.push_str(call.name.v.get_string());

  const expr_args& args = call.args.v;
  if(const expr_content* body = trailing_content(args))
  {
    if(args.size() > 1)
    {
      p.push(' ');
      p.join(args.begin(), std::prev(args.end()), ", ",
          [](const argument& arg, printer& p) { pretty(arg, p); });
    }

    if(const expr_call* inner = single_call(body->nodes))
    {
      // the chained call closes the bracket
      pretty_bracket_call(*inner, p, true);
      return;
    }

    p.push_str("][");
    pretty(body->nodes, p);
  }
  else if(!args.empty())
  {
    p.push(' ');
    pretty(args, p);
  }

  // end of either header or body
  p.push(']');
}

void pretty(const expr_args& args, printer& p)
{
  p.join(args, ", ", [](const argument& arg, printer& p) { pretty(arg, p); });
}

void pretty(const argument& arg, printer& p)
{
  std::visit(base_visitor {
    [&p](const spanned<expr>& pos) { pretty(pos.v, p); },
    [&p](const named& pair)        { pretty(pair, p); },
  }, arg.data);
}

void pretty(const named& pair, printer& p)
{
  p.push_str(pair.name.v.get_string());
  p.push_str(": ");
  pretty(pair.value.v, p);
}

void pretty(const expr_unary& unary, printer& p)
{
  pretty(unary.op.v, p);
  pretty(unary.operand->v, p);
}

void pretty(unop op, printer& p)
{
  switch(op)
  {
  case unop::neg: p.push('-'); break;
  }
}

void pretty(const expr_binary& binary, printer& p)
{
  pretty(binary.lhs->v, p);
  p.push(' ');
  pretty(binary.op.v, p);
  p.push(' ');
  pretty(binary.rhs->v, p);
}

void pretty(binop op, printer& p)
{
  switch(op)
  {
  case binop::add: p.push('+'); break;
  case binop::sub: p.push('-'); break;
  case binop::mul: p.push('*'); break;
  case binop::div: p.push('/'); break;
  }
}

void pretty(const expr_array& array, printer& p)
{
  p.push('(');
  p.join(array.items, ", ", [](const spanned<expr>& item, printer& p) { pretty(item.v, p); });
  // "(x,)" is an array, "(x)" is just x
  if(array.items.size() == 1)
    p.push(',');
  p.push(')');
}

void pretty(const expr_dict& dict, printer& p)
{
  p.push('(');
  // "(:)" is an empty dictionary, "()" an empty array
  if(dict.items.empty())
    p.push(':');
  else
    p.join(dict.items, ", ", [](const named& pair, printer& p) { pretty(pair, p); });
  p.push(')');
}


void pretty(const tree& nodes, printer& p)
{
  for(auto& n : nodes)
    pretty(n.v, p);
}

void pretty(const node& n, printer& p)
{
  std::visit(base_visitor {
    [&p](const node_text& text)       { p.push_str(text.text); },
    [&p](const node_space&)           { p.push(' '); },
    [&p](const node_linebreak&)       { p.push('\\'); },
    [&p](const node_parbreak&)        { p.push_str("\n\n"); },
    [&p](const node_strong&)          { p.push('*'); },
    [&p](const node_emph&)            { p.push('_'); },
    [&p](const node_heading& heading) { pretty(heading, p); },
    [&p](const node_raw& raw)         { pretty(raw, p); },
    [&p](const expr& e)               { pretty_expr_node(e, p); },
  }, n.data);
}

void pretty_expr_node(const expr& e, printer& p)
{
  if(auto* call = std::get_if<expr_call>(&e.data))
  {
    // "{v()}" => "[v]"
    pretty_bracket_call(*call, p, false);
  }
  else if(auto* content = std::get_if<expr_content>(&e.data))
  {
    // "{{Hi}}" => "Hi"
    pretty(content->nodes, p);
  }
  else
  {
    p.push('{');
    pretty(e, p);
    p.push('}');
  }
}

void pretty(const node_heading& heading, printer& p)
{
  for(unsigned i = 0; i <= heading.level.v; ++i)
    p.push('#');
  pretty(heading.contents, p);
}

void pretty(const node_raw& raw, printer& p)
{
  // a language tag or a block needs at least three backticks
  std::size_t backticks = (raw.lang.has_value() || raw.block) ? 3 : 1;

  // a run of n backticks inside needs n + 1 around it
  for(auto& line : raw.lines)
  {
    std::size_t run = 0;
    for(char c : line)
    {
      if(c == '`')
      {
        ++run;
        backticks = std::max({ backticks, std::size_t(3), run + 1 });
      }
      else
        run = 0;
    }
  }

  p.push_str(std::string(backticks, '`'));

  if(raw.lang.has_value())
    p.push_str(raw.lang->get_string());

  if(raw.block)
    p.push('\n');
  else if(backticks >= 3)
    p.push(' ');

  p.join(raw.lines, "\n", [](const std::string& line, printer& p) { p.push_str(line); });

  if(raw.block)
    p.push('\n');
  else if(!raw.lines.empty())
  {
    const std::string& last = raw.lines.back();
    const auto end = last.find_last_not_of(" \t");
    if(end != std::string::npos && last[end] == '`')
      p.push(' ');
  }

  p.push_str(std::string(backticks, '`'));
}

}
