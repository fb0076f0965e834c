#include <reader.hpp>

#include <diagnostic_db.hpp>
#include <stream_lookup.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <string_view>
#include <limits>
#include <cctype>

using namespace std::literals::string_view_literals;

namespace
{

enum class expr_kind
{
  none, ident, boolean, integer, floating, length, percent, color, str,
  call, unary, binary, array, dict, content,
};

enum class node_kind
{
  text, space, linebreak, parbreak, strong, emph, heading, raw, expr,
};

auto expr_kind_map = tsl::robin_map<std::string_view, expr_kind>({
  { "none"sv,    expr_kind::none },
  { "ident"sv,   expr_kind::ident },
  { "bool"sv,    expr_kind::boolean },
  { "int"sv,     expr_kind::integer },
  { "float"sv,   expr_kind::floating },
  { "length"sv,  expr_kind::length },
  { "percent"sv, expr_kind::percent },
  { "color"sv,   expr_kind::color },
  { "str"sv,     expr_kind::str },
  { "call"sv,    expr_kind::call },
  { "unary"sv,   expr_kind::unary },
  { "binary"sv,  expr_kind::binary },
  { "array"sv,   expr_kind::array },
  { "dict"sv,    expr_kind::dict },
  { "content"sv, expr_kind::content },
});

auto node_kind_map = tsl::robin_map<std::string_view, node_kind>({
  { "text"sv,      node_kind::text },
  { "space"sv,     node_kind::space },
  { "linebreak"sv, node_kind::linebreak },
  { "parbreak"sv,  node_kind::parbreak },
  { "strong"sv,    node_kind::strong },
  { "emph"sv,      node_kind::emph },
  { "heading"sv,   node_kind::heading },
  { "raw"sv,       node_kind::raw },
  { "expr"sv,      node_kind::expr },
});

auto unop_map = tsl::robin_map<std::string_view, syntax::unop>({
  { "neg"sv, syntax::unop::neg },
});

auto binop_map = tsl::robin_map<std::string_view, syntax::binop>({
  { "add"sv, syntax::binop::add },
  { "sub"sv, syntax::binop::sub },
  { "mul"sv, syntax::binop::mul },
  { "div"sv, syntax::binop::div },
});

std::string where(const std::string& path)
{ return path.empty() ? "/" : path; }

std::string child(const std::string& path, std::string_view key)
{ return path + "/" + std::string(key); }

std::string child(const std::string& path, std::string_view key, std::size_t idx)
{ return path + "/" + std::string(key) + "/" + std::to_string(idx); }

}

bool is_identifier(std::string_view str)
{
  if(str.empty())
    return false;

  const auto first = static_cast<unsigned char>(str.front());
  if(!std::isalpha(first) && first != '_')
    return false;

  for(char c : str.substr(1))
  {
    const auto ch = static_cast<unsigned char>(c);
    if(!std::isalnum(ch) && ch != '_' && ch != '-')
      return false;
  }
  return true;
}

std::optional<document> ast_reader::read(std::string_view module)
{
  const symbol mod(module);

  auto is = stream_lookup.open(module);
  if(is == nullptr || !is->good())
  {
    diagnostic <<= diagnostic_db::loader::cannot_open(source_range { mod, 0, 0, 0, 0 }, std::string(module));
    return std::nullopt;
  }

  nlohmann::json doc;
  try
  {
    doc = nlohmann::json::parse(*is);
  }
  catch(const nlohmann::json::parse_error& e)
  {
    diagnostic <<= diagnostic_db::loader::invalid_json(source_range { mod, e.byte, 0, e.byte, 0 }, std::string(e.what()));
    return std::nullopt;
  }
  return read_json(doc, mod);
}

std::optional<document> ast_reader::read_json(const nlohmann::json& doc, symbol module)
{
  ast_reader reader(module, config.max_depth);

  if(doc.is_array())
  {
    auto nodes = reader.read_tree(doc, "", 0);
    if(reader.failed)
      return std::nullopt;
    return document { std::move(nodes) };
  }
  if(doc.is_object())
  {
    auto e = reader.read_expr(doc, "", 0);
    if(reader.failed)
      return std::nullopt;
    return document { std::move(e) };
  }

  reader.report(diagnostic_db::loader::expected_document(reader.here(), std::string(doc.type_name()), "/"));
  return std::nullopt;
}

ast_reader::ast_reader(symbol module, std::size_t max_depth)
  : module(module), max_depth(max_depth), b(module)
{  }

void ast_reader::report(const nlohmann::json& msg)
{
  diagnostic <<= msg;
  failed = true;
}

source_range ast_reader::here() const
{ return b.range(); }

bool ast_reader::enter(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
  if(!j.is_object())
  {
    report(diagnostic_db::loader::expected_object(here(), where(path)));
    return false;
  }
  if(depth > max_depth)
  {
    report(diagnostic_db::loader::nesting_too_deep(here(), max_depth, where(path)));
    return false;
  }

  auto sp = j.find("span");
  if(sp == j.end())
  {
    b.at(source_range { module, 0, 0, 0, 0 });
    return true;
  }

  const auto position = [&sp](const char* name) -> std::optional<std::size_t>
    {
      auto it = sp->find(name);
      if(it == sp->end() || !it->is_number_unsigned())
        return std::nullopt;
      return it->get<std::size_t>();
    };

  if(sp->is_object())
  {
    auto col_beg = position("col_beg");
    auto row_beg = position("row_beg");
    auto col_end = position("col_end");
    auto row_end = position("row_end");

    symbol mod = module;
    bool mod_ok = true;
    if(auto m = sp->find("module"); m != sp->end())
    {
      mod_ok = m->is_string();
      if(mod_ok)
        mod = symbol(m->get<std::string>());
    }

    if(col_beg && row_beg && col_end && row_end && mod_ok)
    {
      b.at(source_range { mod, *col_beg, *row_beg, *col_end, *row_end });
      return true;
    }
  }

  b.at(source_range { module, 0, 0, 0, 0 });
  report(diagnostic_db::loader::bad_span(here(), where(path)));
  return true;
}

const nlohmann::json* ast_reader::field(const nlohmann::json& j, const char* name, const std::string& path)
{
  auto it = j.find(name);
  if(it == j.end())
  {
    report(diagnostic_db::loader::missing_field(here(), name, where(path)));
    return nullptr;
  }
  return &*it;
}

std::optional<std::string> ast_reader::string_field(const nlohmann::json& j, const char* name, const std::string& path)
{
  auto* f = field(j, name, path);
  if(f == nullptr)
    return std::nullopt;
  if(!f->is_string())
  {
    report(diagnostic_db::loader::wrong_field_type(here(), name, where(path), "a string"));
    return std::nullopt;
  }
  return f->get<std::string>();
}

syntax::ident ast_reader::ident_field(const nlohmann::json& j, const char* name, const std::string& path)
{
  auto str = string_field(j, name, path);
  if(!str)
    return syntax::ident();
  if(!is_identifier(*str))
  {
    report(diagnostic_db::loader::invalid_identifier(here(), *str, where(path)));
    return syntax::ident();
  }
  return syntax::ident(*str);
}

std::optional<double> ast_reader::number_field(const nlohmann::json& j, const char* name, const std::string& path)
{
  auto* f = field(j, name, path);
  if(f == nullptr)
    return std::nullopt;
  if(!f->is_number())
  {
    report(diagnostic_db::loader::wrong_field_type(here(), name, where(path), "a number"));
    return std::nullopt;
  }
  return f->get<double>();
}

syntax::tree ast_reader::read_tree(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
  syntax::tree nodes;
  if(!j.is_array())
  {
    report(diagnostic_db::loader::expected_array(here(), where(path)));
    return nodes;
  }

  nodes.reserve(j.size());
  for(std::size_t i = 0; i < j.size(); ++i)
    nodes.push_back(read_node(j[i], path + "/" + std::to_string(i), depth));
  return nodes;
}

spanned<syntax::node> ast_reader::read_node(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
  if(!enter(j, path, depth))
    return b.space();
  const source_range range = b.range();

  auto kind = string_field(j, "kind", path);
  if(!kind)
    return b.at(range).space();

  auto it = node_kind_map.find(*kind);
  if(it == node_kind_map.end())
  {
    report(diagnostic_db::loader::unknown_node_kind(here(), *kind, where(path)));
    return b.at(range).space();
  }

  switch(it->second)
  {
  case node_kind::text:
    {
      auto text = string_field(j, "text", path);
      return b.at(range).text(text.value_or(""));
    }
  case node_kind::space:     return b.space();
  case node_kind::linebreak: return b.linebreak();
  case node_kind::parbreak:  return b.parbreak();
  case node_kind::strong:    return b.strong();
  case node_kind::emph:      return b.emph();
  case node_kind::heading:
    {
      std::uint8_t level = 0;
      if(auto* lv = field(j, "level", path))
      {
        if(!lv->is_number_integer())
          report(diagnostic_db::loader::wrong_field_type(here(), "level", where(path), "an integer"));
        else if(lv->is_number_unsigned() ? lv->get<std::uint64_t>() > std::numeric_limits<std::uint8_t>::max()
                                         : (lv->get<std::int64_t>() < 0 || lv->get<std::int64_t>() > std::numeric_limits<std::uint8_t>::max()))
          report(diagnostic_db::loader::heading_level_out_of_range(here(), lv->dump(), where(path)));
        else
          level = static_cast<std::uint8_t>(lv->get<std::uint64_t>());
      }

      syntax::tree contents;
      if(auto* c = field(j, "contents", path))
        contents = read_tree(*c, child(path, "contents"), depth + 1);

      return b.at(range).heading(level, std::move(contents));
    }
  case node_kind::raw:
    {
      std::optional<syntax::ident> lang;
      if(auto l = j.find("lang"); l != j.end() && !l->is_null())
        lang = ident_field(j, "lang", path);

      std::vector<std::string> lines;
      if(auto* ls = field(j, "lines", path))
      {
        bool all_strings = ls->is_array();
        if(all_strings)
        {
          for(auto& line : *ls)
          {
            if(!line.is_string())
            {
              all_strings = false;
              break;
            }
            lines.push_back(line.get<std::string>());
          }
        }
        if(!all_strings)
          report(diagnostic_db::loader::wrong_field_type(here(), "lines", where(path), "an array of strings"));
      }

      bool block = false;
      if(auto bl = j.find("block"); bl != j.end())
      {
        if(bl->is_boolean())
          block = bl->get<bool>();
        else
          report(diagnostic_db::loader::wrong_field_type(here(), "block", where(path), "a boolean"));
      }

      return b.at(range).raw(std::move(lang), std::move(lines), block);
    }
  case node_kind::expr:
    {
      auto* e = field(j, "expr", path);
      if(e == nullptr)
        return b.at(range).space();

      auto inner = read_expr(*e, child(path, "expr"), depth + 1);
      return b.at(range).embed(std::move(inner));
    }
  }
  return b.at(range).space();
}

spanned<syntax::expr> ast_reader::read_expr(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
  if(!enter(j, path, depth))
    return b.none();
  const source_range range = b.range();

  auto kind = string_field(j, "kind", path);
  if(!kind)
    return b.at(range).none();

  auto it = expr_kind_map.find(*kind);
  if(it == expr_kind_map.end())
  {
    report(diagnostic_db::loader::unknown_expr_kind(here(), *kind, where(path)));
    return b.at(range).none();
  }

  switch(it->second)
  {
  case expr_kind::none:
    return b.none();
  case expr_kind::ident:
    return b.id(ident_field(j, "name", path));
  case expr_kind::boolean:
    {
      auto* v = field(j, "value", path);
      if(v != nullptr && !v->is_boolean())
        report(diagnostic_db::loader::wrong_field_type(here(), "value", where(path), "a boolean"));
      return b.boolean(v != nullptr && v->is_boolean() && v->get<bool>());
    }
  case expr_kind::integer:
    {
      auto* v = field(j, "value", path);
      if(v == nullptr)
        return b.none();
      if(!v->is_number_integer()
          || (v->is_number_unsigned() && v->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())))
      {
        report(diagnostic_db::loader::wrong_field_type(here(), "value", where(path), "a 64-bit integer"));
        return b.none();
      }
      return b.integer(v->get<std::int64_t>());
    }
  case expr_kind::floating:
    return b.floating(number_field(j, "value", path).value_or(0.0));
  case expr_kind::length:
    {
      auto value = number_field(j, "value", path);
      auto unit_str = string_field(j, "unit", path);

      std::optional<length_unit> unit;
      if(unit_str)
      {
        unit = length_unit_from_string(*unit_str);
        if(!unit)
          report(diagnostic_db::loader::unknown_unit(here(), *unit_str, where(path)));
      }
      return b.at(range).length(value.value_or(0.0), unit.value_or(length_unit::pt));
    }
  case expr_kind::percent:
    return b.percent(number_field(j, "value", path).value_or(0.0));
  case expr_kind::color:
    {
      auto hex = string_field(j, "value", path);
      if(!hex)
        return b.none();

      auto color = rgba_color::from_hex(*hex);
      if(!color)
      {
        report(diagnostic_db::loader::invalid_color(here(), *hex, where(path)));
        return b.none();
      }
      return b.color(*color);
    }
  case expr_kind::str:
    return b.str(string_field(j, "value", path).value_or(""));
  case expr_kind::call:
    {
      auto name = ident_field(j, "name", path);

      syntax::expr_args args;
      // a call without "args" has no arguments
      if(auto a = j.find("args"); a != j.end())
      {
        if(!a->is_array())
          report(diagnostic_db::loader::expected_array(here(), child(path, "args")));
        else
        {
          args.reserve(a->size());
          for(std::size_t i = 0; i < a->size(); ++i)
            args.push_back(read_argument((*a)[i], child(path, "args", i), depth + 1));
        }
      }
      return b.at(range).call(name, std::move(args));
    }
  case expr_kind::unary:
    {
      syntax::unop op = syntax::unop::neg;
      if(auto op_str = string_field(j, "op", path))
      {
        if(auto o = unop_map.find(*op_str); o != unop_map.end())
          op = o->second;
        else
          report(diagnostic_db::loader::unknown_operator(here(), *op_str, where(path)));
      }

      auto* operand_j = field(j, "operand", path);
      if(operand_j == nullptr)
        return b.at(range).none();

      auto operand = read_expr(*operand_j, child(path, "operand"), depth + 1);
      return b.at(range).unary(op, std::move(operand));
    }
  case expr_kind::binary:
    {
      syntax::binop op = syntax::binop::add;
      if(auto op_str = string_field(j, "op", path))
      {
        if(auto o = binop_map.find(*op_str); o != binop_map.end())
          op = o->second;
        else
          report(diagnostic_db::loader::unknown_operator(here(), *op_str, where(path)));
      }

      auto* lhs_j = field(j, "lhs", path);
      auto* rhs_j = field(j, "rhs", path);
      if(lhs_j == nullptr || rhs_j == nullptr)
        return b.at(range).none();

      auto lhs = read_expr(*lhs_j, child(path, "lhs"), depth + 1);
      auto rhs = read_expr(*rhs_j, child(path, "rhs"), depth + 1);
      return b.at(range).binary(std::move(lhs), op, std::move(rhs));
    }
  case expr_kind::array:
    {
      span_vec<syntax::expr> items;
      if(auto* is = field(j, "items", path))
      {
        if(!is->is_array())
          report(diagnostic_db::loader::expected_array(here(), child(path, "items")));
        else
        {
          items.reserve(is->size());
          for(std::size_t i = 0; i < is->size(); ++i)
            items.push_back(read_expr((*is)[i], child(path, "items", i), depth + 1));
        }
      }
      return b.at(range).array(std::move(items));
    }
  case expr_kind::dict:
    {
      std::vector<syntax::named> items;
      if(auto* is = field(j, "items", path))
      {
        if(!is->is_array())
          report(diagnostic_db::loader::expected_array(here(), child(path, "items")));
        else
        {
          tsl::robin_set<std::string> keys;
          items.reserve(is->size());
          for(std::size_t i = 0; i < is->size(); ++i)
          {
            items.push_back(read_named((*is)[i], child(path, "items", i), depth + 1));

            // duplicates are legal here, but most likely not what was meant
            const std::string& key = items.back().name.v.get_string();
            if(!key.empty() && !keys.insert(key).second)
              diagnostic <<= diagnostic_db::loader::duplicate_key(items.back().name.span, key);
          }
        }
      }
      return b.at(range).dict(std::move(items));
    }
  case expr_kind::content:
    {
      syntax::tree nodes;
      if(auto* ns = field(j, "nodes", path))
        nodes = read_tree(*ns, child(path, "nodes"), depth + 1);
      return b.at(range).content(std::move(nodes));
    }
  }
  return b.at(range).none();
}

syntax::argument ast_reader::read_argument(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
  if(j.is_object())
  {
    if(auto k = j.find("kind"); k != j.end() && k->is_string() && k->get<std::string>() == "named")
      return syntax::argument { read_named(j, path, depth) };
  }
  return b.positional(read_expr(j, path, depth));
}

syntax::named ast_reader::read_named(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
  if(!enter(j, path, depth))
    return b.pair(syntax::ident(), b.none());
  const source_range range = b.range();

  auto name = ident_field(j, "name", path);

  auto* v = field(j, "value", path);
  if(v == nullptr)
    return b.at(range).pair(name, b.none());

  auto value = read_expr(*v, child(path, "value"), depth + 1);
  return b.at(range).pair(name, std::move(value));
}
