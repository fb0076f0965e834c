#include <ast_json.hpp>
#include <tmp.hpp>

namespace syntax
{

namespace
{

struct json_writer
{
  bool with_spans;

  template<typename T>
  nlohmann::json spanned_value(const spanned<T>& s) const
  {
    nlohmann::json j = write(s.v);
    if(with_spans && !s.span.module.empty())
      j["span"] = s.span;
    return j;
  }

  nlohmann::json write(const tree& nodes) const
  {
    nlohmann::json j = nlohmann::json::array();
    for(auto& n : nodes)
      j.push_back(spanned_value(n));
    return j;
  }

  nlohmann::json write(const argument& arg) const
  {
    return std::visit(base_visitor {
      [this](const spanned<expr>& pos) { return spanned_value(pos); },
      [this](const named& pair)        { return write(pair); },
    }, arg.data);
  }

  nlohmann::json write(const named& pair) const
  {
    nlohmann::json j;
    j["kind"] = "named";
    j["name"] = pair.name.v.get_string();
    j["value"] = spanned_value(pair.value);
    return j;
  }

  nlohmann::json write(const expr& e) const
  {
    nlohmann::json j;
    std::visit(base_visitor {
      [&j](const expr_none&)          { j["kind"] = "none"; },
      [&j](const ident& id)           { j["kind"] = "ident"; j["name"] = id.get_string(); },
      [&j](bool v)                    { j["kind"] = "bool"; j["value"] = v; },
      [&j](std::int64_t v)            { j["kind"] = "int"; j["value"] = v; },
      [&j](double v)                  { j["kind"] = "float"; j["value"] = v; },
      [&j](const expr_length& len)    { j["kind"] = "length"; j["value"] = len.value; j["unit"] = len.unit; },
      [&j](const expr_percent& pct)   { j["kind"] = "percent"; j["value"] = pct.value; },
      [&j](const rgba_color& color)   { j["kind"] = "color"; j["value"] = color.to_string(); },
      [&j](const expr_str& str)       { j["kind"] = "str"; j["value"] = str.value; },
      [&j, this](const expr_call& call)
      {
        j["kind"] = "call";
        j["name"] = call.name.v.get_string();
        j["args"] = nlohmann::json::array();
        for(auto& arg : call.args.v)
          j["args"].push_back(write(arg));
      },
      [&j, this](const expr_unary& unary)
      {
        j["kind"] = "unary";
        j["op"] = unary.op.v;
        j["operand"] = spanned_value(*unary.operand);
      },
      [&j, this](const expr_binary& bin)
      {
        j["kind"] = "binary";
        j["lhs"] = spanned_value(*bin.lhs);
        j["op"] = bin.op.v;
        j["rhs"] = spanned_value(*bin.rhs);
      },
      [&j, this](const expr_array& array)
      {
        j["kind"] = "array";
        j["items"] = nlohmann::json::array();
        for(auto& item : array.items)
          j["items"].push_back(spanned_value(item));
      },
      [&j, this](const expr_dict& dict)
      {
        j["kind"] = "dict";
        j["items"] = nlohmann::json::array();
        for(auto& pair : dict.items)
          j["items"].push_back(write(pair));
      },
      [&j, this](const expr_content& content)
      {
        j["kind"] = "content";
        j["nodes"] = write(content.nodes);
      },
    }, e.data);
    return j;
  }

  nlohmann::json write(const node& n) const
  {
    nlohmann::json j;
    std::visit(base_visitor {
      [&j](const node_text& text)     { j["kind"] = "text"; j["text"] = text.text; },
      [&j](const node_space&)         { j["kind"] = "space"; },
      [&j](const node_linebreak&)     { j["kind"] = "linebreak"; },
      [&j](const node_parbreak&)      { j["kind"] = "parbreak"; },
      [&j](const node_strong&)        { j["kind"] = "strong"; },
      [&j](const node_emph&)          { j["kind"] = "emph"; },
      [&j, this](const node_heading& heading)
      {
        j["kind"] = "heading";
        j["level"] = heading.level.v;
        j["contents"] = write(heading.contents);
      },
      [&j](const node_raw& raw)
      {
        j["kind"] = "raw";
        if(raw.lang.has_value())
          j["lang"] = raw.lang->get_string();
        else
          j["lang"] = nullptr;
        j["lines"] = raw.lines;
        j["block"] = raw.block;
      },
      [&j, this](const expr& e)
      {
        j["kind"] = "expr";
        j["expr"] = write(e);
      },
    }, n.data);
    return j;
  }
};

}

void to_json(nlohmann::json& j, const expr& e)
{ j = json_writer { false }.write(e); }

void to_json(nlohmann::json& j, const argument& arg)
{ j = json_writer { false }.write(arg); }

void to_json(nlohmann::json& j, const named& pair)
{ j = json_writer { false }.write(pair); }

void to_json(nlohmann::json& j, const node& n)
{ j = json_writer { false }.write(n); }

nlohmann::json dump(const tree& nodes, bool with_spans)
{ return json_writer { with_spans }.write(nodes); }

nlohmann::json dump(const spanned<expr>& e, bool with_spans)
{ return json_writer { with_spans }.spanned_value(e); }

}
