#include <ast.hpp>

namespace syntax
{

bool operator==(const expr_none&, const expr_none&)
{ return true; }

bool operator==(const expr_length& a, const expr_length& b)
{ return a.value == b.value && a.unit == b.unit; }

bool operator==(const expr_percent& a, const expr_percent& b)
{ return a.value == b.value; }

bool operator==(const expr_str& a, const expr_str& b)
{ return a.value == b.value; }

bool operator==(const expr_call& a, const expr_call& b)
{ return a.name == b.name && a.args == b.args; }

bool operator==(const expr_unary& a, const expr_unary& b)
{ return a.op == b.op && a.operand == b.operand; }

bool operator==(const expr_binary& a, const expr_binary& b)
{ return a.lhs == b.lhs && a.op == b.op && a.rhs == b.rhs; }

bool operator==(const expr_array& a, const expr_array& b)
{ return a.items == b.items; }

bool operator==(const expr_dict& a, const expr_dict& b)
{ return a.items == b.items; }

bool operator==(const expr_content& a, const expr_content& b)
{ return a.nodes == b.nodes; }

bool operator==(const expr& a, const expr& b)
{ return a.data == b.data; }

bool operator==(const named& a, const named& b)
{ return a.name == b.name && a.value == b.value; }

bool operator==(const argument& a, const argument& b)
{ return a.data == b.data; }


bool operator==(const node_text& a, const node_text& b)
{ return a.text == b.text; }

bool operator==(const node_space&, const node_space&)
{ return true; }

bool operator==(const node_linebreak&, const node_linebreak&)
{ return true; }

bool operator==(const node_parbreak&, const node_parbreak&)
{ return true; }

bool operator==(const node_strong&, const node_strong&)
{ return true; }

bool operator==(const node_emph&, const node_emph&)
{ return true; }

bool operator==(const node_heading& a, const node_heading& b)
{ return a.level == b.level && a.contents == b.contents; }

bool operator==(const node_raw& a, const node_raw& b)
{ return a.lang == b.lang && a.lines == b.lines && a.block == b.block; }

bool operator==(const node& a, const node& b)
{ return a.data == b.data; }

}
