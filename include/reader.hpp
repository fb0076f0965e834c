#pragma once

#include <source_range.hpp>
#include <builder.hpp>
#include <symbol.hpp>
#include <ast.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <optional>
#include <variant>
#include <string>

// A module holds either markup or a single expression.
using document = std::variant<syntax::tree, spanned<syntax::expr>>;

// Reads syntax trees from their JSON interchange form.
// Problems are reported to `diagnostic`; reading continues after the first one
// so that all of them get reported, but then no document is returned.
class ast_reader
{
public:
  static std::optional<document> read(std::string_view module);
  static std::optional<document> read_json(const nlohmann::json& doc, symbol module);
private:
  ast_reader(symbol module, std::size_t max_depth);

  syntax::tree read_tree(const nlohmann::json& j, const std::string& path, std::size_t depth);
  spanned<syntax::node> read_node(const nlohmann::json& j, const std::string& path, std::size_t depth);
  spanned<syntax::expr> read_expr(const nlohmann::json& j, const std::string& path, std::size_t depth);
  syntax::argument read_argument(const nlohmann::json& j, const std::string& path, std::size_t depth);
  syntax::named read_named(const nlohmann::json& j, const std::string& path, std::size_t depth);

  // sets the builder to the span of `j`, or to the module if there is none
  bool enter(const nlohmann::json& j, const std::string& path, std::size_t depth);

  const nlohmann::json* field(const nlohmann::json& j, const char* name, const std::string& path);
  std::optional<std::string> string_field(const nlohmann::json& j, const char* name, const std::string& path);
  syntax::ident ident_field(const nlohmann::json& j, const char* name, const std::string& path);
  std::optional<double> number_field(const nlohmann::json& j, const char* name, const std::string& path);

  void report(const nlohmann::json& msg);
  source_range here() const;
private:
  symbol module;
  std::size_t max_depth;
  bool failed { false };

  syntax::builder b;
};

// letter or '_' first, then letters, digits, '_' and '-'
bool is_identifier(std::string_view str);
