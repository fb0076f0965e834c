#pragma once

#include <diagnostic.hpp>
#include <symbol.hpp>

#include <fmt/format.h>

namespace diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, txt) static const auto name = [](const source_range& range, auto t1, auto t2) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

#define db_entry_arg3(lv, name, txt) static const auto name = [](const source_range& range, auto t1, auto t2, auto t3) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2, t3)); }

namespace args
{

db_entry_arg(error, unknown_arg, "Unknown command line argument \"{}\".");
db_entry(error, emit_not_present, "Selected emit class is unknown!");
db_entry(error, num_cores_too_small, "Number of cores smaller than one.");
db_entry(warn, num_cores_too_large, "Number of cores bigger than the number of concurrent threads supported by the implementation.");
db_entry_arg(error, not_a_number, "\"{}\" is not a number.");
db_entry(error, max_depth_too_small, "Maximum nesting depth must be at least one.");
db_entry_arg(error, missing_value, "Command line option \"{}\" expects a value.");

}

namespace loader
{

db_entry_arg(error, cannot_open, "Can not open module \"{}\".");
db_entry_arg(error, invalid_json, "Module is not valid JSON: {}");
db_entry_arg(error, expected_object, "Expected an object at \"{}\".");
db_entry_arg(error, expected_array, "Expected an array at \"{}\".");
db_entry_arg2(error, expected_document, "Document must be an array of nodes or an expression object, instead got {} at \"{}\".");
db_entry_arg2(error, missing_field, "Missing field \"{}\" at \"{}\".");
db_entry_arg3(error, wrong_field_type, "Field \"{}\" at \"{}\" must be {}.");
db_entry_arg2(error, unknown_expr_kind, "Unknown expression kind \"{}\" at \"{}\".");
db_entry_arg2(error, unknown_node_kind, "Unknown node kind \"{}\" at \"{}\".");
db_entry_arg2(error, invalid_identifier, "\"{}\" is not a valid identifier at \"{}\".");
db_entry_arg2(error, invalid_color, "\"{}\" is not a valid color literal at \"{}\".");
db_entry_arg2(error, unknown_unit, "Unknown length unit \"{}\" at \"{}\".");
db_entry_arg2(error, unknown_operator, "Unknown operator \"{}\" at \"{}\".");
db_entry_arg2(error, heading_level_out_of_range, "Heading level {} at \"{}\" is out of range.");
db_entry_arg(error, bad_span, "Malformed span at \"{}\".");
db_entry_arg2(error, nesting_too_deep, "Nesting deeper than {} levels at \"{}\".");
db_entry_arg(warn, duplicate_key, "Dictionary key \"{}\" appears more than once.");

}

}
