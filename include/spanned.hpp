#pragma once

#include <source_range.hpp>

#include <vector>

// A value paired with the source range it was read from.
// Only the payload takes part in comparisons.
template<typename T>
struct spanned
{
  T v;
  source_range span;

  bool operator==(const spanned& other) const
  { return v == other.v; }
  bool operator!=(const spanned& other) const
  { return !(v == other.v); }
};

template<typename T>
using span_vec = std::vector<spanned<T>>;
