#pragma once

#include <cstdint>

namespace kestrel
{

enum class PredicateKind : std::int_fast8_t
{
  irrefutable,
  integer,
  string,
  ctor,
  tuple,
};

enum class ExprKind : std::int_fast8_t
{
  lambda,
  let,
  literal_integer,
  literal_float,
  literal_string,
  symbol,
  match,
  callsite,
  tuple_ctor,
};

}
