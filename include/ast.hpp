#pragma once

#include <source_location.hpp>
#include <ast_nodes.hpp>

#include <string_view>
#include <cstdint>
#include <ostream>
#include <memory>
#include <string>
#include <vector>

namespace kestrel
{

struct identifier
{
  identifier() = default;
  identifier(std::string_view name, location loc)
    : name(name), loc(loc)
  {  }

  std::string_view name;
  location loc;
};

/// Predicates

struct predicate_base
{
  predicate_base(PredicateKind kind, location loc) : kind(kind), loc(loc) {}

  PredicateKind kind;
  location loc;
};
using predicate_ptr = std::shared_ptr<predicate_base>;

// binds its subject to a name
struct irrefutable : predicate_base
{
  using ptr = std::shared_ptr<irrefutable>;

  irrefutable(identifier id)
    : predicate_base(PredicateKind::irrefutable, id.loc), id(id)
  {  }

  identifier id;
};

struct integer_predicate : predicate_base
{
  using ptr = std::shared_ptr<integer_predicate>;

  integer_predicate(location loc, std::int64_t value)
    : predicate_base(PredicateKind::integer, loc), value(value)
  {  }

  std::int64_t value;
};

struct string_predicate : predicate_base
{
  using ptr = std::shared_ptr<string_predicate>;

  string_predicate(location loc, std::string_view value)
    : predicate_base(PredicateKind::string, loc), value(value)
  {  }

  std::string_view value;
};

// `Ctor p1 ... pn`, constructors start with an uppercase letter
struct ctor_predicate : predicate_base
{
  using ptr = std::shared_ptr<ctor_predicate>;

  ctor_predicate(identifier ctor_id, std::vector<predicate_ptr> dims)
    : predicate_base(PredicateKind::ctor, ctor_id.loc), ctor_id(ctor_id), dims(std::move(dims))
  {  }

  identifier ctor_id;
  std::vector<predicate_ptr> dims;
};

struct tuple_predicate : predicate_base
{
  using ptr = std::shared_ptr<tuple_predicate>;

  tuple_predicate(location loc, std::vector<predicate_ptr> dims)
    : predicate_base(PredicateKind::tuple, loc), dims(std::move(dims))
  {  }

  std::vector<predicate_ptr> dims;
};

/// Expressions

struct expr_base
{
  expr_base(ExprKind kind, location loc) : kind(kind), loc(loc) {}

  ExprKind kind;
  location loc;
};
using expr_ptr = std::shared_ptr<expr_base>;

struct lambda : expr_base
{
  using ptr = std::shared_ptr<lambda>;

  lambda(location loc, std::vector<identifier> param_names, expr_ptr body)
    : expr_base(ExprKind::lambda, loc), param_names(std::move(param_names)), body(body)
  {  }

  std::vector<identifier> param_names;
  expr_ptr body;
};

struct let : expr_base
{
  using ptr = std::shared_ptr<let>;

  let(location loc, identifier binding, expr_ptr value, expr_ptr body)
    : expr_base(ExprKind::let, loc), binding(binding), value(value), body(body)
  {  }

  identifier binding;
  expr_ptr value;
  expr_ptr body;
};

struct literal_integer : expr_base
{
  using ptr = std::shared_ptr<literal_integer>;

  literal_integer(location loc, std::int64_t value)
    : expr_base(ExprKind::literal_integer, loc), value(value)
  {  }

  std::int64_t value;
};

struct literal_float : expr_base
{
  using ptr = std::shared_ptr<literal_float>;

  literal_float(location loc, double value)
    : expr_base(ExprKind::literal_float, loc), value(value)
  {  }

  double value;
};

struct literal_string : expr_base
{
  using ptr = std::shared_ptr<literal_string>;

  literal_string(location loc, std::string_view value)
    : expr_base(ExprKind::literal_string, loc), value(value)
  {  }

  std::string_view value;
};

// reference to a name, operators included
struct symbol : expr_base
{
  using ptr = std::shared_ptr<symbol>;

  symbol(identifier id)
    : expr_base(ExprKind::symbol, id.loc), id(id)
  {  }

  identifier id;
};

struct pattern_expr
{
  predicate_ptr predicate;
  expr_ptr expr;
};

struct match : expr_base
{
  using ptr = std::shared_ptr<match>;

  match(location loc, expr_ptr subject, std::vector<pattern_expr> pattern_exprs)
    : expr_base(ExprKind::match, loc), subject(subject), pattern_exprs(std::move(pattern_exprs))
  {  }

  expr_ptr subject;
  std::vector<pattern_expr> pattern_exprs;
};

// located where its function is
struct callsite : expr_base
{
  using ptr = std::shared_ptr<callsite>;

  callsite(expr_ptr function, std::vector<expr_ptr> arguments)
    : expr_base(ExprKind::callsite, function->loc), function(function), arguments(std::move(arguments))
  {  }

  expr_ptr function;
  std::vector<expr_ptr> arguments;
};

struct tuple_ctor : expr_base
{
  using ptr = std::shared_ptr<tuple_ctor>;

  tuple_ctor(location loc, std::vector<expr_ptr> dims)
    : expr_base(ExprKind::tuple_ctor, loc), dims(std::move(dims))
  {  }

  std::vector<expr_ptr> dims;
};

/// Declarations

struct decl
{
  const location& loc() const { return id.loc; }

  identifier id;
  std::vector<predicate_ptr> predicates;
  expr_ptr body;
};

// Canonical s-expression rendering, see `ast-print`
void print(std::ostream& os, const predicate_ptr& pred);
void print(std::ostream& os, const expr_ptr& expr);
void print(std::ostream& os, const decl& d);

std::string to_string(const predicate_ptr& pred);
std::string to_string(const expr_ptr& expr);
std::string to_string(const decl& d);

}
