#include <ast.hpp>

#include <fmt/format.h>

#include <sstream>

namespace kestrel
{

template<typename Container>
static void print_each(std::ostream& os, const Container& c)
{
  for(auto& x : c)
  {
    os << " ";
    print(os, x);
  }
}

void print(std::ostream& os, const predicate_ptr& pred)
{
  if(pred == nullptr)
  {
    os << "NULL";
    return;
  }
  switch(pred->kind)
  {
  case PredicateKind::irrefutable:
    os << std::static_pointer_cast<irrefutable>(pred)->id.name;
    break;
  case PredicateKind::integer:
    os << std::static_pointer_cast<integer_predicate>(pred)->value;
    break;
  case PredicateKind::string:
    os << "\"" << std::static_pointer_cast<string_predicate>(pred)->value << "\"";
    break;
  case PredicateKind::ctor: {
      ctor_predicate::ptr ct = std::static_pointer_cast<ctor_predicate>(pred);
      if(ct->dims.empty())
      {
        os << ct->ctor_id.name;
        break;
      }
      os << "(" << ct->ctor_id.name;
      print_each(os, ct->dims);
      os << ")";
    } break;
  case PredicateKind::tuple: {
      tuple_predicate::ptr tup = std::static_pointer_cast<tuple_predicate>(pred);
      if(tup->dims.empty())
      {
        os << "()";
        break;
      }
      os << "(tuple";
      print_each(os, tup->dims);
      os << ")";
    } break;
  }
}

void print(std::ostream& os, const expr_ptr& expr)
{
  if(expr == nullptr)
  {
    os << "NULL";
    return;
  }
  switch(expr->kind)
  {
  case ExprKind::lambda: {
      lambda::ptr lam = std::static_pointer_cast<lambda>(expr);
      os << "(lambda [";
      for(auto it = lam->param_names.begin(); it != lam->param_names.end(); ++it)
      {
        if(it != lam->param_names.begin())
          os << " ";
        os << it->name;
      }
      os << "] ";
      print(os, lam->body);
      os << ")";
    } break;
  case ExprKind::let: {
      let::ptr l = std::static_pointer_cast<let>(expr);
      os << "(let " << l->binding.name << " ";
      print(os, l->value);
      os << " ";
      print(os, l->body);
      os << ")";
    } break;
  case ExprKind::literal_integer:
    os << std::static_pointer_cast<literal_integer>(expr)->value;
    break;
  case ExprKind::literal_float:
    os << fmt::format("{}", std::static_pointer_cast<literal_float>(expr)->value);
    break;
  case ExprKind::literal_string:
    os << "\"" << std::static_pointer_cast<literal_string>(expr)->value << "\"";
    break;
  case ExprKind::symbol:
    os << std::static_pointer_cast<symbol>(expr)->id.name;
    break;
  case ExprKind::match: {
      match::ptr m = std::static_pointer_cast<match>(expr);
      os << "(match ";
      print(os, m->subject);
      for(auto& arm : m->pattern_exprs)
      {
        os << " (";
        print(os, arm.predicate);
        os << " => ";
        print(os, arm.expr);
        os << ")";
      }
      os << ")";
    } break;
  case ExprKind::callsite: {
      callsite::ptr call = std::static_pointer_cast<callsite>(expr);
      os << "(";
      print(os, call->function);
      print_each(os, call->arguments);
      os << ")";
    } break;
  case ExprKind::tuple_ctor: {
      tuple_ctor::ptr tup = std::static_pointer_cast<tuple_ctor>(expr);
      if(tup->dims.empty())
      {
        os << "()";
        break;
      }
      os << "(tuple";
      print_each(os, tup->dims);
      os << ")";
    } break;
  }
}

void print(std::ostream& os, const decl& d)
{
  os << "(decl " << d.id.name << " [";
  for(auto it = d.predicates.begin(); it != d.predicates.end(); ++it)
  {
    if(it != d.predicates.begin())
      os << " ";
    print(os, *it);
  }
  os << "] ";
  print(os, d.body);
  os << ")";
}

std::string to_string(const predicate_ptr& pred)
{
  std::stringstream ss;
  print(ss, pred);
  return ss.str();
}

std::string to_string(const expr_ptr& expr)
{
  std::stringstream ss;
  print(ss, expr);
  return ss.str();
}

std::string to_string(const decl& d)
{
  std::stringstream ss;
  print(ss, d);
  return ss.str();
}

}
