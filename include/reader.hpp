#pragma once

#include <source_location.hpp>
#include <parse_error.hpp>
#include <lexer.hpp>
#include <token.hpp>
#include <ast.hpp>

#include <string_view>
#include <string>
#include <vector>

namespace kestrel
{

// `if`, `then`, `else`, `do`, `let`, `in` and `match`
bool is_keyword(std::string_view name);

// Recursive descent over the token stream of one module.
//
//  decl      := id predicate* `=` callsite
//  predicate := int | string | id | Ctor predicate* | `(` [predicate (`,` predicate)*] `)`
//  callsite  := term term*
//  term      := id | op | literal | `(` [callsite (`,` callsite)*] `)` | let | match
//  let       := `let` id `=` callsite `in` callsite
//  match     := `match` callsite (predicate `=>` callsite)+
class reader
{
public:
  template<typename T>
  static result<std::vector<T>> read(std::string_view module, std::string_view text)
  { static_assert(sizeof(T) == 0, "unimplemented"); return {}; }
private:
  reader(std::string_view module, std::string_view text)
    : lex(module, text)
  {  }

  maybe<decl> parse_decl();

  maybe<predicate_ptr> parse_predicate();
  result<std::vector<predicate_ptr>> parse_predicates();
  maybe<predicate_ptr> parse_tuple_predicate();

  result<expr_ptr> parse_callsite();
  maybe<expr_ptr> parse_callsite_term();
  maybe<expr_ptr> parse_parentheses();
  maybe<expr_ptr> parse_let_expr(const location& loc);
  maybe<expr_ptr> parse_match_expr(const location& loc);
  maybe<pattern_expr> parse_match_arm();

  result<identifier> parse_identifier();

  template<typename T>
  result<std::vector<T>> parse_many(maybe<T> (reader::*rule)());

  // where the buffered token starts, or the cursor if there is none
  location here() const;
  std::string describe_current() const;
private:
  lexer lex;
};

template<>
result<std::vector<token>> reader::read<token>(std::string_view module, std::string_view text);

template<>
result<std::vector<decl>> reader::read<decl>(std::string_view module, std::string_view text);

}
