#include <reader.hpp>
#include <diagnostic_db.hpp>

#include <tsl/robin_set.h>

#include <cctype>

using namespace std::literals::string_view_literals;

namespace kestrel
{

static const auto keyword_set = tsl::robin_set<std::string_view>({
  "if"sv,
  "then"sv,
  "else"sv,
  "do"sv,
  "let"sv,
  "in"sv,
  "match"sv
});

bool is_keyword(std::string_view name)
{ return keyword_set.count(name) != 0; }

// the span of a quoted string includes its quotes
static std::string_view unquote(std::string_view str)
{ return str.substr(1, str.size() - 2); }

#define propagate(status__) do { if(auto err__ = (status__)) return *err__; } while(false)

#define unwrap(var__, res__) \
  auto var__##_res = (res__); \
  if(is_error(var__##_res)) \
    return std::get<parse_error>(std::move(var__##_res)); \
  auto var__ = std::get<0>(std::move(var__##_res))

#define advance_or_fail() do { if(auto adv__ = lex.advance(); is_error(adv__)) \
    return std::get<parse_error>(std::move(adv__)); } while(false)

location reader::here() const
{
  if(auto tok = lex.peek())
    return tok->loc;
  return lex.loc();
}

std::string reader::describe_current() const
{
  if(auto tok = lex.peek())
    return tok->to_string();
  return "EOF";
}

template<typename T>
result<std::vector<T>> reader::parse_many(maybe<T> (reader::*rule)())
{
  std::vector<T> objects;
  while(true)
  {
    auto object = (this->*rule)();
    if(is_error(object))
      return std::get<parse_error>(std::move(object));
    if(no_match(object))
      break;

    objects.push_back(std::get<T>(std::move(object)));
  }
  return objects;
}

result<identifier> reader::parse_identifier()
{
  auto tok = lex.peek();
  if(!tok)
  {
    if(!lex.started())
      return diagnostic_db::lexer::not_started(lex.loc());
    return diagnostic_db::parser::hit_eof(lex.loc(), "an identifier");
  }
  if(tok->lex.kind != token_kind::Identifier || is_keyword(tok->lex.text))
    return diagnostic_db::parser::identifier_expected(tok->loc, tok->to_string());

  advance_or_fail();
  return identifier(tok->lex.text, tok->loc);
}

// decl := id predicate* `=` callsite
maybe<decl> reader::parse_decl()
{
  auto tok = lex.peek();
  if(!tok || tok->lex.kind != token_kind::Identifier || is_keyword(tok->lex.text))
    return std::monostate {};

  identifier id(tok->lex.text, tok->loc);
  advance_or_fail();

  unwrap(predicates, parse_predicates());
  propagate(lex.chomp(lexeme::op("=")));
  unwrap(body, parse_callsite());

  return decl { id, std::move(predicates), body };
}

result<std::vector<predicate_ptr>> reader::parse_predicates()
{ return parse_many(&reader::parse_predicate); }

maybe<predicate_ptr> reader::parse_predicate()
{
  auto tok = lex.peek();
  if(!tok)
    return std::monostate {};

  switch(tok->lex.kind)
  {
  default:
    return std::monostate {};

  case token_kind::Signed:
    advance_or_fail();
    return predicate_ptr(std::make_shared<integer_predicate>(tok->loc, tok->lex.integer));

  case token_kind::QuotedString:
    advance_or_fail();
    return predicate_ptr(std::make_shared<string_predicate>(tok->loc, unquote(tok->lex.text)));

  case token_kind::Identifier:
    {
      if(is_keyword(tok->lex.text))
        return std::monostate {};

      identifier id(tok->lex.text, tok->loc);
      advance_or_fail();

      if(!std::isupper(static_cast<unsigned char>(id.name.front())))
        return predicate_ptr(std::make_shared<irrefutable>(id));

      // constructors take all predicates that follow
      unwrap(dims, parse_predicates());
      return predicate_ptr(std::make_shared<ctor_predicate>(id, std::move(dims)));
    }

  case token_kind::LParen:
    return parse_tuple_predicate();
  }
}

// `(` `)`  |  `(` p `)`  |  `(` p `,` ... `,` p `)`
maybe<predicate_ptr> reader::parse_tuple_predicate()
{
  const location loc = here();
  advance_or_fail();

  std::vector<predicate_ptr> dims;
  if(lex.peek_matches(token_kind::RParen))
  {
    advance_or_fail();
    return predicate_ptr(std::make_shared<tuple_predicate>(loc, std::move(dims)));
  }

  bool saw_comma = false;
  while(true)
  {
    auto pred = parse_predicate();
    if(is_error(pred))
      return std::get<parse_error>(std::move(pred));
    if(no_match(pred))
    {
      if(!lex.peek())
        return diagnostic_db::parser::predicate_expected_at_eof(lex.loc());
      return diagnostic_db::parser::predicate_expected(here(), describe_current());
    }
    dims.push_back(std::get<predicate_ptr>(std::move(pred)));

    if(!lex.peek_matches(token_kind::Comma))
      break;
    saw_comma = true;
    advance_or_fail();
  }
  propagate(lex.chomp(token_kind::RParen));

  // a single predicate in parentheses is just that predicate
  if(!saw_comma)
    return dims.front();
  return predicate_ptr(std::make_shared<tuple_predicate>(loc, std::move(dims)));
}

// callsite := term term*
result<expr_ptr> reader::parse_callsite()
{
  propagate(lex.skip_semicolon());

  auto function = parse_callsite_term();
  if(is_error(function))
    return std::get<parse_error>(std::move(function));
  if(no_match(function))
    return diagnostic_db::parser::missing_callsite(here());

  unwrap(arguments, parse_many(&reader::parse_callsite_term));

  auto fn = std::get<expr_ptr>(std::move(function));
  if(arguments.empty())
    return fn;
  return expr_ptr(std::make_shared<callsite>(fn, std::move(arguments)));
}

maybe<expr_ptr> reader::parse_callsite_term()
{
  auto tok = lex.peek();
  if(!tok)
    return std::monostate {};

  switch(tok->lex.kind)
  {
  default:
    return diagnostic_db::parser::not_implemented(tok->loc);

  case token_kind::Identifier:
    {
      if(tok->lex.text == "let")
      {
        advance_or_fail();
        return parse_let_expr(tok->loc);
      }
      if(tok->lex.text == "match")
      {
        advance_or_fail();
        return parse_match_expr(tok->loc);
      }
      if(is_keyword(tok->lex.text))
        return std::monostate {};

      advance_or_fail();
      return expr_ptr(std::make_shared<symbol>(identifier(tok->lex.text, tok->loc)));
    }

  case token_kind::Operator:
    {
      // the `=` of a declaration or binding ends the term sequence
      if(tok->lex.text == "=")
        return std::monostate {};

      advance_or_fail();
      return expr_ptr(std::make_shared<symbol>(identifier(tok->lex.text, tok->loc)));
    }

  case token_kind::Signed:
    advance_or_fail();
    return expr_ptr(std::make_shared<literal_integer>(tok->loc, tok->lex.integer));

  case token_kind::Float:
    advance_or_fail();
    return expr_ptr(std::make_shared<literal_float>(tok->loc, tok->lex.real));

  case token_kind::QuotedString:
    advance_or_fail();
    return expr_ptr(std::make_shared<literal_string>(tok->loc, unquote(tok->lex.text)));

  case token_kind::LParen:
    return parse_parentheses();

  case token_kind::RParen:
  case token_kind::Semicolon:
  case token_kind::Comma:
    return std::monostate {};
  }
}

// `(` `)`  |  `(` e `)`  |  `(` e `,` ... `,` e `)`
maybe<expr_ptr> reader::parse_parentheses()
{
  const location loc = here();
  advance_or_fail();

  std::vector<expr_ptr> dims;
  if(lex.peek_matches(token_kind::RParen))
  {
    advance_or_fail();
    return expr_ptr(std::make_shared<tuple_ctor>(loc, std::move(dims)));
  }

  bool saw_comma = false;
  while(true)
  {
    unwrap(dim, parse_callsite());
    dims.push_back(dim);

    if(!lex.peek_matches(token_kind::Comma))
      break;
    saw_comma = true;
    advance_or_fail();
  }
  propagate(lex.chomp(token_kind::RParen));

  if(!saw_comma)
    return dims.front();
  return expr_ptr(std::make_shared<tuple_ctor>(loc, std::move(dims)));
}

// let := `let` id `=` callsite `in` callsite
maybe<expr_ptr> reader::parse_let_expr(const location& loc)
{
  unwrap(binding, parse_identifier());
  propagate(lex.chomp(lexeme::op("=")));
  unwrap(value, parse_callsite());

  propagate(lex.skip_semicolon());
  propagate(lex.chomp(lexeme::identifier("in")));
  unwrap(body, parse_callsite());

  return expr_ptr(std::make_shared<let>(loc, binding, value, body));
}

// match := `match` callsite (predicate `=>` callsite)+
maybe<expr_ptr> reader::parse_match_expr(const location& loc)
{
  unwrap(subject, parse_callsite());
  unwrap(arms, parse_many(&reader::parse_match_arm));

  if(arms.empty())
    return diagnostic_db::parser::match_expects_arm(here(), describe_current());

  return expr_ptr(std::make_shared<match>(loc, subject, std::move(arms)));
}

maybe<pattern_expr> reader::parse_match_arm()
{
  // An arm is only committed to once its `=>` is in sight. Otherwise the
  // tokens belong to whatever follows the match, i.e. the next declaration.
  const lexer snapshot = lex;

  propagate(lex.skip_semicolon());

  // a declaration head never fails as a predicate, so errors are real
  auto pred = parse_predicate();
  if(is_error(pred))
    return std::get<parse_error>(std::move(pred));
  if(no_match(pred) || !lex.peek_matches(lexeme::op("=>")))
  {
    lex = snapshot;
    return std::monostate {};
  }
  advance_or_fail();

  unwrap(body, parse_callsite());
  return pattern_expr { std::get<predicate_ptr>(std::move(pred)), body };
}

template<>
result<std::vector<token>> reader::read<token>(std::string_view module, std::string_view text)
{
  lexer lex(module, text);

  std::vector<token> tokens;
  while(true)
  {
    advance_or_fail();
    if(lex.at_eof())
      break;

    tokens.push_back(*lex.peek());
  }
  return tokens;
}

template<>
result<std::vector<decl>> reader::read<decl>(std::string_view module, std::string_view text)
{
  reader r(module, text);
  auto& lex = r.lex;

  advance_or_fail();

  std::vector<decl> decls;
  while(true)
  {
    propagate(lex.skip_semicolon());
    if(lex.at_eof())
      break;

    auto d = r.parse_decl();
    if(is_error(d))
      return std::get<parse_error>(std::move(d));
    if(no_match(d))
      return diagnostic_db::parser::declaration_expected(r.here(), r.describe_current());

    decls.push_back(std::get<decl>(std::move(d)));
  }
  return decls;
}

#undef propagate
#undef unwrap
#undef advance_or_fail

}
