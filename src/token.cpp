#include <token.hpp>

#include <fmt/format.h>

namespace kestrel
{

std::string_view kind_to_str(token_kind kind)
{
  switch(kind)
  {
  default:
  case token_kind::Undef: return "Undefined";
  case token_kind::Signed: return "Signed";
  case token_kind::Float: return "Float";
  case token_kind::Identifier: return "Identifier";
  case token_kind::QuotedString: return "QuotedString";
  case token_kind::Operator: return "Operator";
  case token_kind::LParen: return "LParen";
  case token_kind::RParen: return "RParen";
  case token_kind::LSquare: return "LSquare";
  case token_kind::RSquare: return "RSquare";
  case token_kind::LCurly: return "LCurly";
  case token_kind::RCurly: return "RCurly";
  case token_kind::Semicolon: return "Semicolon";
  case token_kind::Comma: return "Comma";
  }
}

lexeme lexeme::signed_number(std::int64_t value, std::string_view text)
{
  lexeme lex(token_kind::Signed, text);
  lex.integer = value;
  return lex;
}

lexeme lexeme::float_number(double value, std::string_view text)
{
  lexeme lex(token_kind::Float, text);
  lex.real = value;
  return lex;
}

std::string lexeme::to_string() const
{
  switch(kind)
  {
  case token_kind::Signed:
    return fmt::format("Signed({})", integer);
  case token_kind::Float:
    return fmt::format("Float({})", real);
  case token_kind::Identifier:
  case token_kind::Operator:
    return fmt::format("{}(\"{}\")", kind_to_str(kind), text);
  case token_kind::QuotedString:
    // the span already carries its quotes
    return fmt::format("QuotedString({})", text);
  default:
    return std::string(kind_to_str(kind));
  }
}

bool operator==(const lexeme& lhs, const lexeme& rhs)
{
  if(lhs.kind != rhs.kind)
    return false;

  switch(lhs.kind)
  {
  case token_kind::Signed: return lhs.integer == rhs.integer;
  case token_kind::Float: return lhs.real == rhs.real;
  case token_kind::Identifier:
  case token_kind::QuotedString:
  case token_kind::Operator: return lhs.text == rhs.text;
  default: return true;
  }
}

bool operator!=(const lexeme& lhs, const lexeme& rhs)
{ return !(lhs == rhs); }

bool operator==(const token& lhs, const token& rhs)
{ return lhs.loc == rhs.loc && lhs.lex == rhs.lex; }

}
