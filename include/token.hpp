#pragma once

#include <source_location.hpp>

#include <string_view>
#include <cstdint>
#include <string>

namespace kestrel
{

enum class token_kind : std::int8_t
{
  Undef = 0,
  Signed = 1,
  Float = 2,
  Identifier = 3,
  QuotedString = 4,
  Operator = 5,
  LParen = '(',
  RParen = ')',
  LSquare = '[',
  RSquare = ']',
  LCurly = '{',
  RCurly = '}',
  Semicolon = ';',
  Comma = ',',
};

std::string_view kind_to_str(token_kind kind);

// The classified content of one token.
// `text` is the span inside of the module the lexeme was read from. Lexemes
// built by hand (i.e. to compare against) may leave it empty for the kinds
// that don't carry text.
struct lexeme
{
  lexeme() = default;
  lexeme(token_kind kind) : kind(kind) {}
  lexeme(token_kind kind, std::string_view text) : kind(kind), text(text) {}

  static lexeme signed_number(std::int64_t value, std::string_view text = {});
  static lexeme float_number(double value, std::string_view text = {});
  static lexeme identifier(std::string_view name) { return { token_kind::Identifier, name }; }
  static lexeme quoted_string(std::string_view str) { return { token_kind::QuotedString, str }; }
  static lexeme op(std::string_view name) { return { token_kind::Operator, name }; }

  // renders the lexeme like `Identifier("x")` or `Signed(42)`
  std::string to_string() const;

  token_kind kind { token_kind::Undef };
  std::string_view text;

  std::int64_t integer { 0 };
  double real { 0.0 };
};

// identifiers, operators and strings compare by text, numbers by value
bool operator==(const lexeme& lhs, const lexeme& rhs);
bool operator!=(const lexeme& lhs, const lexeme& rhs);

struct token
{
  token() = default;
  token(location loc, lexeme lex)
    : loc(loc), lex(lex)
  {  }

  std::string to_string() const { return lex.to_string(); }

  location loc;
  lexeme lex;
};

bool operator==(const token& lhs, const token& rhs);

}
