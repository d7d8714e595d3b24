#pragma once

#include <source_location.hpp>
#include <parse_error.hpp>
#include <nesting.hpp>
#include <token.hpp>

#include <string_view>
#include <optional>
#include <memory>

namespace kestrel
{

enum class lexer_state : std::int_fast8_t
{
  Started,
  Read,
  EndOfFile,
};

// Pull based scanner over one module. `current` buffers one token of
// lookahead, `advance` replaces it with the next one.
//
// Copies are cheap and share the nesting arena, so the parser can take a
// snapshot, try a rule and assign the snapshot back if the attempt is
// thrown away.
class lexer
{
public:
  lexer(std::string_view filename, std::string_view contents);

  // nullopt before the first advance and at the end of input
  std::optional<token> peek() const;
  bool peek_matches(const lexeme& lex) const;

  // Scans the next token. Yields its start location, or the location
  // reached if the input is exhausted. Advancing past the end is a no-op.
  result<location> advance();

  // advances if the buffered token equals `expected`, fails otherwise
  status chomp(const lexeme& expected);

  status skip_semicolon();

  const location& loc() const { return cur; }
  bool at_eof() const { return state == lexer_state::EndOfFile; }
  bool started() const { return state != lexer_state::Started; }

  std::size_t nesting_depth() const { return arena->depth(nesting); }
private:
  maybe<token> gett();

  void skip_blanks();
  void consume(std::size_t n);

  maybe<token> lex_number(const location& beg);
  maybe<token> lex_string(const location& beg);
  token lex_while(const location& beg, token_kind kind, bool(*pred)(unsigned char));

  void push_nesting(const location& at, nesting_kind kind);
  status pop_nesting(const location& at, nesting_kind kind);
private:
  std::string_view contents;
  location cur;

  std::shared_ptr<nesting_arena> arena;
  nesting_ref nesting { no_nesting };

  lexer_state state { lexer_state::Started };
  token current;
};

}
