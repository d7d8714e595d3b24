#include <lexer.hpp>
#include <diagnostic_db.hpp>

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <string>

namespace kestrel
{

char opener_of(nesting_kind kind)
{
  switch(kind)
  {
  default:
  case nesting_kind::Paren: return '(';
  case nesting_kind::Square: return '[';
  case nesting_kind::Curly: return '{';
  }
}

char closer_of(nesting_kind kind)
{
  switch(kind)
  {
  default:
  case nesting_kind::Paren: return ')';
  case nesting_kind::Square: return ']';
  case nesting_kind::Curly: return '}';
  }
}

static bool is_blank(unsigned char c)
{ return c != '\n' && std::isspace(c); }

static bool is_digit(unsigned char c)
{ return '0' <= c && c <= '9'; }

// any byte of a multibyte utf-8 sequence is accepted so that identifiers may be unicode
static bool is_identifier_start(unsigned char c)
{ return c == '_' || std::isalpha(c) || c >= 0x80; }

static bool is_identifier_char(unsigned char c)
{ return is_identifier_start(c) || is_digit(c); }

static bool is_operator_char(unsigned char c)
{
  switch(c)
  {
  case '.': case '=': case '>': case '<': case '-': case '+': case '!': case '@': case ':':
  case '$': case '%': case '^': case '&': case '*': case '/': case '?': case '~':
    return true;
  default:
    return false;
  }
}

lexer::lexer(std::string_view filename, std::string_view contents)
  : contents(contents), cur(filename, 1, 0), arena(std::make_shared<nesting_arena>())
{  }

std::optional<token> lexer::peek() const
{
  if(state != lexer_state::Read)
    return std::nullopt;
  return current;
}

bool lexer::peek_matches(const lexeme& lex) const
{ return state == lexer_state::Read && current.lex == lex; }

result<location> lexer::advance()
{
  if(state == lexer_state::EndOfFile)
    return cur;

  auto next = gett();
  if(auto* err = std::get_if<parse_error>(&next))
    return *err;

  if(no_match(next))
  {
    state = lexer_state::EndOfFile;
    current = token();
    return cur;
  }
  state = lexer_state::Read;
  current = std::get<token>(next);
  return current.loc;
}

status lexer::chomp(const lexeme& expected)
{
  switch(state)
  {
  case lexer_state::Started:
    return diagnostic_db::lexer::not_started(cur);
  case lexer_state::EndOfFile:
    return diagnostic_db::parser::hit_eof(cur, expected.to_string());
  case lexer_state::Read:
    break;
  }
  if(current.lex != expected)
    return diagnostic_db::parser::unexpected_token(current.loc, current.to_string(), expected.to_string());

  if(auto next = advance(); is_error(next))
    return std::get<parse_error>(next);
  return std::nullopt;
}

status lexer::skip_semicolon()
{
  while(peek_matches(token_kind::Semicolon))
  {
    if(auto next = advance(); is_error(next))
      return std::get<parse_error>(next);
  }
  return std::nullopt;
}

void lexer::consume(std::size_t n)
{
  for(unsigned char c : contents.substr(0, n))
  {
    if(c == '\n')
    {
      cur.line++;
      cur.column = 0;
    }
    // continuation bytes of utf-8 sequences don't start a new column
    else if((c & 0xC0) != 0x80)
      cur.column++;
  }
  contents.remove_prefix(n);
}

void lexer::skip_blanks()
{
  std::size_t n = 0;
  while(n < contents.size() && is_blank(contents[n]))
    n++;
  consume(n);
}

void lexer::push_nesting(const location& at, nesting_kind kind)
{ nesting = arena->push(at, kind, nesting); }

status lexer::pop_nesting(const location& at, nesting_kind kind)
{
  if(nesting == no_nesting)
    return diagnostic_db::lexer::unmatched_closer(at, closer_of(kind));

  const auto& frame = (*arena)[nesting];
  if(frame.kind != kind)
    return diagnostic_db::lexer::mismatched_closer(at, closer_of(kind), opener_of(frame.kind), frame.opened_at.to_string());

  nesting = frame.parent;
  return std::nullopt;
}

token lexer::lex_while(const location& beg, token_kind kind, bool(*pred)(unsigned char))
{
  std::size_t n = 0;
  while(n < contents.size() && pred(contents[n]))
    n++;

  auto text = contents.substr(0, n);
  consume(n);
  return token(beg, lexeme(kind, text));
}

maybe<token> lexer::lex_number(const location& beg)
{
  std::size_t n = 0;
  if(contents[n] == '-')
    n++;
  while(n < contents.size() && is_digit(contents[n]))
    n++;

  // `1.5` is a float, `1.` or `1.x` remain a number followed by an operator
  bool is_float = false;
  if(n + 1 < contents.size() && contents[n] == '.' && is_digit(contents[n + 1]))
  {
    is_float = true;
    n++;
    while(n < contents.size() && is_digit(contents[n]))
      n++;
  }
  auto text = contents.substr(0, n);

  if(is_float)
  {
    std::string buf(text);

    errno = 0;
    double value = std::strtod(buf.c_str(), nullptr);
    if(errno == ERANGE)
      return diagnostic_db::lexer::float_out_of_range(beg, text);

    consume(n);
    return token(beg, lexeme::float_number(value, text));
  }

  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if(ec == std::errc::result_out_of_range)
    return diagnostic_db::lexer::integer_overflow(beg, text);
  if(ec != std::errc() || ptr != text.data() + text.size())
    return diagnostic_db::lexer::unknown_token(beg, text);

  consume(n);
  return token(beg, lexeme::signed_number(value, text));
}

maybe<token> lexer::lex_string(const location& beg)
{
  // no escape sequences, the literal ends at the next quote
  auto end = contents.find('"', 1);
  if(end == std::string_view::npos)
    return diagnostic_db::lexer::unterminated_string(beg);

  auto text = contents.substr(0, end + 1);
  consume(end + 1);
  return token(beg, lexeme::quoted_string(text));
}

///// Tokenization

maybe<token> lexer::gett()
{
restart_get:
  skip_blanks();
  if(contents.empty())
    return std::monostate {};

  const location beg = cur;
  const unsigned char ch = contents.front();

  auto single = [this, &beg](token_kind kind) {
    auto text = contents.substr(0, 1);
    consume(1);
    return token(beg, lexeme(kind, text));
  };

  switch(ch)
  {
  default:
    if(is_identifier_start(ch))
      return lex_while(beg, token_kind::Identifier, is_identifier_char);
    if(is_operator_char(ch))
      return lex_while(beg, token_kind::Operator, is_operator_char);

    return diagnostic_db::lexer::unknown_token(beg, contents.substr(0, 1));

  case '\n':
    // newlines only separate statements outside of brackets
    if(nesting != no_nesting)
    {
      consume(1);
      goto restart_get;
    }
    return single(token_kind::Semicolon);

  case '0': case '1': case '2': case '3': case '4':
  case '5': case '6': case '7': case '8': case '9':
    return lex_number(beg);

  case '-':
    if(contents.size() > 1 && is_digit(contents[1]))
      return lex_number(beg);
    return lex_while(beg, token_kind::Operator, is_operator_char);

  case '"':
    return lex_string(beg);

  case '(':
    push_nesting(beg, nesting_kind::Paren);
    return single(token_kind::LParen);
  case '[':
    push_nesting(beg, nesting_kind::Square);
    return single(token_kind::LSquare);
  case '{':
    push_nesting(beg, nesting_kind::Curly);
    return single(token_kind::LCurly);

  case ')':
    if(auto err = pop_nesting(beg, nesting_kind::Paren))
      return *err;
    return single(token_kind::RParen);
  case ']':
    if(auto err = pop_nesting(beg, nesting_kind::Square))
      return *err;
    return single(token_kind::RSquare);
  case '}':
    if(auto err = pop_nesting(beg, nesting_kind::Curly))
      return *err;
    return single(token_kind::RCurly);

  case ';':
    return single(token_kind::Semicolon);
  case ',':
    return single(token_kind::Comma);
  }
}

}
