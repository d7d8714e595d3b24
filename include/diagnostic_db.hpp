#pragma once

#include <source_location.hpp>
#include <parse_error.hpp>

#include <fmt/format.h>

namespace kestrel
{

namespace diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const location& loc) \
{ return parse_error::lv(loc, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const location& loc, auto t) \
{ return parse_error::lv(loc, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, txt) static const auto name = [](const location& loc, auto t1, auto t2) \
{ return parse_error::lv(loc, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

#define db_entry_arg3(lv, name, txt) static const auto name = [](const location& loc, auto t1, auto t2, auto t3) \
{ return parse_error::lv(loc, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2, t3)); }

namespace args
{

db_entry_arg(error, unknown_arg, "Unknown command line argument \"{}\".");
db_entry(error, emit_not_present, "Selected emit class is unknown!");
db_entry(error, num_cores_too_small, "Number of cores smaller than one.");
db_entry(warn, num_cores_too_large, "Number of cores bigger than the number of concurrent threads supported by the implementation.");
db_entry_arg(error, num_cores_not_a_number, "\"{}\" is not a number of cores.");
db_entry_arg(error, cannot_open_file, "Can not open \"{}\".");

}

namespace lexer
{

db_entry_arg(error, unknown_token, "Can not tokenize \"{}\".");
db_entry_arg(error, integer_overflow, "Literal number \"{}\" does not fit into a signed 64 bit integer.");
db_entry_arg(error, float_out_of_range, "Literal number \"{}\" is out of range.");
db_entry(error, unterminated_string, "String literal is missing its closing '\"'.");
db_entry_arg(error, unmatched_closer, "Found \"{}\" without an open bracket to close.");
db_entry_arg3(error, mismatched_closer, "Found \"{}\" but \"{}\" opened at {} is still open.");
db_entry(error, not_started, "lexer was not started");

}

namespace parser
{

db_entry_arg(error, hit_eof, "hit EOF but expected {}");
db_entry_arg2(error, unexpected_token, "unexpected token ({}) found. expected {}");
db_entry(error, not_implemented, "parsing this is not implemented");
db_entry(error, missing_callsite, "missing function callsite expression");
db_entry_arg(error, identifier_expected, "Expected identifier, instead got \"{}\".");
db_entry_arg(error, predicate_expected, "Expected a predicate, instead got \"{}\".");
db_entry(error, predicate_expected_at_eof, "Expected a predicate, instead hit EOF.");
db_entry_arg(error, match_expects_arm, "Match expression expects at least one arm, instead got \"{}\".");
db_entry_arg(error, declaration_expected, "Expected a declaration, instead got \"{}\".");

}

namespace driver
{

db_entry_arg2(info, found_declaration, "found declaration of \"{}\" with {} parameter(s)");

}

#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2
#undef db_entry_arg3

}

}
