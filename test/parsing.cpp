#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <reader.hpp>
#include <ast.hpp>

#include <string>
#include <vector>

using namespace kestrel;

static std::vector<decl> parse(std::string_view text)
{
  auto w = reader::read<decl>("test", text);
  if(is_error(w))
    FAIL(std::get<parse_error>(w).to_string());
  return std::get<std::vector<decl>>(w);
}

static std::vector<std::string> parse_printed(std::string_view text)
{
  std::vector<std::string> printed;
  for(auto& d : parse(text))
    printed.push_back(to_string(d));
  return printed;
}

static parse_error parse_failure(std::string_view text)
{
  auto w = reader::read<decl>("test", text);
  REQUIRE(is_error(w));
  return std::get<parse_error>(w);
}

TEST_CASE( "Declarations are parsed correctly", "[Declarations]" ) {

    SECTION( "single_parameter" ) {
      auto w = parse("f x = x");
      REQUIRE(w.size() == 1);

      auto& d = w[0];
      REQUIRE(d.id.name == "f");
      REQUIRE(d.loc() == location("test", 1, 0));

      REQUIRE(d.predicates.size() == 1);
      REQUIRE(d.predicates[0]->kind == PredicateKind::irrefutable);
      auto x = std::static_pointer_cast<irrefutable>(d.predicates[0]);
      REQUIRE(x->id.name == "x");
      REQUIRE(x->loc == location("test", 1, 2));

      REQUIRE(d.body->kind == ExprKind::symbol);
      auto body = std::static_pointer_cast<symbol>(d.body);
      REQUIRE(body->id.name == "x");
      REQUIRE(body->loc == location("test", 1, 6));
    }

    SECTION( "literal_predicates" ) {
      auto w = parse("greet \"bob\" 42 = \"hi\"");
      REQUIRE(w.size() == 1);
      REQUIRE(w[0].predicates.size() == 2);
      REQUIRE(w[0].predicates[0]->kind == PredicateKind::string);
      REQUIRE(std::static_pointer_cast<string_predicate>(w[0].predicates[0])->value == "bob");
      REQUIRE(w[0].predicates[1]->kind == PredicateKind::integer);
      REQUIRE(std::static_pointer_cast<integer_predicate>(w[0].predicates[1])->value == 42);

      REQUIRE(w[0].body->kind == ExprKind::literal_string);
      REQUIRE(std::static_pointer_cast<literal_string>(w[0].body)->value == "hi");
    }

    SECTION( "several_declarations" ) {
      auto w = parse_printed("\n\na = 1\n\n;b = 2.5\nc = \"s\"\n");
      REQUIRE(w == std::vector<std::string> {
          "(decl a [] 1)",
          "(decl b [] 2.5)",
          "(decl c [] \"s\")" });
    }

    SECTION( "empty_module" ) {
      REQUIRE(parse("").empty());
      REQUIRE(parse("\n;\n  ").empty());
    }
}

TEST_CASE( "Call sites are parsed correctly", "[Callsites]" ) {

    SECTION( "arguments" ) {
      auto w = parse("main = f x y");
      REQUIRE(w.size() == 1);
      REQUIRE(w[0].body->kind == ExprKind::callsite);

      auto call = std::static_pointer_cast<callsite>(w[0].body);
      REQUIRE(call->loc == location("test", 1, 7));
      REQUIRE(call->function->kind == ExprKind::symbol);
      REQUIRE(std::static_pointer_cast<symbol>(call->function)->id.name == "f");
      REQUIRE(call->arguments.size() == 2);
      REQUIRE(std::static_pointer_cast<symbol>(call->arguments[0])->id.name == "x");
      REQUIRE(std::static_pointer_cast<symbol>(call->arguments[1])->id.name == "y");
    }

    SECTION( "no_arguments" ) {
      auto w = parse("main = f");
      REQUIRE(w.size() == 1);
      REQUIRE(w[0].body->kind == ExprKind::symbol);
      REQUIRE(std::static_pointer_cast<symbol>(w[0].body)->id.name == "f");
    }

    SECTION( "operators_are_names" ) {
      REQUIRE(parse_printed("add a b = + a b") == std::vector<std::string> { "(decl add [a b] (+ a b))" });
      REQUIRE(parse_printed("add a b = a + b") == std::vector<std::string> { "(decl add [a b] (a + b))" });
    }

    SECTION( "parentheses" ) {
      REQUIRE(parse_printed("f = g (h x) y") == std::vector<std::string> { "(decl f [] (g (h x) y))" });
      REQUIRE(parse_printed("f = (x)") == std::vector<std::string> { "(decl f [] x)" });
      REQUIRE(parse_printed("f = (g\n  x)") == std::vector<std::string> { "(decl f [] (g x))" });
    }

    SECTION( "literals" ) {
      auto w = parse("f = g 1 -2 0.5 \"s\"");
      REQUIRE(w.size() == 1);
      auto call = std::static_pointer_cast<callsite>(w[0].body);
      REQUIRE(call->arguments.size() == 4);
      REQUIRE(call->arguments[0]->kind == ExprKind::literal_integer);
      REQUIRE(std::static_pointer_cast<literal_integer>(call->arguments[1])->value == -2);
      REQUIRE(call->arguments[2]->kind == ExprKind::literal_float);
      REQUIRE(std::static_pointer_cast<literal_float>(call->arguments[2])->value == 0.5);
      REQUIRE(call->arguments[3]->kind == ExprKind::literal_string);
    }
}

TEST_CASE( "Let expressions are parsed correctly", "[Let]" ) {

    SECTION( "single_line" ) {
      auto w = parse("g = let x = 1 in x");
      REQUIRE(w.size() == 1);
      REQUIRE(w[0].body->kind == ExprKind::let);

      auto l = std::static_pointer_cast<let>(w[0].body);
      REQUIRE(l->loc == location("test", 1, 4));
      REQUIRE(l->binding.name == "x");
      REQUIRE(l->value->kind == ExprKind::literal_integer);
      REQUIRE(std::static_pointer_cast<literal_integer>(l->value)->value == 1);
      REQUIRE(l->body->kind == ExprKind::symbol);
      REQUIRE(std::static_pointer_cast<symbol>(l->body)->id.name == "x");
    }

    SECTION( "across_lines" ) {
      REQUIRE(parse_printed("g = let x = f 1\n  in let y = 2 in + x y\nh = 0") == std::vector<std::string> {
          "(decl g [] (let x (f 1) (let y 2 (+ x y))))",
          "(decl h [] 0)" });
    }

    SECTION( "as_argument" ) {
      REQUIRE(parse_printed("g = f (let x = 1 in x) 2") == std::vector<std::string> {
          "(decl g [] (f (let x 1 x) 2))" });
    }
}

TEST_CASE( "Predicates are parsed correctly", "[Predicates]" ) {

    SECTION( "parenthesized_predicate_degenerates" ) {
      auto lhs = parse("h (x) = x");
      auto rhs = parse("h x = x");
      REQUIRE(lhs.size() == 1);
      REQUIRE(rhs.size() == 1);
      REQUIRE(lhs[0].predicates.size() == 1);
      REQUIRE(lhs[0].predicates[0]->kind == PredicateKind::irrefutable);
      REQUIRE(to_string(lhs[0]) == to_string(rhs[0]));
    }

    SECTION( "tuples" ) {
      REQUIRE(parse_printed("swap (a, b) = (b, a)") == std::vector<std::string> {
          "(decl swap [(tuple a b)] (tuple b a))" });
      REQUIRE(parse_printed("f () x = ()") == std::vector<std::string> {
          "(decl f [() x] ())" });
      REQUIRE(parse_printed("f ((a, b), 1) = a") == std::vector<std::string> {
          "(decl f [(tuple (tuple a b) 1)] a)" });
    }

    SECTION( "constructors" ) {
      REQUIRE(parse_printed("f (Just x) Nil = x") == std::vector<std::string> {
          "(decl f [(Just x) Nil] x)" });

      // a constructor takes every predicate that follows
      auto w = parse("f Pair a (b, c) = a");
      REQUIRE(w.size() == 1);
      REQUIRE(w[0].predicates.size() == 1);
      REQUIRE(w[0].predicates[0]->kind == PredicateKind::ctor);
      auto ct = std::static_pointer_cast<ctor_predicate>(w[0].predicates[0]);
      REQUIRE(ct->ctor_id.name == "Pair");
      REQUIRE(ct->dims.size() == 2);
      REQUIRE(ct->dims[1]->kind == PredicateKind::tuple);
    }
}

TEST_CASE( "Match expressions are parsed correctly", "[Match]" ) {

    SECTION( "arms_on_their_own_lines" ) {
      auto w = parse("describe n = match n\n  0 => \"zero\"\n  m => m\nnext = 1");
      REQUIRE(w.size() == 2);
      REQUIRE(w[0].body->kind == ExprKind::match);

      auto m = std::static_pointer_cast<match>(w[0].body);
      REQUIRE(m->loc == location("test", 1, 13));
      REQUIRE(m->subject->kind == ExprKind::symbol);
      REQUIRE(m->pattern_exprs.size() == 2);
      REQUIRE(m->pattern_exprs[0].predicate->kind == PredicateKind::integer);
      REQUIRE(m->pattern_exprs[0].expr->kind == ExprKind::literal_string);
      REQUIRE(m->pattern_exprs[1].predicate->kind == PredicateKind::irrefutable);

      REQUIRE(to_string(w[0]) == "(decl describe [n] (match n (0 => \"zero\") (m => m)))");
      REQUIRE(to_string(w[1]) == "(decl next [] 1)");
    }

    SECTION( "arms_with_patterns" ) {
      REQUIRE(parse_printed("f x = match g x\n  Nil => 0\n  (Cons h t) => + 1 (f t)\n  (a, b) => a") == std::vector<std::string> {
          "(decl f [x] (match (g x) (Nil => 0) ((Cons h t) => (+ 1 (f t))) ((tuple a b) => a)))" });
    }

    SECTION( "followed_by_declaration_with_parameters" ) {
      REQUIRE(parse_printed("f x = match x\n  1 => 2\ng y z = y") == std::vector<std::string> {
          "(decl f [x] (match x (1 => 2)))",
          "(decl g [y z] y)" });
    }

    SECTION( "broken_arm_pattern_is_reported" ) {
      auto err = parse_failure("f = match x\n  1 => 2\n  (1, => 3");
      REQUIRE(err.loc == location("test", 3, 6));
      REQUIRE(err.message == "Expected a predicate, instead got \"Operator(\"=>\")\".");
    }

    SECTION( "requires_an_arm" ) {
      auto err = parse_failure("f x = match x\ng = 1");
      REQUIRE(err.loc == location("test", 1, 13));
      REQUIRE(err.message == "Match expression expects at least one arm, instead got \"Semicolon\".");
    }
}

TEST_CASE( "Parse errors are reported", "[Errors]" ) {

    SECTION( "missing_equals" ) {
      auto err = parse_failure("f x");
      REQUIRE(err.loc == location("test", 1, 3));
      REQUIRE(err.to_string() == "test:1:3: error: hit EOF but expected Operator(\"=\")");
    }

    SECTION( "unmatched_closer_in_head" ) {
      auto err = parse_failure("f x \"y\" 1 ) = 2");
      REQUIRE(err.loc == location("test", 1, 10));
    }

    SECTION( "missing_callsite" ) {
      auto err = parse_failure("f = ");
      REQUIRE(err.loc == location("test", 1, 4));
      REQUIRE(err.message == "missing function callsite expression");

      // the newline is skipped, `g` becomes the body and `=` is left over
      err = parse_failure("f = \ng = 1");
      REQUIRE(err.loc == location("test", 2, 2));
    }

    SECTION( "not_implemented" ) {
      auto err = parse_failure("f = [x]");
      REQUIRE(err.to_string() == "test:1:4: error: parsing this is not implemented");
    }

    SECTION( "keyword_is_not_a_declaration" ) {
      auto err = parse_failure("let = 1");
      REQUIRE(err.loc == location("test", 1, 0));
      REQUIRE(err.message == "Expected a declaration, instead got \"Identifier(\"let\")\".");

      err = parse_failure("f = 1 in 2");
      REQUIRE(err.loc == location("test", 1, 6));
    }

    SECTION( "let_without_binding" ) {
      auto err = parse_failure("f = let 1 = 2 in 3");
      REQUIRE(err.loc == location("test", 1, 8));
      REQUIRE(err.message == "Expected identifier, instead got \"Signed(1)\".");
    }

    SECTION( "let_without_in" ) {
      auto err = parse_failure("f = let x = 1; x");
      REQUIRE(err.message == "unexpected token (Identifier(\"x\")) found. expected Identifier(\"in\")");
    }

    SECTION( "broken_tuple_predicate" ) {
      auto err = parse_failure("f (x y) = x");
      REQUIRE(err.loc == location("test", 1, 5));

      err = parse_failure("f (x, = x");
      REQUIRE(err.loc == location("test", 1, 6));
      REQUIRE(err.message == "Expected a predicate, instead got \"Operator(\"=\")\".");
    }

    SECTION( "lexer_errors_abort_parsing" ) {
      auto err = parse_failure("f = (x]\ng = 1");
      REQUIRE(err.loc == location("test", 1, 6));
      REQUIRE(err.level == diag_level::error);
    }
}

TEST_CASE( "Expressions are printed", "[Printing]" ) {
    const location loc("test", 1, 0);
    auto x = identifier("x", loc);
    auto y = identifier("y", loc);

    expr_ptr lam = std::make_shared<lambda>(loc, std::vector<identifier> { x, y },
                                            std::make_shared<symbol>(x));
    REQUIRE(to_string(lam) == "(lambda [x y] x)");

    predicate_ptr unit = std::make_shared<tuple_predicate>(loc, std::vector<predicate_ptr> {});
    REQUIRE(to_string(unit) == "()");

    predicate_ptr nil = std::make_shared<ctor_predicate>(identifier("Nil", loc), std::vector<predicate_ptr> {});
    REQUIRE(to_string(nil) == "Nil");
}
