#include <cmath>

#include "test_util.h"

namespace test {

namespace {

void TestPrecedence(TestContext* ctx) {
  rt::Session session;
  ExpectNear(ParseReal("2 + 3 * 4", &session), 14.0, "mul_before_add", ctx);
  ExpectNear(ParseReal("(2 + 3) * 4", &session), 20.0, "parentheses", ctx);
  ExpectNear(ParseReal("10 - 4 - 3", &session), 3.0, "sub_left_assoc", ctx);
  ExpectNear(ParseReal("8 / 4 / 2", &session), 1.0, "div_left_assoc", ctx);
  ExpectNear(ParseReal("2 ^ 3 ^ 2", &session), 64.0, "pow_left_assoc", ctx);
  ExpectNear(ParseReal("-2 ^ 2", &session), -4.0, "unary_minus_below_pow", ctx);
  ExpectNear(ParseReal("2 ^ -3 ^ 2", &session), std::pow(2.0, -9.0), "minus_in_exponent", ctx);
  ExpectNear(ParseReal("--3", &session), 3.0, "double_negation", ctx);
  ExpectNear(ParseReal("2 * -3", &session), -6.0, "minus_after_operator", ctx);
  ExpectNear(ParseReal("%16", &session), 4.0, "unary_root", ctx);
  ExpectNear(ParseReal("3 % 27", &session), 3.0, "binary_root", ctx);
  ExpectNear(ParseReal("2 * %9", &session), 6.0, "root_in_product", ctx);
  ExpectNear(ParseReal("2 ** 10", &session), 1024.0, "double_star_power", ctx);
  ExpectNear(ParseReal("1.5e2 + .5", &session), 150.5, "float_literals", ctx);
  ExpectNear(ParseReal("cos(0) + log(8, 2)", &session), 4.0, "function_calls", ctx);
}

void TestNumberKinds(TestContext* ctx) {
  rt::Session session;
  ex::Value seven = ParseText("3 + 4", &session);
  ExpectTrue(seven.number().is_integer() && seven.number().i64 == 7, "integer_sum", ctx);
  ex::Value half = ParseText("1 / 2", &session);
  ExpectTrue(half.number().kind == rt::NumberKind::kReal, "division_is_real", ctx);
  ex::Value big = ParseText("99999999999999999999", &session);
  ExpectTrue(big.number().kind == rt::NumberKind::kReal, "huge_literal_is_real", ctx);

  rt::SessionOptions opts;
  opts.domain = rt::NumericDomain::kComplex;
  rt::Session complex_session(opts);
  ex::Value z = ParseText("1 + 2j", &complex_session);
  ExpectTrue(z.number().is_complex(), "complex_literal", ctx);
  ExpectEqual(z.ToString(), "(1+2j)", "complex_format", ctx);
  ex::Value i = ParseText("sqrt(-1)", &complex_session);
  ExpectNear(i.number().AsComplex().imag(), 1.0, "complex_sqrt", ctx);

  ex::Value root = ParseText("%(-4)", &complex_session);
  ExpectTrue(root.number().is_complex(), "complex_session_unary_root", ctx);
  ExpectNear(root.number().complex.imag(), 2.0, "complex_session_unary_root_value", ctx);
  ex::Value cube = ParseText("3%(-8)", &complex_session);
  ExpectNear(cube.number().complex.real(), 1.0, "complex_session_cube_root_real", ctx);
  ExpectNear(cube.number().complex.imag(), std::sqrt(3.0), "complex_session_cube_root_imag",
             ctx);
  ex::Value third = ParseText("(-8)^(1/3)", &complex_session);
  ExpectNear(third.number().complex.imag(), std::sqrt(3.0), "complex_session_fraction_power",
             ctx);
  ex::Value product = ParseText("2 * 3j - 1", &complex_session);
  ExpectTrue(product.number() == rt::Number::Complex({-1.0, 6.0}), "complex_session_arithmetic",
             ctx);
  ex::Value ints = ParseText("7 - 2 * 3", &complex_session);
  ExpectTrue(ints.number() == rt::Number::Integer(1), "complex_session_keeps_integers", ctx);
  ex::Value polar = ParseText("polar(rect(2, pi/2))", &complex_session);
  ExpectNear(polar.number().complex.real(), 2.0, "complex_session_polar_radius", ctx);
  ExpectNear(polar.number().complex.imag(), std::acos(-1.0) / 2, "complex_session_polar_angle",
             ctx);
  ExpectNear(ParseReal("phase(-1)", &complex_session), std::acos(-1.0), "complex_session_phase",
             ctx);
  ex::Value log_base = ParseText("log(-8, 2)", &complex_session);
  ExpectNear(log_base.number().complex.real(), 3.0, "complex_session_log_base_real", ctx);
  ExpectNear(log_base.number().complex.imag(), std::acos(-1.0) / std::log(2.0),
             "complex_session_log_base_imag", ctx);

  rt::Session real_session;
  ExpectTrue(std::isnan(ParseReal("%(-4)", &real_session)), "real_session_root_is_nan", ctx);
  ExpectTrue(std::isnan(ParseReal("3%(-8)", &real_session)), "real_session_cube_root_is_nan",
             ctx);
}

void TestErrors(TestContext* ctx) {
  rt::Session session;
  ExpectThrows<util::SyntaxError>([&] { ParseText("1 +", &session); }, "missing_operand", ctx);
  ExpectThrows<util::SyntaxError>([&] { ParseText("(1", &session); }, "unclosed_paren", ctx);
  ExpectThrows<util::SyntaxError>([&] { ParseText("1 2", &session); }, "adjacent_numbers", ctx);
  ExpectThrows<util::SyntaxError>([&] { ParseText("cos()", &session); }, "empty_call", ctx);
  ExpectThrows<util::SyntaxError>([&] { ParseText("3 = 4", &session); }, "assign_to_number",
                                  ctx);
  ExpectThrows<util::LexicalError>([&] { ParseText("1 + $", &session); }, "illegal_char", ctx);
  ExpectThrows<util::NameResolutionError>([&] { ParseText("foo(1)", &session); },
                                          "unknown_unary_function", ctx);
  ExpectThrows<util::NameResolutionError>([&] { ParseText("cos(1, 2)", &session); },
                                          "unknown_binary_function", ctx);
  ExpectThrows<util::CapabilityError>([&] { ParseText("2j", &session); }, "imaginary_in_real",
                                      ctx);

  try {
    ParseText("1 + 2 )", &session);
    ExpectTrue(false, "syntax_error_reported", ctx);
  } catch (const util::SyntaxError& err) {
    ExpectEqual(err.what(), "Syntax error at ')'", "syntax_error_message", ctx);
    ExpectTrue(err.line() == 1 && err.column() == 7, "syntax_error_position", ctx);
  }

  try {
    ParseText("1 +\n", &session);
    ExpectTrue(false, "syntax_error_at_line_end", ctx);
  } catch (const util::SyntaxError& err) {
    ExpectEqual(err.what(), "Syntax error at end of line", "syntax_error_line_end", ctx);
  }

  try {
    ParseText("x + #oops", &session);
    ExpectTrue(false, "lexical_error_reported", ctx);
  } catch (const util::LexicalError& err) {
    ExpectTrue(err.character() == '#', "lexical_error_character", ctx);
    ExpectEqual(err.context(), "#oops", "lexical_error_context", ctx);
    ExpectTrue(err.column() == 5, "lexical_error_column", ctx);
  }

  rt::SessionOptions strict;
  strict.allow_free_variables = false;
  rt::Session strict_session(strict);
  try {
    ParseText("1 + y", &strict_session);
    ExpectTrue(false, "unknown_name_reported", ctx);
  } catch (const util::NameResolutionError& err) {
    ExpectEqual(err.name(), "y", "unknown_name", ctx);
    ExpectEqual(err.what(), "Unknown variable or constant y", "unknown_name_message", ctx);
  }
}

void TestAssignments(TestContext* ctx) {
  rt::Session session;
  ExpectNear(ParseReal("a = 1; b = a + 1; b * 10", &session), 20.0, "assign_sequence", ctx);
  ExpectTrue(session.environment().GetVariable("a").has_value() &&
                 session.environment().GetVariable("b").has_value(),
             "assignments_committed", ctx);
  ExpectNear(ParseReal("a = a + 5", &session), 6.0, "reassign_from_self", ctx);

  ExpectThrows<util::SyntaxError>([&] { ParseText("c = 5; a = 100; 1 +", &session); },
                                  "failing_program", ctx);
  ExpectTrue(!session.environment().GetVariable("c").has_value(), "no_partial_commit", ctx);
  ExpectNear(session.environment().GetVariable("a")->number().AsReal(), 6.0,
             "old_value_kept_on_failure", ctx);

  ExpectNear(ParseReal("pi = 3\npi * 2", &session), 6.0, "variable_shadows_constant", ctx);
  ExpectNear(session.environment().GetConstant("pi")->AsReal(), std::acos(-1.0),
             "constant_table_untouched", ctx);

  ex::Value stored = ParseText("f = x + 1", &session);
  ExpectTrue(stored.is_expression(), "assign_tree", ctx);
  ExpectTrue(ex::FreeVariables(ParseText("f * y", &session)) == Names({"x", "y"}),
             "stored_tree_reused", ctx);

  ExpectTrue(!ps::Parse(session, "").has_value(), "empty_program", ctx);
  ExpectTrue(!ps::Parse(session, " ;\n; ").has_value(), "only_separators", ctx);
  ExpectNear(ParseReal("1\n\n2;;3;", &session), 3.0, "last_line_wins", ctx);

  rt::SessionOptions locked;
  locked.allow_assignment = false;
  rt::Session locked_session(locked);
  ExpectThrows<util::CapabilityError>([&] { ParseText("v = 2", &locked_session); },
                                      "assignment_disabled", ctx);
  ExpectTrue(locked_session.environment().variables().empty(), "nothing_assigned", ctx);
}

}  // namespace

void RunParserTests(TestContext* ctx) {
  TestPrecedence(ctx);
  TestNumberKinds(ctx);
  TestErrors(ctx);
  TestAssignments(ctx);
}

}  // namespace test
