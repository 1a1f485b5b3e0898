/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "CalcArithmetic.h"
#include "CalcException.h"
#include "CalcExpression.h"
#include "CalcSyntax.h"
#include "CalcToken.h"
#include "CalcValue.h"
#include "calculator.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#define CATCH_CONFIG_MAIN
#include <gmpxx.h>

#include <catch2/catch.hpp>

using std::string;
using std::string_view;
using std::unique_ptr;

using Catch::Matchers::Contains;

namespace calc::tests {

typedef bool (*TokeniseF)(string_view&,Token&);

template <typename F>
bool tokeniserCheck(string_view& sv, Token& tok, F f) {
    Token t1;
    auto sv1 = sv;
    bool r = tokenise(sv1, t1);
    if (r && f(t1.type)) {tok = t1; sv = sv1; return true;}
    return false;
}

bool tokeniseNumeric(string_view& sv, Token& tok)
{
    return tokeniserCheck(
        sv, tok,
        [](TokenType t) -> bool {
            return t==calc::T_NUMERIC_EXACT || t==calc::T_NUMERIC_APPROX || t==calc::T_NUMERIC_IMAGINARY;
        }
    );
}

bool tokeniseOperator(string_view& sv, Token& tok)
{
    return tokeniserCheck(
        sv, tok,
        [](TokenType t) -> bool {
            return t>=calc::T_PLUS && t<=calc::T_GREQ;
        }
    );
}

bool tokeniseIdentifier(string_view& sv, Token& tok)
{
    return tokeniserCheck(
        sv, tok,
        [](TokenType t) -> bool {
            return t==calc::T_IDENTIFIER;
        }
    );
}

void verifyTokeniserSuccess(TokeniseF t, const char* ss, TokenType tt, const char* tv, const char* fs) {
    Token tok;
    string s{ss};
    string_view sv{s};
    CHECK(t(sv, tok));
    CHECK(tok == Token(tt, tv));
    CHECK(string(sv) == fs);
}

void verifyTokeniserFail(TokeniseF t, const char* c) {
    Token tok;
    string s{c};
    string_view sv{s};
    CHECK(!t(sv, tok));
    CHECK(string(sv) == c);
}

auto test_expression = [](const string& s) -> unique_ptr<Expression>
{
  INFO("String: " << s << " -> ");
  try {
    auto e = make_expression(s);
    INFO("  Parse: " << *e);
    return e;
  } catch (std::exception& e) {
      INFO("  Exception: " << e.what());
      throw;
  }
};

auto printed = [](const auto& v) -> string
{
    std::ostringstream os;
    os << v;
    return os.str();
};

TEST_CASE( "Expressions" ) {

SECTION("tokeniseSuccess")
{
    verifyTokeniserSuccess(&tokenise, "", calc::T_EOS, "", "");
    verifyTokeniserSuccess(&tokenise, " \t ", calc::T_EOS, "", "");
    verifyTokeniserSuccess(&tokenise, "  42 + x", calc::T_NUMERIC_EXACT, "42", " + x");
    verifyTokeniserSuccess(&tokenise, "3.14*2", calc::T_NUMERIC_APPROX, "3.14", "*2");
    verifyTokeniserSuccess(&tokenise, "1e3)", calc::T_NUMERIC_APPROX, "1e3", ")");
    verifyTokeniserSuccess(&tokenise, "2.5E-3+1", calc::T_NUMERIC_APPROX, "2.5E-3", "+1");
    verifyTokeniserSuccess(&tokenise, ".5+1", calc::T_NUMERIC_APPROX, ".5", "+1");
    verifyTokeniserSuccess(&tokenise, "1.+2", calc::T_NUMERIC_APPROX, "1.", "+2");
    verifyTokeniserSuccess(&tokenise, "1_000_000 ", calc::T_NUMERIC_EXACT, "1_000_000", " ");
    verifyTokeniserSuccess(&tokenise, "0x_ff+1", calc::T_NUMERIC_EXACT, "0x_ff", "+1");
    verifyTokeniserSuccess(&tokenise, "0o17)", calc::T_NUMERIC_EXACT, "0o17", ")");
    verifyTokeniserSuccess(&tokenise, "0B1010 ", calc::T_NUMERIC_EXACT, "0B1010", " ");
    verifyTokeniserSuccess(&tokenise, "00 + 1", calc::T_NUMERIC_EXACT, "00", " + 1");
    verifyTokeniserSuccess(&tokenise, "2j*3", calc::T_NUMERIC_IMAGINARY, "2j", "*3");
    verifyTokeniserSuccess(&tokenise, "**2", calc::T_POW, "**", "2");
    verifyTokeniserSuccess(&tokenise, "//3", calc::T_FLOORDIV, "//", "3");
    verifyTokeniserSuccess(&tokenise, "**=3", calc::T_AUGASSIGN, "**=", "3");
    verifyTokeniserSuccess(&tokenise, "<<1", calc::T_LSHIFT, "<<", "1");
    verifyTokeniserSuccess(&tokenise, "!=1", calc::T_NEQ, "!=", "1");
    verifyTokeniserSuccess(&tokenise, ":=1", calc::T_WALRUS, ":=", "1");
    verifyTokeniserSuccess(&tokenise, "...", calc::T_ELLIPSIS, "...", "");
    verifyTokeniserSuccess(&tokenise, "'it''s'", calc::T_STRING, "'it'", "'s'");
    verifyTokeniserSuccess(&tokenise, "\"a\\\"b\" c", calc::T_STRING, "\"a\\\"b\"", " c");
    verifyTokeniserSuccess(&tokenise, "rb'x'+1", calc::T_STRING, "rb'x'", "+1");
    verifyTokeniserSuccess(&tokenise, "'''a\nb'''", calc::T_STRING, "'''a\nb'''", "");
    verifyTokeniserSuccess(&tokenise, "rbx'y'", calc::T_IDENTIFIER, "rbx", "'y'");
    verifyTokeniserSuccess(&tokenise, "__import__('os')", calc::T_IDENTIFIER, "__import__", "('os')");
    verifyTokeniserSuccess(&tokenise, "import os", calc::T_RESERVED, "import", " os");
    verifyTokeniserSuccess(&tokenise, "not x", calc::T_NOT, "not", " x");
    verifyTokeniserSuccess(&tokenise, "None", calc::T_NONE, "None", "");
    verifyTokeniserSuccess(&tokenise, "# comment\n1", calc::T_NEWLINE, "\n", "1");
    verifyTokeniserSuccess(&tokenise, "\\\n 7", calc::T_NUMERIC_EXACT, "7", "");
}

SECTION("tokeniseFailure")
{
    verifyTokeniserFail(&tokenise, "0b12");
    verifyTokeniserFail(&tokenise, "0x");
    verifyTokeniserFail(&tokenise, "0o8");
    verifyTokeniserFail(&tokenise, "012");
    verifyTokeniserFail(&tokenise, "1abc");
    verifyTokeniserFail(&tokenise, "1_");
    verifyTokeniserFail(&tokenise, "1e");
    verifyTokeniserFail(&tokenise, "1__0");
    verifyTokeniserFail(&tokenise, "'abc");
    verifyTokeniserFail(&tokenise, "'''abc''");
    verifyTokeniserFail(&tokenise, "'abc\n'");
    verifyTokeniserFail(&tokenise, "$");
    verifyTokeniserFail(&tokenise, "?");
    verifyTokeniserFail(&tokenise, "`x`");
    verifyTokeniserFail(&tokenise, "!x");
    verifyTokeniserFail(&tokeniseNumeric, "x1");
    verifyTokeniserFail(&tokeniseNumeric, "-1");
    verifyTokeniserFail(&tokeniseNumeric, "'1'");
    verifyTokeniserFail(&tokeniseIdentifier, "123");
    verifyTokeniserFail(&tokeniseIdentifier, "lambda");
    verifyTokeniserFail(&tokeniseIdentifier, "'name'");
    verifyTokeniserFail(&tokeniseOperator, "(");
    verifyTokeniserFail(&tokeniseOperator, "and");
    verifyTokeniserFail(&tokeniseOperator, "=");

    Token tok;
    string error;
    string_view sv{"0b12"};
    CHECK(!tokenise(sv, tok, error));
    CHECK(error == "invalid binary literal");
    sv = "012";
    CHECK(!tokenise(sv, tok, error));
    CHECK(error == "leading zeros in decimal integer literals are not permitted");
    sv = "'abc";
    CHECK(!tokenise(sv, tok, error));
    CHECK(error == "unterminated string literal");
}

SECTION("tokenString")
{
    string exp("(1 +\n 2) * x\n");
    Tokeniser t(exp);

    CHECK(t.nextToken() == Token(calc::T_LPAREN, "("));
    CHECK(t.nextToken() == Token(calc::T_NUMERIC_EXACT, "1"));
    CHECK(t.nextToken() == Token(calc::T_PLUS, "+"));
    CHECK(t.nextToken() == Token(calc::T_NUMERIC_EXACT, "2"));
    CHECK(t.nextToken() == Token(calc::T_RPAREN, ")"));
    CHECK(t.nextToken() == Token(calc::T_MULT, "*"));
    CHECK(t.nextToken() == Token(calc::T_IDENTIFIER, "x"));
    CHECK(t.nextToken() == Token(calc::T_NEWLINE, "\n"));
    CHECK(t.nextToken() == Token(calc::T_EOS, ""));
    CHECK(t.nextToken() == Token(calc::T_EOS, ""));

    t.returnTokens(3);
    CHECK(t.nextToken() == Token(calc::T_NEWLINE, "\n"));
    CHECK(t.nextToken() == Token(calc::T_EOS, ""));
    CHECK(t.nextToken() == Token(calc::T_EOS, ""));
    CHECK(t.nextToken() == Token(calc::T_EOS, ""));

    exp = "2**-1.5e3 // 0x1F";
    Tokeniser u(exp);

    CHECK(u.nextToken() == Token(calc::T_NUMERIC_EXACT, "2"));
    CHECK(u.nextToken() == Token(calc::T_POW, "**"));
    CHECK(u.nextToken() == Token(calc::T_MINUS, "-"));
    CHECK(u.nextToken() == Token(calc::T_NUMERIC_APPROX, "1.5e3"));
    CHECK(u.nextToken() == Token(calc::T_FLOORDIV, "//"));
    CHECK(u.nextToken() == Token(calc::T_NUMERIC_EXACT, "0x1F"));
    CHECK(u.nextToken() == Token(calc::T_EOS, ""));

    exp = "1 + $";
    Tokeniser v(exp);

    CHECK(v.nextToken() == Token(calc::T_NUMERIC_EXACT, "1"));
    CHECK(v.nextToken() == Token(calc::T_PLUS, "+"));
    CHECK_THROWS_AS(v.nextToken(), TokenException);
    CHECK(v.remaining() == " $");
}

SECTION("parseStringFail")
{
    CHECK_THROWS_AS(test_expression(""), SyntaxError);
    CHECK_THROWS_AS(test_expression("   "), SyntaxError);
    CHECK_THROWS_AS(test_expression("\n"), SyntaxError);
    CHECK_THROWS_AS(test_expression("1 +"), SyntaxError);
    CHECK_THROWS_AS(test_expression("1 +* 2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("(1 + 2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("1 + 2)"), SyntaxError);
    CHECK_THROWS_AS(test_expression(")"), SyntaxError);
    CHECK_THROWS_AS(test_expression("1 2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("1\n+2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("1; 2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("x = 1"), SyntaxError);
    CHECK_THROWS_AS(test_expression("x += 1"), SyntaxError);
    CHECK_THROWS_AS(test_expression("import os"), SyntaxError);
    CHECK_THROWS_AS(test_expression("def f(): pass"), SyntaxError);
    CHECK_THROWS_AS(test_expression("a if b"), SyntaxError);
    CHECK_THROWS_AS(test_expression("f(1"), SyntaxError);
    CHECK_THROWS_AS(test_expression("x."), SyntaxError);
    CHECK_THROWS_AS(test_expression("[1, 2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("{1: 2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("'a' b'c'"), SyntaxError);
    CHECK_THROWS_AS(test_expression("2 $ 3"), SyntaxError);
    CHECK_THROWS_AS(test_expression("2 $ 3"), TokenException);
    CHECK_THROWS_AS(test_expression("0b2"), SyntaxError);
    CHECK_THROWS_AS(test_expression("012 + 1"), SyntaxError);
    CHECK_THROWS_AS(test_expression("'abc"), SyntaxError);

    // Syntax errors are range errors, just like the rejected expressions
    CHECK_THROWS_AS(test_expression("1 +"), std::range_error);

    CHECK_THROWS_WITH(test_expression("1 2"), "Illegal expression: '2': extra input");
    CHECK_THROWS_WITH(test_expression(""), "Illegal expression: '': empty expression");
    CHECK_THROWS_WITH(test_expression("2 $ 3"), "Illegal expression: '$': invalid character");
    CHECK_THROWS_WITH(test_expression("import os"), "Illegal expression: 'import': invalid syntax");
}

SECTION("parseRejected")
{
    CHECK_THROWS_AS(test_expression("__import__('os').system('echo no')"), UnsupportedExpression);
    CHECK_THROWS_WITH(test_expression("__import__('os').system('echo no')"), Contains("function call"));
    CHECK_THROWS_WITH(test_expression("abs(-1)"), Contains("function call"));
    CHECK_THROWS_WITH(test_expression("x"), Contains("name reference"));
    CHECK_THROWS_WITH(test_expression("1 + x"), Contains("name reference"));
    CHECK_THROWS_WITH(test_expression("(1).real"), Contains("attribute access"));
    CHECK_THROWS_WITH(test_expression("[1][0]"), Contains("subscript"));
    CHECK_THROWS_WITH(test_expression("1 < 2"), Contains("comparison"));
    CHECK_THROWS_WITH(test_expression("1 and 2"), Contains("boolean operation"));
    CHECK_THROWS_WITH(test_expression("1 if 1 else 2"), Contains("conditional expression"));
    CHECK_THROWS_WITH(test_expression("lambda: 1"), Contains("lambda"));
    CHECK_THROWS_WITH(test_expression("(x := 1)"), Contains("assignment expression"));
    CHECK_THROWS_WITH(test_expression("1, 2"), Contains("tuple"));
    CHECK_THROWS_WITH(test_expression("(1, 2)"), Contains("tuple"));
    CHECK_THROWS_WITH(test_expression("()"), Contains("tuple"));
    CHECK_THROWS_WITH(test_expression("[1, 2]"), Contains("list"));
    CHECK_THROWS_WITH(test_expression("{1}"), Contains("set"));
    CHECK_THROWS_WITH(test_expression("{1: 2}"), Contains("dict"));
    CHECK_THROWS_WITH(test_expression("[x for x in y]"), Contains("list comprehension"));
    CHECK_THROWS_WITH(test_expression("(x for x in y)"), Contains("generator expression"));
    CHECK_THROWS_WITH(test_expression("await x"), Contains("await expression"));
    CHECK_THROWS_WITH(test_expression("(yield)"), Contains("yield expression"));

    CHECK_THROWS_WITH(test_expression("not 1"), Contains("not"));
    CHECK_THROWS_WITH(test_expression("~1"), Contains("~"));
    CHECK_THROWS_WITH(test_expression("1 << 2"), Contains("<<"));
    CHECK_THROWS_WITH(test_expression("1 >> 2"), Contains(">>"));
    CHECK_THROWS_WITH(test_expression("1 & 2"), Contains("&"));
    CHECK_THROWS_WITH(test_expression("1 | 2"), Contains("|"));
    CHECK_THROWS_WITH(test_expression("1 ^ 2"), Contains("^"));
    CHECK_THROWS_WITH(test_expression("1 @ 2"), Contains("@"));

    CHECK_THROWS_WITH(test_expression("'a'"), Contains("string literal"));
    CHECK_THROWS_WITH(test_expression("'a' * 3"), Contains("string literal"));
    CHECK_THROWS_WITH(test_expression("b'a'"), Contains("bytes literal"));
    CHECK_THROWS_WITH(test_expression("f'{1}'"), Contains("formatted string literal"));
    CHECK_THROWS_WITH(test_expression("1j"), Contains("imaginary literal"));
    CHECK_THROWS_WITH(test_expression("True + 1"), Contains("True"));
    CHECK_THROWS_WITH(test_expression("None"), Contains("None"));
    CHECK_THROWS_WITH(test_expression("..."), Contains("Ellipsis"));

    // Rejected before anything is evaluated
    CHECK_THROWS_AS(test_expression("1/0 + x"), UnsupportedExpression);
    CHECK_THROWS_AS(evaluate("1/0 + x"), UnsupportedExpression);
    CHECK_THROWS_AS(evaluate("print(1)"), std::range_error);
}

SECTION("parseDepth")
{
    CHECK(evaluate(string(40, '(') + "1" + string(40, ')')) == 1.0);
    CHECK(evaluate(string(199, '(') + "1" + string(199, ')')) == 1.0);
    CHECK(evaluate(string(100, '(') + "-" + string(100, '(') + "2" + string(100, ')') + string(100, ')')) == -2.0);
    CHECK_THROWS_AS(test_expression(string(201, '(') + "1" + string(201, ')')), SyntaxError);
    CHECK_THROWS_AS(test_expression(string(201, '[') + string(201, ']')), SyntaxError);

    // Unary chains are limited by tree height, not by bracket nesting
    CHECK(evaluate(string(300, '-') + "1") == 1.0);
    CHECK(evaluate(string(301, '-') + "1") == -1.0);
    CHECK(evaluate(string(999, '-') + "1") == -1.0);
    CHECK_THROWS_AS(test_expression(string(1000, '-') + "1"), SyntaxError);
    CHECK_THROWS_AS(test_expression(string(100000, '-') + "1"), SyntaxError);
    CHECK_THROWS_AS(test_expression(string(100000, '[')), SyntaxError);

    string sum = "1";
    for (int i = 0; i < 500; ++i) sum += "+1";
    CHECK(evaluate(sum) == 501.0);
    for (int i = 0; i < 1000; ++i) sum += "+1";
    CHECK_THROWS_AS(test_expression(sum), SyntaxError);
}

SECTION("syntaxTree")
{
    auto n = parse("1 + 2 * 3");
    CHECK(n->kind == SyntaxKind::BinaryOp);
    CHECK(n->binaryOp == SyntaxBinaryOp::Add);
    CHECK(n->height == 3);
    REQUIRE(n->children.size() == 2);
    CHECK(n->children[0]->constant == ConstantKind::Integer);
    CHECK(n->children[0]->text == "1");
    CHECK(n->children[1]->binaryOp == SyntaxBinaryOp::Mult);

    n = parse("__import__('os').system('echo no')");
    CHECK(n->kind == SyntaxKind::Call);
    CHECK(n->children[0]->kind == SyntaxKind::Attribute);
    CHECK(n->children[0]->text == "system");

    CHECK(parse("'a' 'b'")->text == "'a' 'b'");
    CHECK(parse("x[1:2]")->children[1]->kind == SyntaxKind::Slice);
    CHECK(parse("1 < 2 <= 3")->text == "< <=");
    CHECK(parse("a not in b")->text == "not in");
    CHECK(string(describe(SyntaxKind::Call)) == "function call");
}

SECTION("printExpression")
{
    CHECK(printed(*test_expression("2 + 3 * -4")) == "(2+(3*-(4)))");
    CHECK(printed(*test_expression("(1 - 2) - 3")) == "((1-2)-3)");
    CHECK(printed(*test_expression("2 ** 3 ** 2")) == "(2**(3**2))");
    CHECK(printed(*test_expression("7 // 2 % 1.5")) == "((7//2)%1.5)");
    CHECK(printed(*test_expression("+1e16 / 0x10")) == "(+(1e+16)/16)");
}

SECTION("simpleEval")
{
    CHECK(evaluate("2 + 3 * 4 - 1/2") == 13.5);
    CHECK(evaluate("2 ** 10") == 1024.0);
    CHECK(evaluate("7 // 2") == 3.0);
    CHECK(evaluate("5 % 3") == 2.0);
    CHECK(evaluate("10 / 4") == 2.5);
    CHECK(evaluate("(2 + 3) * 4") == 20.0);
    CHECK(evaluate("2 ** 3 ** 2") == 512.0);
    CHECK(evaluate("-2 ** 2") == -4.0);
    CHECK(evaluate("(-2) ** 2") == 4.0);
    CHECK(evaluate("2 ** -1") == 0.5);
    CHECK(evaluate("+-+1") == -1.0);
    CHECK(evaluate("1 - -1") == 2.0);
    CHECK(evaluate("  42  ") == 42.0);
    CHECK(evaluate("\n1 + 1\n") == 2.0);
    CHECK(evaluate("(1 +\n 2)") == 3.0);
    CHECK(evaluate("1 + \\\n 2") == 3.0);
    CHECK(evaluate("6 # six") == 6.0);
    CHECK(evaluate("2 ** 0.5") == Approx(1.4142135623730951));

    // Same text, same result
    const string s = "1/3 + 2 ** 0.5 - 7 % 3";
    CHECK(evaluate(s) == evaluate(s));
}

SECTION("numericEval")
{
    CHECK(evaluate("-7 // 2") == -4.0);
    CHECK(evaluate("7 // -2") == -4.0);
    CHECK(evaluate("-7 % 3") == 2.0);
    CHECK(evaluate("7 % -3") == -2.0);
    CHECK(evaluate("7.5 // 2") == 3.0);
    CHECK(evaluate("-7.5 % 2") == 0.5);
    CHECK(evaluate("5.5 % -2") == -0.5);
    CHECK(evaluate("0x10 + 0o10 + 0b10") == 26.0);
    CHECK(evaluate("1_000 * 2") == 2000.0);
    CHECK(evaluate("1.5e3 + .5") == 1500.5);
    CHECK(evaluate("00 + 1.") == 1.0);
    CHECK(evaluate("9223372036854775807 + 1") == 9223372036854775808.0);
    CHECK(evaluate("-9223372036854775807 - 2") == -9223372036854775809.0);
    CHECK(evaluate("99999999999999999999") == 1e20);
    CHECK(evaluate("0xFFFF_FFFF_FFFF_FFFF_F") == 295147905179352825855.0);
    CHECK(evaluate("2 ** 64") == 18446744073709551616.0);
    CHECK(std::isinf(evaluate("1e400")));
    CHECK_THROWS_AS(evaluate("10.0 ** 400"), OverflowError);
    CHECK_THROWS_WITH(evaluate("2.0 ** 10000"), "Numerical result out of range");
    CHECK_THROWS_AS(evaluate("2 ** 10000.0"), OverflowError);
    CHECK_THROWS_WITH(evaluate("10 ** 400"), "int too large to convert to float");
    CHECK_THROWS_AS(evaluate("10 ** 400 + 1.0"), OverflowError);
    CHECK_THROWS_WITH(evaluate("10 ** 400 / 3"), "integer division result too large for a float");
    CHECK_THROWS_AS(evaluate("2 ** 10 ** 10"), OverflowError);
    CHECK(evaluate("10.0 ** -400") == 0.0);
    CHECK(evaluate("(-8) ** 3") == -512.0);
    CHECK(evaluate("(-8.0) ** 2.0") == 64.0);
    CHECK(evaluate("0 ** 0") == 1.0);
}

SECTION("bigIntegerEval")
{
    CHECK(evaluate("3 ** 40 % 7") == 4.0);
    CHECK(evaluate("10 ** 400 % 7") == 4.0);
    CHECK(evaluate("(2 ** 63 + 1) - 2 ** 63") == 1.0);
    CHECK(evaluate("(2 ** 64 + 1) % 2 ** 32") == 1.0);
    CHECK(evaluate("10 ** 400 // 10 ** 399") == 10.0);
    CHECK(evaluate("10 ** 400 / 10 ** 399") == 10.0);
    CHECK(evaluate("(10 ** 400 + 1) - 10 ** 400") == 1.0);
    CHECK(evaluate("-(10 ** 30) // 7 ** 30") == -44367.0);
    CHECK(evaluate("(-1) ** (10 ** 30 + 1)") == -1.0);
    CHECK(evaluate("1 ** (10 ** 400)") == 1.0);
    CHECK(evaluate("0 ** (10 ** 400)") == 0.0);

    // Conversion to a double rounds to nearest, ties to even
    CHECK(evaluate("2 ** 53 + 1") == 9007199254740992.0);
    CHECK(evaluate("2 ** 53 + 3") == 9007199254740996.0);
    CHECK(evaluate("2 ** 1024 - 2 ** 971") == 1.7976931348623157e308);
    CHECK(evaluate("2 ** 1024 - 2 ** 970 - 1") == 1.7976931348623157e308);
    CHECK_THROWS_AS(evaluate("2 ** 1024 - 2 ** 970"), OverflowError);
    CHECK(evaluate("1 / 3") == 1.0 / 3);
    CHECK(evaluate("(2 ** 60 + 1) / 2 ** 60") == 1.0);
    CHECK(evaluate("10 ** 320 / 10 ** 330") == Approx(1e-10));
}

SECTION("errorEval")
{
    CHECK_THROWS_AS(evaluate("1/0"), DivisionByZero);
    CHECK_THROWS_WITH(evaluate("1/0"), "division by zero");
    CHECK_THROWS_AS(evaluate("1.5 / 0.0"), DivisionByZero);
    CHECK_THROWS_AS(evaluate("1 // 0"), DivisionByZero);
    CHECK_THROWS_AS(evaluate("1 % 0.0"), DivisionByZero);
    CHECK_THROWS_AS(evaluate("0 ** -1"), DivisionByZero);
    CHECK_THROWS_AS(evaluate("0.0 ** -2.5"), DivisionByZero);
    CHECK_THROWS_AS(evaluate("(-8) ** 0.5"), DomainError);
    CHECK_THROWS_AS(evaluate("(-8) ** (1/3)"), DomainError);
    CHECK_THROWS_AS(evaluate("1/0"), std::domain_error);

    // Left operand first
    CHECK_THROWS_AS(evaluate("1/0 + (-1) ** 0.5"), DivisionByZero);
    CHECK_THROWS_AS(evaluate("(-1) ** 0.5 + 1/0"), DomainError);
    CHECK_THROWS_AS(evaluate("-(1 % 0)"), DivisionByZero);
}

}

TEST_CASE( "Values" ) {

SECTION("exactArithmetic")
{
    CHECK(Value(2) + Value(3) == Value(5));
    CHECK(Value(7) / Value(2) == Value(3.5));
    CHECK(Value(6) / Value(3) == Value(2.0));
    CHECK(floorDiv(Value(7), Value(2)) == Value(3));
    CHECK(floorDiv(Value(-7), Value(2)) == Value(-4));
    CHECK(Value(-7) % Value(2) == Value(1));
    CHECK(Value(7) % Value(-2) == Value(-1));
    CHECK(power(Value(2), Value(10)) == Value(1024));
    CHECK(power(Value(2), Value(-1)) == Value(0.5));
    CHECK(power(Value(-3), Value(3)) == Value(-27));

    // Exact and inexact numbers never compare equal
    CHECK(Value(1) != Value(1.0));
    CHECK(exact(Value(1)));
    CHECK(!exact(Value(1.0)));
    CHECK(!exact(Value(1) + Value(0.0)));
}

SECTION("bigIntegers")
{
    const Value max = Value(INT64_MAX);
    const Value min = Value(INT64_MIN);

    CHECK(max + Value(1) == Value(mpz_class("9223372036854775808")));
    CHECK(min - Value(1) == Value(mpz_class("-9223372036854775809")));
    CHECK(max * Value(2) == Value(mpz_class("18446744073709551614")));
    CHECK(-min == Value(mpz_class("9223372036854775808")));
    CHECK(floorDiv(min, Value(-1)) == Value(mpz_class("9223372036854775808")));
    CHECK(min % Value(-1) == Value(0));
    CHECK(exact(power(Value(2), Value(63))));
    CHECK(power(Value(-2), Value(63)) == Value(INT64_MIN));
    CHECK(power(Value(2), Value(100)) == Value(mpz_class("1267650600228229401496703205376")));
    CHECK(floorDiv(power(Value(2), Value(100)), power(Value(2), Value(98))) == Value(4));
    CHECK(exactValue("ffffffffffffffffffff", 16) == power(Value(2), Value(80)) - Value(1));
    CHECK(printed(power(Value(10), Value(25))) == "10000000000000000000000000");
}

SECTION("overflow")
{
    const Value huge = power(Value(10), Value(400));

    CHECK(exact(huge));
    CHECK_THROWS_AS(toDouble(huge), OverflowError);
    CHECK_THROWS_WITH(toDouble(-huge), "int too large to convert to float");
    CHECK_THROWS_AS(huge + Value(0.5), OverflowError);
    CHECK_THROWS_AS(huge / Value(3), OverflowError);
    CHECK(toDouble(Value(1) / huge) == 0.0);
    CHECK_THROWS_AS(power(Value(2.0), Value(1024)), OverflowError);
    CHECK_THROWS_AS(power(Value(-10.0), Value(309)), OverflowError);
    CHECK_THROWS_AS(power(Value(3), power(Value(10), Value(30))), OverflowError);
    CHECK_THROWS_AS(power(Value(2), Value(int64_t{1} << 40)), OverflowError);
    CHECK_THROWS_WITH(huge * power(Value(2), Value(int64_t{MAX_EXACT_BITS} - 1)), "integer result too large");
    CHECK_THROWS_AS(power(Value(7), Value(int32_t{MAX_EXACT_BITS})), OverflowError);

    // Infinite operands are not an overflow
    CHECK(std::isinf(toDouble(power(Value(std::numeric_limits<double>::infinity()), Value(2)))));
    CHECK(std::isinf(evaluate("1e400 ** 2")));
}

SECTION("inexactArithmetic")
{
    CHECK(floorDiv(Value(7.5), Value(2)) == Value(3.0));
    CHECK(Value(-7.5) % Value(2) == Value(0.5));
    CHECK(Value(7.5) % Value(-2) == Value(-0.5));
    CHECK(floorDiv(Value(-0.0), Value(1.0)) == Value(-0.0));
    CHECK(std::signbit(toDouble(Value(-4.0) % Value(-2.0))));
    CHECK(std::signbit(toDouble(floorDiv(Value(-1.0), Value(5.0)))));
    CHECK(toDouble(floorDiv(Value(-1.0), Value(5.0))) == -1.0);

    CHECK_THROWS_AS(Value(1) / Value(0), DivisionByZero);
    CHECK_THROWS_AS(floorDiv(Value(1), Value(0.0)), DivisionByZero);
    CHECK_THROWS_AS(Value(1.0) % Value(0), DivisionByZero);
    CHECK_THROWS_AS(power(Value(0), Value(-1)), DivisionByZero);
    CHECK_THROWS_AS(power(Value(-8.0), Value(0.5)), DomainError);
    CHECK(std::isnan(toDouble(power(Value(std::nan("")), Value(0.5)))));
    CHECK(toDouble(power(Value(-std::numeric_limits<double>::infinity()), Value(0.5))) == std::numeric_limits<double>::infinity());
}

SECTION("formatNumber")
{
    CHECK(formatNumber(13.5) == "13.5");
    CHECK(formatNumber(1024.0) == "1024.0");
    CHECK(formatNumber(3.0) == "3.0");
    CHECK(formatNumber(0.0) == "0.0");
    CHECK(formatNumber(-0.0) == "-0.0");
    CHECK(formatNumber(0.1) == "0.1");
    CHECK(formatNumber(-2.5) == "-2.5");
    CHECK(formatNumber(1.0/3) == "0.3333333333333333");
    CHECK(formatNumber(0.0001) == "0.0001");
    CHECK(formatNumber(1e-5) == "1e-05");
    CHECK(formatNumber(2.5e-10) == "2.5e-10");
    CHECK(formatNumber(1e15) == "1000000000000000.0");
    CHECK(formatNumber(1e16) == "1e+16");
    CHECK(formatNumber(1e22) == "1e+22");
    CHECK(formatNumber(123456789012345680.0) == "1.2345678901234568e+17");
    CHECK(formatNumber(1.7976931348623157e308) == "1.7976931348623157e+308");
    CHECK(formatNumber(std::numeric_limits<double>::infinity()) == "inf");
    CHECK(formatNumber(-std::numeric_limits<double>::infinity()) == "-inf");
    CHECK(formatNumber(std::nan("")) == "nan");

    CHECK(printed(Value(42)) == "42");
    CHECK(printed(Value(42.0)) == "42.0");
}

}

TEST_CASE( "Calculator" ) {

const Calculator calculator{};

SECTION("operations")
{
    CHECK(calculator.add(2, 3) == 5);
    CHECK(calculator.subtract(5, 2) == 3);
    CHECK(calculator.multiply(3, 4) == 12);
    CHECK(calculator.divide(7, 2) == 3.5);
    CHECK(calculator.power(2, 3) == 8);
    CHECK(calculator.power(-8, 3) == -512);
    CHECK(calculator.power(4, 0.5) == 2);
    CHECK(calculator.power(2, 0.5) == Approx(1.4142135623730951));
    CHECK(calculator.sqrt(9) == 3);
    CHECK(calculator.sqrt(0) == 0);
    CHECK(calculator.evaluate("2 + 3 * 4 - 1/2") == 13.5);

    CHECK_THROWS_AS(calculator.divide(1, 0), DivisionByZero);
    CHECK_THROWS_AS(calculator.divide(0, 0), DivisionByZero);
    CHECK_THROWS_AS(calculator.divide(1, -0.0), DivisionByZero);
    CHECK_THROWS_AS(calculator.power(0, -1), DivisionByZero);
    CHECK_THROWS_AS(calculator.power(-8, 0.5), DomainError);
    CHECK_THROWS_AS(calculator.power(10, 400), OverflowError);
    CHECK_THROWS_WITH(calculator.power(2, 10000), "Numerical result out of range");
    CHECK_THROWS_AS(calculator.sqrt(-1), DomainError);
    CHECK_THROWS_AS(calculator.sqrt(-1e-300), DomainError);
    CHECK_THROWS_AS(calculator.evaluate("__import__('os').system('echo no')"), UnsupportedExpression);
}

SECTION("divideMatchesDivision")
{
    const double values[] = {0.0, 1.0, -1.0, 2.5, -7.0, 1e-9, 3.0e12, 12345.678};
    for (auto a : values) {
        for (auto b : values) {
            if (b == 0.0) {
                CHECK_THROWS_AS(calculator.divide(a, b), DivisionByZero);
            } else {
                CHECK(calculator.divide(a, b) == a / b);
            }
        }
    }
}

SECTION("evaluateMatchesDivide")
{
    const double values[] = {1.0, -1.0, 2.5, -7.0, 0.001, 3.0e12, 12345.678};
    for (auto a : values) {
        for (auto b : values) {
            const string exp = formatNumber(a) + " / " + formatNumber(b);
            INFO("Expression: " << exp);
            CHECK(calculator.evaluate(exp) == Approx(calculator.divide(a, b)));
        }
    }
}

SECTION("sqrtSquares")
{
    const double values[] = {0.0, 0.25, 1.0, 2.0, 10.0, 12345.678, 1e10, 1e-10};
    for (auto a : values) {
        auto r = calculator.sqrt(a);
        CHECK(r >= 0.0);
        CHECK(r * r == Approx(a));
    }
}

}

TEST_CASE( "C interface" ) {

SECTION("evaluate")
{
    double r = 0.0;
    CHECK(calc_evaluate("2 + 3 * 4 - 1/2", &r) == CALC_OK);
    CHECK(r == 13.5);
    CHECK(calc_evaluate("1/0", &r) == CALC_DIVISION_BY_ZERO);
    CHECK(calc_evaluate("(-8) ** 0.5", &r) == CALC_DOMAIN_ERROR);
    CHECK(calc_evaluate("x", &r) == CALC_UNSUPPORTED_EXPRESSION);
    CHECK(calc_evaluate("1 +", &r) == CALC_SYNTAX_ERROR);
    CHECK(calc_evaluate("2.0 ** 10000", &r) == CALC_OVERFLOW_ERROR);
    CHECK(calc_evaluate("10 ** 400", &r) == CALC_OVERFLOW_ERROR);
    CHECK(calc_evaluate("2 ** 10 ** 10", &r) == CALC_OVERFLOW_ERROR);
    CHECK(r == 13.5);
    CHECK(calc_evaluate("3 ** 40 % 7", &r) == CALC_OK);
    CHECK(r == 4.0);

    CHECK(string(calc_status_message(CALC_OK)) == "ok");
    CHECK(string(calc_status_message(CALC_DIVISION_BY_ZERO)) == "division by zero");
    CHECK(string(calc_status_message(CALC_OVERFLOW_ERROR)) == "numerical result out of range");
    CHECK(string(calc_status_message(CALC_INTERNAL_ERROR)) == "internal error");
}

SECTION("expressionHandle")
{
    CHECK(calc_expression("1 +") == nullptr);
    CHECK(calc_expression("abs(1)") == nullptr);

    auto exp = calc_expression("2 ** 10");
    REQUIRE(exp != nullptr);
    double r1 = 0.0;
    double r2 = 0.0;
    CHECK(calc_expression_eval(exp, &r1) == CALC_OK);
    CHECK(calc_expression_eval(exp, &r2) == CALC_OK);
    CHECK(r1 == 1024.0);
    CHECK(r1 == r2);
    calc_expression_free(exp);

    exp = calc_expression("1 // (2 - 2)");
    REQUIRE(exp != nullptr);
    CHECK(calc_expression_eval(exp, &r1) == CALC_DIVISION_BY_ZERO);
    calc_expression_free(exp);

    exp = calc_expression("2 ** 1024");
    REQUIRE(exp != nullptr);
    CHECK(calc_expression_eval(exp, &r1) == CALC_OVERFLOW_ERROR);
    CHECK(r1 == 1024.0);
    calc_expression_free(exp);

    CHECK(calc_expression(string(201, '(').c_str()) == nullptr);
}

}

}
