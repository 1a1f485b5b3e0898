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

#include "CalcExpression.h"

#include "CalcException.h"
#include "CalcSyntax.h"
#include "CalcValue.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <ostream>
#include <string>
#include <variant>

using std::make_unique;
using std::ostream;
using std::string;
using std::unique_ptr;

namespace calc {

////////////////////////////////////////////////////

// Numeric literals

static Value integerLiteral(const string& text)
{
    string s;
    std::remove_copy(text.begin(), text.end(), std::back_inserter(s), '_');

    int base = 10;
    if (s.size()>1 && s[0]=='0') {
        switch (s[1]) {
        case 'x': case 'X': base = 16; s = s.substr(2); break;
        case 'o': case 'O': base = 8; s = s.substr(2); break;
        case 'b': case 'B': base = 2; s = s.substr(2); break;
        default: break;
        }
    }

    return exactValue(s, base);
}

static Value floatLiteral(const string& text)
{
    string s;
    std::remove_copy(text.begin(), text.end(), std::back_inserter(s), '_');
    // Out of range literals become infinity or zero, just as strtod has it
    return std::strtod(s.c_str(), nullptr);
}

static unique_ptr<Expression> numberLiteral(const SyntaxNode& n)
{
    switch (n.constant) {
    case ConstantKind::Integer:
        return make_unique<Expression>(Expression{NumberLiteral{integerLiteral(n.text)}});
    case ConstantKind::Float:
        return make_unique<Expression>(Expression{NumberLiteral{floatLiteral(n.text)}});
    case ConstantKind::Imaginary:
    case ConstantKind::String:
    case ConstantKind::Bytes:
    case ConstantKind::FormattedString:
    case ConstantKind::True:
    case ConstantKind::False:
    case ConstantKind::None:
    case ConstantKind::Ellipsis:
        break;
    }
    throw UnsupportedExpression(string("Only numeric constants are allowed, not ") + describe(n.constant));
}

////////////////////////////////////////////////////

// The allow list: numbers, unary + and -, and + - * / ** // %.
// Operands are checked before their operator.

unique_ptr<Expression> make_expression(const SyntaxNode& n)
{
    switch (n.kind) {
    case SyntaxKind::Constant:
        return numberLiteral(n);

    case SyntaxKind::UnaryOp: {
        auto operand = make_expression(*n.children.at(0));
        UnaryOperator op;
        switch (n.unaryOp) {
        case SyntaxUnaryOp::UAdd: op = UnaryOperator::Plus; break;
        case SyntaxUnaryOp::USub: op = UnaryOperator::Minus; break;
        case SyntaxUnaryOp::Invert:
        case SyntaxUnaryOp::Not:
        default:
            throw UnsupportedExpression(string("Unsupported unary operator: ") + describe(n.unaryOp));
        }
        return make_unique<Expression>(Expression{UnaryOp{op, std::move(operand)}});
    }

    case SyntaxKind::BinaryOp: {
        auto left = make_expression(*n.children.at(0));
        auto right = make_expression(*n.children.at(1));
        BinaryOperator op;
        switch (n.binaryOp) {
        case SyntaxBinaryOp::Add:      op = BinaryOperator::Add; break;
        case SyntaxBinaryOp::Sub:      op = BinaryOperator::Sub; break;
        case SyntaxBinaryOp::Mult:     op = BinaryOperator::Mul; break;
        case SyntaxBinaryOp::Div:      op = BinaryOperator::Div; break;
        case SyntaxBinaryOp::Pow:      op = BinaryOperator::Pow; break;
        case SyntaxBinaryOp::FloorDiv: op = BinaryOperator::FloorDiv; break;
        case SyntaxBinaryOp::Mod:      op = BinaryOperator::Mod; break;
        case SyntaxBinaryOp::MatMult:
        case SyntaxBinaryOp::LShift:
        case SyntaxBinaryOp::RShift:
        case SyntaxBinaryOp::BitOr:
        case SyntaxBinaryOp::BitXor:
        case SyntaxBinaryOp::BitAnd:
        default:
            throw UnsupportedExpression(string("Unsupported operator: ") + describe(n.binaryOp));
        }
        return make_unique<Expression>(Expression{BinaryOp{op, std::move(left), std::move(right)}});
    }

    case SyntaxKind::Name:
    case SyntaxKind::BoolOp:
    case SyntaxKind::Compare:
    case SyntaxKind::IfExp:
    case SyntaxKind::Lambda:
    case SyntaxKind::Call:
    case SyntaxKind::Keyword:
    case SyntaxKind::Attribute:
    case SyntaxKind::Subscript:
    case SyntaxKind::Slice:
    case SyntaxKind::Starred:
    case SyntaxKind::Tuple:
    case SyntaxKind::List:
    case SyntaxKind::Set:
    case SyntaxKind::Dict:
    case SyntaxKind::ListComp:
    case SyntaxKind::SetComp:
    case SyntaxKind::DictComp:
    case SyntaxKind::GeneratorExp:
    case SyntaxKind::Comprehension:
    case SyntaxKind::NamedExpr:
    case SyntaxKind::Await:
    case SyntaxKind::Yield:
        break;
    }
    throw UnsupportedExpression(string("Unsupported expression element: ") + describe(n.kind));
}

unique_ptr<Expression> make_expression(const string& exp)
{
    auto syntax = parse(exp);
    return make_expression(*syntax);
}

////////////////////////////////////////////////////

// Evaluation

Value eval(const Expression& e)
{
    return std::visit(overload(
        [](const NumberLiteral& n) {
            return n.value;
        },
        [](const UnaryOp& u) {
            Value v = eval(*u.operand);
            switch (u.op) {
            case UnaryOperator::Plus:  return v;
            case UnaryOperator::Minus: return -v;
            }
            throw UnsupportedExpression("Unsupported unary operator");
        },
        [](const BinaryOp& b) {
            Value l = eval(*b.left);
            Value r = eval(*b.right);
            switch (b.op) {
            case BinaryOperator::Add:      return l + r;
            case BinaryOperator::Sub:      return l - r;
            case BinaryOperator::Mul:      return l * r;
            case BinaryOperator::Div:      return l / r;
            case BinaryOperator::Pow:      return power(l, r);
            case BinaryOperator::FloorDiv: return floorDiv(l, r);
            case BinaryOperator::Mod:      return l % r;
            }
            throw UnsupportedExpression("Unsupported operator");
        }
    ), e.node);
}

double evaluate(const string& exp)
{
    auto e = make_expression(exp);
    return toDouble(eval(*e));
}

////////////////////////////////////////////////////

ostream& operator<<(ostream& os, UnaryOperator op)
{
    switch (op) {
    case UnaryOperator::Plus:  os << "+"; break;
    case UnaryOperator::Minus: os << "-"; break;
    }
    return os;
}

ostream& operator<<(ostream& os, BinaryOperator op)
{
    switch (op) {
    case BinaryOperator::Add:      os << "+"; break;
    case BinaryOperator::Sub:      os << "-"; break;
    case BinaryOperator::Mul:      os << "*"; break;
    case BinaryOperator::Div:      os << "/"; break;
    case BinaryOperator::Pow:      os << "**"; break;
    case BinaryOperator::FloorDiv: os << "//"; break;
    case BinaryOperator::Mod:      os << "%"; break;
    }
    return os;
}

ostream& operator<<(ostream& os, const Expression& e)
{
    std::visit(overload(
        [&](const NumberLiteral& n) { os << n.value; },
        [&](const UnaryOp& u) { os << u.op << "(" << *u.operand << ")"; },
        [&](const BinaryOp& b) { os << "(" << *b.left << b.op << *b.right << ")"; }
    ), e.node);
    return os;
}

}
