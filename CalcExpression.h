#ifndef CALC_EXPRESSION_H
#define CALC_EXPRESSION_H

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

#include "CalcValue.h"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <variant>

#include "calculator_export.h"

namespace calc {

struct SyntaxNode;

enum class UnaryOperator : uint8_t {
    Plus,
    Minus
};

enum class BinaryOperator : uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Pow,
    FloorDiv,
    Mod
};

struct Expression;

struct NumberLiteral {
    Value value;
};

struct UnaryOp {
    UnaryOperator op;
    std::unique_ptr<Expression> operand;
};

struct BinaryOp {
    BinaryOperator op;
    std::unique_ptr<Expression> left;
    std::unique_ptr<Expression> right;
};

// The only things that can be evaluated: numbers and arithmetic on them
struct Expression {
    std::variant<NumberLiteral, UnaryOp, BinaryOp> node;
};

// Keep only what can be evaluated, throws UnsupportedExpression on anything else
CALCULATOR_EXPORT std::unique_ptr<Expression> make_expression(const SyntaxNode&);

// Parse and restrict, throws SyntaxError or UnsupportedExpression
CALCULATOR_EXPORT std::unique_ptr<Expression> make_expression(const std::string& exp);

// Evaluate left before right, throws DivisionByZero or DomainError
CALCULATOR_EXPORT Value eval(const Expression&);

CALCULATOR_EXPORT double evaluate(const std::string& exp);

CALCULATOR_EXPORT std::ostream& operator<<(std::ostream&, const Expression&);
CALCULATOR_EXPORT std::ostream& operator<<(std::ostream&, UnaryOperator);
CALCULATOR_EXPORT std::ostream& operator<<(std::ostream&, BinaryOperator);

}

#endif
