#ifndef CALC_SYNTAX_H
#define CALC_SYNTAX_H

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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "calculator_export.h"

namespace calc {

// Every kind of expression the grammar recognises. Only a few of these
// can ever be evaluated.
enum class SyntaxKind : uint8_t {
    Constant,
    Name,
    UnaryOp,
    BinaryOp,
    BoolOp,
    Compare,
    IfExp,
    Lambda,
    Call,
    Keyword,
    Attribute,
    Subscript,
    Slice,
    Starred,
    Tuple,
    List,
    Set,
    Dict,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    Comprehension,
    NamedExpr,
    Await,
    Yield
};

enum class ConstantKind : uint8_t {
    Integer,
    Float,
    Imaginary,
    String,
    Bytes,
    FormattedString,
    True,
    False,
    None,
    Ellipsis
};

enum class SyntaxUnaryOp : uint8_t {
    UAdd,
    USub,
    Invert,
    Not
};

enum class SyntaxBinaryOp : uint8_t {
    Add,
    Sub,
    Mult,
    Div,
    FloorDiv,
    Mod,
    Pow,
    MatMult,
    LShift,
    RShift,
    BitOr,
    BitXor,
    BitAnd
};

// Result of parsing: a general tree in which children hold the operands
// in source order. text is the literal or name as written, or the operator.
struct SyntaxNode {
    SyntaxKind kind;
    std::string text;
    ConstantKind constant = ConstantKind::None;
    SyntaxUnaryOp unaryOp = SyntaxUnaryOp::UAdd;
    SyntaxBinaryOp binaryOp = SyntaxBinaryOp::Add;
    std::vector<std::unique_ptr<SyntaxNode>> children;
    // Length of the longest path down to a leaf (a leaf has height 1)
    std::size_t height = 1;
};

// Nesting of brackets, calls and subscripts
constexpr unsigned int MAX_NESTING = 200;
// Chains of unary operators, powers, lambdas and conditionals
constexpr unsigned int MAX_DEPTH = 1000;
// Keeps evaluation and destruction recursion within bounds
constexpr std::size_t MAX_HEIGHT = 1000;

// Parse text as a single expression, throws SyntaxError
CALCULATOR_EXPORT std::unique_ptr<SyntaxNode> parse(std::string_view text);

// Human readable name of the construct, eg "function call"
CALCULATOR_EXPORT const char* describe(SyntaxKind);
CALCULATOR_EXPORT const char* describe(ConstantKind);
CALCULATOR_EXPORT const char* describe(SyntaxUnaryOp);
CALCULATOR_EXPORT const char* describe(SyntaxBinaryOp);

}

#endif
