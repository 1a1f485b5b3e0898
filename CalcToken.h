#ifndef CALC_TOKEN_H
#define CALC_TOKEN_H

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

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "CalcException.h"
#include "calculator_export.h"

namespace calc {

enum TokenType : uint8_t {
    T_EOS,
    T_NEWLINE,
    T_IDENTIFIER,
    // Keywords that can appear in an expression
    T_FALSE,
    T_NONE,
    T_TRUE,
    T_AND,
    T_OR,
    T_NOT,
    T_IN,
    T_IS,
    T_IF,
    T_ELSE,
    T_LAMBDA,
    T_FOR,
    T_ASYNC,
    T_AWAIT,
    T_YIELD,
    // Any other keyword (import, def, return...)
    T_RESERVED,
    T_NUMERIC_EXACT,
    T_NUMERIC_APPROX,
    T_NUMERIC_IMAGINARY,
    T_STRING,
    T_LPAREN,
    T_RPAREN,
    T_LBRACKET,
    T_RBRACKET,
    T_LBRACE,
    T_RBRACE,
    T_COMMA,
    T_COLON,
    T_SEMICOLON,
    T_DOT,
    T_ELLIPSIS,
    T_ARROW,
    T_ASSIGN,
    T_AUGASSIGN,
    T_WALRUS,
    T_PLUS,
    T_MINUS,
    T_MULT,
    T_DIV,
    T_FLOORDIV,
    T_MOD,
    T_POW,
    T_MATMUL,
    T_LSHIFT,
    T_RSHIFT,
    T_BITAND,
    T_BITOR,
    T_BITXOR,
    T_INVERT,
    T_EQUAL,
    T_NEQ,
    T_LESS,
    T_GRT,
    T_LSEQ,
    T_GREQ
};

// val holds the token text exactly as written, including any string
// prefix and quotes
struct Token {
    TokenType type;
    std::string val;

    Token() :
        type(T_EOS)
    {}

    Token(TokenType t, std::string_view v) :
        type(t),
        val(v)
    {}

    auto operator==(const Token& r) const -> bool
    {
        return
            (type == T_EOS && r.type == T_EOS) ||
            (type == r.type && val == r.val);
    }
};

CALCULATOR_EXPORT
auto operator<<(std::ostream& os, const Token& t) -> std::ostream&;

class CALCULATOR_EXPORT
TokenException : public SyntaxError {
public:
    TokenException(const std::string&);
};

// Skip whitespace and read one token from the front of sv.
// On success sv is advanced past the token; on failure sv is unchanged.
CALCULATOR_EXPORT
auto tokenise(std::string_view& sv, Token& tok) -> bool;

// As above, but say what was wrong with the input on failure
CALCULATOR_EXPORT
auto tokenise(std::string_view& sv, Token& tok, std::string& error) -> bool;

// Token stream with unlimited push back. Newlines inside brackets are
// dropped; a bad token throws TokenException.
class
Tokeniser {
    std::vector<Token> tokens;
    unsigned int tokp;
    unsigned int nesting;

    std::string_view input;

public:
    CALCULATOR_EXPORT explicit Tokeniser(std::string_view input);
    CALCULATOR_EXPORT auto returnTokens(unsigned int n = 1) -> void;
    CALCULATOR_EXPORT auto nextToken() -> const Token&;
    CALCULATOR_EXPORT auto remaining() -> std::string_view;
};

}

#endif
