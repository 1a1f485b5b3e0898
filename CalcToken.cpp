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

#include "CalcToken.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

using std::ostream;
using std::string;
using std::string_view;
using std::unordered_map;

/*
 * Lexical structure (informal):
 *
 * Identifier ::= (Alpha | "_" | NonAscii) (Alpha | Digit | "_" | NonAscii)*
 * Keywords are reserved identifiers; only some can appear in an expression
 *
 * DigitPart(D) ::= D ("_"? D)*
 * Integer ::= "0" ("x"|"X") "_"? DigitPart(HexDigit) |
 *             "0" ("o"|"O") "_"? DigitPart(OctDigit) |
 *             "0" ("b"|"B") "_"? DigitPart(BinDigit) |
 *             NonZeroDigit ("_"? Digit)* | "0"+ ("_"? "0")*
 * Exponent ::= ("e"|"E") ("+"|"-")? DigitPart(Digit)
 * Float ::= DigitPart(Digit)? "." DigitPart(Digit) Exponent? |
 *           DigitPart(Digit) "." Exponent? |
 *           DigitPart(Digit) Exponent
 * Imaginary ::= (Float | DigitPart(Digit)) ("j"|"J")
 * A number must not run straight into an identifier ("1abc", "0b12")
 *
 * StringPrefix ::= "r" | "u" | "b" | "br" | "rb" | "f" | "fr" | "rf" // Case insensitive
 * String ::= StringPrefix? (ShortString | LongString)
 * Backslash always escapes the next character, even in raw strings
 *
 * Whitespace, comments ("#" to end of line) and backslash line continuations
 * are skipped. Newlines are tokens.
 */

namespace calc {

namespace {

const unordered_map<string_view, TokenType> keywords = {
    {"False", T_FALSE},
    {"None", T_NONE},
    {"True", T_TRUE},
    {"and", T_AND},
    {"as", T_RESERVED},
    {"assert", T_RESERVED},
    {"async", T_ASYNC},
    {"await", T_AWAIT},
    {"break", T_RESERVED},
    {"class", T_RESERVED},
    {"continue", T_RESERVED},
    {"def", T_RESERVED},
    {"del", T_RESERVED},
    {"elif", T_RESERVED},
    {"else", T_ELSE},
    {"except", T_RESERVED},
    {"finally", T_RESERVED},
    {"for", T_FOR},
    {"from", T_RESERVED},
    {"global", T_RESERVED},
    {"if", T_IF},
    {"import", T_RESERVED},
    {"in", T_IN},
    {"is", T_IS},
    {"lambda", T_LAMBDA},
    {"nonlocal", T_RESERVED},
    {"not", T_NOT},
    {"or", T_OR},
    {"pass", T_RESERVED},
    {"raise", T_RESERVED},
    {"return", T_RESERVED},
    {"try", T_RESERVED},
    {"while", T_RESERVED},
    {"with", T_RESERVED},
    {"yield", T_YIELD}
};

// Longest first so that "**=" beats "**" beats "*"
const std::pair<string_view, TokenType> operators[] = {
    {"**=", T_AUGASSIGN},
    {"//=", T_AUGASSIGN},
    {">>=", T_AUGASSIGN},
    {"<<=", T_AUGASSIGN},
    {"...", T_ELLIPSIS},
    {"**", T_POW},
    {"//", T_FLOORDIV},
    {"<<", T_LSHIFT},
    {">>", T_RSHIFT},
    {"<=", T_LSEQ},
    {">=", T_GREQ},
    {"==", T_EQUAL},
    {"!=", T_NEQ},
    {"->", T_ARROW},
    {":=", T_WALRUS},
    {"+=", T_AUGASSIGN},
    {"-=", T_AUGASSIGN},
    {"*=", T_AUGASSIGN},
    {"/=", T_AUGASSIGN},
    {"%=", T_AUGASSIGN},
    {"&=", T_AUGASSIGN},
    {"|=", T_AUGASSIGN},
    {"^=", T_AUGASSIGN},
    {"@=", T_AUGASSIGN},
    {"+", T_PLUS},
    {"-", T_MINUS},
    {"*", T_MULT},
    {"/", T_DIV},
    {"%", T_MOD},
    {"@", T_MATMUL},
    {"&", T_BITAND},
    {"|", T_BITOR},
    {"^", T_BITXOR},
    {"~", T_INVERT},
    {"<", T_LESS},
    {">", T_GRT},
    {"(", T_LPAREN},
    {")", T_RPAREN},
    {"[", T_LBRACKET},
    {"]", T_RBRACKET},
    {"{", T_LBRACE},
    {"}", T_RBRACE},
    {",", T_COMMA},
    {":", T_COLON},
    {";", T_SEMICOLON},
    {".", T_DOT},
    {"=", T_ASSIGN}
};

inline bool isDecDigit(char c) { return c>='0' && c<='9'; }
inline bool isHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)); }
inline bool isOctDigit(char c) { return c>='0' && c<='7'; }
inline bool isBinDigit(char c) { return c=='0' || c=='1'; }

inline bool isIdentifierStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c=='_' || static_cast<unsigned char>(c)>=0x80;
}

inline bool isIdentifierPart(char c)
{
    return isIdentifierStart(c) || isDecDigit(c);
}

// Index just past the digits (with single "_" separators) starting at i,
// i itself if there is no digit there
template <typename F>
std::size_t digitPart(string_view sv, std::size_t i, F isDigit)
{
    if (i>=sv.size() || !isDigit(sv[i])) return i;
    ++i;
    while (i<sv.size()) {
        if (isDigit(sv[i])) {
            ++i;
        } else if (sv[i]=='_' && i+1<sv.size() && isDigit(sv[i+1])) {
            i += 2;
        } else {
            break;
        }
    }
    return i;
}

void skipWhitespace(string_view& sv)
{
    while (!sv.empty()) {
        switch (sv[0]) {
        case ' ':
        case '\t':
        case '\f':
            sv.remove_prefix(1);
            continue;
        case '#': {
            auto e = sv.find_first_of("\r\n");
            sv.remove_prefix(e==string_view::npos ? sv.size() : e);
            continue;
        }
        case '\\':
            if (sv.substr(1, 2)=="\r\n") {
                sv.remove_prefix(3);
                continue;
            } else if (sv.size()>1 && (sv[1]=='\n' || sv[1]=='\r')) {
                sv.remove_prefix(2);
                continue;
            }
            return;
        default:
            return;
        }
    }
}

bool tokeniseNumber(string_view& sv, Token& tok, string& error)
{
    std::size_t i = 0;
    TokenType type = T_NUMERIC_EXACT;

    if (sv.size()>1 && sv[0]=='0' && std::strchr("xXoObB", sv[1])) {
        const char* kind;
        std::size_t j;
        i = 2;
        if (i<sv.size() && sv[i]=='_') ++i;
        switch (sv[1]) {
        case 'x': case 'X': kind = "hexadecimal"; j = digitPart(sv, i, isHexDigit); break;
        case 'o': case 'O': kind = "octal"; j = digitPart(sv, i, isOctDigit); break;
        default:            kind = "binary"; j = digitPart(sv, i, isBinDigit); break;
        }
        if (j==i || (j<sv.size() && isIdentifierPart(sv[j]))) {
            error = string("invalid ") + kind + " literal";
            return false;
        }
        i = j;
    } else {
        i = digitPart(sv, 0, isDecDigit);
        // Only all zero decimal integers may start with "0"
        auto whole = sv.substr(0, i);
        bool leadingZero = i>0 && whole[0]=='0' && whole.find_first_not_of("0_")!=string_view::npos;

        if (i<sv.size() && sv[i]=='.') {
            type = T_NUMERIC_APPROX;
            i = digitPart(sv, i+1, isDecDigit);
        }
        if (i<sv.size() && (sv[i]=='e' || sv[i]=='E')) {
            auto j = i+1;
            if (j<sv.size() && (sv[j]=='+' || sv[j]=='-')) ++j;
            auto k = digitPart(sv, j, isDecDigit);
            if (k!=j) {
                type = T_NUMERIC_APPROX;
                i = k;
            }
        }
        if (i<sv.size() && (sv[i]=='j' || sv[i]=='J')) {
            type = T_NUMERIC_IMAGINARY;
            ++i;
        }
        if (type==T_NUMERIC_EXACT && leadingZero) {
            error = "leading zeros in decimal integer literals are not permitted";
            return false;
        }
        if (i<sv.size() && isIdentifierPart(sv[i])) {
            error = "invalid decimal literal";
            return false;
        }
    }

    tok = Token(type, sv.substr(0, i));
    sv.remove_prefix(i);
    return true;
}

// Quoted string starting after a prefix of prefixLength characters
bool tokeniseString(string_view& sv, std::size_t prefixLength, Token& tok, string& error)
{
    std::size_t i = prefixLength;
    const char q = sv[i];
    const string longQuote(3, q);
    const bool triple = sv.substr(i, 3)==longQuote;
    i += triple ? 3 : 1;

    while (i<sv.size()) {
        char c = sv[i];
        if (c=='\\') {
            i += 2;
            continue;
        }
        if (!triple && (c=='\n' || c=='\r')) break;
        if (c==q) {
            if (!triple) {
                ++i;
                tok = Token(T_STRING, sv.substr(0, i));
                sv.remove_prefix(i);
                return true;
            }
            if (sv.substr(i, 3)==longQuote) {
                i += 3;
                tok = Token(T_STRING, sv.substr(0, i));
                sv.remove_prefix(i);
                return true;
            }
        }
        ++i;
    }
    error = triple ? "unterminated triple-quoted string literal" : "unterminated string literal";
    return false;
}

bool isStringPrefix(string_view word)
{
    string p;
    std::transform(word.begin(), word.end(), std::back_inserter(p),
                   [](char c) { return std::tolower(static_cast<unsigned char>(c)); });
    return p=="r" || p=="u" || p=="b" || p=="br" || p=="rb" || p=="f" || p=="fr" || p=="rf";
}

// Identifier, keyword or prefixed string
bool tokeniseWord(string_view& sv, Token& tok, string& error)
{
    std::size_t i = 1;
    while (i<sv.size() && isIdentifierPart(sv[i])) ++i;
    auto word = sv.substr(0, i);

    if (i<sv.size() && (sv[i]=='\'' || sv[i]=='"') && isStringPrefix(word)) {
        return tokeniseString(sv, i, tok, error);
    }

    auto k = keywords.find(word);
    tok = Token(k==keywords.end() ? T_IDENTIFIER : k->second, word);
    sv.remove_prefix(i);
    return true;
}

bool tokeniseOperator(string_view& sv, Token& tok, string& error)
{
    for (auto& [op, type] : operators) {
        if (sv.substr(0, op.size())==op) {
            tok = Token(type, op);
            sv.remove_prefix(op.size());
            return true;
        }
    }
    error = "invalid character";
    return false;
}

}

ostream& operator<<(ostream& os, const Token& t)
{
    os << "T<" << int(t.type) << ">:" << t.val;
    return os;
}

TokenException::TokenException(const string& msg) :
    SyntaxError(msg)
{}

auto tokenise(string_view& sv, Token& tok, string& error) -> bool
{
    auto s = sv;
    skipWhitespace(s);

    if (s.empty()) {
        tok = Token(T_EOS, "");
        sv = s;
        return true;
    }

    bool r;
    char c = s[0];
    if (c=='\n' || c=='\r') {
        std::size_t n = s.substr(0, 2)=="\r\n" ? 2 : 1;
        tok = Token(T_NEWLINE, s.substr(0, n));
        s.remove_prefix(n);
        r = true;
    } else if (isDecDigit(c) || (c=='.' && s.size()>1 && isDecDigit(s[1]))) {
        r = tokeniseNumber(s, tok, error);
    } else if (c=='\'' || c=='"') {
        r = tokeniseString(s, 0, tok, error);
    } else if (isIdentifierStart(c)) {
        r = tokeniseWord(s, tok, error);
    } else {
        r = tokeniseOperator(s, tok, error);
    }

    if (r) sv = s;
    return r;
}

auto tokenise(string_view& sv, Token& tok) -> bool
{
    string error;
    return tokenise(sv, tok, error);
}

Tokeniser::Tokeniser(string_view input0) :
    tokp(0),
    nesting(0),
    input(input0)
{}

auto Tokeniser::returnTokens(unsigned int n) -> void
{
    tokp = n>tokp ? 0 : tokp-n;
}

auto Tokeniser::nextToken() -> const Token&
{
    if (tokp<tokens.size()) return tokens[tokp++];

    // Keep on returning end of input, but each one can be returned
    if (!tokens.empty() && tokens.back().type==T_EOS) {
        tokens.push_back(tokens.back());
        return tokens[tokp++];
    }

    Token tok;
    string error;
    while (true) {
        if (!tokenise(input, tok, error)) {
            auto bad = input;
            skipWhitespace(bad);
            bad = bad.substr(0, bad.find_first_of(" \t\r\n"));
            throw TokenException("Illegal expression: '" + string(bad) + "': " + error);
        }
        // Line breaks don't matter inside brackets
        if (tok.type==T_NEWLINE && nesting>0) continue;
        break;
    }

    switch (tok.type) {
    case T_LPAREN:
    case T_LBRACKET:
    case T_LBRACE:
        ++nesting;
        break;
    case T_RPAREN:
    case T_RBRACKET:
    case T_RBRACE:
        if (nesting>0) --nesting;
        break;
    default:
        break;
    }

    tokens.push_back(std::move(tok));
    return tokens[tokp++];
}

auto Tokeniser::remaining() -> std::string_view
{
    return input;
}

}
