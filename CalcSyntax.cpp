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

#include "CalcSyntax.h"

#include "CalcException.h"
#include "CalcToken.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using std::make_unique;
using std::string;
using std::string_view;
using std::unique_ptr;
using std::vector;

/*
 * Expression syntax (informal).
 * Everything here is recognised; what may be evaluated is decided later.
 *
 * The top level term is Input
 *
 * Input ::= NEWLINE* Expressions NEWLINE* EOS
 *
 * Expressions ::= StarExpression ( "," StarExpression )* ","?   // Tuple if any ","
 * StarExpression ::= "*" BitOr | Expression
 * StarNamedExpression ::= "*" BitOr | NamedExpression
 * NamedExpression ::= Identifier ":=" Expression | Expression
 *
 * Expression ::= "lambda" LambdaParams? ":" Expression |
 *                Disjunction ( "if" Disjunction "else" Expression )?
 *
 * Disjunction ::= Conjunction ( "or" Conjunction )*
 * Conjunction ::= Inversion ( "and" Inversion )*
 * Inversion ::= "not" Inversion | Comparison
 * Comparison ::= BitOr ( CompOp BitOr )*
 * CompOp ::= "==" | "!=" | "<" | ">" | "<=" | ">=" | "in" | "not" "in" | "is" | "is" "not"
 *
 * BitOr ::= BitXor ( "|" BitXor )*
 * BitXor ::= BitAnd ( "^" BitAnd )*
 * BitAnd ::= Shift ( "&" Shift )*
 * Shift ::= Sum ( ( "<<" | ">>" ) Sum )*
 * Sum ::= Term ( ( "+" | "-" ) Term )*
 * Term ::= Factor ( ( "*" | "/" | "//" | "%" | "@" ) Factor )*
 * Factor ::= ( "+" | "-" | "~" ) Factor | Power
 * Power ::= AwaitPrimary ( "**" Factor )?     // So -2**2 is -(2**2) and 2**-1 is 2**(-1)
 * AwaitPrimary ::= "await" Primary | Primary
 *
 * Primary ::= Atom ( "." Identifier | "(" Arguments? ")" | "[" Slices "]" )*
 * Arguments ::= Argument ( "," Argument )* ","?
 * Argument ::= "*" Expression | "**" Expression | Identifier "=" Expression |
 *              NamedExpression ForIfClauses?
 * Slices ::= Slice ( "," Slice )* ","?
 * Slice ::= Expression? ":" Expression? ( ":" Expression? )? | StarNamedExpression
 *
 * Atom ::= Identifier | "True" | "False" | "None" | "..." | Number | String+ |
 *          "(" ")" | "(" "yield" ( "from" Expression | Expressions )? ")" |
 *          "(" StarNamedExpression ForIfClauses ")" |
 *          "(" StarNamedExpression ")" |
 *          "(" StarNamedExpression "," ( StarNamedExpression "," )* StarNamedExpression? ")" |
 *          "[" StarNamedExpression ForIfClauses "]" |
 *          "[" ( StarNamedExpression ( "," StarNamedExpression )* ","? )? "]" |
 *          "{" StarNamedExpression ForIfClauses "}" |
 *          "{" Expression ":" Expression ForIfClauses "}" |
 *          "{" ( DictItem ( "," DictItem )* ","? )? "}" |
 *          "{" StarNamedExpression ( "," StarNamedExpression )* ","? "}"
 * DictItem ::= Expression ":" Expression | "**" BitOr
 *
 * ForIfClauses ::= ( "async"? "for" Targets "in" Disjunction ( "if" Disjunction )* )+
 * Targets ::= StarTarget ( "," StarTarget )* ","?
 * StarTarget ::= "*" BitOr | BitOr
 *
 * LambdaParams ::= LambdaParam ( "," LambdaParam )* ","?
 * LambdaParam ::= Identifier ( "=" Expression )? | "*" Identifier? | "**" Identifier | "/"
 */

namespace calc {

using NodePtr = unique_ptr<SyntaxNode>;

[[noreturn]] void throwParseError(const Token& token, const string& msg) {
    string error("Illegal expression: '");
    error += token.val;
    error += "': ";
    error += msg;
    throw SyntaxError(error);
}

[[noreturn]] void throwParseError(Tokeniser& tokeniser, const string& msg) {
    tokeniser.returnTokens();
    throwParseError(tokeniser.nextToken(), msg);
}

template <typename ...Ns>
vector<NodePtr> nodes(Ns... ns)
{
    vector<NodePtr> v;
    (v.push_back(std::move(ns)), ...);
    return v;
}

NodePtr makeNode(SyntaxKind kind, string_view text, vector<NodePtr> children = {})
{
    auto n = make_unique<SyntaxNode>();
    n->kind = kind;
    n->text = string{text};
    for (auto& c : children) {
        n->height = std::max(n->height, c->height+1);
    }
    n->children = std::move(children);
    if (n->height > MAX_HEIGHT) {
        throw SyntaxError("Illegal expression: expression too deeply nested");
    }
    return n;
}

NodePtr constant(ConstantKind kind, string_view text)
{
    auto n = makeNode(SyntaxKind::Constant, text);
    n->constant = kind;
    return n;
}

NodePtr unary(SyntaxUnaryOp op, string_view text, NodePtr operand)
{
    auto n = makeNode(SyntaxKind::UnaryOp, text, nodes(std::move(operand)));
    n->unaryOp = op;
    return n;
}

NodePtr binary(SyntaxBinaryOp op, string_view text, NodePtr left, NodePtr right)
{
    auto n = makeNode(SyntaxKind::BinaryOp, text, nodes(std::move(left), std::move(right)));
    n->binaryOp = op;
    return n;
}

bool startsExpression(TokenType t)
{
    switch (t) {
    case T_IDENTIFIER:
    case T_FALSE:
    case T_NONE:
    case T_TRUE:
    case T_NOT:
    case T_LAMBDA:
    case T_AWAIT:
    case T_NUMERIC_EXACT:
    case T_NUMERIC_APPROX:
    case T_NUMERIC_IMAGINARY:
    case T_STRING:
    case T_LPAREN:
    case T_LBRACKET:
    case T_LBRACE:
    case T_ELLIPSIS:
    case T_PLUS:
    case T_MINUS:
    case T_INVERT:
    case T_MULT:
        return true;
    default:
        return false;
    }
}

class Parse {
    Tokeniser& tokeniser;
    unsigned int nesting;

    unsigned int depth;

    // Counts one level for as long as it lives
    class Nested {
        unsigned int& level;

    public:
        Nested(unsigned int& l, unsigned int limit) :
            level(l)
        {
            if (++level > limit) {
                --level;
                throw SyntaxError("Illegal expression: expression nested too deeply");
            }
        }

        ~Nested()
        {
            --level;
        }
    };

    TokenType peek()
    {
        auto t = tokeniser.nextToken().type;
        tokeniser.returnTokens();
        return t;
    }

    bool accept(TokenType t)
    {
        if (tokeniser.nextToken().type==t) return true;
        tokeniser.returnTokens();
        return false;
    }

    void expect(TokenType t, const string& msg)
    {
        if (tokeniser.nextToken().type!=t) {
            throwParseError(tokeniser, msg);
        }
    }

    bool comprehensionFollows()
    {
        auto t = peek();
        return t==T_FOR || t==T_ASYNC;
    }

    void skipNewlines()
    {
        while (tokeniser.nextToken().type==T_NEWLINE) {}
        tokeniser.returnTokens();
    }

public:
    explicit Parse(Tokeniser& t) :
        tokeniser(t),
        nesting(0),
        depth(0)
    {}

    NodePtr input()
    {
        skipNewlines();
        if (tokeniser.nextToken().type==T_EOS) {
            throwParseError(tokeniser, "empty expression");
        }
        tokeniser.returnTokens();
        auto e = expressions();
        skipNewlines();
        if (tokeniser.nextToken().type!=T_EOS) {
            throwParseError(tokeniser, "extra input");
        }
        return e;
    }

private:
    NodePtr expressions()
    {
        auto e = starExpression();
        if (!accept(T_COMMA)) return e;

        vector<NodePtr> items;
        items.push_back(std::move(e));
        while (startsExpression(peek())) {
            items.push_back(starExpression());
            if (!accept(T_COMMA)) break;
        }
        return makeNode(SyntaxKind::Tuple, ",", std::move(items));
    }

    NodePtr starExpression()
    {
        if (accept(T_MULT)) return makeNode(SyntaxKind::Starred, "*", nodes(bitOr()));
        return expression();
    }

    NodePtr starNamedExpression()
    {
        if (accept(T_MULT)) return makeNode(SyntaxKind::Starred, "*", nodes(bitOr()));
        return namedExpression();
    }

    NodePtr namedExpression()
    {
        auto t = tokeniser.nextToken();
        if (t.type==T_IDENTIFIER && accept(T_WALRUS)) {
            return makeNode(SyntaxKind::NamedExpr, ":=", nodes(makeNode(SyntaxKind::Name, t.val), expression()));
        }
        tokeniser.returnTokens();
        return expression();
    }

    NodePtr expression()
    {
        if (accept(T_LAMBDA)) {
            Nested nested(depth, MAX_DEPTH);
            return lambda();
        }

        auto e = disjunction();
        if (!accept(T_IF)) return e;

        auto test = disjunction();
        expect(T_ELSE, "expected 'else' after 'if' expression");
        Nested nested(depth, MAX_DEPTH);
        auto orelse = expression();
        return makeNode(SyntaxKind::IfExp, "if", nodes(std::move(e), std::move(test), std::move(orelse)));
    }

    // Parameters are kept only as text, the defaults and body as children
    NodePtr lambda()
    {
        vector<NodePtr> children;
        string params;
        while (!accept(T_COLON)) {
            auto t = tokeniser.nextToken();
            switch (t.type) {
            case T_IDENTIFIER:
                params += t.val;
                if (accept(T_ASSIGN)) children.push_back(expression());
                break;
            case T_MULT:
                params += "*";
                if (peek()==T_IDENTIFIER) params += tokeniser.nextToken().val;
                break;
            case T_POW: {
                auto n = tokeniser.nextToken();
                if (n.type!=T_IDENTIFIER) {
                    throwParseError(tokeniser, "expected parameter name after '**'");
                }
                params += "**";
                params += n.val;
                break;
            }
            case T_DIV:
                params += "/";
                break;
            default:
                throwParseError(tokeniser, "invalid lambda parameter");
            }
            if (!accept(T_COMMA)) {
                expect(T_COLON, "expected ':' after lambda parameters");
                break;
            }
            params += ",";
        }
        children.push_back(expression());
        return makeNode(SyntaxKind::Lambda, params, std::move(children));
    }

    NodePtr disjunction()
    {
        auto e = conjunction();
        if (peek()!=T_OR) return e;

        vector<NodePtr> values;
        values.push_back(std::move(e));
        while (accept(T_OR)) {
            values.push_back(conjunction());
        }
        return makeNode(SyntaxKind::BoolOp, "or", std::move(values));
    }

    NodePtr conjunction()
    {
        auto e = inversion();
        if (peek()!=T_AND) return e;

        vector<NodePtr> values;
        values.push_back(std::move(e));
        while (accept(T_AND)) {
            values.push_back(inversion());
        }
        return makeNode(SyntaxKind::BoolOp, "and", std::move(values));
    }

    NodePtr inversion()
    {
        if (accept(T_NOT)) {
            Nested nested(depth, MAX_DEPTH);
            return unary(SyntaxUnaryOp::Not, "not", inversion());
        }
        return comparison();
    }

    NodePtr comparison()
    {
        auto e = bitOr();

        vector<NodePtr> operands;
        string ops;
        while (true) {
            const char* op = nullptr;
            switch (tokeniser.nextToken().type) {
            case T_EQUAL: op = "=="; break;
            case T_NEQ:   op = "!="; break;
            case T_LESS:  op = "<"; break;
            case T_GRT:   op = ">"; break;
            case T_LSEQ:  op = "<="; break;
            case T_GREQ:  op = ">="; break;
            case T_IN:    op = "in"; break;
            case T_IS:
                op = accept(T_NOT) ? "is not" : "is";
                break;
            case T_NOT:
                // Only "not in" continues a comparison
                if (tokeniser.nextToken().type==T_IN) {
                    op = "not in";
                } else {
                    tokeniser.returnTokens(2);
                }
                break;
            default:
                tokeniser.returnTokens();
                break;
            }
            if (!op) break;

            if (operands.empty()) operands.push_back(std::move(e));
            if (!ops.empty()) ops += " ";
            ops += op;
            operands.push_back(bitOr());
        }

        if (operands.empty()) return e;
        return makeNode(SyntaxKind::Compare, ops, std::move(operands));
    }

    NodePtr bitOr()
    {
        auto e = bitXor();
        while (accept(T_BITOR)) {
            e = binary(SyntaxBinaryOp::BitOr, "|", std::move(e), bitXor());
        }
        return e;
    }

    NodePtr bitXor()
    {
        auto e = bitAnd();
        while (accept(T_BITXOR)) {
            e = binary(SyntaxBinaryOp::BitXor, "^", std::move(e), bitAnd());
        }
        return e;
    }

    NodePtr bitAnd()
    {
        auto e = shift();
        while (accept(T_BITAND)) {
            e = binary(SyntaxBinaryOp::BitAnd, "&", std::move(e), shift());
        }
        return e;
    }

    NodePtr shift()
    {
        auto e = sum();
        while (true) {
            switch (tokeniser.nextToken().type) {
            case T_LSHIFT: e = binary(SyntaxBinaryOp::LShift, "<<", std::move(e), sum()); break;
            case T_RSHIFT: e = binary(SyntaxBinaryOp::RShift, ">>", std::move(e), sum()); break;
            default:
                tokeniser.returnTokens();
                return e;
            }
        }
    }

    NodePtr sum()
    {
        auto e = term();
        while (true) {
            switch (tokeniser.nextToken().type) {
            case T_PLUS:  e = binary(SyntaxBinaryOp::Add, "+", std::move(e), term()); break;
            case T_MINUS: e = binary(SyntaxBinaryOp::Sub, "-", std::move(e), term()); break;
            default:
                tokeniser.returnTokens();
                return e;
            }
        }
    }

    NodePtr term()
    {
        auto e = factor();
        while (true) {
            switch (tokeniser.nextToken().type) {
            case T_MULT:     e = binary(SyntaxBinaryOp::Mult, "*", std::move(e), factor()); break;
            case T_DIV:      e = binary(SyntaxBinaryOp::Div, "/", std::move(e), factor()); break;
            case T_FLOORDIV: e = binary(SyntaxBinaryOp::FloorDiv, "//", std::move(e), factor()); break;
            case T_MOD:      e = binary(SyntaxBinaryOp::Mod, "%", std::move(e), factor()); break;
            case T_MATMUL:   e = binary(SyntaxBinaryOp::MatMult, "@", std::move(e), factor()); break;
            default:
                tokeniser.returnTokens();
                return e;
            }
        }
    }

    NodePtr factor()
    {
        switch (tokeniser.nextToken().type) {
        case T_PLUS: {
            Nested nested(depth, MAX_DEPTH);
            return unary(SyntaxUnaryOp::UAdd, "+", factor());
        }
        case T_MINUS: {
            Nested nested(depth, MAX_DEPTH);
            return unary(SyntaxUnaryOp::USub, "-", factor());
        }
        case T_INVERT: {
            Nested nested(depth, MAX_DEPTH);
            return unary(SyntaxUnaryOp::Invert, "~", factor());
        }
        default:
            tokeniser.returnTokens();
            return power();
        }
    }

    NodePtr power()
    {
        auto e = awaitPrimary();
        if (!accept(T_POW)) return e;

        Nested nested(depth, MAX_DEPTH);
        return binary(SyntaxBinaryOp::Pow, "**", std::move(e), factor());
    }

    NodePtr awaitPrimary()
    {
        if (accept(T_AWAIT)) {
            Nested nested(depth, MAX_DEPTH);
            return makeNode(SyntaxKind::Await, "await", nodes(primary()));
        }
        return primary();
    }

    NodePtr primary()
    {
        auto e = atom();
        while (true) {
            switch (tokeniser.nextToken().type) {
            case T_DOT: {
                auto name = tokeniser.nextToken();
                if (name.type!=T_IDENTIFIER) {
                    throwParseError(tokeniser, "expected name after '.'");
                }
                e = makeNode(SyntaxKind::Attribute, name.val, nodes(std::move(e)));
                break;
            }
            case T_LPAREN:
                e = call(std::move(e));
                break;
            case T_LBRACKET: {
                Nested nested(nesting, MAX_NESTING);
                e = makeNode(SyntaxKind::Subscript, "[]", nodes(std::move(e), slices()));
                expect(T_RBRACKET, "missing ']' after subscript");
                break;
            }
            default:
                tokeniser.returnTokens();
                return e;
            }
        }
    }

    // The function being called is the first child
    NodePtr call(NodePtr function)
    {
        Nested nested(nesting, MAX_NESTING);
        vector<NodePtr> args;
        args.push_back(std::move(function));
        while (!accept(T_RPAREN)) {
            args.push_back(argument());
            if (!accept(T_COMMA)) {
                expect(T_RPAREN, "missing ',' or ')' in call arguments");
                break;
            }
        }
        return makeNode(SyntaxKind::Call, "()", std::move(args));
    }

    NodePtr argument()
    {
        auto t = tokeniser.nextToken();
        switch (t.type) {
        case T_MULT:
            return makeNode(SyntaxKind::Starred, "*", nodes(expression()));
        case T_POW:
            return makeNode(SyntaxKind::Keyword, "**", nodes(expression()));
        case T_IDENTIFIER:
            if (accept(T_ASSIGN)) {
                return makeNode(SyntaxKind::Keyword, t.val, nodes(expression()));
            }
            tokeniser.returnTokens();
            break;
        default:
            tokeniser.returnTokens();
            break;
        }

        auto e = namedExpression();
        if (comprehensionFollows()) {
            return comprehension(SyntaxKind::GeneratorExp, nodes(std::move(e)));
        }
        return e;
    }

    NodePtr slices()
    {
        auto s = slice();
        if (peek()!=T_COMMA) return s;

        vector<NodePtr> items;
        items.push_back(std::move(s));
        while (accept(T_COMMA)) {
            if (peek()==T_RBRACKET) break;
            items.push_back(slice());
        }
        return makeNode(SyntaxKind::Tuple, ",", std::move(items));
    }

    NodePtr slice()
    {
        vector<NodePtr> parts;
        if (peek()!=T_COLON) {
            if (accept(T_MULT)) return makeNode(SyntaxKind::Starred, "*", nodes(bitOr()));
            auto lower = namedExpression();
            if (peek()!=T_COLON) return lower;
            parts.push_back(std::move(lower));
        }

        string text(":");
        tokeniser.nextToken();
        if (startsExpression(peek())) parts.push_back(expression());
        if (accept(T_COLON)) {
            text += ":";
            if (startsExpression(peek())) parts.push_back(expression());
        }
        return makeNode(SyntaxKind::Slice, text, std::move(parts));
    }

    // Adds the for/if clauses to the already parsed element(s)
    NodePtr comprehension(SyntaxKind kind, vector<NodePtr> items)
    {
        while (true) {
            bool async = accept(T_ASYNC);
            if (!accept(T_FOR)) {
                if (async) throwParseError(tokeniser, "expected 'for' after 'async'");
                break;
            }
            vector<NodePtr> clause;
            clause.push_back(targets());
            expect(T_IN, "expected 'in' after comprehension target");
            clause.push_back(disjunction());
            while (accept(T_IF)) {
                clause.push_back(disjunction());
            }
            items.push_back(makeNode(SyntaxKind::Comprehension, async ? "async for" : "for", std::move(clause)));
        }
        return makeNode(kind, "for", std::move(items));
    }

    NodePtr targets()
    {
        auto t = starTarget();
        if (peek()!=T_COMMA) return t;

        vector<NodePtr> items;
        items.push_back(std::move(t));
        while (accept(T_COMMA)) {
            if (peek()==T_IN) break;
            items.push_back(starTarget());
        }
        return makeNode(SyntaxKind::Tuple, ",", std::move(items));
    }

    NodePtr starTarget()
    {
        if (accept(T_MULT)) return makeNode(SyntaxKind::Starred, "*", nodes(bitOr()));
        return bitOr();
    }

    NodePtr atom()
    {
        auto t = tokeniser.nextToken();
        switch (t.type) {
        case T_IDENTIFIER:
            return makeNode(SyntaxKind::Name, t.val);
        case T_TRUE:
            return constant(ConstantKind::True, t.val);
        case T_FALSE:
            return constant(ConstantKind::False, t.val);
        case T_NONE:
            return constant(ConstantKind::None, t.val);
        case T_ELLIPSIS:
            return constant(ConstantKind::Ellipsis, t.val);
        case T_NUMERIC_EXACT:
            return constant(ConstantKind::Integer, t.val);
        case T_NUMERIC_APPROX:
            return constant(ConstantKind::Float, t.val);
        case T_NUMERIC_IMAGINARY:
            return constant(ConstantKind::Imaginary, t.val);
        case T_STRING:
            tokeniser.returnTokens();
            return strings();
        case T_LPAREN:
            return parenthesised();
        case T_LBRACKET:
            return list();
        case T_LBRACE:
            return dictOrSet();
        default:
            throwParseError(tokeniser, "invalid syntax");
        }
    }

    // Adjacent string literals make one constant
    NodePtr strings()
    {
        string text;
        bool bytes = false;
        bool nonBytes = false;
        bool formatted = false;
        while (true) {
            auto t = tokeniser.nextToken();
            if (t.type!=T_STRING) {
                tokeniser.returnTokens();
                break;
            }
            string prefix = t.val.substr(0, t.val.find_first_of("'\""));
            std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                           [](char c) { return std::tolower(static_cast<unsigned char>(c)); });
            if (prefix.find('b')!=string::npos) bytes = true;
            else nonBytes = true;
            if (prefix.find('f')!=string::npos) formatted = true;
            if (bytes && nonBytes) {
                throwParseError(t, "cannot mix bytes and nonbytes literals");
            }
            if (!text.empty()) text += " ";
            text += t.val;
        }
        auto kind = bytes ? ConstantKind::Bytes : formatted ? ConstantKind::FormattedString : ConstantKind::String;
        return constant(kind, text);
    }

    // Everything after "(": empty tuple, yield, generator, grouping or tuple
    NodePtr parenthesised()
    {
        Nested nested(nesting, MAX_NESTING);

        if (accept(T_RPAREN)) return makeNode(SyntaxKind::Tuple, "()");

        if (accept(T_YIELD)) {
            vector<NodePtr> value;
            string text("yield");
            auto t = tokeniser.nextToken();
            if (t.type==T_RESERVED && t.val=="from") {
                text += " from";
                value.push_back(expression());
            } else {
                tokeniser.returnTokens();
                if (startsExpression(peek())) value.push_back(expressions());
            }
            expect(T_RPAREN, "missing ')' after yield");
            return makeNode(SyntaxKind::Yield, text, std::move(value));
        }

        auto e = starNamedExpression();
        if (comprehensionFollows()) {
            auto g = comprehension(SyntaxKind::GeneratorExp, nodes(std::move(e)));
            expect(T_RPAREN, "missing ')' after generator expression");
            return g;
        }
        if (!accept(T_COMMA)) {
            expect(T_RPAREN, "missing ')' after '('");
            return e;
        }

        vector<NodePtr> items;
        items.push_back(std::move(e));
        elements(items, T_RPAREN, "missing ',' or ')' in tuple");
        return makeNode(SyntaxKind::Tuple, ",", std::move(items));
    }

    NodePtr list()
    {
        Nested nested(nesting, MAX_NESTING);

        if (accept(T_RBRACKET)) return makeNode(SyntaxKind::List, "[]");

        auto e = starNamedExpression();
        if (comprehensionFollows()) {
            auto c = comprehension(SyntaxKind::ListComp, nodes(std::move(e)));
            expect(T_RBRACKET, "missing ']' after list comprehension");
            return c;
        }

        vector<NodePtr> items;
        items.push_back(std::move(e));
        if (accept(T_COMMA)) {
            elements(items, T_RBRACKET, "missing ',' or ']' in list");
        } else {
            expect(T_RBRACKET, "missing ',' or ']' in list");
        }
        return makeNode(SyntaxKind::List, "[]", std::move(items));
    }

    NodePtr dictOrSet()
    {
        Nested nested(nesting, MAX_NESTING);

        if (accept(T_RBRACE)) return makeNode(SyntaxKind::Dict, "{}");

        vector<NodePtr> items;
        if (accept(T_POW)) {
            items.push_back(makeNode(SyntaxKind::Starred, "**", nodes(bitOr())));
            return dictItems(std::move(items));
        }

        auto e = starNamedExpression();
        if (accept(T_COLON)) {
            auto v = expression();
            if (comprehensionFollows()) {
                auto c = comprehension(SyntaxKind::DictComp, nodes(std::move(e), std::move(v)));
                expect(T_RBRACE, "missing '}' after dict comprehension");
                return c;
            }
            items.push_back(std::move(e));
            items.push_back(std::move(v));
            return dictItems(std::move(items));
        }

        if (comprehensionFollows()) {
            auto c = comprehension(SyntaxKind::SetComp, nodes(std::move(e)));
            expect(T_RBRACE, "missing '}' after set comprehension");
            return c;
        }

        items.push_back(std::move(e));
        if (accept(T_COMMA)) {
            elements(items, T_RBRACE, "missing ',' or '}' in set");
        } else {
            expect(T_RBRACE, "missing ',' or '}' in set");
        }
        return makeNode(SyntaxKind::Set, "{}", std::move(items));
    }

    // Rest of a dict display after its first item
    NodePtr dictItems(vector<NodePtr> items)
    {
        while (accept(T_COMMA)) {
            if (accept(T_RBRACE)) return makeNode(SyntaxKind::Dict, "{}", std::move(items));
            if (accept(T_POW)) {
                items.push_back(makeNode(SyntaxKind::Starred, "**", nodes(bitOr())));
                continue;
            }
            items.push_back(expression());
            expect(T_COLON, "expected ':' after dict key");
            items.push_back(expression());
        }
        expect(T_RBRACE, "missing ',' or '}' in dict");
        return makeNode(SyntaxKind::Dict, "{}", std::move(items));
    }

    // Remaining comma separated elements up to and including close
    void elements(vector<NodePtr>& items, TokenType close, const string& msg)
    {
        while (!accept(close)) {
            items.push_back(starNamedExpression());
            if (!accept(T_COMMA)) {
                expect(close, msg);
                return;
            }
        }
    }
};

///////////////////////////////////////////////////////////

unique_ptr<SyntaxNode> parse(string_view text)
{
    auto tokeniser = Tokeniser{text};
    return Parse{tokeniser}.input();
}

const char* describe(SyntaxKind kind)
{
    switch (kind) {
    case SyntaxKind::Constant:      return "constant";
    case SyntaxKind::Name:          return "name reference";
    case SyntaxKind::UnaryOp:       return "unary operation";
    case SyntaxKind::BinaryOp:      return "binary operation";
    case SyntaxKind::BoolOp:        return "boolean operation";
    case SyntaxKind::Compare:       return "comparison";
    case SyntaxKind::IfExp:         return "conditional expression";
    case SyntaxKind::Lambda:        return "lambda";
    case SyntaxKind::Call:          return "function call";
    case SyntaxKind::Keyword:       return "keyword argument";
    case SyntaxKind::Attribute:     return "attribute access";
    case SyntaxKind::Subscript:     return "subscript";
    case SyntaxKind::Slice:         return "slice";
    case SyntaxKind::Starred:       return "starred expression";
    case SyntaxKind::Tuple:         return "tuple";
    case SyntaxKind::List:          return "list";
    case SyntaxKind::Set:           return "set";
    case SyntaxKind::Dict:          return "dict";
    case SyntaxKind::ListComp:      return "list comprehension";
    case SyntaxKind::SetComp:       return "set comprehension";
    case SyntaxKind::DictComp:      return "dict comprehension";
    case SyntaxKind::GeneratorExp:  return "generator expression";
    case SyntaxKind::Comprehension: return "comprehension clause";
    case SyntaxKind::NamedExpr:     return "assignment expression";
    case SyntaxKind::Await:         return "await expression";
    case SyntaxKind::Yield:         return "yield expression";
    }
    return "unknown construct";
}

const char* describe(ConstantKind kind)
{
    switch (kind) {
    case ConstantKind::Integer:         return "integer literal";
    case ConstantKind::Float:           return "float literal";
    case ConstantKind::Imaginary:       return "imaginary literal";
    case ConstantKind::String:          return "string literal";
    case ConstantKind::Bytes:           return "bytes literal";
    case ConstantKind::FormattedString: return "formatted string literal";
    case ConstantKind::True:            return "True";
    case ConstantKind::False:           return "False";
    case ConstantKind::None:            return "None";
    case ConstantKind::Ellipsis:        return "Ellipsis";
    }
    return "unknown literal";
}

const char* describe(SyntaxUnaryOp op)
{
    switch (op) {
    case SyntaxUnaryOp::UAdd:   return "+";
    case SyntaxUnaryOp::USub:   return "-";
    case SyntaxUnaryOp::Invert: return "~";
    case SyntaxUnaryOp::Not:    return "not";
    }
    return "?";
}

const char* describe(SyntaxBinaryOp op)
{
    switch (op) {
    case SyntaxBinaryOp::Add:      return "+";
    case SyntaxBinaryOp::Sub:      return "-";
    case SyntaxBinaryOp::Mult:     return "*";
    case SyntaxBinaryOp::Div:      return "/";
    case SyntaxBinaryOp::FloorDiv: return "//";
    case SyntaxBinaryOp::Mod:      return "%";
    case SyntaxBinaryOp::Pow:      return "**";
    case SyntaxBinaryOp::MatMult:  return "@";
    case SyntaxBinaryOp::LShift:   return "<<";
    case SyntaxBinaryOp::RShift:   return ">>";
    case SyntaxBinaryOp::BitOr:    return "|";
    case SyntaxBinaryOp::BitXor:   return "^";
    case SyntaxBinaryOp::BitAnd:   return "&";
    }
    return "?";
}

}
