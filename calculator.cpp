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

#include "calculator.h"

#include "CalcException.h"
#include "CalcExpression.h"
#include "CalcValue.h"

#include <iostream>
#include <memory>
#include <exception>

using std::unique_ptr;

// C interfaces

struct calc_expression_t {
    unique_ptr<calc::Expression> expression;
};

namespace {

auto report(const std::exception& e) -> void {
    std::cerr << "Error: " << e.what() << "\n";
}

// Run f, turning the library's exceptions into a status
template <typename F>
auto status(F f) -> calc_status_t {
    try {
        f();
        return CALC_OK;
    } catch (calc::SyntaxError& e) {
        report(e);
        return CALC_SYNTAX_ERROR;
    } catch (calc::UnsupportedExpression& e) {
        report(e);
        return CALC_UNSUPPORTED_EXPRESSION;
    } catch (calc::DivisionByZero& e) {
        report(e);
        return CALC_DIVISION_BY_ZERO;
    } catch (calc::DomainError& e) {
        report(e);
        return CALC_DOMAIN_ERROR;
    } catch (calc::OverflowError& e) {
        report(e);
        return CALC_OVERFLOW_ERROR;
    } catch (std::exception& e) {
        report(e);
        return CALC_INTERNAL_ERROR;
    }
}

}

auto calc_expression(const char* exp) -> const calc_expression_t* {
    try {
        return new calc_expression_t{calc::make_expression(exp)};
    } catch (std::exception& e) {
        report(e);
        return nullptr;
    }
}

auto calc_expression_free(const calc_expression_t* exp) -> void {
    delete exp;
}

auto calc_expression_eval(const calc_expression_t* exp, double* result) -> calc_status_t {
    return status([&] {
        *result = calc::toDouble(calc::eval(*exp->expression));
    });
}

auto calc_expression_dump(const calc_expression_t* exp) -> void {
    std::cerr << *exp->expression << "\n";
}

auto calc_evaluate(const char* exp, double* result) -> calc_status_t {
    return status([&] {
        *result = calc::evaluate(exp);
    });
}

auto calc_status_message(calc_status_t s) -> const char* {
    switch (s) {
    case CALC_OK: return "ok";
    case CALC_SYNTAX_ERROR: return "syntax error";
    case CALC_UNSUPPORTED_EXPRESSION: return "unsupported expression";
    case CALC_DIVISION_BY_ZERO: return "division by zero";
    case CALC_DOMAIN_ERROR: return "math domain error";
    case CALC_OVERFLOW_ERROR: return "numerical result out of range";
    case CALC_INTERNAL_ERROR: return "internal error";
    }
    return "unknown status";
}
