#ifndef CALC_ARITHMETIC_H
#define CALC_ARITHMETIC_H

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

#include <string>

#include "calculator_export.h"

namespace calc {

// Arithmetic on doubles, and evaluation of arithmetic written as text.
// Holds no state: any number of threads may share one Calculator.
class CALCULATOR_EXPORT
Calculator {
public:
    double add(double a, double b) const;
    double subtract(double a, double b) const;
    double multiply(double a, double b) const;
    // Throws DivisionByZero if b is zero
    double divide(double a, double b) const;
    // Throws DivisionByZero for 0 to a negative power and DomainError for
    // a negative base with a fractional exponent; overflow gives infinity
    double power(double a, double b) const;
    // Throws DomainError if a is negative
    double sqrt(double a) const;

    // Safely evaluate an arithmetic expression, eg "2 + 3 * 4 - 1/2".
    // Throws SyntaxError, UnsupportedExpression, DivisionByZero or DomainError
    double evaluate(const std::string& expression) const;
};

}

#endif
