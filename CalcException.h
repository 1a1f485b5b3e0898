#ifndef CALC_EXCEPTION_H
#define CALC_EXCEPTION_H

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

#include <stdexcept>
#include <string>

#include "calculator_export.h"

namespace calc {

// Input text is not a single well formed expression
class CALCULATOR_EXPORT
SyntaxError : public std::range_error {
public:
    explicit SyntaxError(const std::string&);
};

// Well formed expression using something other than numbers and arithmetic
class CALCULATOR_EXPORT
UnsupportedExpression : public std::range_error {
public:
    explicit UnsupportedExpression(const std::string&);
};

class CALCULATOR_EXPORT
DivisionByZero : public std::domain_error {
public:
    explicit DivisionByZero(const std::string&);
};

// Result too large: a float power that overflows, or an integer too
// big to convert to a double
class CALCULATOR_EXPORT
OverflowError : public std::overflow_error {
public:
    explicit OverflowError(const std::string&);
};

// Arithmetic with no real result (sqrt(-1), (-8) ** 0.5)
class CALCULATOR_EXPORT
DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string&);
};

}

#endif
