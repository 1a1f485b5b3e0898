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
#include "CalcValue.h"

#include <cmath>
#include <string>

namespace calc {

// Going through Value keeps these identical to the evaluator's arithmetic

double Calculator::add(double a, double b) const
{
    return toDouble(Value(a) + Value(b));
}

double Calculator::subtract(double a, double b) const
{
    return toDouble(Value(a) - Value(b));
}

double Calculator::multiply(double a, double b) const
{
    return toDouble(Value(a) * Value(b));
}

double Calculator::divide(double a, double b) const
{
    return toDouble(Value(a) / Value(b));
}

double Calculator::power(double a, double b) const
{
    return toDouble(calc::power(Value(a), Value(b)));
}

double Calculator::sqrt(double a) const
{
    if (a < 0.0) throw DomainError("math domain error: square root of negative number");
    return std::sqrt(a);
}

double Calculator::evaluate(const std::string& expression) const
{
    return calc::evaluate(expression);
}

}
