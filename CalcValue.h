#ifndef CALC_VALUE_H
#define CALC_VALUE_H

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
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <gmpxx.h>

#include "calculator_export.h"

namespace calc {

// Define overload until C++26!
template <class ...Fs>
struct overload : Fs... {
  template <class ...Ts>
  overload(Ts&& ...ts) : Fs{std::forward<Ts>(ts)}...
  {}

  using Fs::operator()...;
};

template <class ...Ts>
overload(Ts&&...) -> overload<std::remove_reference_t<Ts>...>;

// Largest exact integer (in bits) an operation may produce
constexpr std::size_t MAX_EXACT_BITS = std::size_t{1} << 24;

// A number is either exact (an integer of any size) or inexact (floating
// point). Exact arithmetic stays exact; only mixing with an inexact
// operand, true division or a negative power makes a result inexact.
class Value {
public:
    // NB: Must keep this in the same order as the variant or strange things will happen
    enum : uint8_t {
        T_EXACT,
        T_INEXACT
    };

    std::variant<mpz_class, double> value;

    Value(const Value&) = default;
    Value(Value&&) = default;
    Value& operator=(const Value&) = default;
    Value& operator=(Value&&) = default;
    ~Value() = default;

    size_t type() const {
        return value.index();
    }

    Value() :
        value(std::in_place_type<mpz_class>, 0)
    {}

    Value(const int64_t i0) :
        value(std::in_place_type<mpz_class>, static_cast<long>(i0))
    {}

    Value(const int32_t i0) :
        value(std::in_place_type<mpz_class>, static_cast<long>(i0))
    {}

    Value(const mpz_class& z0) :
        value(std::in_place_type<mpz_class>, z0)
    {}

    Value(const double x0) :
        value(std::in_place_type<double>, x0)
    {}
};

inline bool exact(const Value& v) {
    return v.value.index() == Value::T_EXACT;
}

inline bool sameType(const Value& v1, const Value& v2) {
    return v1.value.index() == v2.value.index();
}

// Exact values convert with correct rounding, throws OverflowError if
// the integer is too large for a double
CALCULATOR_EXPORT double toDouble(const Value&);
CALCULATOR_EXPORT bool isZero(const Value&);

// Exact comparison without promotion: EXACT:1 and INEXACT:1.0 differ
CALCULATOR_EXPORT bool operator==(const Value&, const Value&);
CALCULATOR_EXPORT bool operator!=(const Value&, const Value&);

CALCULATOR_EXPORT Value operator+(Value, Value);
CALCULATOR_EXPORT Value operator-(Value, Value);
CALCULATOR_EXPORT Value operator*(Value, Value);
// True division: always inexact
CALCULATOR_EXPORT Value operator/(Value, Value);
// Floor division and remainder: quotient rounds towards negative infinity,
// remainder takes the sign of the divisor
CALCULATOR_EXPORT Value floorDiv(Value, Value);
CALCULATOR_EXPORT Value operator%(Value, Value);
CALCULATOR_EXPORT Value power(Value, Value);
CALCULATOR_EXPORT Value operator-(const Value&);

CALCULATOR_EXPORT std::ostream& operator<<(std::ostream& os, const Value& v);

// Integer text in base 2, 8, 10 or 16 (no prefix or separators)
CALCULATOR_EXPORT Value exactValue(const std::string& digits, int base);

// Shortest text that reads back as the same double, in the usual
// repr style: "13.5", "1024.0", "1e+16", "5e-05", "inf", "nan"
CALCULATOR_EXPORT std::string formatNumber(double);

}

#endif
