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

#include "CalcException.h"

#include <gmp.h>
#include <gmpxx.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

using std::get;
using std::ostream;
using std::pair;
using std::string;

namespace calc {

// Nearest double to m * 2**e, with m >= 0. sticky says that the true value
// is a little more than that: some lower bits were already discarded.
// Ties round to even.
static double nearestDouble(const mpz_class& m, long e, bool sticky)
{
    if (sgn(m) == 0) return 0.0;

    long bits = long(mpz_sizeinbase(m.get_mpz_t(), 2));
    if (bits <= 53 && !sticky) return std::ldexp(m.get_d(), int(e));

    // Keep 54 bits: 53 for the result and one more to round with
    long shift = bits - 54;
    mpz_class top;
    if (shift >= 0) {
        mpz_fdiv_q_2exp(top.get_mpz_t(), m.get_mpz_t(), shift);
        sticky = sticky || mpz_scan1(m.get_mpz_t(), 0) < static_cast<mp_bitcnt_t>(shift);
    } else {
        mpz_mul_2exp(top.get_mpz_t(), m.get_mpz_t(), -shift);
    }
    unsigned long q = top.get_ui();
    if ((q & 1) && (sticky || (q & 2))) q += 2;
    q >>= 1;
    return std::ldexp(double(q), int(e + shift + 1));
}

static double exactToDouble(const mpz_class& z)
{
    if (mpz_sizeinbase(z.get_mpz_t(), 2) > 1024) {
        throw OverflowError("int too large to convert to float");
    }
    mpz_class a = abs(z);
    double d = nearestDouble(a, 0, false);
    if (std::isinf(d)) throw OverflowError("int too large to convert to float");
    return sgn(z) < 0 ? -d : d;
}

// Correctly rounded n / d for exact operands, d not zero
static double exactTrueDivide(const mpz_class& n, const mpz_class& d)
{
    mpz_class a = abs(n);
    mpz_class b = abs(d);
    long na = long(mpz_sizeinbase(a.get_mpz_t(), 2));
    long nb = long(mpz_sizeinbase(b.get_mpz_t(), 2));

    double result;
    if (na <= 53 && nb <= 53) {
        result = a.get_d() / b.get_d();
    } else {
        // Scale so the quotient has at least 55 significant bits
        long k = std::max(0L, 55 + nb - na);
        mpz_class q;
        mpz_class r;
        mpz_mul_2exp(a.get_mpz_t(), a.get_mpz_t(), k);
        mpz_fdiv_qr(q.get_mpz_t(), r.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
        result = nearestDouble(q, -k, sgn(r) != 0);
        if (std::isinf(result)) throw OverflowError("integer division result too large for a float");
    }
    return (sgn(n) < 0) != (sgn(d) < 0) ? -result : result;
}

static void checkExactSize(std::size_t bits)
{
    if (bits > MAX_EXACT_BITS) throw OverflowError("integer result too large");
}

static std::size_t exactBits(const mpz_class& z)
{
    return mpz_sizeinbase(z.get_mpz_t(), 2);
}

double toDouble(const Value& v)
{
    return std::visit(overload(
        [](const mpz_class& i) { return exactToDouble(i); },
        [](double d) { return d; }
    ), v.value);
}

bool isZero(const Value& v)
{
    return std::visit(overload(
        [](const mpz_class& i) { return sgn(i) == 0; },
        [](double d) { return d == 0.0; }
    ), v.value);
}

bool operator==(const Value& v1, const Value& v2)
{
    if (!sameType(v1, v2)) return false;
    switch (v1.type()) {
    case Value::T_EXACT:
        return mpz_cmp(get<mpz_class>(v1.value).get_mpz_t(), get<mpz_class>(v2.value).get_mpz_t()) == 0;
    default:
        return get<double>(v1.value) == get<double>(v2.value);
    }
}

bool operator!=(const Value& v1, const Value& v2)
{
    return !(v1 == v2);
}

ostream& operator<<(ostream& os, const Value& v)
{
    std::visit(overload(
        [&](const mpz_class& i) { os << i.get_str(); },
        [&](double d) { os << formatNumber(d); }
    ), v.value);
    return os;
}

Value exactValue(const string& digits, int base)
{
    return mpz_class(digits, base);
}

inline void promoteNumeric(Value& v1, Value& v2)
{
    if (sameType(v1,v2)) return;
    switch (v1.type()) {
    case Value::T_INEXACT: v2 = exactToDouble(get<mpz_class>(v2.value)); return;
    case Value::T_EXACT:   v1 = exactToDouble(get<mpz_class>(v1.value)); return;
    }
}

// Quotient and remainder of floating point floor division, computed
// from fmod so that q*b + r == a as closely as possible
static pair<double, double> floatDivmod(double a, double b)
{
    double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0.0) {
        if ((b < 0) != (mod < 0)) {
            mod += b;
            div -= 1.0;
        }
    } else {
        mod = std::copysign(0.0, b);
    }
    double floordiv;
    if (div != 0.0) {
        floordiv = std::floor(div);
        if (div - floordiv > 0.5) floordiv += 1.0;
    } else {
        floordiv = std::copysign(0.0, a / b);
    }
    return {floordiv, mod};
}

static double floatPower(double x, double y)
{
    if (x == 0.0 && y < 0.0) {
        throw DivisionByZero("0.0 cannot be raised to a negative power");
    }
    if (x < 0.0 && std::isfinite(x) && std::isfinite(y) && y != std::floor(y)) {
        throw DomainError("negative number cannot be raised to a fractional power");
    }
    double r = std::pow(x, y);
    if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) {
        throw OverflowError("Numerical result out of range");
    }
    return r;
}

static Value exactPower(const mpz_class& base, const mpz_class& exponent)
{
    // 0, 1 and -1 stay small whatever the exponent
    if (mpz_cmpabs_ui(base.get_mpz_t(), 1) <= 0) {
        if (sgn(base) == 0) return sgn(exponent) == 0 ? mpz_class(1) : mpz_class(0);
        if (sgn(base) > 0 || mpz_even_p(exponent.get_mpz_t())) return mpz_class(1);
        return mpz_class(-1);
    }
    if (!mpz_fits_ulong_p(exponent.get_mpz_t())) checkExactSize(MAX_EXACT_BITS + 1);
    unsigned long e = exponent.get_ui();
    if (e > MAX_EXACT_BITS) checkExactSize(MAX_EXACT_BITS + 1);
    checkExactSize((exactBits(base) - 1) * e + 1);

    mpz_class r;
    mpz_pow_ui(r.get_mpz_t(), base.get_mpz_t(), e);
    return r;
}

Value operator+(Value v1, Value v2)
{
    promoteNumeric(v1, v2);

    switch (v1.type()) {
    case Value::T_EXACT: {
        mpz_class r = get<mpz_class>(v1.value) + get<mpz_class>(v2.value);
        return r;
    }
    default:
        return get<double>(v1.value) + get<double>(v2.value);
    }
}

Value operator-(Value v1, Value v2)
{
    promoteNumeric(v1, v2);

    switch (v1.type()) {
    case Value::T_EXACT: {
        mpz_class r = get<mpz_class>(v1.value) - get<mpz_class>(v2.value);
        return r;
    }
    default:
        return get<double>(v1.value) - get<double>(v2.value);
    }
}

Value operator*(Value v1, Value v2)
{
    promoteNumeric(v1, v2);

    switch (v1.type()) {
    case Value::T_EXACT: {
        auto& i1 = get<mpz_class>(v1.value);
        auto& i2 = get<mpz_class>(v2.value);
        checkExactSize(exactBits(i1) + exactBits(i2));
        mpz_class r = i1 * i2;
        return r;
    }
    default:
        return get<double>(v1.value) * get<double>(v2.value);
    }
}

Value operator/(Value v1, Value v2)
{
    if (isZero(v2)) throw DivisionByZero("division by zero");

    if (exact(v1) && exact(v2)) {
        return exactTrueDivide(get<mpz_class>(v1.value), get<mpz_class>(v2.value));
    }
    return toDouble(v1) / toDouble(v2);
}

Value floorDiv(Value v1, Value v2)
{
    if (isZero(v2)) throw DivisionByZero("integer division or modulo by zero");
    promoteNumeric(v1, v2);

    switch (v1.type()) {
    case Value::T_EXACT: {
        mpz_class q;
        mpz_fdiv_q(q.get_mpz_t(), get<mpz_class>(v1.value).get_mpz_t(), get<mpz_class>(v2.value).get_mpz_t());
        return q;
    }
    default:
        return floatDivmod(get<double>(v1.value), get<double>(v2.value)).first;
    }
}

Value operator%(Value v1, Value v2)
{
    if (isZero(v2)) throw DivisionByZero("integer division or modulo by zero");
    promoteNumeric(v1, v2);

    switch (v1.type()) {
    case Value::T_EXACT: {
        mpz_class r;
        mpz_fdiv_r(r.get_mpz_t(), get<mpz_class>(v1.value).get_mpz_t(), get<mpz_class>(v2.value).get_mpz_t());
        return r;
    }
    default:
        return floatDivmod(get<double>(v1.value), get<double>(v2.value)).second;
    }
}

Value power(Value v1, Value v2)
{
    if (exact(v1) && exact(v2)) {
        auto& base = get<mpz_class>(v1.value);
        auto& exponent = get<mpz_class>(v2.value);
        if (sgn(exponent) >= 0) return exactPower(base, exponent);
    }
    // Anything else is done in floating point
    return floatPower(toDouble(v1), toDouble(v2));
}

Value operator-(const Value& v)
{
    switch (v.type()) {
    case Value::T_EXACT: {
        mpz_class r = -get<mpz_class>(v.value);
        return r;
    }
    default:
        return -get<double>(v.value);
    }
}

string formatNumber(double d)
{
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    // Shortest round trip digits, eg "-1.2345e+02"
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), d, std::chars_format::scientific);
    string sci(buffer, end);

    string result;
    auto p = sci.cbegin();
    if (*p == '-') {
        result += '-';
        ++p;
    }
    string digits;
    for (; p != sci.cend() && *p != 'e'; ++p) {
        if (*p != '.') digits += *p;
    }
    int exponent = std::atoi(string(p + 1, sci.cend()).c_str());

    // Position of the decimal point relative to the first digit
    int decpt = exponent + 1;
    int ndigits = digits.size();
    if (decpt <= -4 || decpt > 16) {
        result += digits[0];
        if (ndigits > 1) {
            result += '.';
            result.append(digits, 1, string::npos);
        }
        int e = decpt - 1;
        result += e < 0 ? "e-" : "e+";
        if (std::abs(e) < 10) result += '0';
        result += std::to_string(std::abs(e));
    } else if (decpt <= 0) {
        result += "0.";
        result.append(-decpt, '0');
        result += digits;
    } else if (decpt >= ndigits) {
        result += digits;
        result.append(decpt - ndigits, '0');
        result += ".0";
    } else {
        result.append(digits, 0, decpt);
        result += '.';
        result.append(digits, decpt, string::npos);
    }
    return result;
}

}
