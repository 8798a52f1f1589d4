//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// exact symbolic algebra made easier in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

// C++ includes
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string>

// GMP includes
#include <gmpxx.h>

// Boost includes
#include <boost/container_hash/hash.hpp>

namespace symcore {

// 10^n as a GMP integer
inline mpz_class power_of_ten(unsigned long n)
{
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 10, n);
    return result;
}

/**
 * @brief Arbitrary-precision decimal: value = unscaled * 10^-scale.
 *
 * The representation is kept normalized (no trailing zeros in the unscaled
 * value while scale > 0, zero always has scale 0), so two decimals holding
 * the same value compare equal member by member.
 *
 * Addition, subtraction and multiplication are exact. Division is carried out
 * on the exact quotient and truncated to a number of fractional digits.
 */
class BigDecimal
{
  private:
    mpz_class unscaled_;
    unsigned long scale_ = 0;

    void normalize()
    {
        if(unscaled_ == 0) { scale_ = 0; return; }
        mpz_class quotient, remainder;
        while(scale_ > 0) {
            mpz_tdiv_qr_ui(quotient.get_mpz_t(), remainder.get_mpz_t(), unscaled_.get_mpz_t(), 10);
            if(remainder != 0) break;
            unscaled_ = quotient;
            --scale_;
        }
    }

    static void align(const BigDecimal& a, const BigDecimal& b, mpz_class& ua, mpz_class& ub, unsigned long& scale)
    {
        scale = a.scale_ > b.scale_ ? a.scale_ : b.scale_;
        ua = a.unscaled_ * power_of_ten(scale - a.scale_);
        ub = b.unscaled_ * power_of_ten(scale - b.scale_);
    }

  public:
    // Fractional digits kept by division and rational conversion.
    static constexpr unsigned long DIVISION_DIGITS = 50;

    BigDecimal() : unscaled_(0) {}

    explicit BigDecimal(const mpz_class& integer) : unscaled_(integer) {}

    BigDecimal(const mpz_class& unscaled, unsigned long scale) : unscaled_(unscaled), scale_(scale)
    {
        normalize();
    }

    /// Parses `[-+]digits[.digits][e[-+]digits]`.
    static BigDecimal from_string(const std::string& text)
    {
        std::size_t pos = 0;
        bool negative = false;
        if(pos < text.size() && (text[pos] == '-' || text[pos] == '+')) negative = text[pos++] == '-';

        std::string digits;
        unsigned long scale = 0;
        bool seen_point = false;
        for(; pos < text.size(); ++pos) {
            const char c = text[pos];
            if(std::isdigit(static_cast<unsigned char>(c))) {
                digits.push_back(c);
                if(seen_point) ++scale;
            }
            else if(c == '.' && !seen_point) seen_point = true;
            else break;
        }
        if(digits.empty()) throw std::invalid_argument("malformed decimal: '" + text + "'");

        long exponent = 0;
        if(pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            const std::string tail = text.substr(pos + 1);
            std::size_t used = 0;
            try {
                exponent = std::stol(tail, &used);
            } catch(const std::logic_error&) {
                throw std::invalid_argument("malformed decimal exponent: '" + text + "'");
            }
            pos += 1 + used;
        }
        if(pos != text.size()) throw std::invalid_argument("malformed decimal: '" + text + "'");

        mpz_class unscaled(digits, 10);
        if(negative) unscaled = -unscaled;
        if(exponent >= 0) {
            const auto shift = static_cast<unsigned long>(exponent);
            if(shift >= scale) return BigDecimal(mpz_class(unscaled * power_of_ten(shift - scale)), 0);
            return BigDecimal(unscaled, scale - shift);
        }
        return BigDecimal(unscaled, scale + static_cast<unsigned long>(-exponent));
    }

    /// Truncates q to `digits` fractional digits; exact when q terminates within them.
    static BigDecimal from_rational(const mpq_class& q, unsigned long digits = DIVISION_DIGITS)
    {
        mpz_class scaled = q.get_num() * power_of_ten(digits);
        mpz_class truncated;
        mpz_tdiv_q(truncated.get_mpz_t(), scaled.get_mpz_t(), q.get_den_mpz_t());
        return BigDecimal(truncated, digits);
    }

    const mpz_class& unscaled() const { return unscaled_; }
    unsigned long scale() const { return scale_; }

    bool is_zero() const { return unscaled_ == 0; }
    bool is_one() const { return scale_ == 0 && unscaled_ == 1; }
    bool is_integer() const { return scale_ == 0; }
    int sign() const { return sgn(unscaled_); }

    mpq_class to_rational() const
    {
        mpq_class q(unscaled_, power_of_ten(scale_));
        q.canonicalize();
        return q;
    }

    /// Integer part, truncated toward zero.
    mpz_class to_integer() const
    {
        mpz_class result;
        const mpz_class divisor = power_of_ten(scale_);
        mpz_tdiv_q(result.get_mpz_t(), unscaled_.get_mpz_t(), divisor.get_mpz_t());
        return result;
    }

    double to_double() const { return to_rational().get_d(); }

    BigDecimal operator-() const { return BigDecimal(mpz_class(-unscaled_), scale_); }

    BigDecimal abs() const { return BigDecimal(mpz_class(::abs(unscaled_)), scale_); }

    friend BigDecimal operator+(const BigDecimal& a, const BigDecimal& b)
    {
        mpz_class ua, ub;
        unsigned long scale;
        align(a, b, ua, ub, scale);
        return BigDecimal(mpz_class(ua + ub), scale);
    }

    friend BigDecimal operator-(const BigDecimal& a, const BigDecimal& b)
    {
        mpz_class ua, ub;
        unsigned long scale;
        align(a, b, ua, ub, scale);
        return BigDecimal(mpz_class(ua - ub), scale);
    }

    friend BigDecimal operator*(const BigDecimal& a, const BigDecimal& b)
    {
        return BigDecimal(mpz_class(a.unscaled_ * b.unscaled_), a.scale_ + b.scale_);
    }

    /// Quotient truncated to `digits` fractional digits. The divisor must be non-zero.
    BigDecimal divide(const BigDecimal& divisor, unsigned long digits = DIVISION_DIGITS) const
    {
        if(divisor.is_zero()) throw std::invalid_argument("BigDecimal::divide by zero");
        return from_rational(to_rational() / divisor.to_rational(), digits);
    }

    int compare(const BigDecimal& other) const
    {
        mpz_class ua, ub;
        unsigned long scale;
        align(*this, other, ua, ub, scale);
        return cmp(ua, ub);
    }

    friend bool operator==(const BigDecimal& a, const BigDecimal& b)
    {
        return a.scale_ == b.scale_ && a.unscaled_ == b.unscaled_;
    }
    friend bool operator!=(const BigDecimal& a, const BigDecimal& b) { return !(a == b); }
    friend bool operator<(const BigDecimal& a, const BigDecimal& b) { return a.compare(b) < 0; }

    std::string to_string() const
    {
        std::string digits = mpz_class(::abs(unscaled_)).get_str();
        if(scale_ > 0) {
            if(digits.size() <= scale_) digits.insert(0, scale_ - digits.size() + 1, '0');
            digits.insert(digits.size() - scale_, 1, '.');
        }
        return unscaled_ < 0 ? "-" + digits : digits;
    }

    std::size_t hash() const
    {
        std::size_t seed = 0;
        boost::hash_combine(seed, unscaled_.get_str(16));
        boost::hash_combine(seed, scale_);
        return seed;
    }
};

} // namespace symcore
