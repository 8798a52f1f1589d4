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
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

// GMP includes
#include <gmpxx.h>

// Boost includes
#include <boost/container_hash/hash.hpp>

// symcore includes
#include <symcore/common/error.hpp>
#include <symcore/numeric/decimal.hpp>

namespace symcore {

/// Numeric representations, ordered by promotion rank for the exact kinds.
enum class NumberKind : uint8_t
{
    Integer,
    Rational,
    Real,
    Complex,
    Float,
    Symbolic
};

/// Why a value could not be resolved to a concrete number.
enum class SymbolicReason : uint8_t
{
    DivisionByZero,
    Indeterminate,
    Unevaluated
};

/**
 * @brief A value of the numeric tower.
 *
 * Integer, Rational and Real (arbitrary-precision decimal) are exact and
 * promote into each other in that order; Complex holds two non-complex parts;
 * Float is a machine approximation that only combines with other Floats;
 * Symbolic records a value that has a name but no concrete representation
 * (e.g. `5/0`, `0/0`, or an operation mixing Float with an exact value).
 *
 * Usage:
 *   auto third = Number::rational(1, 3);
 *   auto one = third + third + third;      // exactly 1
 *   auto z = Number::complex(Number::integer(3), Number::integer(4));
 *   z.approximate();                       // 5.0, the modulus
 */
class Number
{
  private:
    NumberKind kind_ = NumberKind::Integer;
    mpz_class integer_;
    mpq_class rational_;
    BigDecimal real_;
    double float_ = 0.0;
    std::shared_ptr<const Number> re_;
    std::shared_ptr<const Number> im_;
    SymbolicReason reason_ = SymbolicReason::Unevaluated;
    std::string text_;

    explicit Number(NumberKind kind) : kind_(kind) {}

  public:
    Number() = default;

    static Number integer(long value)
    {
        Number n(NumberKind::Integer);
        n.integer_ = value;
        return n;
    }

    static Number integer(const mpz_class& value)
    {
        Number n(NumberKind::Integer);
        n.integer_ = value;
        return n;
    }

    /// Parses a base-10 integer; throws std::invalid_argument on malformed text.
    static Number integer(const std::string& digits)
    {
        return integer(mpz_class(digits, 10));
    }

    /// A normalized rational. A zero denominator yields a Symbolic value.
    static Number rational(const mpz_class& num, const mpz_class& den)
    {
        if(den == 0) {
            if(num == 0) return symbolic(SymbolicReason::Indeterminate, "0/0");
            return symbolic(SymbolicReason::DivisionByZero, num.get_str() + "/0");
        }
        Number n(NumberKind::Rational);
        n.rational_ = mpq_class(num, den);
        n.rational_.canonicalize();
        return n;
    }

    static Number rational(long num, long den)
    {
        return rational(mpz_class(num), mpz_class(den));
    }

    static Number rational(const mpq_class& value)
    {
        Number n(NumberKind::Rational);
        n.rational_ = value;
        n.rational_.canonicalize();
        return n;
    }

    static Number real(const BigDecimal& value)
    {
        Number n(NumberKind::Real);
        n.real_ = value;
        return n;
    }

    static Number real(const std::string& text)
    {
        return real(BigDecimal::from_string(text));
    }

    static Number complex(const Number& re, const Number& im)
    {
        if(re.is_complex() || im.is_complex() || re.is_symbolic() || im.is_symbolic())
            throw std::invalid_argument("complex parts must be non-complex concrete numbers");
        Number n(NumberKind::Complex);
        n.re_ = std::make_shared<const Number>(re);
        n.im_ = std::make_shared<const Number>(im);
        return n;
    }

    static Number floating(double value)
    {
        Number n(NumberKind::Float);
        n.float_ = value;
        return n;
    }

    static Number symbolic(SymbolicReason reason, const std::string& text)
    {
        Number n(NumberKind::Symbolic);
        n.reason_ = reason;
        n.text_ = text;
        return n;
    }

    static Number zero() { return integer(0L); }
    static Number one() { return integer(1L); }
    static Number minus_one() { return integer(-1L); }
    static Number imaginary_unit() { return complex(zero(), one()); }

    NumberKind kind() const { return kind_; }

    const mpz_class& integer_value() const { return integer_; }
    const mpq_class& rational_value() const { return rational_; }
    const BigDecimal& real_value() const { return real_; }
    double float_value() const { return float_; }
    const Number& real_part() const { return *re_; }
    const Number& imag_part() const { return *im_; }
    SymbolicReason symbolic_reason() const { return reason_; }
    const std::string& symbolic_text() const { return text_; }

    bool is_symbolic() const { return kind_ == NumberKind::Symbolic; }
    bool is_complex() const { return kind_ == NumberKind::Complex; }
    bool is_float() const { return kind_ == NumberKind::Float; }

    bool is_zero() const
    {
        switch(kind_) {
            case NumberKind::Integer: return integer_ == 0;
            case NumberKind::Rational: return rational_ == 0;
            case NumberKind::Real: return real_.is_zero();
            case NumberKind::Complex: return re_->is_zero() && im_->is_zero();
            case NumberKind::Float: return float_ == 0.0;
            case NumberKind::Symbolic: return false;
        }
        return false;
    }

    bool is_one() const
    {
        switch(kind_) {
            case NumberKind::Integer: return integer_ == 1;
            case NumberKind::Rational: return rational_ == 1;
            case NumberKind::Real: return real_.is_one();
            case NumberKind::Complex: return re_->is_one() && im_->is_zero();
            case NumberKind::Float: return float_ == 1.0;
            case NumberKind::Symbolic: return false;
        }
        return false;
    }

    /// False only for Float and for Complex values built from Float parts.
    bool is_exact() const
    {
        if(kind_ == NumberKind::Complex) return re_->is_exact() && im_->is_exact();
        return kind_ != NumberKind::Float;
    }

    bool is_integer() const
    {
        switch(kind_) {
            case NumberKind::Integer: return true;
            case NumberKind::Rational: return rational_.get_den() == 1;
            case NumberKind::Real: return real_.is_integer();
            case NumberKind::Complex: return im_->is_zero() && re_->is_integer();
            case NumberKind::Float: return std::isfinite(float_) && std::trunc(float_) == float_;
            case NumberKind::Symbolic: return false;
        }
        return false;
    }

    bool is_rational() const { return kind_ == NumberKind::Integer || kind_ == NumberKind::Rational; }

    bool is_real() const { return kind_ != NumberKind::Complex && kind_ != NumberKind::Symbolic; }

    int sign() const
    {
        switch(kind_) {
            case NumberKind::Integer: return sgn(integer_);
            case NumberKind::Rational: return sgn(rational_);
            case NumberKind::Real: return real_.sign();
            case NumberKind::Float: return float_ > 0.0 ? 1 : (float_ < 0.0 ? -1 : 0);
            case NumberKind::Complex:
            case NumberKind::Symbolic: return 0;
        }
        return 0;
    }

    bool is_negative() const { return sign() < 0; }
    bool is_positive() const { return sign() > 0; }

    bool is_even() const
    {
        if(!is_integer() || kind_ == NumberKind::Float || kind_ == NumberKind::Complex) return false;
        return mpz_even_p(to_integer().get_mpz_t()) != 0;
    }

    /// Exact counterpart of a Float (binary value, no rounding); identity for exact kinds.
    Number to_exact() const
    {
        if(kind_ == NumberKind::Complex) return complex(re_->to_exact(), im_->to_exact());
        if(kind_ != NumberKind::Float) return *this;
        if(!std::isfinite(float_)) return symbolic(SymbolicReason::Unevaluated, to_string());
        mpq_class q(float_);
        q.canonicalize();
        if(q.get_den() == 1) return integer(mpz_class(q.get_num()));
        return rational(q);
    }

    /// Machine approximation; the modulus for Complex, NaN for Symbolic.
    double approximate() const
    {
        switch(kind_) {
            case NumberKind::Integer: return integer_.get_d();
            case NumberKind::Rational: return rational_.get_d();
            case NumberKind::Real: return real_.to_double();
            case NumberKind::Complex: return std::hypot(re_->approximate(), im_->approximate());
            case NumberKind::Float: return float_;
            case NumberKind::Symbolic: return std::numeric_limits<double>::quiet_NaN();
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    /// Collapses Rational n/1 to Integer and Complex with exact zero imaginary part to its real part.
    Number canonical() const
    {
        if(kind_ == NumberKind::Rational && rational_.get_den() == 1) return integer(mpz_class(rational_.get_num()));
        if(kind_ == NumberKind::Complex) {
            if(im_->is_exact() && im_->is_zero()) return re_->canonical();
            return complex(re_->canonical(), im_->canonical());
        }
        return *this;
    }

    /// Integer part truncated toward zero.
    mpz_class to_integer() const
    {
        switch(kind_) {
            case NumberKind::Integer: return integer_;
            case NumberKind::Rational: {
                mpz_class result;
                mpz_tdiv_q(result.get_mpz_t(), rational_.get_num_mpz_t(), rational_.get_den_mpz_t());
                return result;
            }
            case NumberKind::Real: return real_.to_integer();
            case NumberKind::Float:
                if(!std::isfinite(float_)) throw ComputeError::domain_error("integer part of " + to_string());
                return mpz_class(std::trunc(float_));
            case NumberKind::Complex:
                if(!im_->is_zero()) throw ComputeError::domain_error("integer part of complex value " + to_string());
                return re_->to_integer();
            case NumberKind::Symbolic: break;
        }
        throw ComputeError::domain_error("integer part of symbolic value " + to_string());
    }

    mpq_class to_rational() const
    {
        switch(kind_) {
            case NumberKind::Integer: return mpq_class(integer_);
            case NumberKind::Rational: return rational_;
            case NumberKind::Real: return real_.to_rational();
            case NumberKind::Float: {
                if(!std::isfinite(float_)) throw ComputeError::domain_error("rational value of " + to_string());
                mpq_class q(float_);
                q.canonicalize();
                return q;
            }
            case NumberKind::Complex:
            case NumberKind::Symbolic: break;
        }
        throw ComputeError::domain_error("rational value of " + to_string());
    }

    /// The value as a machine integer when it is integral and fits.
    std::optional<long> to_int64() const
    {
        if(!is_integer() || kind_ == NumberKind::Complex) return std::nullopt;
        const mpz_class value = to_integer();
        if(!value.fits_slong_p()) return std::nullopt;
        return value.get_si();
    }

    std::string to_string() const;

    /**
     * @brief Hash consistent with operator==.
     *
     * Exact reals hash through their reduced rational value, so `6`, `6/1` and
     * Real `6` agree; a Complex with a zero imaginary part hashes as its real
     * part. Use it for containers keyed by value, and hash() where numbers of
     * different kinds must stay apart.
     */
    std::size_t value_hash() const
    {
        std::size_t seed = 0;
        switch(kind_) {
            case NumberKind::Integer:
            case NumberKind::Rational:
            case NumberKind::Real: {
                const mpq_class q = to_rational();
                boost::hash_combine(seed, 0);
                boost::hash_combine(seed, q.get_num().get_str(16));
                boost::hash_combine(seed, q.get_den().get_str(16));
                break;
            }
            case NumberKind::Complex:
                if(im_->is_zero()) return re_->value_hash();
                boost::hash_combine(seed, 1);
                boost::hash_combine(seed, re_->value_hash());
                boost::hash_combine(seed, im_->value_hash());
                break;
            case NumberKind::Float:
                boost::hash_combine(seed, 2);
                boost::hash_combine(seed, float_ == 0.0 ? 0.0 : float_);
                break;
            case NumberKind::Symbolic:
                boost::hash_combine(seed, 3);
                boost::hash_combine(seed, static_cast<int>(reason_));
                boost::hash_combine(seed, text_);
                break;
        }
        return seed;
    }

    /// Hash consistent with identical(): kind and value.
    std::size_t hash() const
    {
        std::size_t seed = 0;
        boost::hash_combine(seed, static_cast<int>(kind_));
        switch(kind_) {
            case NumberKind::Integer: boost::hash_combine(seed, integer_.get_str(16)); break;
            case NumberKind::Rational:
                boost::hash_combine(seed, rational_.get_num().get_str(16));
                boost::hash_combine(seed, rational_.get_den().get_str(16));
                break;
            case NumberKind::Real: boost::hash_combine(seed, real_.hash()); break;
            case NumberKind::Complex:
                boost::hash_combine(seed, re_->hash());
                boost::hash_combine(seed, im_->hash());
                break;
            case NumberKind::Float: boost::hash_combine(seed, float_ == 0.0 ? 0.0 : float_); break;
            case NumberKind::Symbolic:
                boost::hash_combine(seed, static_cast<int>(reason_));
                boost::hash_combine(seed, text_);
                break;
        }
        return seed;
    }

    /// Rough heap footprint, used by memory accounting.
    std::size_t estimated_size() const
    {
        std::size_t bytes = sizeof(Number) + text_.capacity();
        bytes += mpz_size(integer_.get_mpz_t()) * sizeof(mp_limb_t);
        bytes += (mpz_size(rational_.get_num_mpz_t()) + mpz_size(rational_.get_den_mpz_t())) * sizeof(mp_limb_t);
        bytes += mpz_size(real_.unscaled().get_mpz_t()) * sizeof(mp_limb_t);
        if(re_) bytes += re_->estimated_size() + im_->estimated_size();
        return bytes;
    }
};

namespace detail {

inline std::string format_float(double value)
{
    if(std::isnan(value)) return "nan";
    if(std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::ostringstream out;
    out << std::setprecision(15) << value;
    std::string text = out.str();
    if(std::strtod(text.c_str(), nullptr) != value) {
        std::ostringstream precise;
        precise << std::setprecision(17) << value;
        text = precise.str();
    }
    if(text.find_first_of(".en") == std::string::npos) text += ".0";
    return text;
}

} // namespace detail

inline std::string Number::to_string() const
{
    switch(kind_) {
        case NumberKind::Integer: return integer_.get_str();
        case NumberKind::Rational:
            if(rational_.get_den() == 1) return rational_.get_num().get_str();
            return rational_.get_str();
        case NumberKind::Real: return real_.to_string();
        case NumberKind::Float: return detail::format_float(float_);
        case NumberKind::Complex: {
            if(im_->is_zero()) return re_->to_string();
            std::string imag;
            if(im_->is_one()) imag = "i";
            else if(im_->is_exact() && im_->to_string() == "-1") imag = "-i";
            else imag = im_->to_string() + "i";
            if(re_->is_zero()) return imag;
            return re_->to_string() + (imag[0] == '-' ? "" : "+") + imag;
        }
        case NumberKind::Symbolic: return text_;
    }
    return text_;
}

inline std::ostream& operator<<(std::ostream& out, const Number& n)
{
    return out << n.to_string();
}

//=====================================================================================================================
// PROMOTION
//=====================================================================================================================

namespace detail {

inline int promotion_rank(NumberKind kind)
{
    switch(kind) {
        case NumberKind::Integer: return 0;
        case NumberKind::Rational: return 1;
        case NumberKind::Real: return 2;
        case NumberKind::Complex: return 3;
        default: return -1;
    }
}

inline Number to_complex(const Number& x)
{
    if(x.is_complex()) return x;
    return Number::complex(x, x.is_float() ? Number::floating(0.0) : Number::zero());
}

// True when the denominator has no prime factors other than 2 and 5.
inline bool terminates_in_base10(const mpq_class& q)
{
    mpz_class den = q.get_den();
    mpz_remove(den.get_mpz_t(), den.get_mpz_t(), mpz_class(2).get_mpz_t());
    mpz_remove(den.get_mpz_t(), den.get_mpz_t(), mpz_class(5).get_mpz_t());
    return den == 1;
}

// Converts an exact real value up to Rational or Real.
inline Number convert_exact(const Number& x, NumberKind target)
{
    if(x.kind() == target) return x;
    if(target == NumberKind::Rational) {
        if(x.kind() == NumberKind::Integer) return Number::rational(mpq_class(x.integer_value()));
        return Number::rational(x.real_value().to_rational());
    }
    if(target == NumberKind::Real) {
        if(x.kind() == NumberKind::Integer) return Number::real(BigDecimal(x.integer_value()));
        return Number::real(BigDecimal::from_rational(x.rational_value()));
    }
    return x;
}

} // namespace detail

/**
 * @brief Converts both operands to their least common representation.
 *
 * Integer < Rational < Real < Complex. A Rational whose decimal expansion does
 * not terminate meets a Real in Rational instead, since every Real is an exact
 * rational and the reverse conversion would truncate.
 *
 * Float has no common representation
 * with the exact kinds (other than Complex with Float parts) and Symbolic has
 * none at all; such pairs come back unchanged, with differing kinds.
 */
inline std::pair<Number, Number> promote_types(const Number& a, const Number& b)
{
    if(a.kind() == b.kind() || a.is_symbolic() || b.is_symbolic()) return {a, b};
    if(a.is_complex() || b.is_complex()) return {detail::to_complex(a), detail::to_complex(b)};
    if(a.is_float() || b.is_float()) return {a, b};
    const int rank = std::max(detail::promotion_rank(a.kind()), detail::promotion_rank(b.kind()));
    NumberKind target = rank == 1 ? NumberKind::Rational : NumberKind::Real;
    if(target == NumberKind::Real) {
        const Number& other = a.kind() == NumberKind::Real ? b : a;
        if(other.kind() == NumberKind::Rational && !detail::terminates_in_base10(other.rational_value()))
            target = NumberKind::Rational;
    }
    return {detail::convert_exact(a, target), detail::convert_exact(b, target)};
}

//=====================================================================================================================
// ARITHMETIC
//=====================================================================================================================

namespace detail {

enum class ArithOp : uint8_t { Add, Sub, Mul, Div };

inline const char* arith_symbol(ArithOp op)
{
    switch(op) {
        case ArithOp::Add: return "+";
        case ArithOp::Sub: return "-";
        case ArithOp::Mul: return "*";
        case ArithOp::Div: return "/";
    }
    return "?";
}

inline Number unevaluated(const Number& a, const char* symbol, const Number& b)
{
    return Number::symbolic(SymbolicReason::Unevaluated, a.to_string() + " " + symbol + " " + b.to_string());
}

inline double checked_float(double result, double a, double b, const char* operation)
{
    if(std::isinf(result) && std::isfinite(a) && std::isfinite(b)) throw ComputeError::overflow(operation);
    return result;
}

inline Number arith(const Number& a, ArithOp op, const Number& b);

inline Number complex_arith(const Number& x, ArithOp op, const Number& y, const Number& a, const Number& b)
{
    const Number& ar = x.real_part();
    const Number& ai = x.imag_part();
    const Number& br = y.real_part();
    const Number& bi = y.imag_part();
    Number re, im;
    switch(op) {
        case ArithOp::Add:
            re = arith(ar, ArithOp::Add, br);
            im = arith(ai, ArithOp::Add, bi);
            break;
        case ArithOp::Sub:
            re = arith(ar, ArithOp::Sub, br);
            im = arith(ai, ArithOp::Sub, bi);
            break;
        case ArithOp::Mul:
            re = arith(arith(ar, ArithOp::Mul, br), ArithOp::Sub, arith(ai, ArithOp::Mul, bi));
            im = arith(arith(ar, ArithOp::Mul, bi), ArithOp::Add, arith(ai, ArithOp::Mul, br));
            break;
        case ArithOp::Div: {
            // multiply by the conjugate, divide by the squared modulus
            const Number modulus2 = arith(arith(br, ArithOp::Mul, br), ArithOp::Add, arith(bi, ArithOp::Mul, bi));
            const Number re_num = arith(arith(ar, ArithOp::Mul, br), ArithOp::Add, arith(ai, ArithOp::Mul, bi));
            const Number im_num = arith(arith(ai, ArithOp::Mul, br), ArithOp::Sub, arith(ar, ArithOp::Mul, bi));
            re = arith(re_num, ArithOp::Div, modulus2);
            im = arith(im_num, ArithOp::Div, modulus2);
            break;
        }
    }
    if(re.is_symbolic() || im.is_symbolic()) return unevaluated(a, arith_symbol(op), b);
    if(im.is_exact() && im.is_zero()) return re;
    return Number::complex(re, im);
}

inline Number arith(const Number& a, ArithOp op, const Number& b)
{
    if(op == ArithOp::Div && b.is_zero()) {
        if(a.is_zero()) return Number::symbolic(SymbolicReason::Indeterminate, "0/0");
        return Number::symbolic(SymbolicReason::DivisionByZero, a.to_string() + "/0");
    }
    if(a.is_symbolic() || b.is_symbolic()) return unevaluated(a, arith_symbol(op), b);

    const auto promoted = promote_types(a, b);
    const Number& x = promoted.first;
    const Number& y = promoted.second;
    if(x.kind() != y.kind()) return unevaluated(a, arith_symbol(op), b);

    switch(x.kind()) {
        case NumberKind::Integer: {
            const mpz_class& p = x.integer_value();
            const mpz_class& q = y.integer_value();
            switch(op) {
                case ArithOp::Add: return Number::integer(mpz_class(p + q));
                case ArithOp::Sub: return Number::integer(mpz_class(p - q));
                case ArithOp::Mul: return Number::integer(mpz_class(p * q));
                case ArithOp::Div:
                    if(mpz_divisible_p(p.get_mpz_t(), q.get_mpz_t())) return Number::integer(mpz_class(p / q));
                    return Number::rational(p, q);
            }
            break;
        }
        case NumberKind::Rational: {
            const mpq_class& p = x.rational_value();
            const mpq_class& q = y.rational_value();
            switch(op) {
                case ArithOp::Add: return Number::rational(mpq_class(p + q));
                case ArithOp::Sub: return Number::rational(mpq_class(p - q));
                case ArithOp::Mul: return Number::rational(mpq_class(p * q));
                case ArithOp::Div: return Number::rational(mpq_class(p / q));
            }
            break;
        }
        case NumberKind::Real: {
            const BigDecimal& p = x.real_value();
            const BigDecimal& q = y.real_value();
            switch(op) {
                case ArithOp::Add: return Number::real(p + q);
                case ArithOp::Sub: return Number::real(p - q);
                case ArithOp::Mul: return Number::real(p * q);
                case ArithOp::Div: return Number::real(p.divide(q));
            }
            break;
        }
        case NumberKind::Float: {
            const double p = x.float_value();
            const double q = y.float_value();
            switch(op) {
                case ArithOp::Add: return Number::floating(checked_float(p + q, p, q, "float addition"));
                case ArithOp::Sub: return Number::floating(checked_float(p - q, p, q, "float subtraction"));
                case ArithOp::Mul: return Number::floating(checked_float(p * q, p, q, "float multiplication"));
                case ArithOp::Div: return Number::floating(checked_float(p / q, p, q, "float division"));
            }
            break;
        }
        case NumberKind::Complex: return complex_arith(x, op, y, a, b);
        case NumberKind::Symbolic: break;
    }
    return unevaluated(a, arith_symbol(op), b);
}

} // namespace detail

inline Number add(const Number& a, const Number& b) { return detail::arith(a, detail::ArithOp::Add, b); }
inline Number sub(const Number& a, const Number& b) { return detail::arith(a, detail::ArithOp::Sub, b); }
inline Number mul(const Number& a, const Number& b) { return detail::arith(a, detail::ArithOp::Mul, b); }

/// Never throws for a zero divisor: `x/0` and `0/0` come back Symbolic.
inline Number div(const Number& a, const Number& b) { return detail::arith(a, detail::ArithOp::Div, b); }

inline Number neg(const Number& a)
{
    switch(a.kind()) {
        case NumberKind::Integer: return Number::integer(mpz_class(-a.integer_value()));
        case NumberKind::Rational: return Number::rational(mpq_class(-a.rational_value()));
        case NumberKind::Real: return Number::real(-a.real_value());
        case NumberKind::Complex: return Number::complex(neg(a.real_part()), neg(a.imag_part()));
        case NumberKind::Float: return Number::floating(-a.float_value());
        case NumberKind::Symbolic: break;
    }
    return Number::symbolic(SymbolicReason::Unevaluated, "-(" + a.to_string() + ")");
}

inline Number operator+(const Number& a, const Number& b) { return add(a, b); }
inline Number operator-(const Number& a, const Number& b) { return sub(a, b); }
inline Number operator*(const Number& a, const Number& b) { return mul(a, b); }
inline Number operator/(const Number& a, const Number& b) { return div(a, b); }
inline Number operator-(const Number& a) { return neg(a); }

//=====================================================================================================================
// COMPARISON
//=====================================================================================================================

/// Value equality: exact kinds compare after promotion (`6/1 == 6`); Float only equals Float.
inline bool operator==(const Number& a, const Number& b)
{
    if(a.is_symbolic() || b.is_symbolic()) {
        return a.is_symbolic() && b.is_symbolic() && a.symbolic_reason() == b.symbolic_reason()
            && a.symbolic_text() == b.symbolic_text();
    }
    const auto promoted = promote_types(a, b);
    const Number& x = promoted.first;
    const Number& y = promoted.second;
    if(x.kind() != y.kind()) return false;
    switch(x.kind()) {
        case NumberKind::Integer: return x.integer_value() == y.integer_value();
        case NumberKind::Rational: return x.rational_value() == y.rational_value();
        case NumberKind::Real: return x.real_value() == y.real_value();
        case NumberKind::Float: return x.float_value() == y.float_value();
        case NumberKind::Complex: return x.real_part() == y.real_part() && x.imag_part() == y.imag_part();
        case NumberKind::Symbolic: break;
    }
    return false;
}

inline bool operator!=(const Number& a, const Number& b) { return !(a == b); }

/// Same kind and same value.
inline bool identical(const Number& a, const Number& b)
{
    if(a.kind() != b.kind()) return false;
    if(a.is_complex()) return identical(a.real_part(), b.real_part()) && identical(a.imag_part(), b.imag_part());
    return a == b;
}

/// Three-way comparison of real values; throws DomainError for complex or symbolic operands.
inline int compare(const Number& a, const Number& b)
{
    if(!a.is_real() || !b.is_real())
        throw ComputeError::domain_error("ordering of " + a.to_string() + " and " + b.to_string());
    if(a.is_float() || b.is_float()) {
        const double x = a.approximate();
        const double y = b.approximate();
        if(!std::isfinite(x) || !std::isfinite(y)) return x < y ? -1 : (y < x ? 1 : 0);
    }
    return cmp(a.to_rational(), b.to_rational());
}

//=====================================================================================================================
// POWERS, ROOTS, ABSOLUTE VALUE
//=====================================================================================================================

// Exponents above this magnitude are left unevaluated.
constexpr long MAX_EXACT_EXPONENT = 100000;

/// Exact square root of a perfect-square Integer, Rational or Real; negative squares give `k*i`.
inline std::optional<Number> sqrt_exact(const Number& n)
{
    auto exact_root = [](const mpz_class& value, mpz_class& root) {
        if(value < 0 || mpz_perfect_square_p(value.get_mpz_t()) == 0) return false;
        mpz_sqrt(root.get_mpz_t(), value.get_mpz_t());
        return true;
    };
    auto rational_root = [&](const mpq_class& q) -> std::optional<Number> {
        const bool negative = q < 0;
        const mpz_class num = ::abs(q.get_num());
        mpz_class rn, rd;
        if(!exact_root(num, rn) || !exact_root(q.get_den(), rd)) return std::nullopt;
        Number root = rd == 1 ? Number::integer(rn) : Number::rational(rn, rd);
        if(negative) return Number::complex(Number::zero(), root);
        return root;
    };

    switch(n.kind()) {
        case NumberKind::Integer: return rational_root(mpq_class(n.integer_value()));
        case NumberKind::Rational: {
            auto root = rational_root(n.rational_value());
            if(root && root->kind() == NumberKind::Integer) return Number::rational(mpq_class(root->integer_value()));
            return root;
        }
        case NumberKind::Real: {
            auto root = rational_root(n.real_value().to_rational());
            if(!root) return std::nullopt;
            if(root->is_complex()) return Number::complex(Number::zero(), Number::real(BigDecimal::from_rational(root->imag_part().to_rational())));
            return Number::real(BigDecimal::from_rational(root->to_rational()));
        }
        default: break;
    }
    return std::nullopt;
}

inline Number abs(const Number& a)
{
    switch(a.kind()) {
        case NumberKind::Integer: return Number::integer(mpz_class(::abs(a.integer_value())));
        case NumberKind::Rational: return Number::rational(mpq_class(::abs(a.rational_value())));
        case NumberKind::Real: return Number::real(a.real_value().abs());
        case NumberKind::Float: return Number::floating(std::fabs(a.float_value()));
        case NumberKind::Complex: {
            if(!a.is_exact()) return Number::floating(a.approximate());
            const Number modulus2 = a.real_part() * a.real_part() + a.imag_part() * a.imag_part();
            auto root = sqrt_exact(modulus2);
            if(root && !root->is_complex()) return *root;
            break;
        }
        case NumberKind::Symbolic: break;
    }
    return Number::symbolic(SymbolicReason::Unevaluated, "abs(" + a.to_string() + ")");
}

/**
 * @brief base^exponent for integer exponents (and exponent 1/2 on perfect squares).
 *
 * Negative exponents produce the exact inverse; non-integer or huge exponents
 * stay Symbolic, as does mixing Float with exact operands. 0^0 is 1 and 0 to a
 * negative power is a Symbolic division by zero.
 */
inline Number pow(const Number& base, const Number& exponent)
{
    if(base.is_symbolic() || exponent.is_symbolic()) return detail::unevaluated(base, "^", exponent);
    if(base.is_float() || exponent.is_float()) {
        if(!base.is_float() || !exponent.is_float()) return detail::unevaluated(base, "^", exponent);
        const double p = base.float_value();
        const double q = exponent.float_value();
        return Number::floating(detail::checked_float(std::pow(p, q), p, q, "float power"));
    }
    if(exponent.kind() == NumberKind::Rational && exponent.rational_value() == mpq_class(1, 2)) {
        if(auto root = sqrt_exact(base)) return *root;
        return detail::unevaluated(base, "^", exponent);
    }

    const auto e = exponent.to_int64();
    if(!e || exponent.is_complex()) return detail::unevaluated(base, "^", exponent);
    if(*e == 0) return Number::one();
    if(*e > MAX_EXACT_EXPONENT || *e < -MAX_EXACT_EXPONENT) return detail::unevaluated(base, "^", exponent);
    if(*e < 0 && base.is_zero())
        return Number::symbolic(SymbolicReason::DivisionByZero, base.to_string() + "^" + exponent.to_string());

    const unsigned long magnitude = static_cast<unsigned long>(*e < 0 ? -*e : *e);
    Number result;
    switch(base.kind()) {
        case NumberKind::Integer: {
            mpz_class value;
            mpz_pow_ui(value.get_mpz_t(), base.integer_value().get_mpz_t(), magnitude);
            result = Number::integer(value);
            break;
        }
        case NumberKind::Rational: {
            mpz_class num, den;
            mpz_pow_ui(num.get_mpz_t(), base.rational_value().get_num_mpz_t(), magnitude);
            mpz_pow_ui(den.get_mpz_t(), base.rational_value().get_den_mpz_t(), magnitude);
            result = Number::rational(num, den);
            break;
        }
        case NumberKind::Real: {
            mpz_class unscaled;
            mpz_pow_ui(unscaled.get_mpz_t(), base.real_value().unscaled().get_mpz_t(), magnitude);
            result = Number::real(BigDecimal(unscaled, base.real_value().scale() * magnitude));
            break;
        }
        case NumberKind::Complex: {
            // square-and-multiply
            Number square = base;
            result = Number::one();
            for(unsigned long k = magnitude; k > 0; k >>= 1) {
                if(k & 1UL) result = result * square;
                if(k > 1) square = square * square;
            }
            break;
        }
        default: return detail::unevaluated(base, "^", exponent);
    }
    if(*e < 0) return div(Number::one(), result);
    return result;
}

} // namespace symcore

namespace std {

template<>
struct hash<symcore::Number>
{
    std::size_t operator()(const symcore::Number& n) const { return n.value_hash(); }
};

} // namespace std
