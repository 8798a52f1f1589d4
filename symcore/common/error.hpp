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
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace symcore {

/// The failure categories every layer above the core handles uniformly.
enum class ErrorKind : uint8_t
{
    DivisionByZero,
    UndefinedVariable,
    DomainError,
    Overflow,
    Timeout,
    UnsupportedOperation
};

inline const char* error_kind_name(ErrorKind kind)
{
    switch(kind) {
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::UndefinedVariable: return "UndefinedVariable";
        case ErrorKind::DomainError: return "DomainError";
        case ErrorKind::Overflow: return "Overflow";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
    }
    return "Unknown";
}

/**
 * @brief Exception raised by symcore operations that cannot produce a value.
 *
 * Arithmetic never throws on division by zero (it yields a Symbolic number);
 * ComputeError is reserved for unbound variables, domain violations, float
 * overflow and exhausted rewrite budgets.
 *
 * Usage:
 *   try { evaluate(expr, bindings); }
 *   catch(const ComputeError& e) {
 *       if(e.kind() == ErrorKind::UndefinedVariable) bindings[e.detail()] = ...;
 *   }
 */
class ComputeError : public std::runtime_error
{
  private:
    ErrorKind kind_;
    std::string detail_;

  public:
    ComputeError(ErrorKind kind, const std::string& detail, const std::string& message)
        : std::runtime_error(message), kind_(kind), detail_(detail)
    {}

    static ComputeError division_by_zero()
    {
        return ComputeError(ErrorKind::DivisionByZero, "", "division by zero");
    }

    static ComputeError undefined_variable(const std::string& name)
    {
        return ComputeError(ErrorKind::UndefinedVariable, name, "undefined variable: " + name);
    }

    static ComputeError domain_error(const std::string& reason)
    {
        return ComputeError(ErrorKind::DomainError, reason, "domain error: " + reason);
    }

    static ComputeError overflow(const std::string& operation)
    {
        return ComputeError(ErrorKind::Overflow, operation, "numeric overflow in " + operation);
    }

    static ComputeError timeout(std::size_t passes)
    {
        return ComputeError(ErrorKind::Timeout, std::to_string(passes),
                            "rewrite budget of " + std::to_string(passes) + " passes exhausted");
    }

    static ComputeError unsupported(const std::string& operation)
    {
        return ComputeError(ErrorKind::UnsupportedOperation, operation, "unsupported operation: " + operation);
    }

    ErrorKind kind() const { return kind_; }

    /// The variable name, domain reason or operation the error refers to.
    const std::string& detail() const { return detail_; }

    /// Whether retrying with more input (a binding, a larger budget) can succeed.
    bool is_recoverable() const
    {
        return kind_ == ErrorKind::UndefinedVariable || kind_ == ErrorKind::Timeout;
    }

    std::string user_message() const
    {
        switch(kind_) {
            case ErrorKind::DivisionByZero: return "Division by zero is undefined.";
            case ErrorKind::UndefinedVariable: return "The variable '" + detail_ + "' has no value.";
            case ErrorKind::DomainError: return "The operation is not defined here: " + detail_ + ".";
            case ErrorKind::Overflow: return "The result is too large to represent.";
            case ErrorKind::Timeout: return "Simplification did not settle within " + detail_ + " passes.";
            case ErrorKind::UnsupportedOperation: return "This operation is not supported: " + detail_ + ".";
        }
        return what();
    }

    std::vector<std::string> suggestions() const
    {
        switch(kind_) {
            case ErrorKind::DivisionByZero:
                return {"Check the denominator for values that vanish."};
            case ErrorKind::UndefinedVariable:
                return {"Bind '" + detail_ + "' to a value before evaluating.", "Check the spelling of the variable name."};
            case ErrorKind::DomainError:
                return {"Enable complex results if a complex value is acceptable.", "Restrict the input to the function's domain."};
            case ErrorKind::Overflow:
                return {"Use exact numbers instead of floating point values."};
            case ErrorKind::Timeout:
                return {"Retry with a larger pass budget.", "Accept the last intermediate form."};
            case ErrorKind::UnsupportedOperation:
                return {"Rewrite the expression using supported operations."};
        }
        return {};
    }
};

} // namespace symcore
