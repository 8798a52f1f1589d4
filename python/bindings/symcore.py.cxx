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

// pybind11 includes
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

// symcore includes
#include <symcore/symcore.hpp>

namespace py = pybind11;

using namespace symcore;
using namespace symcore::simplify;

void export_number(py::module& m)
{
    py::enum_<NumberKind>(m, "NumberKind")
        .value("Integer", NumberKind::Integer)
        .value("Rational", NumberKind::Rational)
        .value("Real", NumberKind::Real)
        .value("Complex", NumberKind::Complex)
        .value("Float", NumberKind::Float)
        .value("Symbolic", NumberKind::Symbolic);

    py::class_<Number>(m, "Number")
        .def_static("integer", [](const std::string& digits) { return Number::integer(digits); })
        .def_static("rational", [](long num, long den) { return Number::rational(num, den); })
        .def_static("real", [](const std::string& text) { return Number::real(text); })
        .def_static("complex", &Number::complex)
        .def_static("floating", &Number::floating)
        .def_static("imaginary_unit", &Number::imaginary_unit)
        .def("kind", &Number::kind)
        .def("is_zero", &Number::is_zero)
        .def("is_one", &Number::is_one)
        .def("is_exact", &Number::is_exact)
        .def("is_integer", &Number::is_integer)
        .def("is_symbolic", &Number::is_symbolic)
        .def("is_complex", &Number::is_complex)
        .def("approximate", &Number::approximate)
        .def("canonical", &Number::canonical)
        .def("__add__", [](const Number& a, const Number& b) { return a + b; })
        .def("__sub__", [](const Number& a, const Number& b) { return a - b; })
        .def("__mul__", [](const Number& a, const Number& b) { return a * b; })
        .def("__truediv__", [](const Number& a, const Number& b) { return a / b; })
        .def("__pow__", [](const Number& a, const Number& b) { return pow(a, b); })
        .def("__neg__", [](const Number& a) { return -a; })
        .def("__eq__", [](const Number& a, const Number& b) { return a == b; })
        .def("__hash__", &Number::value_hash)
        .def("__str__", &Number::to_string)
        .def("__repr__", [](const Number& n) { return "Number(" + n.to_string() + ")"; });
}

void export_expression(py::module& m)
{
    py::enum_<ConstantKind>(m, "Constant")
        .value("Pi", ConstantKind::Pi)
        .value("E", ConstantKind::E)
        .value("I", ConstantKind::I)
        .value("EulerGamma", ConstantKind::EulerGamma)
        .value("GoldenRatio", ConstantKind::GoldenRatio)
        .value("Catalan", ConstantKind::Catalan);

    py::class_<SharedExpr>(m, "Expr")
        .def("ref_count", &SharedExpr::ref_count)
        .def("is_unique", &SharedExpr::is_unique)
        .def("same_node", &SharedExpr::same_node)
        .def("complexity", [](const SharedExpr& e) { return complexity(e); })
        .def("variables", [](const SharedExpr& e) { return variables(e); })
        .def("__eq__", [](const SharedExpr& a, const SharedExpr& b) { return a == b; })
        .def("__hash__", &SharedExpr::hash)
        .def("__str__", [](const SharedExpr& e) { return to_string(e); })
        .def("__repr__", [](const SharedExpr& e) { return "Expr(" + to_string(e) + ")"; });

    py::class_<ExpressionBuilder>(m, "ExpressionBuilder")
        .def(py::init<>())
        .def("variable", &ExpressionBuilder::variable)
        .def("integer", &ExpressionBuilder::integer)
        .def("rational", &ExpressionBuilder::rational)
        .def("number", &ExpressionBuilder::number)
        .def("constant", &ExpressionBuilder::constant)
        .def("pi", &ExpressionBuilder::pi)
        .def("add", &ExpressionBuilder::add)
        .def("subtract", &ExpressionBuilder::subtract)
        .def("multiply", &ExpressionBuilder::multiply)
        .def("divide", &ExpressionBuilder::divide)
        .def("power", &ExpressionBuilder::power)
        .def("negate", &ExpressionBuilder::negate)
        .def("sin", &ExpressionBuilder::sin)
        .def("cos", &ExpressionBuilder::cos)
        .def("tan", &ExpressionBuilder::tan)
        .def("sqrt", &ExpressionBuilder::sqrt)
        .def("function", &ExpressionBuilder::function)
        .def("cleanup", &ExpressionBuilder::cleanup)
        .def("interned_count", &ExpressionBuilder::interned_count);
}

void export_simplifier(py::module& m)
{
    py::class_<SimplifierConfig>(m, "SimplifierConfig")
        .def(py::init<>())
        .def_readwrite("max_passes", &SimplifierConfig::max_passes)
        .def_readwrite("max_local_rewrites", &SimplifierConfig::max_local_rewrites)
        .def_readwrite("enable_trigonometric", &SimplifierConfig::enable_trigonometric)
        .def_readwrite("enable_radicals", &SimplifierConfig::enable_radicals)
        .def_readwrite("allow_complex", &SimplifierConfig::allow_complex)
        .def_readwrite("cache_capacity", &SimplifierConfig::cache_capacity);

    py::class_<SimplifyStats>(m, "SimplifyStats")
        .def_readonly("passes", &SimplifyStats::passes)
        .def_readonly("rewrites", &SimplifyStats::rewrites)
        .def_readonly("cache_hits", &SimplifyStats::cache_hits);

    // the simplifier keeps a reference to its builder
    py::class_<Simplifier>(m, "Simplifier")
        .def(py::init<ExpressionBuilder&, SimplifierConfig>(), py::arg("builder"), py::arg("config") = SimplifierConfig{},
             py::keep_alive<1, 2>())
        .def("simplify", [](Simplifier& s, const SharedExpr& e) { return s.simplify(e); })
        .def("simplify", [](Simplifier& s, const SharedExpr& e, std::size_t max_passes) { return s.simplify(e, max_passes); })
        .def("set_family_enabled", &Simplifier::set_family_enabled)
        .def("last_stats", &Simplifier::last_stats)
        .def("cache_size", &Simplifier::cache_size)
        .def("clear_cache", &Simplifier::clear_cache);
}

void export_evaluate(py::module& m)
{
    py::class_<EvalOptions>(m, "EvalOptions")
        .def(py::init<>())
        .def_readwrite("allow_complex", &EvalOptions::allow_complex)
        .def_readwrite("approximate", &EvalOptions::approximate)
        .def_readwrite("max_factorial", &EvalOptions::max_factorial);

    m.def("evaluate",
          [](const SharedExpr& e, const std::unordered_map<std::string, Number>& bindings, const EvalOptions& options) {
              return evaluate(e, bindings, options);
          },
          py::arg("expr"), py::arg("bindings") = std::unordered_map<std::string, Number>{}, py::arg("options") = EvalOptions{});
}

PYBIND11_MODULE(symcore4py, m)
{
    py::register_exception<ComputeError>(m, "ComputeError");

    export_number(m);
    export_expression(m);
    export_simplifier(m);
    export_evaluate(m);
}
