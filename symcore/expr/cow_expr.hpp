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
#include <utility>

// symcore includes
#include <symcore/expr/expr.hpp>

namespace symcore {

/**
 * @brief Copy-on-write view over a SharedExpr.
 *
 * Reads go straight to the shared node. The first as_mut() while the node is
 * aliased clones it into a private copy; later calls reuse that copy. Other
 * holders of the original node never observe the mutation.
 *
 * Usage:
 *   CowExpr a(shared), b(shared);
 *   a.as_mut().name = "y";      // b still reads the original node
 */
class CowExpr
{
  private:
    SharedExpr inner_;
    bool modified_ = false;

  public:
    explicit CowExpr(SharedExpr shared) : inner_(std::move(shared)) {}

    explicit CowExpr(ExprNode node) : inner_(std::move(node)) {}

    const ExprNode& as_ref() const { return *inner_; }

    ExprNode& as_mut()
    {
        modified_ = true;
        return inner_.make_mut();
    }

    bool is_modified() const { return modified_; }

    long ref_count() const { return inner_.ref_count(); }

    bool is_unique() const { return inner_.is_unique(); }

    const SharedExpr& shared() const { return inner_; }

    SharedExpr into_shared() && { return std::move(inner_); }
};

} // namespace symcore
