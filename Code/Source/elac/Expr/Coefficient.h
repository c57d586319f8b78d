/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef ELAC_EXPR_COEFFICIENT_H
#define ELAC_EXPR_COEFFICIENT_H

/**
 * @file Coefficient.h
 * @brief Named external fields referenced by tensor expressions
 */

#include "Expr/FunctionSpace.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace elac {
namespace expr {

/**
 * @brief External field on a function space
 *
 * Each coefficient receives a process-local creation number when it is
 * created; ascending creation number is the canonical coefficient order.
 * Coefficients on a mixed space own one sub-coefficient per component,
 * created together with the parent.
 */
class Coefficient {
public:
    using Ptr = std::shared_ptr<const Coefficient>;

    static Ptr create(std::string name, FunctionSpace::Ptr space);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint64_t number() const noexcept { return number_; }
    [[nodiscard]] const FunctionSpace::Ptr& space() const noexcept { return space_; }

    /// Sub-coefficients of a mixed coefficient; `{self}` for a simple one
    [[nodiscard]] std::vector<Ptr> split() const;

    /// Owning mixed coefficient, null for top-level coefficients
    [[nodiscard]] const Coefficient* parent() const noexcept { return parent_; }

    [[nodiscard]] std::string toString() const;

private:
    Coefficient(std::string name, FunctionSpace::Ptr space, const Coefficient* parent);

    std::string name_;
    FunctionSpace::Ptr space_;
    std::uint64_t number_{0};
    const Coefficient* parent_{nullptr};
    std::vector<std::shared_ptr<Coefficient>> parts_;
    std::weak_ptr<const Coefficient> self_;
};

/**
 * @brief Strict weak order on creation number
 */
struct CoefficientNumberLess {
    bool operator()(const Coefficient::Ptr& a, const Coefficient::Ptr& b) const noexcept
    {
        return a->number() < b->number();
    }
};

} // namespace expr
} // namespace elac

#endif // ELAC_EXPR_COEFFICIENT_H
