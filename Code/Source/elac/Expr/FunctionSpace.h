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

#ifndef ELAC_EXPR_FUNCTIONSPACE_H
#define ELAC_EXPR_FUNCTIONSPACE_H

/**
 * @file FunctionSpace.h
 * @brief Function spaces that coefficients live on
 *
 * A space is either simple (one component with a value dimension) or mixed
 * (an ordered list of component spaces). Only the block structure matters to
 * the kernel compiler; element-level evaluation is out of scope.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace elac {
namespace expr {

enum class SpaceType {
    Simple,
    Mixed
};

class FunctionSpace : public std::enable_shared_from_this<FunctionSpace> {
public:
    using Ptr = std::shared_ptr<const FunctionSpace>;

    /// Simple space with `value_dimension` values per point
    static Ptr simple(std::string name, int value_dimension = 1);

    /// Mixed space; requires at least one non-null component
    static Ptr mixed(std::string name, std::vector<Ptr> components);

    [[nodiscard]] SpaceType spaceType() const noexcept { return type_; }
    [[nodiscard]] bool isMixed() const noexcept { return type_ == SpaceType::Mixed; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// 1 for simple spaces
    [[nodiscard]] std::size_t numComponents() const noexcept;

    /// Component space `i`; a simple space is its own only component
    [[nodiscard]] Ptr component(std::size_t i) const;

    /// Value dimension; the sum over components for mixed spaces
    [[nodiscard]] int dimension() const noexcept;

    /// One subspace per component
    [[nodiscard]] std::vector<Ptr> split() const;

    [[nodiscard]] std::string toString() const;

private:
    FunctionSpace(SpaceType type, std::string name, int value_dimension, std::vector<Ptr> components);

    SpaceType type_;
    std::string name_;
    int value_dimension_{1};
    std::vector<Ptr> components_;
};

} // namespace expr
} // namespace elac

#endif // ELAC_EXPR_FUNCTIONSPACE_H
