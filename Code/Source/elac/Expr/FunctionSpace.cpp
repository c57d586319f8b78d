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

#include "Expr/FunctionSpace.h"

#include "Core/ElacException.h"

#include <sstream>

namespace elac {
namespace expr {

FunctionSpace::FunctionSpace(SpaceType type, std::string name, int value_dimension, std::vector<Ptr> components)
    : type_(type),
      name_(std::move(name)),
      value_dimension_(value_dimension),
      components_(std::move(components))
{
}

FunctionSpace::Ptr FunctionSpace::simple(std::string name, int value_dimension)
{
    ELAC_CHECK_ARG(value_dimension > 0,
                   "FunctionSpace::simple: value dimension must be positive, got " +
                       std::to_string(value_dimension));
    return Ptr(new FunctionSpace(SpaceType::Simple, std::move(name), value_dimension, {}));
}

FunctionSpace::Ptr FunctionSpace::mixed(std::string name, std::vector<Ptr> components)
{
    ELAC_CHECK_ARG(!components.empty(), "FunctionSpace::mixed: at least one component is required");
    int dim = 0;
    for (const auto& c : components) {
        ELAC_CHECK_NOT_NULL(c.get(), "FunctionSpace::mixed: component");
        dim += c->dimension();
    }
    return Ptr(new FunctionSpace(SpaceType::Mixed, std::move(name), dim, std::move(components)));
}

std::size_t FunctionSpace::numComponents() const noexcept
{
    return isMixed() ? components_.size() : 1u;
}

FunctionSpace::Ptr FunctionSpace::component(std::size_t i) const
{
    ELAC_CHECK_INDEX(i, numComponents());
    if (!isMixed()) {
        return shared_from_this();
    }
    return components_[i];
}

int FunctionSpace::dimension() const noexcept
{
    return value_dimension_;
}

std::vector<FunctionSpace::Ptr> FunctionSpace::split() const
{
    if (!isMixed()) {
        return {shared_from_this()};
    }
    return components_;
}

std::string FunctionSpace::toString() const
{
    std::ostringstream oss;
    oss << name_;
    if (isMixed()) {
        oss << "(";
        for (std::size_t i = 0; i < components_.size(); ++i) {
            if (i) oss << " * ";
            oss << components_[i]->toString();
        }
        oss << ")";
    } else if (value_dimension_ > 1) {
        oss << "^" << value_dimension_;
    }
    return oss.str();
}

} // namespace expr
} // namespace elac
