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

#include "Expr/Coefficient.h"

#include "Core/ElacException.h"

#include <atomic>

namespace elac {
namespace expr {

namespace {

std::uint64_t nextCoefficientNumber()
{
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

Coefficient::Coefficient(std::string name, FunctionSpace::Ptr space, const Coefficient* parent)
    : name_(std::move(name)),
      space_(std::move(space)),
      number_(nextCoefficientNumber()),
      parent_(parent)
{
}

Coefficient::Ptr Coefficient::create(std::string name, FunctionSpace::Ptr space)
{
    ELAC_CHECK_NOT_NULL(space.get(), "Coefficient::create: space");

    std::shared_ptr<Coefficient> c(new Coefficient(std::move(name), std::move(space), nullptr));
    c->self_ = c;
    if (c->space_->isMixed()) {
        const auto subspaces = c->space_->split();
        c->parts_.reserve(subspaces.size());
        for (std::size_t i = 0; i < subspaces.size(); ++i) {
            std::shared_ptr<Coefficient> part(
                new Coefficient(c->name_ + "[" + std::to_string(i) + "]", subspaces[i], c.get()));
            part->self_ = part;
            c->parts_.push_back(std::move(part));
        }
    }
    return c;
}

std::vector<Coefficient::Ptr> Coefficient::split() const
{
    if (parts_.empty()) {
        return {self_.lock()};
    }
    return {parts_.begin(), parts_.end()};
}

std::string Coefficient::toString() const
{
    return name_ + " in " + space_->toString();
}

} // namespace expr
} // namespace elac
