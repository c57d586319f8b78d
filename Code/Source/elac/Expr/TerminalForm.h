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

#ifndef ELAC_EXPR_TERMINALFORM_H
#define ELAC_EXPR_TERMINALFORM_H

/**
 * @file TerminalForm.h
 * @brief Opaque description of an assembled local tensor
 *
 * A terminal form is what a terminal-form compiler turns into subkernels.
 * The kernel compiler only inspects its shape and the coefficients it reads.
 */

#include "Core/Types.h"
#include "Expr/Coefficient.h"

#include <memory>
#include <string>
#include <vector>

namespace elac {
namespace expr {

struct TerminalForm {
    /// Form name, used in diagnostics and by terminal-form compilers
    std::string name{};

    /// Extent per form argument: {} scalar, {n} vector, {m, n} matrix
    std::vector<int> argument_dimensions{};

    /// Coefficients the form reads
    std::vector<Coefficient::Ptr> coefficients{};

    /// Integration domains present in the form
    std::vector<IntegralType> integral_types{IntegralType::Cell};

    [[nodiscard]] int rank() const noexcept { return static_cast<int>(argument_dimensions.size()); }
};

using TerminalFormPtr = std::shared_ptr<const TerminalForm>;

} // namespace expr
} // namespace elac

#endif // ELAC_EXPR_TERMINALFORM_H
