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

#ifndef ELAC_COMPILER_CONTEXTKERNEL_H
#define ELAC_COMPILER_CONTEXTKERNEL_H

/**
 * @file ContextKernel.h
 * @brief Output records of a terminal-form compiler
 */

#include "AST/KernelAST.h"
#include "Core/Types.h"
#include "Expr/Coefficient.h"
#include "Expr/TensorExpr.h"

#include <memory>
#include <string>
#include <vector>

namespace elac {
namespace compiler {

/**
 * @brief One generated subkernel and the data needed to call it
 */
struct KernelInfo {
    /// Generated subkernel (normally an ast::FunDecl)
    ast::NodePtr ast{};

    std::string name{};
    IntegralType integral_type{IntegralType::Cell};

    /// Must be DEFAULT_SUBDOMAIN_ID for kernels the builder accepts
    std::string subdomain_id{DEFAULT_SUBDOMAIN_ID};

    /// The subkernel reads cell orientations
    bool oriented{false};

    int domain_number{0};

    /// Positions, in the form's coefficient list, of the coefficients passed in
    std::vector<int> coefficient_map{};

    bool needs_cell_facets{false};
    bool pass_layer_arg{false};
};

/**
 * @brief Kernel for one block of a (possibly mixed) terminal tensor
 */
struct SplitKernel {
    std::vector<int> indices{};
    KernelInfo kinfo{};
};

/**
 * @brief Compiled form of one terminal tensor for one integral type
 */
struct ContextKernel {
    expr::TensorExpr tensor{};
    std::vector<expr::Coefficient::Ptr> coefficients{};
    IntegralType original_integral_type{IntegralType::Cell};
    std::vector<SplitKernel> split_kernels{};
};

} // namespace compiler
} // namespace elac

#endif // ELAC_COMPILER_CONTEXTKERNEL_H
