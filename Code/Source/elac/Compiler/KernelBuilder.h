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

#ifndef ELAC_COMPILER_KERNELBUILDER_H
#define ELAC_COMPILER_KERNELBUILDER_H

/**
 * @file KernelBuilder.h
 * @brief Compilation state for one tensor expression
 *
 * The builder runs the graph analyses on construction, compiles the terminal
 * tensors on demand, and produces the kernel artifact in two phases:
 *
 *   KernelBuilder builder(expr, compiler);
 *   builder.finalize();                       // rewrite subkernels, aggregate flags
 *   auto root = builder.construct({driver});  // subkernels followed by drivers
 *
 * A builder is driven by one thread; the memoized accessors are not safe for
 * concurrent first access.
 */

#include "AST/KernelAST.h"
#include "Compiler/ContextKernel.h"
#include "Compiler/ExprAnalysis.h"
#include "Compiler/KernelTransformer.h"
#include "Compiler/TerminalFormCompiler.h"
#include "Core/ParameterValue.h"
#include "Core/Types.h"
#include "Expr/TensorExpr.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace elac {
namespace compiler {

enum class BuilderState : std::uint8_t {
    Constructed,
    Finalized
};

[[nodiscard]] const char* builderStateName(BuilderState s) noexcept;

/**
 * @brief Insertion-ordered coefficient -> symbol tuple map
 *
 * The i-th coefficient in canonical order maps to ("w_i") on a simple space
 * and to ("w_i_0", ..., "w_i_{N-1}") on a mixed space with N components.
 */
class CoefficientMap {
public:
    using Symbols = std::vector<std::shared_ptr<const ast::Symbol>>;

    struct Entry {
        expr::Coefficient::Ptr coefficient;
        Symbols symbols;
    };

    void add(expr::Coefficient::Ptr coefficient, Symbols symbols);

    /// Null if `c` is not in the map
    [[nodiscard]] const Symbols* find(const expr::Coefficient* c) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const Entry& operator[](std::size_t i) const { return entries_.at(i); }

    [[nodiscard]] std::vector<Entry>::const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] std::vector<Entry>::const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<Entry> entries_{};
};

class KernelBuilder {
public:
    /**
     * @param expression  root of the expression graph; must be non-empty
     * @param compiler    terminal-form compiler; must be non-null
     * @param parameters  forwarded verbatim to `compiler`
     * @param transformer rewriting pass for subkernels; EigenTransformer if null
     */
    KernelBuilder(expr::TensorExpr expression,
                  std::shared_ptr<TerminalFormCompiler> compiler,
                  CompilerParameters parameters = {},
                  std::shared_ptr<const KernelTransformer> transformer = nullptr);
    ~KernelBuilder();

    KernelBuilder(KernelBuilder&&) noexcept;
    KernelBuilder& operator=(KernelBuilder&&) noexcept;

    KernelBuilder(const KernelBuilder&) = delete;
    KernelBuilder& operator=(const KernelBuilder&) = delete;

    // ---- Requirements ----
    void requireCellFacets() noexcept;
    void requireMeshLayers() noexcept;

    [[nodiscard]] bool needsCellFacets() const noexcept;
    [[nodiscard]] bool needsMeshLayers() const noexcept;

    /// True once finalize has seen a subkernel that reads cell orientations
    [[nodiscard]] bool oriented() const noexcept;

    // ---- Analysis results ----
    [[nodiscard]] const expr::TensorExpr& expression() const noexcept;
    [[nodiscard]] const CompilerParameters& parameters() const noexcept;
    [[nodiscard]] const TemporaryMap& temporaries() const noexcept;

    /// Temporary of a terminal; LookupException if `terminal` is not one of ours
    [[nodiscard]] const ast::Symbol& temporary(const expr::TensorExpr& terminal) const;

    /// Operators referenced more than once and every Action, by ascending complexity
    [[nodiscard]] const std::vector<expr::TensorExpr>& auxiliaryExpressions() const noexcept;

    [[nodiscard]] const ReferenceCountMap& referenceCounts() const noexcept;

    /// Computed on first access and returned unchanged afterwards
    [[nodiscard]] const CoefficientMap& coefficientMap() const;

    /// Symbols of `c`; LookupException if `c` is not read by the expression
    [[nodiscard]] const CoefficientMap::Symbols& coefficient(const expr::Coefficient& c) const;

    /**
     * @brief Compiled terminals, one compiler call per temporary in map order
     *
     * Computed on first access. A compiler failure propagates and leaves the
     * memo empty, so the next call compiles again.
     */
    [[nodiscard]] const std::vector<ContextKernel>& contextKernels();

    /// Always IntegralType::Cell
    [[nodiscard]] IntegralType integralType() const noexcept;

    // ---- Two-phase build ----
    [[nodiscard]] BuilderState state() const noexcept;
    [[nodiscard]] bool isFinalized() const noexcept;

    /**
     * @brief Rewrite every subkernel and aggregate the orientation flag
     *
     * No-op when already finalized. Throws NotImplementedException for a
     * subkernel restricted to a subdomain; on any exception the builder is
     * left exactly as before the call.
     */
    void finalize();

    /// Rewritten subkernels, empty before finalize
    [[nodiscard]] const std::vector<ast::NodePtr>& finalizedAst() const noexcept;

    /**
     * @brief Finalized subkernels followed by `macro_kernels`
     *
     * PreconditionException before finalize; InvalidArgumentException for a
     * null macro kernel.
     */
    [[nodiscard]] std::shared_ptr<const ast::Root> construct(const std::vector<ast::NodePtr>& macro_kernels) const;

    /// Same as compiler::constructMacroKernel
    [[nodiscard]] std::shared_ptr<const ast::FunDecl> constructMacroKernel(const std::string& name,
                                                                           const std::vector<ast::NodePtr>& args,
                                                                           const ast::NodePtr& body) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace compiler
} // namespace elac

#endif // ELAC_COMPILER_KERNELBUILDER_H
