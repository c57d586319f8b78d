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

#include "Compiler/KernelBuilder.h"

#include "Compiler/MacroKernel.h"
#include "Core/ElacConfig.h"
#include "Core/ElacException.h"
#include "Core/Logger.h"

#include <optional>
#include <sstream>

namespace elac {
namespace compiler {

const char* builderStateName(BuilderState s) noexcept
{
    switch (s) {
        case BuilderState::Constructed: return "Constructed";
        case BuilderState::Finalized:   return "Finalized";
        default:                        return "Unknown";
    }
}

// ============================================================================
// CoefficientMap
// ============================================================================

void CoefficientMap::add(expr::Coefficient::Ptr coefficient, Symbols symbols)
{
    ELAC_CHECK_NOT_NULL(coefficient.get(), "CoefficientMap::add: coefficient");
    ELAC_CHECK_ARG(find(coefficient.get()) == nullptr,
                   "CoefficientMap::add: coefficient '" + coefficient->name() + "' already mapped");
    entries_.push_back(Entry{std::move(coefficient), std::move(symbols)});
}

const CoefficientMap::Symbols* CoefficientMap::find(const expr::Coefficient* c) const noexcept
{
    for (const auto& e : entries_) {
        if (e.coefficient.get() == c) return &e.symbols;
    }
    return nullptr;
}

// ============================================================================
// KernelBuilder
// ============================================================================

struct KernelBuilder::Impl {
    expr::TensorExpr expression{};
    std::shared_ptr<TerminalFormCompiler> compiler{};
    std::shared_ptr<const KernelTransformer> transformer{};
    CompilerParameters parameters{};

    TemporaryMap temporaries{};
    ReferenceCountMap reference_counts{};
    std::vector<expr::TensorExpr> aux_exprs{};

    bool needs_cell_facets{false};
    bool needs_mesh_layers{false};
    bool oriented{false};

    BuilderState state{BuilderState::Constructed};
    std::vector<ast::NodePtr> finalized_ast{};

    std::optional<CoefficientMap> coefficient_map{};
    std::optional<std::vector<ContextKernel>> context_kernels{};
};

KernelBuilder::KernelBuilder(expr::TensorExpr expression,
                             std::shared_ptr<TerminalFormCompiler> compiler,
                             CompilerParameters parameters,
                             std::shared_ptr<const KernelTransformer> transformer)
    : impl_(std::make_unique<Impl>())
{
    ELAC_CHECK_ARG(expression.isValid(), "KernelBuilder: expression is empty");
    ELAC_CHECK_NOT_NULL(compiler.get(), "KernelBuilder: terminal-form compiler");

    impl_->expression = std::move(expression);
    impl_->compiler = std::move(compiler);
    impl_->parameters = std::move(parameters);
    impl_->transformer = transformer ? std::move(transformer)
                                     : std::make_shared<const EigenTransformer>();

    ExprData data = generateExprData(impl_->expression);
    impl_->temporaries = std::move(data.temporaries);
    impl_->reference_counts = collectReferenceCount({impl_->expression});
    impl_->aux_exprs = selectAuxiliaryExpressions(data.tensor_ops, impl_->reference_counts);

#if ELAC_DEBUG_MODE
    std::ostringstream oss;
    oss << "KernelBuilder: " << impl_->expression.toString() << ": "
        << impl_->temporaries.size() << " temporaries, "
        << data.tensor_ops.size() << " operators, "
        << impl_->aux_exprs.size() << " auxiliary expressions";
    ELAC_LOG_DEBUG(oss.str());
#endif
}

KernelBuilder::~KernelBuilder() = default;

KernelBuilder::KernelBuilder(KernelBuilder&&) noexcept = default;
KernelBuilder& KernelBuilder::operator=(KernelBuilder&&) noexcept = default;

void KernelBuilder::requireCellFacets() noexcept
{
    impl_->needs_cell_facets = true;
}

void KernelBuilder::requireMeshLayers() noexcept
{
    impl_->needs_mesh_layers = true;
}

bool KernelBuilder::needsCellFacets() const noexcept { return impl_->needs_cell_facets; }
bool KernelBuilder::needsMeshLayers() const noexcept { return impl_->needs_mesh_layers; }
bool KernelBuilder::oriented() const noexcept { return impl_->oriented; }

const expr::TensorExpr& KernelBuilder::expression() const noexcept { return impl_->expression; }
const CompilerParameters& KernelBuilder::parameters() const noexcept { return impl_->parameters; }
const TemporaryMap& KernelBuilder::temporaries() const noexcept { return impl_->temporaries; }

const ast::Symbol& KernelBuilder::temporary(const expr::TensorExpr& terminal) const
{
    const auto* sym = impl_->temporaries.find(terminal.node());
    ELAC_THROW_IF(sym == nullptr, LookupException,
                  "KernelBuilder::temporary: " + terminal.toString() +
                      " is not a terminal of the compiled expression");
    return *sym;
}

const std::vector<expr::TensorExpr>& KernelBuilder::auxiliaryExpressions() const noexcept
{
    return impl_->aux_exprs;
}

const ReferenceCountMap& KernelBuilder::referenceCounts() const noexcept
{
    return impl_->reference_counts;
}

const CoefficientMap& KernelBuilder::coefficientMap() const
{
    if (!impl_->coefficient_map) {
        CoefficientMap map;
        const auto coefficients = impl_->expression.coefficients();
        for (std::size_t i = 0; i < coefficients.size(); ++i) {
            const auto& c = coefficients[i];
            const std::string base = config::COEFFICIENT_PREFIX + std::to_string(i);
            CoefficientMap::Symbols symbols;
            if (c->space()->isMixed()) {
                const std::size_t n = c->space()->numComponents();
                symbols.reserve(n);
                for (std::size_t j = 0; j < n; ++j) {
                    symbols.push_back(std::make_shared<const ast::Symbol>(base + "_" + std::to_string(j)));
                }
            } else {
                symbols.push_back(std::make_shared<const ast::Symbol>(base));
            }
            map.add(c, std::move(symbols));
        }
        impl_->coefficient_map = std::move(map);
    }
    return *impl_->coefficient_map;
}

const CoefficientMap::Symbols& KernelBuilder::coefficient(const expr::Coefficient& c) const
{
    const auto* symbols = coefficientMap().find(&c);
    ELAC_THROW_IF(symbols == nullptr, LookupException,
                  "KernelBuilder::coefficient: coefficient '" + c.name() +
                      "' is not read by the compiled expression");
    return *symbols;
}

const std::vector<ContextKernel>& KernelBuilder::contextKernels()
{
    if (!impl_->context_kernels) {
        std::vector<ContextKernel> kernels;
        std::size_t i = 0;
        for (const auto& entry : impl_->temporaries) {
            const std::string prefix = config::SUBKERNEL_PREFIX + std::to_string(i) + "_";
            auto compiled = impl_->compiler->compile(entry.terminal, prefix, impl_->parameters);
            ELAC_LOG_DEBUG("KernelBuilder: compiled " + entry.terminal.toString() + " as " +
                           prefix + " (" + std::to_string(compiled.size()) + " context kernels)");
            for (auto& ck : compiled) {
                kernels.push_back(std::move(ck));
            }
            ++i;
        }
        impl_->context_kernels = std::move(kernels);
    }
    return *impl_->context_kernels;
}

IntegralType KernelBuilder::integralType() const noexcept
{
    return IntegralType::Cell;
}

BuilderState KernelBuilder::state() const noexcept { return impl_->state; }

bool KernelBuilder::isFinalized() const noexcept
{
    return impl_->state == BuilderState::Finalized;
}

void KernelBuilder::finalize()
{
    if (isFinalized()) {
        ELAC_LOG_DEBUG("KernelBuilder::finalize: already finalized");
        return;
    }

    const auto& kernels = contextKernels();

    bool oriented = impl_->oriented;
    std::vector<ast::NodePtr> finalized;
    for (const auto& ck : kernels) {
        for (const auto& split : ck.split_kernels) {
            const auto& kinfo = split.kinfo;
            oriented = oriented || kinfo.oriented;

            if (kinfo.subdomain_id != DEFAULT_SUBDOMAIN_ID) {
                ELAC_NOT_IMPLEMENTED("subdomain integrals in tensor expressions (subkernel '" +
                                     kinfo.name + "' is restricted to subdomain '" +
                                     kinfo.subdomain_id + "')");
            }
            ELAC_THROW_IF(!kinfo.ast, InvalidArgumentException,
                          "KernelBuilder::finalize: subkernel '" + kinfo.name + "' has no AST");

            auto rewritten = impl_->transformer->transform(kinfo.ast);
            ELAC_THROW_IF(!rewritten, InvalidArgumentException,
                          "KernelBuilder::finalize: rewriting subkernel '" + kinfo.name + "' produced no AST");
            finalized.push_back(std::move(rewritten));
        }
    }

    impl_->oriented = oriented;
    impl_->finalized_ast = std::move(finalized);
    impl_->state = BuilderState::Finalized;

    ELAC_LOG_DEBUG("KernelBuilder::finalize: " + std::to_string(impl_->finalized_ast.size()) +
                   " subkernels" + (impl_->oriented ? ", oriented" : ""));
}

const std::vector<ast::NodePtr>& KernelBuilder::finalizedAst() const noexcept
{
    return impl_->finalized_ast;
}

std::shared_ptr<const ast::Root> KernelBuilder::construct(const std::vector<ast::NodePtr>& macro_kernels) const
{
    ELAC_THROW_IF(!isFinalized(), PreconditionException,
                  "KernelBuilder::construct: builder must be finalized first (state: " +
                      std::string(builderStateName(impl_->state)) + ")");

    std::vector<ast::NodePtr> nodes = impl_->finalized_ast;
    nodes.reserve(nodes.size() + macro_kernels.size());
    for (std::size_t i = 0; i < macro_kernels.size(); ++i) {
        ELAC_THROW_IF(!macro_kernels[i], InvalidArgumentException,
                      "KernelBuilder::construct: macro kernel " + std::to_string(i) + " is null");
        nodes.push_back(macro_kernels[i]);
    }
    return std::make_shared<const ast::Root>(std::move(nodes));
}

std::shared_ptr<const ast::FunDecl> KernelBuilder::constructMacroKernel(const std::string& name,
                                                                        const std::vector<ast::NodePtr>& args,
                                                                        const ast::NodePtr& body) const
{
    return compiler::constructMacroKernel(name, args, body);
}

} // namespace compiler
} // namespace elac
