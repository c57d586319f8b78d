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

#include "Compiler/ExprAnalysis.h"

#include "Core/ElacConfig.h"
#include "Core/ElacException.h"

#include <algorithm>
#include <limits>
#include <unordered_set>

namespace elac {
namespace compiler {

using expr::TensorExpr;
using expr::TensorExprNode;
using expr::TensorExprType;

// ============================================================================
// TemporaryMap
// ============================================================================

const std::shared_ptr<const ast::Symbol>& TemporaryMap::getOrAssign(const TensorExpr& terminal)
{
    ELAC_CHECK_ARG(terminal.isValid(), "TemporaryMap::getOrAssign: empty expression");

    const auto it = index_.find(terminal.node());
    if (it != index_.end()) {
        return entries_[it->second].symbol;
    }

    const std::size_t i = entries_.size();
    auto symbol = std::make_shared<const ast::Symbol>(config::TEMPORARY_PREFIX + std::to_string(i));
    entries_.push_back(Entry{terminal, std::move(symbol)});
    index_.emplace(terminal.node(), i);
    return entries_.back().symbol;
}

bool TemporaryMap::contains(const TensorExprNode* node) const noexcept
{
    return index_.find(node) != index_.end();
}

const ast::Symbol* TemporaryMap::find(const TensorExprNode* node) const noexcept
{
    const auto it = index_.find(node);
    return it == index_.end() ? nullptr : entries_[it->second].symbol.get();
}

std::size_t TemporaryMap::indexOf(const TensorExprNode* node) const
{
    const auto it = index_.find(node);
    ELAC_THROW_IF(it == index_.end(), LookupException,
                  "TemporaryMap::indexOf: node is not a terminal of this expression");
    return it->second;
}

std::size_t ReferenceCountMap::count(const TensorExprNode* node) const noexcept
{
    const auto it = counts_.find(node);
    return it == counts_.end() ? 0u : it->second;
}

// ============================================================================
// Analyses
// ============================================================================

std::vector<TensorExpr> traverseDags(const std::vector<TensorExpr>& roots)
{
    std::unordered_set<const TensorExprNode*> seen;
    std::vector<TensorExpr> stack;
    stack.reserve(roots.size());

    for (const auto& r : roots) {
        ELAC_CHECK_ARG(r.isValid(), "traverseDags: empty expression among roots");
        if (seen.insert(r.node()).second) {
            stack.push_back(r);
        }
    }

    std::vector<TensorExpr> order;
    while (!stack.empty()) {
        TensorExpr e = std::move(stack.back());
        stack.pop_back();
        for (auto& op : e.operands()) {
            if (seen.insert(op.node()).second) {
                stack.push_back(std::move(op));
            }
        }
        order.push_back(std::move(e));
    }
    return order;
}

ReferenceCountMap collectReferenceCount(const std::vector<TensorExpr>& roots)
{
    ReferenceCountMap counts;
    for (const auto& e : traverseDags(roots)) {
        for (const auto& op : e.nodeShared()->operands()) {
            counts.increment(op.get());
        }
    }
    return counts;
}

namespace {

constexpr std::size_t SATURATED = std::numeric_limits<std::size_t>::max();

std::size_t saturatingAdd(std::size_t a, std::size_t b) noexcept
{
    return a > SATURATED - b ? SATURATED : a + b;
}

struct Measure {
    std::size_t operands{0};  ///< per-path operand edges, clamped at SATURATED
    std::size_t height{0};    ///< longest operand chain down to a terminal
};

// Memoized per node; one instance spans one analysis
class MeasureCache {
public:
    const Measure& of(const TensorExprNode& n)
    {
        const auto it = memo_.find(&n);
        if (it != memo_.end()) return it->second;

        Measure m;
        for (const auto& op : n.operands()) {
            const Measure& sub = of(*op);
            m.operands = saturatingAdd(m.operands, saturatingAdd(sub.operands, 1u));
            m.height = std::max(m.height, sub.height + 1u);
        }
        return memo_.emplace(&n, m).first->second;
    }

private:
    std::unordered_map<const TensorExprNode*, Measure> memo_{};
};

} // namespace

std::size_t countOperands(const TensorExpr& e)
{
    ELAC_CHECK_ARG(e.isValid(), "countOperands: empty expression");
    MeasureCache cache;
    return cache.of(*e.node()).operands;
}

ExprData generateExprData(const TensorExpr& root)
{
    ELAC_CHECK_ARG(root.isValid(), "generateExprData: empty expression");

    ExprData data;
    MeasureCache cache;
    std::vector<std::pair<Measure, TensorExpr>> ops;
    for (auto& e : traverseDags({root})) {
        if (e.isTerminal()) {
            data.temporaries.getOrAssign(e);
        } else {
            ops.emplace_back(cache.of(*e.node()), std::move(e));
        }
    }

    // Saturated counts no longer order a node after its operands; height does
    std::stable_sort(ops.begin(), ops.end(), [](const auto& a, const auto& b) {
        if (a.first.operands != b.first.operands) return a.first.operands < b.first.operands;
        return a.first.operands == SATURATED && a.first.height < b.first.height;
    });

    data.tensor_ops.reserve(ops.size());
    for (auto& op : ops) {
        data.tensor_ops.push_back(std::move(op.second));
    }
    return data;
}

std::vector<TensorExpr> selectAuxiliaryExpressions(const std::vector<TensorExpr>& tensor_ops,
                                                   const ReferenceCountMap& reference_counts)
{
    std::vector<TensorExpr> aux;
    for (const auto& op : tensor_ops) {
        if (reference_counts.count(op) > 1u || op.type() == TensorExprType::Action) {
            aux.push_back(op);
        }
    }
    return aux;
}

} // namespace compiler
} // namespace elac
