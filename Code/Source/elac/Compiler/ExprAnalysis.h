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

#ifndef ELAC_COMPILER_EXPRANALYSIS_H
#define ELAC_COMPILER_EXPRANALYSIS_H

/**
 * @file ExprAnalysis.h
 * @brief Graph analyses that drive temporary allocation
 *
 * All results are ordered by a stack-based traversal whose visiting order
 * depends only on the shape of the graph, never on node addresses, so that
 * structurally identical expressions are compiled identically on every
 * process of a distributed run.
 */

#include "AST/KernelAST.h"
#include "Expr/TensorExpr.h"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace elac {
namespace compiler {

/**
 * @brief Insertion-ordered map from terminal node to temporary symbol
 *
 * Keys are node identities. Symbols are "T0", "T1", ... in insertion order.
 */
class TemporaryMap {
public:
    struct Entry {
        expr::TensorExpr terminal;
        std::shared_ptr<const ast::Symbol> symbol;
    };

    /**
     * @brief Symbol of `terminal`, allocating the next one on first sight
     */
    const std::shared_ptr<const ast::Symbol>& getOrAssign(const expr::TensorExpr& terminal);

    [[nodiscard]] bool contains(const expr::TensorExprNode* node) const noexcept;

    /// Null if `node` has no temporary
    [[nodiscard]] const ast::Symbol* find(const expr::TensorExprNode* node) const noexcept;

    /// Position of `node` in insertion order; throws LookupException if absent
    [[nodiscard]] std::size_t indexOf(const expr::TensorExprNode* node) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const Entry& operator[](std::size_t i) const { return entries_.at(i); }

    [[nodiscard]] std::vector<Entry>::const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] std::vector<Entry>::const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<Entry> entries_{};
    std::unordered_map<const expr::TensorExprNode*, std::size_t> index_{};
};

/**
 * @brief Number of incoming operand edges per node
 *
 * Nodes never referenced as an operand (the roots) report 0.
 */
class ReferenceCountMap {
public:
    void increment(const expr::TensorExprNode* node) { ++counts_[node]; }

    [[nodiscard]] std::size_t count(const expr::TensorExprNode* node) const noexcept;
    [[nodiscard]] std::size_t count(const expr::TensorExpr& e) const noexcept { return count(e.node()); }

    /// Number of distinct nodes with a nonzero count
    [[nodiscard]] std::size_t size() const noexcept { return counts_.size(); }

private:
    std::unordered_map<const expr::TensorExprNode*, std::size_t> counts_{};
};

/**
 * @brief Every node reachable from `roots`, each exactly once
 *
 * Depth-first with an explicit stack: the distinct roots seed the stack,
 * the last pushed node is visited next, and its unseen operands are pushed
 * in operand order.
 */
[[nodiscard]] std::vector<expr::TensorExpr> traverseDags(const std::vector<expr::TensorExpr>& roots);

/**
 * @brief Count operand edges into every node reachable from `roots`
 *
 * A node that is an operand of the same parent twice counts twice.
 */
[[nodiscard]] ReferenceCountMap collectReferenceCount(const std::vector<expr::TensorExpr>& roots);

/**
 * @brief Structural complexity: operand edges in the subtree below `e`
 *
 * 0 for a terminal; for an operator, the sum over operands of
 * 1 + countOperands(operand). Shared subtrees are counted once per path;
 * the sum saturates at std::numeric_limits<std::size_t>::max().
 */
[[nodiscard]] std::size_t countOperands(const expr::TensorExpr& e);

struct ExprData {
    /// Terminal node -> temporary, first-encounter order
    TemporaryMap temporaries{};

    /// Every operator node once, stable-sorted by ascending countOperands.
    /// Among saturated counts the shorter operand chain comes first.
    std::vector<expr::TensorExpr> tensor_ops{};
};

[[nodiscard]] ExprData generateExprData(const expr::TensorExpr& root);

/**
 * @brief Operators that need their own temporary in the driver
 *
 * Keeps, in the given order, the operators referenced more than once and
 * every Action node.
 */
[[nodiscard]] std::vector<expr::TensorExpr> selectAuxiliaryExpressions(
    const std::vector<expr::TensorExpr>& tensor_ops,
    const ReferenceCountMap& reference_counts);

} // namespace compiler
} // namespace elac

#endif // ELAC_COMPILER_EXPRANALYSIS_H
