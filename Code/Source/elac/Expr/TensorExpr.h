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

#ifndef ELAC_EXPR_TENSOREXPR_H
#define ELAC_EXPR_TENSOREXPR_H

/**
 * @file TensorExpr.h
 * @brief Dense local linear-algebra expression graph
 *
 * Expressions are DAGs of shared nodes. Terminals (`Tensor`) wrap one
 * TerminalForm; operators combine operand expressions. Nodes are identified
 * by address: two structurally equal subexpressions built from distinct
 * nodes are distinct vertices, while reusing a TensorExpr handle shares the
 * node.
 */

#include "Expr/Coefficient.h"
#include "Expr/TerminalForm.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace elac {
namespace expr {

enum class TensorExprType : std::uint8_t {
    // Terminal
    Tensor,

    // Operators
    Add,
    Subtract,
    Negative,
    Mul,
    Transpose,
    Inverse,
    Action
};

[[nodiscard]] const char* tensorExprTypeName(TensorExprType t) noexcept;

/**
 * @brief Extents of a node value: {} scalar, {n} vector, {m, n} matrix
 */
struct TensorShape {
    std::vector<int> extents{};

    [[nodiscard]] int rank() const noexcept { return static_cast<int>(extents.size()); }
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const TensorShape& a, const TensorShape& b) { return a.extents == b.extents; }
    friend bool operator!=(const TensorShape& a, const TensorShape& b) { return !(a == b); }
};

/**
 * @brief Base class for expression graph nodes
 */
class TensorExprNode {
public:
    virtual ~TensorExprNode() = default;

    [[nodiscard]] virtual TensorExprType type() const noexcept = 0;
    [[nodiscard]] virtual std::string toString() const = 0;
    [[nodiscard]] virtual const TensorShape& shape() const noexcept = 0;

    /// Operand nodes in operand order; empty for terminals
    [[nodiscard]] virtual std::vector<std::shared_ptr<const TensorExprNode>> operands() const { return {}; }

    /// Wrapped form of a terminal, null otherwise
    [[nodiscard]] virtual const TerminalFormPtr* form() const { return nullptr; }

    /// Assembled data an Action applies to, null otherwise
    [[nodiscard]] virtual const Coefficient::Ptr* actingCoefficient() const { return nullptr; }

    [[nodiscard]] bool isTerminal() const noexcept { return type() == TensorExprType::Tensor; }
};

using TensorExprNodePtr = std::shared_ptr<const TensorExprNode>;

// ============================================================================
// TensorExpr handle
// ============================================================================

/**
 * @brief Value-semantic handle to an expression node
 *
 * Copying a handle shares the node. A default-constructed handle is empty.
 */
class TensorExpr {
public:
    TensorExpr() = default;
    explicit TensorExpr(TensorExprNodePtr node);

    // ---- Terminals ----
    static TensorExpr tensor(TerminalFormPtr form);

    // ---- Algebra ----
    [[nodiscard]] TensorExpr operator+(const TensorExpr& rhs) const;
    [[nodiscard]] TensorExpr operator-(const TensorExpr& rhs) const;
    [[nodiscard]] TensorExpr operator-() const;
    [[nodiscard]] TensorExpr operator*(const TensorExpr& rhs) const;
    [[nodiscard]] TensorExpr transpose() const;
    [[nodiscard]] TensorExpr inverse() const;

    /// Apply this rank-2 tensor to assembled coefficient data
    [[nodiscard]] TensorExpr action(Coefficient::Ptr coefficient) const;

    // ---- Queries ----
    [[nodiscard]] bool isValid() const noexcept { return node_ != nullptr; }
    explicit operator bool() const noexcept { return isValid(); }

    [[nodiscard]] TensorExprType type() const;
    [[nodiscard]] bool isTerminal() const;
    [[nodiscard]] std::vector<TensorExpr> operands() const;
    [[nodiscard]] const TensorShape& shape() const;
    [[nodiscard]] int rank() const;
    [[nodiscard]] const TerminalForm& form() const;
    [[nodiscard]] std::string toString() const;

    /// External coefficients without duplicates, ascending creation number
    [[nodiscard]] std::vector<Coefficient::Ptr> coefficients() const;

    [[nodiscard]] const TensorExprNodePtr& nodeShared() const noexcept { return node_; }
    [[nodiscard]] const TensorExprNode* node() const noexcept { return node_.get(); }

    /// Identity comparison
    [[nodiscard]] bool sameNode(const TensorExpr& other) const noexcept { return node_ == other.node_; }

private:
    TensorExprNodePtr node_{};
};

} // namespace expr
} // namespace elac

#endif // ELAC_EXPR_TENSOREXPR_H
