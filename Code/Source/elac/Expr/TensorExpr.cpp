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

#include "Expr/TensorExpr.h"

#include "Core/ElacException.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace elac {
namespace expr {

namespace {

// ============================================================================
// Terminal node
// ============================================================================

class TensorNode final : public TensorExprNode {
public:
    explicit TensorNode(TerminalFormPtr form)
        : form_(std::move(form))
    {
        shape_.extents = form_->argument_dimensions;
    }

    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Tensor; }
    [[nodiscard]] std::string toString() const override { return "Tensor(" + form_->name + ")"; }
    [[nodiscard]] const TensorShape& shape() const noexcept override { return shape_; }
    [[nodiscard]] const TerminalFormPtr* form() const override { return &form_; }

private:
    TerminalFormPtr form_;
    TensorShape shape_{};
};

// ============================================================================
// Operator nodes
// ============================================================================

class OperatorNode : public TensorExprNode {
public:
    OperatorNode(std::vector<TensorExprNodePtr> operands, TensorShape shape)
        : operands_(std::move(operands)), shape_(std::move(shape))
    {
    }

    [[nodiscard]] const TensorShape& shape() const noexcept override { return shape_; }
    [[nodiscard]] std::vector<TensorExprNodePtr> operands() const override { return operands_; }

protected:
    std::vector<TensorExprNodePtr> operands_;
    TensorShape shape_;
};

class AddNode final : public OperatorNode {
public:
    using OperatorNode::OperatorNode;
    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Add; }
    [[nodiscard]] std::string toString() const override {
        return "(" + operands_[0]->toString() + " + " + operands_[1]->toString() + ")";
    }
};

class SubtractNode final : public OperatorNode {
public:
    using OperatorNode::OperatorNode;
    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Subtract; }
    [[nodiscard]] std::string toString() const override {
        return "(" + operands_[0]->toString() + " - " + operands_[1]->toString() + ")";
    }
};

class NegativeNode final : public OperatorNode {
public:
    using OperatorNode::OperatorNode;
    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Negative; }
    [[nodiscard]] std::string toString() const override { return "-" + operands_[0]->toString(); }
};

class MulNode final : public OperatorNode {
public:
    using OperatorNode::OperatorNode;
    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Mul; }
    [[nodiscard]] std::string toString() const override {
        return "(" + operands_[0]->toString() + " * " + operands_[1]->toString() + ")";
    }
};

class TransposeNode final : public OperatorNode {
public:
    using OperatorNode::OperatorNode;
    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Transpose; }
    [[nodiscard]] std::string toString() const override { return operands_[0]->toString() + ".T"; }
};

class InverseNode final : public OperatorNode {
public:
    using OperatorNode::OperatorNode;
    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Inverse; }
    [[nodiscard]] std::string toString() const override { return operands_[0]->toString() + ".inv"; }
};

class ActionNode final : public OperatorNode {
public:
    ActionNode(std::vector<TensorExprNodePtr> operands, TensorShape shape, Coefficient::Ptr coefficient)
        : OperatorNode(std::move(operands), std::move(shape)), coefficient_(std::move(coefficient))
    {
    }

    [[nodiscard]] TensorExprType type() const noexcept override { return TensorExprType::Action; }
    [[nodiscard]] std::string toString() const override {
        return "action(" + operands_[0]->toString() + ", " + coefficient_->name() + ")";
    }
    [[nodiscard]] const Coefficient::Ptr* actingCoefficient() const override { return &coefficient_; }

private:
    Coefficient::Ptr coefficient_;
};

const TensorExprNodePtr& requireNode(const TensorExprNodePtr& node, const char* where)
{
    ELAC_THROW_IF(!node, InvalidArgumentException,
                  std::string(where) + ": empty expression");
    return node;
}

} // namespace

const char* tensorExprTypeName(TensorExprType t) noexcept
{
    switch (t) {
        case TensorExprType::Tensor:    return "Tensor";
        case TensorExprType::Add:       return "Add";
        case TensorExprType::Subtract:  return "Subtract";
        case TensorExprType::Negative:  return "Negative";
        case TensorExprType::Mul:       return "Mul";
        case TensorExprType::Transpose: return "Transpose";
        case TensorExprType::Inverse:   return "Inverse";
        case TensorExprType::Action:    return "Action";
        default:                        return "Unknown";
    }
}

std::string TensorShape::toString() const
{
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < extents.size(); ++i) {
        if (i) oss << ", ";
        oss << extents[i];
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// TensorExpr
// ============================================================================

TensorExpr::TensorExpr(TensorExprNodePtr node)
    : node_(std::move(node))
{
}

TensorExpr TensorExpr::tensor(TerminalFormPtr form)
{
    ELAC_CHECK_NOT_NULL(form.get(), "TensorExpr::tensor: form");
    ELAC_CHECK_ARG(form->rank() <= 2,
                   "TensorExpr::tensor: forms of rank " + std::to_string(form->rank()) +
                       " are not supported");
    for (const int d : form->argument_dimensions) {
        ELAC_CHECK_ARG(d > 0, "TensorExpr::tensor: argument dimensions must be positive");
    }
    return TensorExpr(std::make_shared<TensorNode>(std::move(form)));
}

TensorExpr TensorExpr::operator+(const TensorExpr& rhs) const
{
    const auto& a = requireNode(node_, "TensorExpr::operator+");
    const auto& b = requireNode(rhs.node_, "TensorExpr::operator+");
    ELAC_CHECK_ARG(a->shape() == b->shape(),
                   "TensorExpr::operator+: shape mismatch " + a->shape().toString() +
                       " vs " + b->shape().toString());
    return TensorExpr(std::make_shared<AddNode>(std::vector<TensorExprNodePtr>{a, b}, a->shape()));
}

TensorExpr TensorExpr::operator-(const TensorExpr& rhs) const
{
    const auto& a = requireNode(node_, "TensorExpr::operator-");
    const auto& b = requireNode(rhs.node_, "TensorExpr::operator-");
    ELAC_CHECK_ARG(a->shape() == b->shape(),
                   "TensorExpr::operator-: shape mismatch " + a->shape().toString() +
                       " vs " + b->shape().toString());
    return TensorExpr(std::make_shared<SubtractNode>(std::vector<TensorExprNodePtr>{a, b}, a->shape()));
}

TensorExpr TensorExpr::operator-() const
{
    const auto& a = requireNode(node_, "TensorExpr::operator-");
    return TensorExpr(std::make_shared<NegativeNode>(std::vector<TensorExprNodePtr>{a}, a->shape()));
}

TensorExpr TensorExpr::operator*(const TensorExpr& rhs) const
{
    const auto& a = requireNode(node_, "TensorExpr::operator*");
    const auto& b = requireNode(rhs.node_, "TensorExpr::operator*");

    TensorShape result;
    if (a->shape().rank() == 0) {
        result = b->shape();
    } else if (b->shape().rank() == 0) {
        result = a->shape();
    } else {
        const auto& ea = a->shape().extents;
        const auto& eb = b->shape().extents;
        ELAC_CHECK_ARG(ea.back() == eb.front(),
                       "TensorExpr::operator*: inner extents differ " + a->shape().toString() +
                           " * " + b->shape().toString());
        result.extents.assign(ea.begin(), ea.end() - 1);
        result.extents.insert(result.extents.end(), eb.begin() + 1, eb.end());
    }
    return TensorExpr(std::make_shared<MulNode>(std::vector<TensorExprNodePtr>{a, b}, std::move(result)));
}

TensorExpr TensorExpr::transpose() const
{
    const auto& a = requireNode(node_, "TensorExpr::transpose");
    TensorShape result = a->shape();
    std::reverse(result.extents.begin(), result.extents.end());
    return TensorExpr(std::make_shared<TransposeNode>(std::vector<TensorExprNodePtr>{a}, std::move(result)));
}

TensorExpr TensorExpr::inverse() const
{
    const auto& a = requireNode(node_, "TensorExpr::inverse");
    const auto& e = a->shape().extents;
    ELAC_CHECK_ARG(e.size() == 2u && e[0] == e[1],
                   "TensorExpr::inverse: operand must be a square matrix, got " + a->shape().toString());
    return TensorExpr(std::make_shared<InverseNode>(std::vector<TensorExprNodePtr>{a}, a->shape()));
}

TensorExpr TensorExpr::action(Coefficient::Ptr coefficient) const
{
    const auto& a = requireNode(node_, "TensorExpr::action");
    ELAC_CHECK_NOT_NULL(coefficient.get(), "TensorExpr::action: coefficient");
    const auto& e = a->shape().extents;
    ELAC_CHECK_ARG(e.size() == 2u,
                   "TensorExpr::action: operand must be a rank-2 tensor, got " + a->shape().toString());
    ELAC_CHECK_ARG(e[1] == coefficient->space()->dimension(),
                   "TensorExpr::action: coefficient '" + coefficient->name() + "' has dimension " +
                       std::to_string(coefficient->space()->dimension()) + ", expected " +
                       std::to_string(e[1]));
    TensorShape result;
    result.extents = {e[0]};
    return TensorExpr(std::make_shared<ActionNode>(std::vector<TensorExprNodePtr>{a}, std::move(result),
                                                   std::move(coefficient)));
}

TensorExprType TensorExpr::type() const
{
    return requireNode(node_, "TensorExpr::type")->type();
}

bool TensorExpr::isTerminal() const
{
    return requireNode(node_, "TensorExpr::isTerminal")->isTerminal();
}

std::vector<TensorExpr> TensorExpr::operands() const
{
    const auto ops = requireNode(node_, "TensorExpr::operands")->operands();
    std::vector<TensorExpr> out;
    out.reserve(ops.size());
    for (const auto& op : ops) {
        out.emplace_back(op);
    }
    return out;
}

const TensorShape& TensorExpr::shape() const
{
    return requireNode(node_, "TensorExpr::shape")->shape();
}

int TensorExpr::rank() const
{
    return shape().rank();
}

const TerminalForm& TensorExpr::form() const
{
    const auto* f = requireNode(node_, "TensorExpr::form")->form();
    ELAC_THROW_IF(f == nullptr, InvalidArgumentException,
                  "TensorExpr::form: " + std::string(tensorExprTypeName(node_->type())) +
                      " node has no form");
    return **f;
}

std::string TensorExpr::toString() const
{
    return node_ ? node_->toString() : std::string("<empty>");
}

std::vector<Coefficient::Ptr> TensorExpr::coefficients() const
{
    requireNode(node_, "TensorExpr::coefficients");

    std::vector<Coefficient::Ptr> out;
    std::unordered_set<const Coefficient*> seen_coefficients;
    std::unordered_set<const TensorExprNode*> seen_nodes;

    const auto add = [&](const Coefficient::Ptr& c) {
        if (c && seen_coefficients.insert(c.get()).second) {
            out.push_back(c);
        }
    };

    std::vector<const TensorExprNode*> stack{node_.get()};
    seen_nodes.insert(node_.get());
    while (!stack.empty()) {
        const auto* n = stack.back();
        stack.pop_back();
        if (const auto* f = n->form()) {
            for (const auto& c : (*f)->coefficients) add(c);
        }
        if (const auto* c = n->actingCoefficient()) {
            add(*c);
        }
        for (const auto& op : n->operands()) {
            if (seen_nodes.insert(op.get()).second) {
                stack.push_back(op.get());
            }
        }
    }

    std::sort(out.begin(), out.end(), CoefficientNumberLess{});
    return out;
}

} // namespace expr
} // namespace elac
