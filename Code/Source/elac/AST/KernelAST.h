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

#ifndef ELAC_AST_KERNELAST_H
#define ELAC_AST_KERNELAST_H

/**
 * @file KernelAST.h
 * @brief Minimal C-like AST for generated kernels
 *
 * Nodes are immutable and shared. Passes that rewrite a tree build new nodes
 * via `rebuild`/`transformTree` and leave the input untouched. Every node
 * prints itself as C++ source with `gen()`.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace elac {
namespace ast {

enum class NodeKind : std::uint8_t {
    Symbol,
    Decl,
    Block,
    FunDecl,
    FunCall,
    Assign,
    BinaryOp,
    FlatBlock,
    Root
};

[[nodiscard]] const char* nodeKindName(NodeKind k) noexcept;

class Node;
using NodePtr = std::shared_ptr<const Node>;

/**
 * @brief Base class for AST nodes
 */
class Node {
public:
    virtual ~Node() = default;

    [[nodiscard]] virtual NodeKind kind() const noexcept = 0;

    /// C++ source text; statements are emitted without the trailing ';'
    [[nodiscard]] virtual std::string gen() const = 0;

    [[nodiscard]] virtual std::vector<NodePtr> children() const { return {}; }

    /// Copy of this node with `children` replacing children() one to one
    [[nodiscard]] virtual NodePtr rebuild(std::vector<NodePtr> children) const = 0;
};

// ============================================================================
// Node types
// ============================================================================

/**
 * @brief Named value, optionally with rank suffixes: `A`, `A[3][3]`, `A[i][j]`
 */
class Symbol final : public Node {
public:
    explicit Symbol(std::string name, std::vector<std::string> rank = {})
        : name_(std::move(name)), rank_(std::move(rank))
    {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Symbol; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<std::string>& rank() const noexcept { return rank_; }

    friend bool operator==(const Symbol& a, const Symbol& b)
    {
        return a.name_ == b.name_ && a.rank_ == b.rank_;
    }

private:
    std::string name_;
    std::vector<std::string> rank_;
};

/**
 * @brief Variable declaration `qualifiers type sym [= init]`
 *
 * With `direct_init` the initializer is emitted as `type sym(init)`.
 */
class Decl final : public Node {
public:
    Decl(std::string type,
         std::shared_ptr<const Symbol> sym,
         NodePtr init = nullptr,
         std::vector<std::string> qualifiers = {},
         bool direct_init = false);

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Decl; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override;
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] const std::shared_ptr<const Symbol>& sym() const noexcept { return sym_; }
    [[nodiscard]] const NodePtr& init() const noexcept { return init_; }
    [[nodiscard]] const std::vector<std::string>& qualifiers() const noexcept { return qualifiers_; }

private:
    std::string type_;
    std::shared_ptr<const Symbol> sym_;
    NodePtr init_;
    std::vector<std::string> qualifiers_;
    bool direct_init_{false};
};

/**
 * @brief Statement sequence; `open_scope` wraps it in braces
 */
class Block final : public Node {
public:
    explicit Block(std::vector<NodePtr> statements, bool open_scope = false)
        : statements_(std::move(statements)), open_scope_(open_scope)
    {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Block; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override { return statements_; }
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const std::vector<NodePtr>& statements() const noexcept { return statements_; }
    [[nodiscard]] bool openScope() const noexcept { return open_scope_; }

private:
    std::vector<NodePtr> statements_;
    bool open_scope_{false};
};

/**
 * @brief Function definition `pred ret name(args) { body }`
 */
class FunDecl final : public Node {
public:
    FunDecl(std::string ret,
            std::string name,
            std::vector<NodePtr> args,
            std::shared_ptr<const Block> body,
            std::vector<std::string> pred = {});

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::FunDecl; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override;
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const std::string& ret() const noexcept { return ret_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<NodePtr>& args() const noexcept { return args_; }
    [[nodiscard]] const std::shared_ptr<const Block>& body() const noexcept { return body_; }
    [[nodiscard]] const std::vector<std::string>& pred() const noexcept { return pred_; }

private:
    std::string ret_;
    std::string name_;
    std::vector<NodePtr> args_;
    std::shared_ptr<const Block> body_;
    std::vector<std::string> pred_;
};

class FunCall final : public Node {
public:
    FunCall(std::string name, std::vector<NodePtr> args)
        : name_(std::move(name)), args_(std::move(args))
    {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::FunCall; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override { return args_; }
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<NodePtr>& args() const noexcept { return args_; }

private:
    std::string name_;
    std::vector<NodePtr> args_;
};

/**
 * @brief Assignment `lhs op rhs` with op one of `=`, `+=`
 */
class Assign final : public Node {
public:
    Assign(NodePtr lhs, NodePtr rhs, std::string op = "=")
        : lhs_(std::move(lhs)), rhs_(std::move(rhs)), op_(std::move(op))
    {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Assign; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override { return {lhs_, rhs_}; }
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const NodePtr& lhs() const noexcept { return lhs_; }
    [[nodiscard]] const NodePtr& rhs() const noexcept { return rhs_; }

private:
    NodePtr lhs_;
    NodePtr rhs_;
    std::string op_;
};

class BinaryOp final : public Node {
public:
    BinaryOp(std::string op, NodePtr lhs, NodePtr rhs)
        : op_(std::move(op)), lhs_(std::move(lhs)), rhs_(std::move(rhs))
    {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::BinaryOp; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override { return {lhs_, rhs_}; }
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

private:
    std::string op_;
    NodePtr lhs_;
    NodePtr rhs_;
};

/**
 * @brief Verbatim source text
 */
class FlatBlock final : public Node {
public:
    explicit FlatBlock(std::string code) : code_(std::move(code)) {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::FlatBlock; }
    [[nodiscard]] std::string gen() const override { return code_; }
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

/**
 * @brief Top-level compilation unit
 */
class Root final : public Node {
public:
    explicit Root(std::vector<NodePtr> children) : children_(std::move(children)) {}

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Root; }
    [[nodiscard]] std::string gen() const override;
    [[nodiscard]] std::vector<NodePtr> children() const override { return children_; }
    [[nodiscard]] NodePtr rebuild(std::vector<NodePtr> children) const override;

private:
    std::vector<NodePtr> children_;
};

// ============================================================================
// Tree utilities
// ============================================================================

/**
 * @brief Bottom-up rewrite
 *
 * Children are rewritten first; `fn` then sees the node rebuilt over the
 * rewritten children and returns its replacement (or the node itself).
 * Subtrees for which nothing changed are shared with the input.
 */
[[nodiscard]] NodePtr transformTree(const NodePtr& node,
                                    const std::function<NodePtr(const NodePtr&)>& fn);

/**
 * @brief Pre-order visit of every node reachable from `node`
 */
void visitTree(const NodePtr& node, const std::function<void(const Node&)>& fn);

/**
 * @brief Structural equality via generated source
 */
[[nodiscard]] bool sameSource(const Node& a, const Node& b);

} // namespace ast
} // namespace elac

#endif // ELAC_AST_KERNELAST_H
