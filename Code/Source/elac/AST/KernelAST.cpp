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

#include "AST/KernelAST.h"

#include "Core/ElacException.h"

#include <sstream>

namespace elac {
namespace ast {

namespace {

std::string joinWords(const std::vector<std::string>& words)
{
    std::string out;
    for (const auto& w : words) {
        out += w;
        out += ' ';
    }
    return out;
}

std::string joinArgs(const std::vector<NodePtr>& args)
{
    std::string out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i) out += ", ";
        out += args[i]->gen();
    }
    return out;
}

bool needsSemicolon(const Node& n) noexcept
{
    switch (n.kind()) {
        case NodeKind::Block:
        case NodeKind::FunDecl:
        case NodeKind::FlatBlock:
        case NodeKind::Root:
            return false;
        default:
            return true;
    }
}

std::string indent(const std::string& text, const std::string& pad)
{
    std::istringstream in(text);
    std::ostringstream out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out << pad << line;
        out << "\n";
    }
    return out.str();
}

std::string genStatements(const std::vector<NodePtr>& statements)
{
    std::string out;
    for (const auto& s : statements) {
        out += s->gen();
        if (needsSemicolon(*s)) out += ';';
        if (out.empty() || out.back() != '\n') out += '\n';
    }
    return out;
}

void checkChildCount(const std::vector<NodePtr>& children, std::size_t expected, const char* where)
{
    ELAC_CHECK_ARG(children.size() == expected,
                   std::string(where) + ": expected " + std::to_string(expected) +
                       " children, got " + std::to_string(children.size()));
}

} // namespace

const char* nodeKindName(NodeKind k) noexcept
{
    switch (k) {
        case NodeKind::Symbol:    return "Symbol";
        case NodeKind::Decl:      return "Decl";
        case NodeKind::Block:     return "Block";
        case NodeKind::FunDecl:   return "FunDecl";
        case NodeKind::FunCall:   return "FunCall";
        case NodeKind::Assign:    return "Assign";
        case NodeKind::BinaryOp:  return "BinaryOp";
        case NodeKind::FlatBlock: return "FlatBlock";
        case NodeKind::Root:      return "Root";
        default:                  return "Unknown";
    }
}

// ---- Symbol ----

std::string Symbol::gen() const
{
    std::string out = name_;
    for (const auto& r : rank_) {
        out += "[" + r + "]";
    }
    return out;
}

NodePtr Symbol::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, 0, "Symbol::rebuild");
    return std::make_shared<Symbol>(*this);
}

// ---- Decl ----

Decl::Decl(std::string type,
           std::shared_ptr<const Symbol> sym,
           NodePtr init,
           std::vector<std::string> qualifiers,
           bool direct_init)
    : type_(std::move(type)),
      sym_(std::move(sym)),
      init_(std::move(init)),
      qualifiers_(std::move(qualifiers)),
      direct_init_(direct_init)
{
    ELAC_CHECK_NOT_NULL(sym_.get(), "Decl: symbol");
}

std::string Decl::gen() const
{
    std::string out = joinWords(qualifiers_) + type_;
    if (!type_.empty() && type_.back() != '*') out += ' ';
    out += sym_->gen();
    if (init_) {
        out += direct_init_ ? "(" + init_->gen() + ")" : " = " + init_->gen();
    }
    return out;
}

std::vector<NodePtr> Decl::children() const
{
    if (init_) return {sym_, init_};
    return {sym_};
}

NodePtr Decl::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, init_ ? 2u : 1u, "Decl::rebuild");
    auto sym = std::dynamic_pointer_cast<const Symbol>(children[0]);
    ELAC_THROW_IF(!sym, InvalidArgumentException,
                  "Decl::rebuild: declared name must remain a Symbol");
    return std::make_shared<Decl>(type_, std::move(sym), init_ ? children[1] : nullptr,
                                  qualifiers_, direct_init_);
}

// ---- Block ----

std::string Block::gen() const
{
    const std::string body = genStatements(statements_);
    if (!open_scope_) return body;
    return "{\n" + indent(body, "  ") + "}\n";
}

NodePtr Block::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, statements_.size(), "Block::rebuild");
    return std::make_shared<Block>(std::move(children), open_scope_);
}

// ---- FunDecl ----

FunDecl::FunDecl(std::string ret,
                 std::string name,
                 std::vector<NodePtr> args,
                 std::shared_ptr<const Block> body,
                 std::vector<std::string> pred)
    : ret_(std::move(ret)),
      name_(std::move(name)),
      args_(std::move(args)),
      body_(std::move(body)),
      pred_(std::move(pred))
{
    ELAC_CHECK_NOT_NULL(body_.get(), "FunDecl: body");
    for (const auto& a : args_) {
        ELAC_CHECK_NOT_NULL(a.get(), "FunDecl: argument");
    }
}

std::string FunDecl::gen() const
{
    std::ostringstream oss;
    oss << joinWords(pred_) << ret_ << " " << name_ << "(" << joinArgs(args_) << ")\n";
    oss << "{\n" << indent(genStatements(body_->statements()), "  ") << "}\n";
    return oss.str();
}

std::vector<NodePtr> FunDecl::children() const
{
    std::vector<NodePtr> out = args_;
    out.push_back(body_);
    return out;
}

NodePtr FunDecl::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, args_.size() + 1u, "FunDecl::rebuild");
    auto body = std::dynamic_pointer_cast<const Block>(children.back());
    ELAC_THROW_IF(!body, InvalidArgumentException,
                  "FunDecl::rebuild: function body must remain a Block");
    children.pop_back();
    return std::make_shared<FunDecl>(ret_, name_, std::move(children), std::move(body), pred_);
}

// ---- FunCall ----

std::string FunCall::gen() const
{
    return name_ + "(" + joinArgs(args_) + ")";
}

NodePtr FunCall::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, args_.size(), "FunCall::rebuild");
    return std::make_shared<FunCall>(name_, std::move(children));
}

// ---- Assign ----

std::string Assign::gen() const
{
    return lhs_->gen() + " " + op_ + " " + rhs_->gen();
}

NodePtr Assign::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, 2, "Assign::rebuild");
    return std::make_shared<Assign>(children[0], children[1], op_);
}

// ---- BinaryOp ----

std::string BinaryOp::gen() const
{
    return "(" + lhs_->gen() + " " + op_ + " " + rhs_->gen() + ")";
}

NodePtr BinaryOp::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, 2, "BinaryOp::rebuild");
    return std::make_shared<BinaryOp>(op_, children[0], children[1]);
}

// ---- FlatBlock ----

NodePtr FlatBlock::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, 0, "FlatBlock::rebuild");
    return std::make_shared<FlatBlock>(code_);
}

// ---- Root ----

std::string Root::gen() const
{
    std::string out;
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (i) out += "\n";
        out += children_[i]->gen();
        if (needsSemicolon(*children_[i])) out += ";\n";
    }
    return out;
}

NodePtr Root::rebuild(std::vector<NodePtr> children) const
{
    checkChildCount(children, children_.size(), "Root::rebuild");
    return std::make_shared<Root>(std::move(children));
}

// ============================================================================
// Tree utilities
// ============================================================================

NodePtr transformTree(const NodePtr& node, const std::function<NodePtr(const NodePtr&)>& fn)
{
    ELAC_CHECK_NOT_NULL(node.get(), "transformTree: node");

    const auto children = node->children();
    NodePtr current = node;
    if (!children.empty()) {
        std::vector<NodePtr> rewritten;
        rewritten.reserve(children.size());
        bool changed = false;
        for (const auto& c : children) {
            rewritten.push_back(transformTree(c, fn));
            changed = changed || rewritten.back() != c;
        }
        if (changed) {
            current = node->rebuild(std::move(rewritten));
        }
    }

    NodePtr out = fn(current);
    ELAC_THROW_IF(!out, InvalidArgumentException,
                  std::string("transformTree: rewrite of ") + nodeKindName(node->kind()) +
                      " returned null");
    return out;
}

void visitTree(const NodePtr& node, const std::function<void(const Node&)>& fn)
{
    if (!node) return;
    fn(*node);
    for (const auto& c : node->children()) {
        visitTree(c, fn);
    }
}

bool sameSource(const Node& a, const Node& b)
{
    return a.kind() == b.kind() && a.gen() == b.gen();
}

} // namespace ast
} // namespace elac
