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

#include "Compiler/KernelTransformer.h"

#include "Core/ElacException.h"

#include <cctype>
#include <string>
#include <vector>

namespace elac {
namespace compiler {

namespace {

bool isExtent(const std::string& s)
{
    if (s.empty()) return false;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return s != "0";
}

// Eigen rejects row-major storage for compile-time column vectors.
std::string eigenMatrixType(const std::string& scalar, const std::vector<std::string>& extents)
{
    const std::string rows = extents[0];
    const std::string cols = extents.size() == 2u ? extents[1] : std::string("1");
    std::string t = "Eigen::Matrix<" + scalar + ", " + rows + ", " + cols;
    if (cols != "1") {
        t += ", Eigen::RowMajor";
    }
    t += ">";
    return "Eigen::Map<" + t + ">";
}

} // namespace

ast::NodePtr EigenTransformer::transform(const ast::NodePtr& kernel) const
{
    ELAC_CHECK_NOT_NULL(kernel.get(), "EigenTransformer::transform: kernel");
    const auto* fun = dynamic_cast<const ast::FunDecl*>(kernel.get());
    ELAC_THROW_IF(fun == nullptr, InvalidArgumentException,
                  std::string("EigenTransformer::transform: expected a FunDecl, got ") +
                      ast::nodeKindName(kernel->kind()));
    ELAC_THROW_IF(fun->args().empty(), InvalidArgumentException,
                  "EigenTransformer::transform: subkernel '" + fun->name() + "' has no output argument");

    const auto* out = dynamic_cast<const ast::Decl*>(fun->args().front().get());
    ELAC_THROW_IF(out == nullptr, InvalidArgumentException,
                  "EigenTransformer::transform: first argument of '" + fun->name() + "' is not a declaration");

    const auto& extents = out->sym()->rank();
    ELAC_THROW_IF(extents.empty() || extents.size() > 2u, InvalidArgumentException,
                  "EigenTransformer::transform: output argument '" + out->sym()->gen() +
                      "' must be an array of rank 1 or 2");
    for (const auto& e : extents) {
        ELAC_THROW_IF(!isExtent(e), InvalidArgumentException,
                      "EigenTransformer::transform: output extent '" + e + "' is not a positive constant");
    }

    const std::string& tensor = out->sym()->name();
    const std::string& scalar = out->type();
    const std::string pointer_name = tensor + "_";

    std::vector<ast::NodePtr> args = fun->args();
    args.front() = std::make_shared<ast::Decl>(scalar + " *", std::make_shared<ast::Symbol>(pointer_name));

    const auto rewrite_access = [&tensor](const ast::NodePtr& n) -> ast::NodePtr {
        const auto* sym = dynamic_cast<const ast::Symbol*>(n.get());
        if (sym == nullptr || sym->name() != tensor || sym->rank().empty()) {
            return n;
        }
        std::vector<ast::NodePtr> indices;
        indices.reserve(sym->rank().size());
        for (const auto& i : sym->rank()) {
            indices.push_back(std::make_shared<ast::Symbol>(i));
        }
        return std::make_shared<ast::FunCall>(tensor, std::move(indices));
    };

    std::vector<ast::NodePtr> statements;
    statements.reserve(fun->body()->statements().size() + 1u);
    statements.push_back(std::make_shared<ast::Decl>(
        eigenMatrixType(scalar, extents),
        std::make_shared<ast::Symbol>(tensor),
        std::make_shared<ast::FlatBlock>("(" + scalar + " *)" + pointer_name),
        std::vector<std::string>{},
        true));
    for (const auto& s : fun->body()->statements()) {
        statements.push_back(ast::transformTree(s, rewrite_access));
    }

    return std::make_shared<ast::FunDecl>(fun->ret(), fun->name(), std::move(args),
                                          std::make_shared<ast::Block>(std::move(statements),
                                                                       fun->body()->openScope()),
                                          fun->pred());
}

} // namespace compiler
} // namespace elac
