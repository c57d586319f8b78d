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

#include "Compiler/MacroKernel.h"

#include "Core/ElacException.h"

namespace elac {
namespace compiler {

std::shared_ptr<const ast::FunDecl> constructMacroKernel(const std::string& name,
                                                         const std::vector<ast::NodePtr>& args,
                                                         const ast::NodePtr& body)
{
    ELAC_CHECK_ARG(!name.empty(), "constructMacroKernel: kernel name is empty");
    for (std::size_t i = 0; i < args.size(); ++i) {
        ELAC_THROW_IF(!args[i], InvalidArgumentException,
                      "constructMacroKernel: argument " + std::to_string(i) + " of '" + name + "' is null");
    }
    auto block = std::dynamic_pointer_cast<const ast::Block>(body);
    ELAC_THROW_IF(!block, InvalidArgumentException,
                  "constructMacroKernel: body statements of '" + name + "' must be wrapped in an ast::Block");

    return std::make_shared<const ast::FunDecl>("void", name, args, std::move(block),
                                                std::vector<std::string>{"static", "inline"});
}

} // namespace compiler
} // namespace elac
