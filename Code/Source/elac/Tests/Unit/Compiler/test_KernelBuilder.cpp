/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_KernelBuilder.cpp
 * @brief Unit tests for KernelBuilder analysis, finalize and construct
 */

#include <gtest/gtest.h>

#include "Compiler/KernelBuilder.h"
#include "Core/ElacConfig.h"
#include "Core/ElacException.h"
#include "Core/Logger.h"
#include "CompilerTestHelpers.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

using elac::CompilationException;
using elac::CompilerParameters;
using elac::IntegralType;
using elac::InvalidArgumentException;
using elac::LookupException;
using elac::NotImplementedException;
using elac::PreconditionException;
using elac::compiler::BuilderState;
using elac::compiler::KernelBuilder;
using elac::compiler::KernelTransformer;
using elac::compiler::test::FakeTerminalCompiler;
using elac::compiler::test::makeTensor;
using elac::expr::Coefficient;
using elac::expr::FunctionSpace;
using elac::expr::TensorExpr;
using elac::expr::TensorExprType;

namespace ast = elac::ast;

namespace {

// Leaves kernels untouched so tests can count transform calls
class CountingTransformer final : public KernelTransformer {
public:
    ast::NodePtr transform(const ast::NodePtr& kernel) const override {
        ++calls;
        return kernel;
    }
    mutable int calls = 0;
};

class NullTransformer final : public KernelTransformer {
public:
    ast::NodePtr transform(const ast::NodePtr&) const override { return nullptr; }
};

} // namespace

TEST(KernelBuilder, RejectsEmptyInputs) {
    auto compiler = std::make_shared<FakeTerminalCompiler>();
    EXPECT_THROW(KernelBuilder(TensorExpr{}, compiler), InvalidArgumentException);
    EXPECT_THROW(KernelBuilder(makeTensor("A", {2, 2}), nullptr), InvalidArgumentException);
}

TEST(KernelBuilder, AnalysisOnConstruction) {
    auto A = makeTensor("A", {3, 3});
    auto B = makeTensor("B", {3, 3});
    auto S = A * B;
    auto e = S + S.transpose();

    KernelBuilder builder(e, std::make_shared<FakeTerminalCompiler>());
    EXPECT_EQ(builder.state(), BuilderState::Constructed);
    EXPECT_FALSE(builder.isFinalized());
    EXPECT_TRUE(builder.expression().sameNode(e));
    EXPECT_EQ(builder.temporaries().size(), 2u);
    EXPECT_EQ(builder.referenceCounts().count(S), 2u);

    ASSERT_EQ(builder.auxiliaryExpressions().size(), 1u);
    EXPECT_TRUE(builder.auxiliaryExpressions()[0].sameNode(S));

    EXPECT_EQ(builder.temporary(A).rank().size(), 0u);
    EXPECT_THROW((void)builder.temporary(makeTensor("C", {3, 3})), LookupException);
    EXPECT_EQ(builder.integralType(), IntegralType::Cell);
}

TEST(KernelBuilder, AnalysisSummaryOnlyInDebugBuilds) {
    auto& logger = elac::Logger::instance();
    const auto saved = logger.get_level();
    std::vector<std::string> lines;
    logger.set_level(elac::LogLevel::DEBUG);
    logger.add_handler([&lines](const elac::LogMessage& m) { lines.push_back(m.text); });

    KernelBuilder builder(makeTensor("A", {2, 2}) + makeTensor("B", {2, 2}),
                          std::make_shared<FakeTerminalCompiler>());

    logger.clear_handlers();
    logger.set_level(saved);

    std::size_t summaries = 0;
    for (const auto& line : lines) {
        if (line.find("2 temporaries, 1 operators, 0 auxiliary expressions") != std::string::npos) {
            ++summaries;
        }
    }
    EXPECT_EQ(summaries, ELAC_DEBUG_MODE ? 1u : 0u);
}

TEST(KernelBuilder, RepeatedTerminalSingleTemporary) {
    auto A = makeTensor("A", {2, 2});
    KernelBuilder builder(A + A, std::make_shared<FakeTerminalCompiler>());
    ASSERT_EQ(builder.temporaries().size(), 1u);
    EXPECT_EQ(builder.temporary(A).name(), "T0");
    EXPECT_EQ(builder.referenceCounts().count(A), 2u);
    EXPECT_TRUE(builder.auxiliaryExpressions().empty());
}

TEST(KernelBuilder, ActionIsAlwaysAuxiliary) {
    auto u = Coefficient::create("u", FunctionSpace::simple("V", 2));
    auto A = makeTensor("A", {2, 2});
    KernelBuilder builder(-A.action(u), std::make_shared<FakeTerminalCompiler>());
    ASSERT_EQ(builder.auxiliaryExpressions().size(), 1u);
    EXPECT_EQ(builder.auxiliaryExpressions()[0].type(), TensorExprType::Action);
}

TEST(KernelBuilder, CoefficientMapNamesSimpleAndMixed) {
    auto V = FunctionSpace::simple("V", 2);
    auto W = FunctionSpace::mixed("W", {FunctionSpace::simple("P2", 1), FunctionSpace::simple("P1", 1)});
    auto f = Coefficient::create("f", V);
    auto m = Coefficient::create("m", W);

    auto A = makeTensor("A", {2, 2}, {m});
    auto B = makeTensor("B", {2, 2}, {f});
    KernelBuilder builder(A + B, std::make_shared<FakeTerminalCompiler>());

    const auto& map = builder.coefficientMap();
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map[0].coefficient.get(), f.get());
    EXPECT_EQ(map[1].coefficient.get(), m.get());

    const auto& fs = builder.coefficient(*f);
    ASSERT_EQ(fs.size(), 1u);
    EXPECT_EQ(fs[0]->name(), "w_0");

    const auto& ms = builder.coefficient(*m);
    ASSERT_EQ(ms.size(), 2u);
    EXPECT_EQ(ms[0]->name(), "w_1_0");
    EXPECT_EQ(ms[1]->name(), "w_1_1");

    auto g = Coefficient::create("g", V);
    EXPECT_THROW((void)builder.coefficient(*g), LookupException);

    // Memoized
    EXPECT_EQ(&builder.coefficientMap(), &map);
    EXPECT_EQ(builder.coefficient(*f)[0].get(), fs[0].get());
}

TEST(KernelBuilder, ContextKernelsUsePrefixesAndParameters) {
    auto compiler = std::make_shared<FakeTerminalCompiler>();
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    CompilerParameters params;
    params.set("mode", std::string("vanilla"));

    KernelBuilder builder(A * B, compiler, params);
    const auto& kernels = builder.contextKernels();
    ASSERT_EQ(kernels.size(), 2u);
    ASSERT_EQ(compiler->calls.size(), 2u);

    // Temporary order: B is T0, A is T1
    EXPECT_EQ(compiler->calls[0].form, "B");
    EXPECT_EQ(compiler->calls[0].prefix, "subkernel0_");
    EXPECT_EQ(compiler->calls[1].form, "A");
    EXPECT_EQ(compiler->calls[1].prefix, "subkernel1_");
    EXPECT_TRUE(compiler->calls[0].parameters == params);
    EXPECT_EQ(kernels[0].split_kernels[0].kinfo.name, "subkernel0_B");

    // Second access does not recompile
    (void)builder.contextKernels();
    EXPECT_EQ(compiler->calls.size(), 2u);
    EXPECT_EQ(&builder.contextKernels(), &kernels);
}

TEST(KernelBuilder, CompileFailurePropagates) {
    auto compiler = std::make_shared<FakeTerminalCompiler>();
    compiler->failing.insert("A");
    KernelBuilder builder(makeTensor("A", {2, 2}), compiler);

    EXPECT_THROW((void)builder.contextKernels(), CompilationException);
    EXPECT_THROW(builder.finalize(), CompilationException);
    EXPECT_FALSE(builder.isFinalized());

    // Nothing was memoized; a repaired compiler is consulted again
    compiler->failing.clear();
    EXPECT_NO_THROW(builder.finalize());
    EXPECT_TRUE(builder.isFinalized());
}

TEST(KernelBuilder, ConstructRequiresFinalize) {
    KernelBuilder builder(makeTensor("A", {2, 2}), std::make_shared<FakeTerminalCompiler>());
    EXPECT_THROW((void)builder.construct({}), PreconditionException);
    EXPECT_TRUE(builder.finalizedAst().empty());
}

TEST(KernelBuilder, FinalizeThenConstruct) {
    auto A = makeTensor("A", {2, 2});
    auto b = makeTensor("b", {2});
    KernelBuilder builder(A * b, std::make_shared<FakeTerminalCompiler>());

    builder.finalize();
    EXPECT_EQ(builder.state(), BuilderState::Finalized);
    ASSERT_EQ(builder.finalizedAst().size(), 2u);

    auto body = std::make_shared<const ast::Block>(std::vector<ast::NodePtr>{
        std::make_shared<ast::FlatBlock>("// combine temporaries\n")});
    auto macro = builder.constructMacroKernel("wrap", {}, body);
    auto root = builder.construct({macro});

    ASSERT_NE(root, nullptr);
    const auto children = root->children();
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[2].get(), macro.get());

    const std::string code = root->gen();
    EXPECT_NE(code.find("Eigen::Map<Eigen::Matrix<double, 2, 2, Eigen::RowMajor>> A((double *)A_);"),
              std::string::npos);
    EXPECT_NE(code.find("Eigen::Map<Eigen::Matrix<double, 2, 1>> A((double *)A_);"), std::string::npos);
    EXPECT_NE(code.find("static inline void wrap()"), std::string::npos);
    EXPECT_LT(code.find("subkernel0_b"), code.find("wrap"));

    EXPECT_THROW((void)builder.construct({nullptr}), InvalidArgumentException);
}

TEST(KernelBuilder, DoubleFinalizeIsNoOp) {
    auto transformer = std::make_shared<CountingTransformer>();
    KernelBuilder builder(makeTensor("A", {2, 2}), std::make_shared<FakeTerminalCompiler>(), {}, transformer);

    builder.finalize();
    const auto first = builder.finalizedAst();
    builder.finalize();
    EXPECT_EQ(transformer->calls, 1);
    ASSERT_EQ(builder.finalizedAst().size(), first.size());
    EXPECT_EQ(builder.finalizedAst()[0].get(), first[0].get());
}

TEST(KernelBuilder, OrientationAccumulates) {
    auto compiler = std::make_shared<FakeTerminalCompiler>();
    compiler->oriented.insert("B");
    KernelBuilder builder(makeTensor("A", {2, 2}) + makeTensor("B", {2, 2}), compiler);

    EXPECT_FALSE(builder.oriented());
    builder.finalize();
    EXPECT_TRUE(builder.oriented());
}

TEST(KernelBuilder, OrientationStaysFalseWithoutOrientedKernels) {
    KernelBuilder builder(makeTensor("A", {2, 2}) + makeTensor("B", {2, 2}),
                          std::make_shared<FakeTerminalCompiler>());
    builder.finalize();
    EXPECT_TRUE(builder.isFinalized());
    EXPECT_FALSE(builder.oriented());
}

TEST(KernelBuilder, ConstructIsRepeatable) {
    KernelBuilder builder(makeTensor("A", {2, 2}) * makeTensor("b", {2}),
                          std::make_shared<FakeTerminalCompiler>());
    builder.finalize();

    auto body = std::make_shared<const ast::Block>(std::vector<ast::NodePtr>{
        std::make_shared<ast::FlatBlock>("// apply\n")});
    auto macro = builder.constructMacroKernel("apply", {}, body);

    const auto first = builder.construct({macro});
    const auto second = builder.construct({macro});
    ASSERT_NE(first.get(), second.get());
    EXPECT_EQ(first->gen(), second->gen());
    ASSERT_EQ(first->children().size(), second->children().size());
    for (std::size_t i = 0; i < first->children().size(); ++i) {
        EXPECT_EQ(first->children()[i].get(), second->children()[i].get());
    }
    EXPECT_EQ(builder.finalizedAst().size(), 2u);
}

TEST(KernelBuilder, SubdomainKernelsRejected) {
    auto compiler = std::make_shared<FakeTerminalCompiler>();
    compiler->oriented.insert("A");
    compiler->subdomains["B"] = "7";
    KernelBuilder builder(makeTensor("A", {2, 2}) - makeTensor("B", {2, 2}), compiler);

    EXPECT_THROW(builder.finalize(), NotImplementedException);
    // Failed finalize leaves the builder untouched
    EXPECT_FALSE(builder.isFinalized());
    EXPECT_FALSE(builder.oriented());
    EXPECT_TRUE(builder.finalizedAst().empty());
    EXPECT_THROW((void)builder.construct({}), PreconditionException);
}

TEST(KernelBuilder, MissingOrDroppedAstRejected) {
    auto compiler = std::make_shared<FakeTerminalCompiler>();
    compiler->missing_ast.insert("A");
    KernelBuilder missing(makeTensor("A", {2, 2}), compiler);
    EXPECT_THROW(missing.finalize(), InvalidArgumentException);

    KernelBuilder dropped(makeTensor("B", {2, 2}), std::make_shared<FakeTerminalCompiler>(), {},
                          std::make_shared<NullTransformer>());
    EXPECT_THROW(dropped.finalize(), InvalidArgumentException);
    EXPECT_FALSE(dropped.isFinalized());
}

TEST(KernelBuilder, RequirementFlags) {
    KernelBuilder builder(makeTensor("A", {2, 2}), std::make_shared<FakeTerminalCompiler>());
    EXPECT_FALSE(builder.needsCellFacets());
    EXPECT_FALSE(builder.needsMeshLayers());
    builder.requireCellFacets();
    builder.requireMeshLayers();
    EXPECT_TRUE(builder.needsCellFacets());
    EXPECT_TRUE(builder.needsMeshLayers());
}

TEST(KernelBuilder, MoveKeepsState) {
    KernelBuilder builder(makeTensor("A", {2, 2}), std::make_shared<FakeTerminalCompiler>());
    builder.finalize();
    KernelBuilder moved(std::move(builder));
    EXPECT_TRUE(moved.isFinalized());
    EXPECT_EQ(moved.finalizedAst().size(), 1u);
}
