/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_ExprAnalysis.cpp
 * @brief Unit tests for DAG traversal, reference counting and temporaries
 */

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <vector>

#include "Compiler/ExprAnalysis.h"
#include "Core/ElacException.h"
#include "CompilerTestHelpers.h"

using elac::InvalidArgumentException;
using elac::LookupException;
using elac::compiler::collectReferenceCount;
using elac::compiler::countOperands;
using elac::compiler::generateExprData;
using elac::compiler::selectAuxiliaryExpressions;
using elac::compiler::TemporaryMap;
using elac::compiler::traverseDags;
using elac::compiler::test::makeTensor;
using elac::expr::Coefficient;
using elac::expr::FunctionSpace;
using elac::expr::TensorExprType;

TEST(TraverseDags, VisitsEachNodeOnce) {
    auto A = makeTensor("A", {2, 2});
    auto e = (A + A) * A;

    const auto order = traverseDags({e});
    ASSERT_EQ(order.size(), 3u);
    EXPECT_TRUE(order[0].sameNode(e));
}

TEST(TraverseDags, PopsLastPushedOperandFirst) {
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    auto e = A + B;

    const auto order = traverseDags({e});
    ASSERT_EQ(order.size(), 3u);
    EXPECT_TRUE(order[0].sameNode(e));
    EXPECT_TRUE(order[1].sameNode(B));
    EXPECT_TRUE(order[2].sameNode(A));
}

TEST(TraverseDags, DuplicateRootsCollapse) {
    auto A = makeTensor("A", {2});
    EXPECT_EQ(traverseDags({A, A}).size(), 1u);
    EXPECT_THROW((void)traverseDags({elac::expr::TensorExpr{}}), InvalidArgumentException);
}

TEST(ReferenceCount, CountsEveryOperandEdge) {
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    auto sum = A + A;
    auto e = sum * B;

    const auto counts = collectReferenceCount({e});
    EXPECT_EQ(counts.count(A), 2u);
    EXPECT_EQ(counts.count(B), 1u);
    EXPECT_EQ(counts.count(sum), 1u);
    EXPECT_EQ(counts.count(e), 0u);
}

TEST(ReferenceCount, SharedAcrossRoots) {
    auto A = makeTensor("A", {2, 2});
    auto r1 = -A;
    auto r2 = A.transpose();
    const auto counts = collectReferenceCount({r1, r2});
    EXPECT_EQ(counts.count(A), 2u);
}

TEST(CountOperands, SumsSubtreeSizes) {
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    EXPECT_EQ(countOperands(A), 0u);
    EXPECT_EQ(countOperands(A + B), 2u);
    EXPECT_EQ(countOperands(-(A + B)), 3u);
    // Shared operands are counted once per edge
    auto S = A * B;
    EXPECT_EQ(countOperands(S + S), 6u);
}

TEST(GenerateExprData, AssignsTemporariesInTraversalOrder) {
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    const auto data = generateExprData(A + B);

    ASSERT_EQ(data.temporaries.size(), 2u);
    EXPECT_TRUE(data.temporaries[0].terminal.sameNode(B));
    EXPECT_EQ(data.temporaries[0].symbol->name(), "T0");
    EXPECT_TRUE(data.temporaries[1].terminal.sameNode(A));
    EXPECT_EQ(data.temporaries[1].symbol->name(), "T1");
    EXPECT_EQ(data.temporaries.indexOf(A.node()), 1u);
    ASSERT_EQ(data.tensor_ops.size(), 1u);
    EXPECT_EQ(data.tensor_ops[0].type(), TensorExprType::Add);
}

TEST(GenerateExprData, RepeatedTerminalGetsOneTemporary) {
    auto A = makeTensor("A", {2, 2});
    const auto data = generateExprData(A + A);
    ASSERT_EQ(data.temporaries.size(), 1u);
    EXPECT_EQ(data.temporaries[0].symbol->name(), "T0");
}

TEST(GenerateExprData, TerminalRootHasNoOperators) {
    auto A = makeTensor("A", {3});
    const auto data = generateExprData(A);
    EXPECT_EQ(data.temporaries.size(), 1u);
    EXPECT_TRUE(data.tensor_ops.empty());
}

TEST(GenerateExprData, OperatorsSortedByComplexity) {
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    auto S = A * B;
    auto T = S.transpose();
    auto e = S + T;

    const auto data = generateExprData(e);
    ASSERT_EQ(data.tensor_ops.size(), 3u);
    EXPECT_TRUE(data.tensor_ops[0].sameNode(S));
    EXPECT_TRUE(data.tensor_ops[1].sameNode(T));
    EXPECT_TRUE(data.tensor_ops[2].sameNode(e));
}

TEST(GenerateExprData, IsDeterministicAcrossIndependentGraphs) {
    const auto build = [] {
        auto A = makeTensor("A", {2, 2});
        auto B = makeTensor("B", {2, 2});
        auto C = makeTensor("C", {2, 2});
        auto S = A * B;
        return (S + C).inverse() - S.transpose() + C;
    };
    const auto e1 = build();
    const auto e2 = build();
    ASSERT_FALSE(e1.sameNode(e2));

    const auto first = generateExprData(e1);
    const auto second = generateExprData(e2);
    ASSERT_EQ(first.temporaries.size(), 3u);
    ASSERT_EQ(second.temporaries.size(), 3u);
    for (std::size_t i = 0; i < first.temporaries.size(); ++i) {
        EXPECT_EQ(first.temporaries[i].terminal.form().name, second.temporaries[i].terminal.form().name);
        EXPECT_EQ(first.temporaries[i].symbol->name(), second.temporaries[i].symbol->name());
    }
    ASSERT_EQ(first.tensor_ops.size(), second.tensor_ops.size());
    for (std::size_t i = 0; i < first.tensor_ops.size(); ++i) {
        EXPECT_EQ(first.tensor_ops[i].toString(), second.tensor_ops[i].toString());
    }

    const auto aux1 = selectAuxiliaryExpressions(first.tensor_ops, collectReferenceCount({e1}));
    const auto aux2 = selectAuxiliaryExpressions(second.tensor_ops, collectReferenceCount({e2}));
    ASSERT_EQ(aux1.size(), 1u);
    ASSERT_EQ(aux2.size(), 1u);
    EXPECT_EQ(aux1[0].toString(), aux2[0].toString());
}

TEST(GenerateExprData, EqualComplexityKeepsDiscoveryOrder) {
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    auto C = makeTensor("C", {2, 2});
    auto D = makeTensor("D", {2, 2});
    auto P = A * B;
    auto Q = C * D;
    auto L = P + Q;
    auto R = P + Q;
    auto e = L - R;

    // R is walked before L, and Q before P inside R
    const auto data = generateExprData(e);
    ASSERT_EQ(data.tensor_ops.size(), 5u);
    EXPECT_TRUE(data.tensor_ops[0].sameNode(Q));
    EXPECT_TRUE(data.tensor_ops[1].sameNode(P));
    EXPECT_TRUE(data.tensor_ops[2].sameNode(R));
    EXPECT_TRUE(data.tensor_ops[3].sameNode(L));
    EXPECT_TRUE(data.tensor_ops[4].sameNode(e));

    const auto aux = selectAuxiliaryExpressions(data.tensor_ops, collectReferenceCount({e}));
    ASSERT_EQ(aux.size(), 2u);
    EXPECT_TRUE(aux[0].sameNode(Q));
    EXPECT_TRUE(aux[1].sameNode(P));
}

TEST(CountOperands, SaturatesOnDeeplySharedChain) {
    auto x = makeTensor("A", {2, 2});
    std::vector<elac::expr::TensorExpr> chain;
    for (int i = 0; i < 66; ++i) {
        x = x + x;
        chain.push_back(x);
    }

    EXPECT_EQ(countOperands(chain[0]), 2u);
    EXPECT_EQ(countOperands(chain[9]), 2046u);
    EXPECT_EQ(countOperands(x), std::numeric_limits<std::size_t>::max());

    // Every subexpression still precedes the expressions built on it
    const auto data = generateExprData(x);
    ASSERT_EQ(data.tensor_ops.size(), chain.size());
    for (std::size_t i = 0; i < chain.size(); ++i) {
        EXPECT_TRUE(data.tensor_ops[i].sameNode(chain[i])) << "level " << i;
    }

    const auto aux = selectAuxiliaryExpressions(data.tensor_ops, collectReferenceCount({x}));
    ASSERT_EQ(aux.size(), chain.size() - 1);
    EXPECT_TRUE(aux.front().sameNode(chain.front()));
    EXPECT_TRUE(aux.back().sameNode(chain[chain.size() - 2]));
}

TEST(AuxiliaryExpressions, SharedOperatorsAndActions) {
    auto V = FunctionSpace::simple("V", 2);
    auto u = Coefficient::create("u", V);
    auto A = makeTensor("A", {2, 2});
    auto B = makeTensor("B", {2, 2});
    auto S = A * B;
    auto Su = S.action(u);
    auto e = S.transpose().action(u) + Su;

    const auto data = generateExprData(e);
    const auto counts = collectReferenceCount({e});
    const auto aux = selectAuxiliaryExpressions(data.tensor_ops, counts);

    // S is shared; both actions are selected regardless of reference count
    ASSERT_EQ(aux.size(), 3u);
    EXPECT_TRUE(aux[0].sameNode(S));
    EXPECT_EQ(aux[1].type(), TensorExprType::Action);
    EXPECT_EQ(aux[2].type(), TensorExprType::Action);
}

TEST(AuxiliaryExpressions, SingleUseOperatorsAreInlined) {
    auto A = makeTensor("A", {2, 2});
    auto e = A + A;
    const auto data = generateExprData(e);
    const auto aux = selectAuxiliaryExpressions(data.tensor_ops, collectReferenceCount({e}));
    EXPECT_TRUE(aux.empty());
}

TEST(TemporaryMap, LookupOfForeignNode) {
    TemporaryMap map;
    auto A = makeTensor("A", {2});
    auto B = makeTensor("B", {2});
    const auto& sym = map.getOrAssign(A);
    EXPECT_EQ(sym->name(), "T0");
    EXPECT_EQ(map.getOrAssign(A).get(), sym.get());
    EXPECT_TRUE(map.contains(A.node()));
    EXPECT_EQ(map.find(B.node()), nullptr);
    EXPECT_THROW((void)map.indexOf(B.node()), LookupException);
}
