/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_TensorExpr.cpp
 * @brief Unit tests for the tensor expression vocabulary
 */

#include <gtest/gtest.h>

#include "Core/ElacException.h"
#include "Expr/TensorExpr.h"

#include <memory>
#include <vector>

using elac::InvalidArgumentException;
using elac::expr::Coefficient;
using elac::expr::FunctionSpace;
using elac::expr::TensorExpr;
using elac::expr::TensorExprType;
using elac::expr::TensorShape;
using elac::expr::TerminalForm;

namespace {

TensorExpr makeTensor(const std::string& name,
                      std::vector<int> dims,
                      std::vector<Coefficient::Ptr> coefficients = {}) {
    auto form = std::make_shared<TerminalForm>();
    form->name = name;
    form->argument_dimensions = std::move(dims);
    form->coefficients = std::move(coefficients);
    return TensorExpr::tensor(form);
}

TensorShape shapeOf(std::vector<int> extents) {
    TensorShape s;
    s.extents = std::move(extents);
    return s;
}

} // namespace

TEST(TensorExpr, TerminalShapeFollowsArguments) {
    auto A = makeTensor("mass", {3, 3});
    auto b = makeTensor("load", {3});
    auto s = makeTensor("energy", {});

    EXPECT_TRUE(A.isTerminal());
    EXPECT_EQ(A.type(), TensorExprType::Tensor);
    EXPECT_EQ(A.shape(), shapeOf({3, 3}));
    EXPECT_EQ(b.rank(), 1);
    EXPECT_EQ(s.rank(), 0);
    EXPECT_EQ(A.form().name, "mass");
    EXPECT_EQ(A.toString(), "Tensor(mass)");
}

TEST(TensorExpr, RejectsInvalidForms) {
    EXPECT_THROW((void)TensorExpr::tensor(nullptr), InvalidArgumentException);
    EXPECT_THROW((void)makeTensor("rank3", {2, 2, 2}), InvalidArgumentException);
    EXPECT_THROW((void)makeTensor("zero", {0}), InvalidArgumentException);
}

TEST(TensorExpr, AddAndSubtractRequireEqualShapes) {
    auto A = makeTensor("A", {3, 3});
    auto B = makeTensor("B", {3, 3});
    auto C = makeTensor("C", {3, 2});

    auto sum = A + B;
    EXPECT_EQ(sum.type(), TensorExprType::Add);
    EXPECT_EQ(sum.shape(), shapeOf({3, 3}));
    ASSERT_EQ(sum.operands().size(), 2u);
    EXPECT_TRUE(sum.operands()[0].sameNode(A));
    EXPECT_TRUE(sum.operands()[1].sameNode(B));

    EXPECT_EQ((A - B).type(), TensorExprType::Subtract);
    EXPECT_THROW((void)(A + C), InvalidArgumentException);
    EXPECT_THROW((void)(A - C), InvalidArgumentException);
}

TEST(TensorExpr, MulContractsInnerExtent) {
    auto A = makeTensor("A", {3, 4});
    auto B = makeTensor("B", {4, 2});
    auto x = makeTensor("x", {4});
    auto s = makeTensor("s", {});

    EXPECT_EQ((A * B).shape(), shapeOf({3, 2}));
    EXPECT_EQ((A * x).shape(), shapeOf({3}));
    EXPECT_EQ((x * x).shape(), shapeOf({}));
    EXPECT_EQ((s * A).shape(), shapeOf({3, 4}));
    EXPECT_EQ((A * s).shape(), shapeOf({3, 4}));
    EXPECT_THROW((void)(A * A), InvalidArgumentException);
}

TEST(TensorExpr, UnaryOperators) {
    auto A = makeTensor("A", {3, 2});
    auto S = makeTensor("S", {2, 2});

    EXPECT_EQ((-A).type(), TensorExprType::Negative);
    EXPECT_EQ((-A).shape(), A.shape());
    EXPECT_EQ(A.transpose().shape(), shapeOf({2, 3}));
    EXPECT_EQ(S.inverse().shape(), S.shape());
    EXPECT_EQ(S.inverse().type(), TensorExprType::Inverse);
    EXPECT_THROW((void)A.inverse(), InvalidArgumentException);
    EXPECT_EQ(A.transpose().toString(), "Tensor(A).T");
}

TEST(TensorExpr, ActionAppliesMatrixToCoefficient) {
    auto V = FunctionSpace::simple("V", 3);
    auto u = Coefficient::create("u", V);
    auto A = makeTensor("A", {3, 3});

    auto Au = A.action(u);
    EXPECT_EQ(Au.type(), TensorExprType::Action);
    EXPECT_EQ(Au.shape(), shapeOf({3}));
    ASSERT_NE(Au.node()->actingCoefficient(), nullptr);
    EXPECT_EQ(Au.node()->actingCoefficient()->get(), u.get());

    auto w = Coefficient::create("w", FunctionSpace::simple("W", 2));
    EXPECT_THROW((void)A.action(w), InvalidArgumentException);
    EXPECT_THROW((void)makeTensor("b", {3}).action(u), InvalidArgumentException);
    EXPECT_THROW((void)A.action(nullptr), InvalidArgumentException);
}

TEST(TensorExpr, CoefficientsAreUniqueAndOrdered) {
    auto V = FunctionSpace::simple("V", 2);
    auto first = Coefficient::create("first", V);
    auto second = Coefficient::create("second", V);
    auto third = Coefficient::create("third", V);

    auto A = makeTensor("A", {2, 2}, {third, first});
    auto B = makeTensor("B", {2, 2}, {first});
    auto e = (A + B).action(second);

    const auto coefficients = e.coefficients();
    ASSERT_EQ(coefficients.size(), 3u);
    EXPECT_EQ(coefficients[0].get(), first.get());
    EXPECT_EQ(coefficients[1].get(), second.get());
    EXPECT_EQ(coefficients[2].get(), third.get());
}

TEST(TensorExpr, EmptyHandleThrows) {
    TensorExpr empty;
    EXPECT_FALSE(empty.isValid());
    EXPECT_FALSE(static_cast<bool>(empty));
    EXPECT_EQ(empty.toString(), "<empty>");
    EXPECT_THROW((void)empty.type(), InvalidArgumentException);
    EXPECT_THROW((void)empty.shape(), InvalidArgumentException);
    auto A = makeTensor("A", {2});
    EXPECT_THROW((void)(A + empty), InvalidArgumentException);
}

TEST(TensorExpr, SharedOperandsKeepIdentity) {
    auto A = makeTensor("A", {2, 2});
    auto e = A + A;
    ASSERT_EQ(e.operands().size(), 2u);
    EXPECT_TRUE(e.operands()[0].sameNode(e.operands()[1]));
    EXPECT_EQ(e.node()->operands()[0].get(), A.node());
}
