/**
 * @file test_FunctionSpace.cpp
 * @brief Unit tests for FunctionSpace and Coefficient
 */

#include <gtest/gtest.h>

#include "Core/ElacException.h"
#include "Expr/Coefficient.h"
#include "Expr/FunctionSpace.h"

using elac::InvalidArgumentException;
using elac::expr::Coefficient;
using elac::expr::FunctionSpace;
using elac::expr::SpaceType;

TEST(FunctionSpace, SimpleSpace) {
    auto V = FunctionSpace::simple("P1", 3);
    EXPECT_EQ(V->spaceType(), SpaceType::Simple);
    EXPECT_FALSE(V->isMixed());
    EXPECT_EQ(V->numComponents(), 1u);
    EXPECT_EQ(V->dimension(), 3);
    EXPECT_EQ(V->component(0).get(), V.get());
    EXPECT_THROW((void)V->component(1), InvalidArgumentException);
}

TEST(FunctionSpace, MixedSpaceSumsDimensions) {
    auto V = FunctionSpace::simple("P2", 2);
    auto Q = FunctionSpace::simple("P1", 1);
    auto W = FunctionSpace::mixed("Taylor-Hood", {V, Q});

    EXPECT_TRUE(W->isMixed());
    EXPECT_EQ(W->numComponents(), 2u);
    EXPECT_EQ(W->dimension(), 3);

    const auto parts = W->split();
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].get(), V.get());
    EXPECT_EQ(parts[1].get(), Q.get());
}

TEST(FunctionSpace, InvalidConstruction) {
    EXPECT_THROW((void)FunctionSpace::simple("bad", 0), InvalidArgumentException);
    EXPECT_THROW((void)FunctionSpace::mixed("empty", {}), InvalidArgumentException);
    EXPECT_THROW((void)FunctionSpace::mixed("null", {nullptr}), InvalidArgumentException);
}

TEST(Coefficient, CreationNumbersIncrease) {
    auto V = FunctionSpace::simple("P1");
    auto f = Coefficient::create("f", V);
    auto g = Coefficient::create("g", V);
    EXPECT_LT(f->number(), g->number());
    EXPECT_EQ(f->name(), "f");
    EXPECT_EQ(f->space().get(), V.get());
    EXPECT_EQ(f->parent(), nullptr);
}

TEST(Coefficient, SimpleSplitIsSelf) {
    auto f = Coefficient::create("f", FunctionSpace::simple("P1"));
    const auto parts = f->split();
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].get(), f.get());
}

TEST(Coefficient, MixedSplitCreatesParts) {
    auto W = FunctionSpace::mixed("W", {FunctionSpace::simple("V", 2), FunctionSpace::simple("Q")});
    auto u = Coefficient::create("u", W);

    const auto parts = u->split();
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0]->name(), "u[0]");
    EXPECT_EQ(parts[1]->name(), "u[1]");
    EXPECT_EQ(parts[0]->parent(), u.get());
    EXPECT_EQ(parts[0]->space()->dimension(), 2);

    // Parts are stable across calls
    EXPECT_EQ(u->split()[1].get(), parts[1].get());
}

TEST(Coefficient, NullSpaceRejected) {
    EXPECT_THROW((void)Coefficient::create("f", nullptr), InvalidArgumentException);
}
