/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_Halo.cpp
 * @brief Single-participant Halo tests
 */

#include <gtest/gtest.h>

#include "Core/ElacException.h"
#include "Halo/Halo.h"

#include <vector>

using elac::GlobalIndex;
using elac::InvalidArgumentException;
using elac::NotImplementedException;
using elac::halo::ArrayView;
using elac::halo::DataLayout;
using elac::halo::GhostPoint;
using elac::halo::Halo;
using elac::halo::InsertMode;

TEST(Halo, SerialExchangesAreNoOps) {
    Halo halo(DataLayout::uniform(3, 2));
    EXPECT_EQ(halo.size(), 1);
    EXPECT_EQ(halo.rank(), 0);

    std::vector<double> v{1, 2, 3, 4, 5, 6};
    const auto before = v;
    const auto view = ArrayView::of(v);

    halo.globalToLocalBegin(view, InsertMode::Write);
    EXPECT_FALSE(halo.hasPendingExchange(v.data()));
    halo.globalToLocalEnd(view, InsertMode::Write);
    halo.localToGlobalBegin(view, InsertMode::Inc);
    halo.localToGlobalEnd(view, InsertMode::Inc);
    EXPECT_EQ(v, before);
}

TEST(Halo, UnsupportedModesRejected) {
    Halo halo(DataLayout::uniform(2, 1));
    std::vector<double> v(2, 0.0);
    const auto view = ArrayView::of(v);

    for (const auto mode : {InsertMode::Read, InsertMode::ReadWrite, InsertMode::Inc,
                            InsertMode::Min, InsertMode::Max}) {
        EXPECT_THROW(halo.globalToLocalBegin(view, mode), NotImplementedException) << elac::halo::insertModeName(mode);
        EXPECT_THROW(halo.globalToLocalEnd(view, mode), NotImplementedException);
    }
    for (const auto mode : {InsertMode::Read, InsertMode::Write, InsertMode::ReadWrite,
                            InsertMode::Min, InsertMode::Max}) {
        EXPECT_THROW(halo.localToGlobalBegin(view, mode), NotImplementedException) << elac::halo::insertModeName(mode);
        EXPECT_THROW(halo.localToGlobalEnd(view, mode), NotImplementedException);
    }
}

TEST(Halo, SerialRejectsRemoteOwners) {
    EXPECT_THROW(Halo(DataLayout({1, 1}, {{1, 1, 0}})), InvalidArgumentException);
}

TEST(Halo, SerialStarForestIsEmpty) {
    Halo halo(DataLayout({1, 2}, {{1, 0, 0}}));
    const auto& sf = halo.sf();
    EXPECT_EQ(sf.numRoots(), 3);
    EXPECT_EQ(sf.numLeaves(), 0u);
    EXPECT_TRUE(halo.commGraph().empty());
    // Cached
    EXPECT_EQ(&halo.sf(), &sf);
}

TEST(Halo, SerialNumberingSharesOwnerNumbers) {
    // Point 1 is a local copy of point 0
    Halo halo(DataLayout({2, 2, 1}, {{1, 0, 0}}));
    const auto& numbers = halo.localToGlobalNumbering();
    EXPECT_EQ(numbers, (std::vector<GlobalIndex>{0, 1, 0, 1, 2}));
    EXPECT_EQ(&halo.localToGlobalNumbering(), &numbers);
}

TEST(Halo, SerialNumberingRejectsMismatchedCopy) {
    Halo halo(DataLayout({2, 1}, {{1, 0, 0}}));
    EXPECT_THROW((void)halo.localToGlobalNumbering(), InvalidArgumentException);
}

TEST(Halo, InsertModeNames) {
    EXPECT_STREQ(elac::halo::insertModeName(InsertMode::Write), "WRITE");
    EXPECT_STREQ(elac::halo::insertModeName(InsertMode::Inc), "INC");
}

TEST(ArrayView, SlotsCountBlocks) {
    std::vector<float> v(12);
    const auto view = ArrayView::of(v, 3);
    EXPECT_EQ(view.num_slots, 4);
    EXPECT_EQ(view.block_size, 3);
    EXPECT_EQ(view.dtype, elac::ScalarType::Float32);
}
