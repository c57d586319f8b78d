/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_ElacException.cpp
 * @brief Unit tests for the exception hierarchy and throw macros
 */

#include <gtest/gtest.h>

#include "Core/ElacException.h"

#include <string>

using elac::ElacException;
using elac::ElacStatus;
using elac::InvalidArgumentException;
using elac::LookupException;
using elac::NotImplementedException;
using elac::PreconditionException;

namespace {

void throwIfNegative(int x) {
    ELAC_CHECK_ARG(x >= 0, "x must be non-negative, got " + std::to_string(x));
}

void notReady() {
    ELAC_NOT_IMPLEMENTED("mesh layers");
}

} // namespace

TEST(ElacException, CarriesMessageAndLocation) {
    try {
        ELAC_THROW(ElacException, "plain failure");
        FAIL() << "expected a throw";
    } catch (const ElacException& e) {
        EXPECT_EQ(e.message(), "plain failure");
        EXPECT_EQ(e.status(), ElacStatus::Unknown);
        EXPECT_NE(e.file().find("test_ElacException.cpp"), std::string::npos);
        EXPECT_GT(e.line(), 0);
        EXPECT_NE(std::string(e.what()).find("plain failure"), std::string::npos);
    }
}

TEST(ElacException, SubclassesMapToStatusCodes) {
    EXPECT_EQ(InvalidArgumentException("a").status(), ElacStatus::InvalidArgument);
    EXPECT_EQ(PreconditionException("b").status(), ElacStatus::Precondition);
    EXPECT_EQ(NotImplementedException("c").status(), ElacStatus::NotImplemented);
    EXPECT_EQ(LookupException("d").status(), ElacStatus::LookupError);
    EXPECT_EQ(elac::CompilationException("e").status(), ElacStatus::CompilationError);
}

TEST(ElacException, CheckArgThrowsInvalidArgument) {
    EXPECT_NO_THROW(throwIfNegative(3));
    EXPECT_THROW(throwIfNegative(-1), InvalidArgumentException);
    EXPECT_THROW(throwIfNegative(-1), ElacException);
}

TEST(ElacException, NotImplementedPrefixesFeature) {
    try {
        notReady();
        FAIL() << "expected a throw";
    } catch (const NotImplementedException& e) {
        EXPECT_EQ(e.message(), "Feature not implemented: mesh layers");
    }
}

TEST(ElacException, ThrowIfTwoArgumentFormUsesBaseType) {
    try {
        ELAC_THROW_IF(true, "generic");
        FAIL() << "expected a throw";
    } catch (const ElacException& e) {
        EXPECT_EQ(e.status(), ElacStatus::Unknown);
    }
    EXPECT_NO_THROW(ELAC_THROW_IF(false, PreconditionException, "never"));
}

TEST(ElacException, AddContextAppearsInWhat) {
    InvalidArgumentException e("bad shape");
    e.add_context("while compiling T0");
    EXPECT_EQ(e.message(), "while compiling T0: bad shape");
    EXPECT_NE(std::string(e.what()).find("while compiling T0: bad shape"), std::string::npos);
}

TEST(ElacException, WhatStartsWithStatus) {
    PreconditionException e("not finalized", "KernelBuilder.cpp", 42, "construct");
    const std::string what = e.what();
    EXPECT_EQ(what.rfind("Precondition", 0), 0u);
    EXPECT_NE(what.find("KernelBuilder.cpp:42 (construct)"), std::string::npos);
    EXPECT_EQ(e.line(), 42);
}

TEST(ElacException, CheckNotNull) {
    const int* p = nullptr;
    EXPECT_THROW(ELAC_CHECK_NOT_NULL(p, "p"), InvalidArgumentException);
}

TEST(ElacStatus, ToString) {
    EXPECT_STREQ(elac::status_to_string(ElacStatus::Success), "Success");
    EXPECT_STREQ(elac::status_to_string(ElacStatus::LookupError), "Lookup error");
}
