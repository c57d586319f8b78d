/**
 * @file test_CompilerParameters.cpp
 * @brief Unit tests for CompilerParameters and params::Value helpers
 */

#include <gtest/gtest.h>

#include "Core/ParameterValue.h"
#include "Core/Types.h"

#include <string>
#include <vector>

using elac::CompilerParameters;
namespace params = elac::params;

TEST(CompilerParameters, DefaultIsEmpty) {
    CompilerParameters p;
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.size(), 0u);
    EXPECT_FALSE(p.contains("mode"));
    EXPECT_EQ(p.find("mode"), nullptr);
}

TEST(CompilerParameters, SetKeepsInsertionOrder) {
    CompilerParameters p;
    p.set("mode", std::string("spectral"))
     .set("quadrature_degree", 4)
     .set("scale", 0.5);

    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p.entries()[0].first, "mode");
    EXPECT_EQ(p.entries()[1].first, "quadrature_degree");
    EXPECT_EQ(p.entries()[2].first, "scale");
}

TEST(CompilerParameters, SetReplacesInPlace) {
    CompilerParameters p;
    p.set("a", 1).set("b", 2).set("a", 10);

    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p.entries()[0].first, "a");
    EXPECT_EQ(p.get<int>("a").value_or(int{}), 10);
}

TEST(CompilerParameters, TypedLookup) {
    CompilerParameters p;
    p.set("degree", 3).set("fast", true).set("weights", std::vector<double>{1.0, 2.0});

    EXPECT_EQ(p.get<int>("degree").value_or(int{}), 3);
    EXPECT_FALSE(p.get<double>("degree").has_value());
    EXPECT_EQ(p.get<bool>("fast").value_or(bool{}), true);
    ASSERT_TRUE(p.get<std::vector<double>>("weights").has_value());
    EXPECT_EQ(p.get<std::vector<double>>("weights")->size(), 2u);
    EXPECT_FALSE(p.get<int>("missing").has_value());
}

TEST(CompilerParameters, Equality) {
    CompilerParameters a;
    CompilerParameters b;
    a.set("x", 1);
    b.set("x", 1);
    EXPECT_TRUE(a == b);
    b.set("y", 2);
    EXPECT_FALSE(a == b);
}

TEST(ParameterValue, TypeOf) {
    EXPECT_EQ(params::typeOf(params::Value{1.5}), params::ValueType::Real);
    EXPECT_EQ(params::typeOf(params::Value{7}), params::ValueType::Int);
    EXPECT_EQ(params::typeOf(params::Value{std::string("s")}), params::ValueType::String);
    EXPECT_EQ(params::typeName(params::ValueType::RealVector), "RealVector");
}

TEST(Types, ScalarTypeProperties) {
    EXPECT_EQ(elac::scalar_type_size(elac::ScalarType::Float64), 8u);
    EXPECT_EQ(elac::scalar_type_size(elac::ScalarType::Int32), 4u);
    EXPECT_EQ(elac::scalar_type_size(elac::ScalarType::Unknown), 0u);
    EXPECT_STREQ(elac::scalar_type_to_string(elac::ScalarType::Float32), "float32");
}

TEST(Types, IntegralTypeNames) {
    EXPECT_STREQ(elac::integral_type_to_string(elac::IntegralType::Cell), "cell");
    EXPECT_STREQ(elac::integral_type_to_string(elac::IntegralType::InteriorFacet), "interior_facet");
    EXPECT_EQ(elac::DEFAULT_SUBDOMAIN_ID, "otherwise");
}
