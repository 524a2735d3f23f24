#include "tower.hpp"
#include <gtest/gtest.h>


class TowerTest : public ::testing::Test {
protected:
    GiNaC::realsymbol x{"x"};
    extension_tower tower{x};
    GiNaC::ex tower_form;
    std::string reason;

    void expect_round_trip(const GiNaC::ex& expr) {
        GiNaC::ex back = tower.back_substitute(tower_form);
        EXPECT_TRUE((back - expr).normal().is_zero()) << back << " vs " << expr;
    }
};


TEST_F(TowerTest, Rational) {
    GiNaC::ex expr = 1 / (x + 1);
    ASSERT_TRUE(tower.build(expr, tower_form, reason));
    EXPECT_EQ(tower.size(), 0);
    EXPECT_TRUE(tower_form.is_equal(expr));
}


TEST_F(TowerTest, Exponential) {
    GiNaC::ex expr = x * GiNaC::exp(x);
    ASSERT_TRUE(tower.build(expr, tower_form, reason)) << reason;
    ASSERT_EQ(tower.size(), 1);
    EXPECT_EQ(tower[0].kind, extension_kind::EXPONENTIAL);
    EXPECT_TRUE((tower.derive(tower[0].var) - tower[0].var).is_zero());
    expect_round_trip(expr);
}


TEST_F(TowerTest, Logarithm) {
    GiNaC::ex expr = GiNaC::log(x) / x;
    ASSERT_TRUE(tower.build(expr, tower_form, reason)) << reason;
    ASSERT_EQ(tower.size(), 1);
    EXPECT_EQ(tower[0].kind, extension_kind::LOGARITHMIC);
    EXPECT_TRUE((tower.derive(tower[0].var) - 1 / x).normal().is_zero());
    expect_round_trip(expr);
}


TEST_F(TowerTest, RepeatedExponentialSharesExtension) {
    GiNaC::ex expr = GiNaC::exp(x) / (GiNaC::exp(x) + 1);
    ASSERT_TRUE(tower.build(expr, tower_form, reason)) << reason;
    EXPECT_EQ(tower.size(), 1);
    expect_round_trip(expr);
}


TEST_F(TowerTest, LogarithmOfProductIsSplit) {
    GiNaC::ex expr = GiNaC::log(2 * x);
    ASSERT_TRUE(tower.build(expr, tower_form, reason)) << reason;
    ASSERT_EQ(tower.size(), 1);
    EXPECT_TRUE(tower[0].argument.is_equal(x));
    EXPECT_TRUE(tower_form.has(GiNaC::log(2)));
}


TEST_F(TowerTest, NestedExtensions) {
    GiNaC::ex expr = GiNaC::exp(x) * GiNaC::log(x);
    ASSERT_TRUE(tower.build(expr, tower_form, reason)) << reason;
    EXPECT_EQ(tower.size(), 2);
    expect_round_trip(expr);
}


TEST_F(TowerTest, VariableExponent) {
    GiNaC::ex expr = GiNaC::pow(x, x);
    ASSERT_TRUE(tower.build(expr, tower_form, reason)) << reason;
    ASSERT_EQ(tower.size(), 2);
    EXPECT_EQ(tower[0].kind, extension_kind::LOGARITHMIC);
    EXPECT_EQ(tower[1].kind, extension_kind::EXPONENTIAL);
}


TEST_F(TowerTest, TrigonometricUsesComplexExponential) {
    ASSERT_TRUE(tower.build(GiNaC::sin(x) / x, tower_form, reason)) << reason;
    EXPECT_TRUE(tower.uses_complex());
    EXPECT_EQ(tower.size(), 1);
}


TEST_F(TowerTest, AlgebraicIsRejected) {
    EXPECT_FALSE(tower.build(GiNaC::sqrt(x) * GiNaC::exp(x), tower_form, reason));
    EXPECT_NE(reason.find("algebraic"), std::string::npos) << reason;
}


TEST_F(TowerTest, UnknownFunctionIsRejected) {
    EXPECT_FALSE(tower.build(GiNaC::abs(x), tower_form, reason));
    EXPECT_FALSE(reason.empty());
}


TEST_F(TowerTest, ConstantsAreConstant) {
    ASSERT_TRUE(tower.build(GiNaC::exp(x), tower_form, reason));
    EXPECT_TRUE(tower.is_constant(GiNaC::log(2) + 3));
    EXPECT_FALSE(tower.is_constant(x));
    EXPECT_FALSE(tower.is_constant(tower[0].var));
}
