#include "byparts.hpp"
#include "test_helpers.hpp"


class ByPartsTest : public technique_test {
protected:
    void expect_integrated(const GiNaC::ex& integrand) {
        integration_result result;
        ASSERT_TRUE(try_by_parts(integrand, x, ctx, result)) << integrand;
        ASSERT_TRUE(result.is_closed_form());
        EXPECT_EQ(result.method, technique::BY_PARTS);
        EXPECT_ANTIDERIVATIVE(result.value, integrand, x);
    }
};


TEST_F(ByPartsTest, LiateClasses) {
    EXPECT_EQ(classify_factor(GiNaC::log(x), x), liate_class::LOGARITHMIC);
    EXPECT_EQ(classify_factor(GiNaC::pow(GiNaC::log(x), 2), x), liate_class::LOGARITHMIC);
    EXPECT_EQ(classify_factor(GiNaC::atan(x), x), liate_class::INVERSE_TRIG);
    EXPECT_EQ(classify_factor(GiNaC::pow(x, 2) + 1, x), liate_class::ALGEBRAIC);
    EXPECT_EQ(classify_factor(GiNaC::sin(2 * x), x), liate_class::TRIGONOMETRIC);
    EXPECT_EQ(classify_factor(GiNaC::exp(3 * x + 1), x), liate_class::EXPONENTIAL);
    EXPECT_EQ(classify_factor(GiNaC::pow(2, x), x), liate_class::EXPONENTIAL);
    EXPECT_EQ(classify_factor(GiNaC::exp(GiNaC::pow(x, 2)), x), liate_class::OTHER);
    EXPECT_EQ(classify_factor(1 / x, x), liate_class::ALGEBRAIC);
    EXPECT_EQ(classify_factor(GiNaC::sqrt(x), x), liate_class::ALGEBRAIC);
    EXPECT_EQ(classify_factor(1 / (x + 1), x), liate_class::OTHER);
}


TEST_F(ByPartsTest, SplitPrefersHigherClass) {
    GiNaC::ex u, dv;
    ASSERT_TRUE(split_by_parts(x * GiNaC::exp(x), x, false, u, dv));
    EXPECT_TRUE(u.is_equal(x));
    EXPECT_TRUE(dv.is_equal(GiNaC::exp(x)));

    ASSERT_TRUE(split_by_parts(x * GiNaC::exp(x), x, true, u, dv));
    EXPECT_TRUE(u.is_equal(GiNaC::exp(x)));
    EXPECT_TRUE(dv.is_equal(x));
}


TEST_F(ByPartsTest, SplitSingleLogarithm) {
    GiNaC::ex u, dv;
    ASSERT_TRUE(split_by_parts(GiNaC::log(x), x, false, u, dv));
    EXPECT_TRUE(dv.is_equal(1));
    EXPECT_FALSE(split_by_parts(GiNaC::exp(x), x, false, u, dv));
    EXPECT_FALSE(split_by_parts(x / (x + 1), x, false, u, dv));
}


TEST_F(ByPartsTest, PolynomialTimesExponential) {
    expect_integrated(GiNaC::pow(x, 3) * GiNaC::exp(x));
    expect_integrated(x * GiNaC::exp(2 * x));
}


TEST_F(ByPartsTest, PolynomialTimesTrigonometric) {
    expect_integrated(x * GiNaC::cos(x));
    expect_integrated(GiNaC::pow(x, 2) * GiNaC::sin(3 * x));
}


TEST_F(ByPartsTest, LogarithmPowers) {
    expect_integrated(GiNaC::pow(GiNaC::log(x), 2));
    expect_integrated(GiNaC::pow(x, 2) * GiNaC::log(x));
}


TEST_F(ByPartsTest, InverseTrigonometric) {
    expect_integrated(x * GiNaC::atan(x));
}


TEST_F(ByPartsTest, NonPolynomialPowerAsDv) {
    GiNaC::ex u, dv;
    ASSERT_TRUE(split_by_parts(GiNaC::atan(x) / GiNaC::pow(x, 2), x, false, u, dv));
    EXPECT_TRUE(u.is_equal(GiNaC::atan(x)));
    EXPECT_FALSE(split_by_parts(GiNaC::atan(x) / GiNaC::pow(x, 2), x, true, u, dv));

    expect_integrated(GiNaC::atan(x) / GiNaC::pow(x, 2));
    expect_integrated(GiNaC::sqrt(x) * GiNaC::log(x));
    expect_integrated(GiNaC::log(x) / GiNaC::pow(x, 3));
}


TEST_F(ByPartsTest, CyclicIntegral) {
    expect_integrated(GiNaC::exp(x) * GiNaC::sin(x));
    EXPECT_TRUE(trace_mentions("solved cyclic integral"));
}


TEST_F(ByPartsTest, CyclicIntegralWithScaledArguments) {
    expect_integrated(GiNaC::exp(2 * x) * GiNaC::cos(3 * x));
}


TEST_F(ByPartsTest, DeclinesUnclassifiedFactor) {
    integration_result result;
    EXPECT_FALSE(try_by_parts(GiNaC::exp(GiNaC::pow(x, 2)) * x, x, ctx, result));
}


TEST_F(ByPartsTest, DeclinesNegativePowerAsU) {
    integration_result result;
    EXPECT_FALSE(try_by_parts(GiNaC::exp(x) / x, x, ctx, result));
    EXPECT_FALSE(try_by_parts(GiNaC::sin(x) / x, x, ctx, result));
}
