#include "trigonometric.hpp"
#include "test_helpers.hpp"


class TrigonometricTest : public technique_test {
protected:
    void expect_integrated(const GiNaC::ex& integrand) {
        integration_result result;
        ASSERT_TRUE(try_trigonometric(integrand, x, ctx, result)) << integrand;
        EXPECT_EQ(result.method, technique::TRIGONOMETRIC);
        EXPECT_ANTIDERIVATIVE(result.value, integrand, x);
    }
};


TEST_F(TrigonometricTest, MatchMonomial) {
    trig_monomial m;
    ASSERT_TRUE(match_trig_monomial(GiNaC::pow(GiNaC::sin(2 * x), 3) * GiNaC::pow(GiNaC::cos(2 * x), 2), x, m));
    EXPECT_TRUE(m.argument.is_equal(2 * x));
    EXPECT_EQ(m.sin_power, 3);
    EXPECT_EQ(m.cos_power, 2);

    ASSERT_TRUE(match_trig_monomial(GiNaC::sin(x) / GiNaC::pow(GiNaC::cos(x), 3), x, m));
    EXPECT_EQ(m.sin_power, 1);
    EXPECT_EQ(m.cos_power, -3);
}


TEST_F(TrigonometricTest, MatchRejectsOtherShapes) {
    trig_monomial m;
    EXPECT_FALSE(match_trig_monomial(GiNaC::sin(x) * GiNaC::cos(2 * x), x, m));
    EXPECT_FALSE(match_trig_monomial(x * GiNaC::sin(x), x, m));
    EXPECT_FALSE(match_trig_monomial(GiNaC::sin(GiNaC::pow(x, 2)), x, m));
    EXPECT_FALSE(match_trig_monomial(GiNaC::sqrt(GiNaC::sin(x)), x, m));
}


TEST_F(TrigonometricTest, OddSinePower) {
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 3));
    expect_integrated(GiNaC::pow(GiNaC::sin(3 * x), 5));
    expect_integrated(GiNaC::sin(x) / GiNaC::pow(GiNaC::cos(x), 3));
}


TEST_F(TrigonometricTest, OddCosinePower) {
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 2) * GiNaC::pow(GiNaC::cos(x), 3));
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 3) * GiNaC::cos(x));
    expect_integrated(GiNaC::cos(2 * x) / GiNaC::pow(GiNaC::sin(2 * x), 4));
}


TEST_F(TrigonometricTest, BothPowersOdd) {
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 3) * GiNaC::pow(GiNaC::cos(x), 3));
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 5) * GiNaC::pow(GiNaC::cos(x), 3));
}


TEST_F(TrigonometricTest, EvenPowers) {
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 2) * GiNaC::pow(GiNaC::cos(x), 2));
    expect_integrated(GiNaC::pow(GiNaC::cos(x), 4));
    expect_integrated(GiNaC::pow(GiNaC::sin(2 * x + 1), 4));
    EXPECT_TRUE(trace_mentions("half-angle"));
}


TEST_F(TrigonometricTest, NegativeEvenPowersDecline) {
    integration_result result;
    EXPECT_FALSE(try_trigonometric(GiNaC::pow(GiNaC::sin(x), -2) * GiNaC::pow(GiNaC::cos(x), -2), x, ctx, result));
}


TEST_F(TrigonometricTest, ProductToSum) {
    GiNaC::ex sum;
    ASSERT_TRUE(product_to_sum(GiNaC::sin(2 * x) * GiNaC::cos(3 * x), x, sum));
    EXPECT_TRUE((sum - (GiNaC::sin(5 * x) - GiNaC::sin(x)) / 2).expand().is_zero()) << sum;
    EXPECT_FALSE(product_to_sum(GiNaC::sin(x) * GiNaC::cos(x), x, sum));
    EXPECT_FALSE(product_to_sum(GiNaC::sin(x) * GiNaC::cos(GiNaC::pow(x, 2)), x, sum));
    EXPECT_FALSE(product_to_sum(x * GiNaC::cos(2 * x), x, sum));
}


TEST_F(TrigonometricTest, ProductsOfDifferentArguments) {
    expect_integrated(GiNaC::sin(2 * x) * GiNaC::cos(3 * x));
    expect_integrated(GiNaC::sin(x) * GiNaC::sin(4 * x));
    expect_integrated(3 * GiNaC::cos(x + 1) * GiNaC::cos(2 * x));
    EXPECT_TRUE(trace_mentions("product to sum"));
}
