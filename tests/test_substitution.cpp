#include "substitution.hpp"
#include "test_helpers.hpp"


class SubstitutionTest : public technique_test {
protected:
    void expect_integrated(const GiNaC::ex& integrand) {
        integration_result result;
        ASSERT_TRUE(try_substitution(integrand, x, ctx, result)) << integrand;
        EXPECT_EQ(result.method, technique::SUBSTITUTION);
        EXPECT_ANTIDERIVATIVE(result.value, integrand, x);
    }
};


TEST_F(SubstitutionTest, ComposeWithDerivative) {
    GiNaC::realsymbol u("u");
    GiNaC::ex reduced;
    ASSERT_TRUE(substitute_composite(x * GiNaC::exp(GiNaC::pow(x, 2)), x, GiNaC::pow(x, 2), u, reduced));
    EXPECT_TRUE((reduced - GiNaC::exp(u) / 2).is_zero()) << reduced;
}


TEST_F(SubstitutionTest, ComposeLinearInner) {
    GiNaC::realsymbol u("u");
    GiNaC::ex reduced;
    ASSERT_TRUE(substitute_composite(x * GiNaC::pow(x + 1, 5), x, x + 1, u, reduced));
    EXPECT_TRUE((reduced - (u - 1) * GiNaC::pow(u, 5)).expand().is_zero()) << reduced;
}


TEST_F(SubstitutionTest, LinearInnerKeepsBareArguments) {
    GiNaC::realsymbol u("u");
    GiNaC::ex reduced;
    EXPECT_FALSE(substitute_composite(GiNaC::sin(2 * x) * GiNaC::cos(3 * x), x, 2 * x, u, reduced));
    EXPECT_FALSE(substitute_composite(GiNaC::sin(x + 1) * GiNaC::cos(x - 1), x, x + 1, u, reduced));
    ASSERT_TRUE(substitute_composite(x * GiNaC::sqrt(x + 1), x, x + 1, u, reduced));
    EXPECT_TRUE((reduced - (u - 1) * GiNaC::sqrt(u)).expand().is_zero()) << reduced;
}


TEST_F(SubstitutionTest, NoDerivativeFactor) {
    GiNaC::realsymbol u("u");
    GiNaC::ex reduced;
    EXPECT_FALSE(substitute_composite(GiNaC::exp(GiNaC::pow(x, 2)), x, GiNaC::pow(x, 2), u, reduced));
}


TEST_F(SubstitutionTest, ExponentialQuotient) {
    GiNaC::ex integrand = GiNaC::exp(x) / (GiNaC::exp(x) + 1);
    integration_result result;
    ASSERT_TRUE(try_substitution(integrand, x, ctx, result));
    EXPECT_TRUE(is_equivalent(result.value, GiNaC::log(GiNaC::exp(x) + 1), x)) << result.value;
}


TEST_F(SubstitutionTest, ChainRule) {
    expect_integrated(x * GiNaC::exp(GiNaC::pow(x, 2)));
    expect_integrated(2 * x * GiNaC::cos(GiNaC::pow(x, 2)));
    expect_integrated(GiNaC::cos(x) / (GiNaC::sin(x) + 1));
    expect_integrated(GiNaC::pow(GiNaC::sin(x), 3) * GiNaC::cos(x));
}


TEST_F(SubstitutionTest, LogarithmicInner) {
    expect_integrated(GiNaC::pow(GiNaC::log(x), 3) / x);
}


TEST_F(SubstitutionTest, ShiftedRadicand) {
    expect_integrated(x * GiNaC::sqrt(x + 1));
}


TEST_F(SubstitutionTest, DeclinesProductOfDifferentArguments) {
    integration_result result;
    EXPECT_FALSE(try_substitution(GiNaC::sin(2 * x) * GiNaC::cos(3 * x), x, ctx, result));
    EXPECT_FALSE(trace_mentions("u = "));
}


TEST_F(SubstitutionTest, RecordsChosenSubstitution) {
    integration_result result;
    ASSERT_TRUE(try_substitution(x * GiNaC::exp(GiNaC::pow(x, 2)), x, ctx, result));
    EXPECT_TRUE(trace_mentions("u = "));
}


TEST_F(SubstitutionTest, DeclinesWithoutComposite) {
    integration_result result;
    EXPECT_FALSE(try_substitution(x * GiNaC::exp(x), x, ctx, result));
}
