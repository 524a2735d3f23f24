#include "hermite.hpp"
#include "logpart.hpp"
#include "rational.hpp"
#include "test_helpers.hpp"


class RationalTest : public ::testing::Test {
protected:
    GiNaC::realsymbol x{"x"}, a{"a"};

    void expect_integrated(const GiNaC::ex& integrand) {
        GiNaC::ex antiderivative;
        ASSERT_TRUE(integrate_rational_function(integrand, x, antiderivative)) << integrand;
        EXPECT_ANTIDERIVATIVE(antiderivative, integrand, x);
    }
};


TEST_F(RationalTest, Polynomial) {
    GiNaC::ex antiderivative;
    ASSERT_TRUE(integrate_rational_function(3 * GiNaC::pow(x, 2) + 2 * x + 1, x, antiderivative));
    EXPECT_TRUE((antiderivative - (GiNaC::pow(x, 3) + GiNaC::pow(x, 2) + x)).expand().is_zero()) << antiderivative;
}


TEST_F(RationalTest, ArctangentTerm) {
    GiNaC::ex antiderivative;
    ASSERT_TRUE(integrate_rational_function(1 / (GiNaC::pow(x, 2) + 1), x, antiderivative));
    EXPECT_TRUE(antiderivative.has(GiNaC::atan(x))) << antiderivative;
    EXPECT_ANTIDERIVATIVE(antiderivative, 1 / (GiNaC::pow(x, 2) + 1), x);
}


TEST_F(RationalTest, LogarithmTerms) {
    expect_integrated(1 / (GiNaC::pow(x, 2) - 1));
    expect_integrated((2 * x + 1) / (x * (x - 3) * (x + 5)));
}


TEST_F(RationalTest, RepeatedFactors) {
    expect_integrated(1 / GiNaC::pow(x + 1, 3));
    expect_integrated(1 / GiNaC::pow(GiNaC::pow(x, 2) + 1, 2));
    expect_integrated((x + 2) / (GiNaC::pow(x, 2) * GiNaC::pow(x - 1, 2)));
}


TEST_F(RationalTest, PolynomialPart) {
    expect_integrated(GiNaC::pow(x, 4) / (GiNaC::pow(x, 2) + 1));
    expect_integrated((GiNaC::pow(x, 3) + 1) / (x - 2));
}


TEST_F(RationalTest, MixedLinearAndQuadratic) {
    expect_integrated(1 / (GiNaC::pow(x, 3) + 1));
}


TEST_F(RationalTest, QuadraticWithNegativeDiscriminant) {
    GiNaC::ex numer = 2 * x + 3, denom = GiNaC::pow(x, 2) + 2 * x + 5, antiderivative;
    ASSERT_TRUE(integrate_quadratic_term(numer, denom, x, antiderivative));
    EXPECT_ANTIDERIVATIVE(antiderivative, numer / denom, x);
    EXPECT_TRUE(antiderivative.has(GiNaC::log(denom)));
    EXPECT_FALSE(antiderivative.has(GiNaC::abs(denom)));
}


TEST_F(RationalTest, QuadraticWithPositiveDiscriminant) {
    GiNaC::ex denom = GiNaC::pow(x, 2) - 2, antiderivative;
    ASSERT_TRUE(integrate_quadratic_term(1, denom, x, antiderivative));
    EXPECT_FALSE(antiderivative.has(GiNaC::atan(GiNaC::wild())));
    EXPECT_ANTIDERIVATIVE(antiderivative, 1 / denom, x);
}


TEST_F(RationalTest, QuadraticWithUndecidableDiscriminant) {
    GiNaC::ex antiderivative;
    EXPECT_FALSE(integrate_quadratic_term(1, GiNaC::pow(x, 2) + a, x, antiderivative));
}


TEST_F(RationalTest, AlgebraicResiduesDecline) {
    GiNaC::ex antiderivative;
    EXPECT_FALSE(integrate_rational_function(1 / (GiNaC::pow(x, 4) + 1), x, antiderivative));
}


TEST_F(RationalTest, NotRational) {
    GiNaC::ex antiderivative;
    EXPECT_FALSE(integrate_rational_function(GiNaC::exp(x) / x, x, antiderivative));
}


TEST_F(RationalTest, HermiteReduction) {
    derivation D = [this](const GiNaC::ex& e) { return e.diff(x); };
    GiNaC::ex denom = GiNaC::pow(GiNaC::pow(x, 2) + 1, 2);
    hermite_result reduced = hermite_reduce(1, denom.expand(), x, D);

    EXPECT_EQ(reduced.simple_denom.expand().degree(x), 2);
    GiNaC::ex check = D(reduced.rational_part) + reduced.simple_numer / reduced.simple_denom - 1 / denom;
    EXPECT_TRUE(check.normal().is_zero()) << reduced.rational_part;
}


TEST_F(RationalTest, LogPartOverRationals) {
    derivation D = [this](const GiNaC::ex& e) { return e.diff(x); };
    auto is_constant = [this](const GiNaC::ex& e) { return !e.has(x); };
    std::vector<log_part_term> terms;
    std::string reason;
    GiNaC::ex numer = 1, denom = GiNaC::pow(x, 3) - x;

    ASSERT_EQ(solve_log_part(numer, denom, x, D, is_constant, terms, reason), log_part_status::SOLVED);
    GiNaC::ex sum = 0;
    for (auto& term: terms)
        sum += term.coefficient * GiNaC::log(term.argument);
    EXPECT_ANTIDERIVATIVE(sum, numer / denom, x);
}


TEST_F(RationalTest, LogPartWithAlgebraicResidues) {
    derivation D = [this](const GiNaC::ex& e) { return e.diff(x); };
    auto is_constant = [this](const GiNaC::ex& e) { return !e.has(x); };
    std::vector<log_part_term> terms;
    std::string reason;
    EXPECT_EQ(solve_log_part(1, GiNaC::pow(x, 4) + 1, x, D, is_constant, terms, reason),
              log_part_status::UNSUPPORTED);
    EXPECT_FALSE(reason.empty());
}


TEST_F(technique_test, TryRationalRecordsDegree) {
    integration_result result;
    ASSERT_TRUE(try_rational(1 / (GiNaC::pow(x, 2) - 4), x, ctx, result));
    EXPECT_EQ(result.method, technique::RATIONAL);
    EXPECT_TRUE(trace_mentions("deg Q = 2"));
}
