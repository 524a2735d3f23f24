#include "polynomial.hpp"
#include <gtest/gtest.h>


class PolynomialTest : public ::testing::Test {
protected:
    GiNaC::realsymbol x{"x"}, a{"a"};
};


TEST_F(PolynomialTest, DegreeAndLeadingCoefficient) {
    EXPECT_EQ(poly_degree(3 * GiNaC::pow(x, 3) + 2 * x, x), 3);
    EXPECT_EQ(poly_degree(a, x), 0);
    EXPECT_EQ(poly_degree(0, x), -1);
    EXPECT_TRUE(poly_lcoeff(a * GiNaC::pow(x, 2) + x, x).is_equal(a));
}


TEST_F(PolynomialTest, MakeMonic) {
    GiNaC::ex monic = make_monic(2 * GiNaC::pow(x, 2) + 4, x);
    EXPECT_TRUE((monic - (GiNaC::pow(x, 2) + 2)).expand().is_zero()) << monic;
}


TEST_F(PolynomialTest, LongDivision) {
    auto quo_rem = generalized_div(GiNaC::pow(x, 3) + 1, x + 1, x);
    EXPECT_TRUE((quo_rem.op(0) - (GiNaC::pow(x, 2) - x + 1)).expand().is_zero()) << quo_rem;
    EXPECT_TRUE(quo_rem.op(1).is_zero());

    quo_rem = generalized_div(GiNaC::pow(x, 2), a * x + 1, x);
    GiNaC::ex check = quo_rem.op(0) * (a * x + 1) + quo_rem.op(1) - GiNaC::pow(x, 2);
    EXPECT_TRUE(check.normal().is_zero()) << quo_rem;
    EXPECT_EQ(poly_degree(quo_rem.op(1), x), 0);
}


TEST_F(PolynomialTest, DivisionByZeroThrows) {
    EXPECT_THROW(generalized_div(x, 0, x), std::invalid_argument);
}


TEST_F(PolynomialTest, GcdIsMonic) {
    GiNaC::ex gcd = generalized_gcd(GiNaC::pow(x, 2) - 1, 2 * GiNaC::pow(x, 2) + 4 * x + 2, x);
    EXPECT_TRUE((gcd - (x + 1)).expand().is_zero()) << gcd;
    EXPECT_TRUE(generalized_gcd(x, x + 1, x).is_equal(1));
}


TEST_F(PolynomialTest, GcdWithParameter) {
    GiNaC::ex gcd = generalized_gcd((x - a) * (x + 1), (x - a) * (x + 2), x);
    EXPECT_TRUE((gcd - (x - a)).expand().is_zero()) << gcd;
}


TEST_F(PolynomialTest, Lcm) {
    GiNaC::ex lcm = generalized_lcm(x * (x + 1), x * (x - 1), x);
    EXPECT_TRUE((lcm - x * (x + 1) * (x - 1)).expand().is_zero()) << lcm;
}


TEST_F(PolynomialTest, ExtendedEuclid) {
    GiNaC::ex s, t;
    GiNaC::ex p1 = GiNaC::pow(x, 2) + 1, p2 = x + 2;
    GiNaC::ex gcd = generalized_gcdex(p1, p2, x, s, t);
    EXPECT_TRUE(gcd.is_equal(1));
    EXPECT_TRUE((s * p1 + t * p2 - gcd).expand().normal().is_zero());
}


TEST_F(PolynomialTest, Diophantine) {
    GiNaC::ex s, t;
    GiNaC::ex p1 = x - 1, p2 = GiNaC::pow(x, 2) + 1, rhs = GiNaC::pow(x, 3) + x;
    ASSERT_TRUE(solve_diophantine(p1, p2, rhs, x, s, t));
    EXPECT_TRUE((s * p1 + t * p2 - rhs).expand().normal().is_zero());
    EXPECT_LT(poly_degree(s, x), 2);
}


TEST_F(PolynomialTest, DiophantineWithoutSolution) {
    GiNaC::ex s, t;
    EXPECT_FALSE(solve_diophantine(x * (x + 1), x * (x - 1), 1, x, s, t));
}


TEST_F(PolynomialTest, SquareFreeDecomposition) {
    GiNaC::ex poly = GiNaC::pow(x + 1, 2) * (x + 2) * GiNaC::pow(x - 3, 3);
    auto factors = square_free_decomposition(poly.expand(), x);

    GiNaC::ex product = 1;
    for (auto& f: factors)
        product *= GiNaC::pow(f.factor, f.multiplicity);
    EXPECT_TRUE((product - poly).expand().is_zero()) << product;

    ASSERT_EQ(factors.size(), 3u);
    EXPECT_EQ(factors[0].multiplicity, 1);
    EXPECT_TRUE((factors[0].factor - (x + 2)).expand().is_zero());
    EXPECT_EQ(factors[1].multiplicity, 2);
    EXPECT_TRUE((factors[1].factor - (x + 1)).expand().is_zero());
    EXPECT_EQ(factors[2].multiplicity, 3);
}


TEST_F(PolynomialTest, Resultant) {
    EXPECT_TRUE(generalized_resultant(GiNaC::pow(x, 2) - 1, x - 1, x).is_zero());
    EXPECT_FALSE(generalized_resultant(GiNaC::pow(x, 2) + 1, x, x).is_zero());
}


TEST_F(PolynomialTest, RationalFunctionCheck) {
    GiNaC::ex numer, denom;
    EXPECT_TRUE(as_rational_function(1 / (x + 1) + x, x, numer, denom));
    EXPECT_TRUE((numer / denom - (1 / (x + 1) + x)).normal().is_zero());
    EXPECT_FALSE(as_rational_function(GiNaC::exp(x), x, numer, denom));
    EXPECT_FALSE(as_rational_function(GiNaC::sqrt(x), x, numer, denom));
}
