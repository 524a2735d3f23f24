#ifndef POLYNOMIAL_HPP
#define POLYNOMIAL_HPP


/**
 * polynomial.hpp - Univariate polynomial arithmetic.
 *
 * Polynomials are ordinary expressions, polynomial in a distinguished
 * variable `var`. Their coefficients may be arbitrary rational expressions
 * in other symbols (parameters, or the lower variables of a differential
 * extension tower). All coefficient arithmetic goes through `normal()`, so
 * a coefficient that vanishes is always recognized as zero.
 */


#include <ginac/ginac.h>
#include <vector>


struct sqrfree_factor {
    GiNaC::ex   factor;
    int         multiplicity;
};


/**
 * Expand `poly` and normalize each coefficient with respect to `var`.
 */
GiNaC::ex canonical_poly(const GiNaC::ex& poly, const GiNaC::symbol& var);


/**
 * Degree of `poly` in `var` after canonicalization; -1 for the zero
 * polynomial.
 */
int poly_degree(const GiNaC::ex& poly, const GiNaC::symbol& var);


/**
 * Leading coefficient of `poly` in `var`.
 */
GiNaC::ex poly_lcoeff(const GiNaC::ex& poly, const GiNaC::symbol& var);


/**
 * Divide `poly` by its leading coefficient in `var`.
 */
GiNaC::ex make_monic(const GiNaC::ex& poly, const GiNaC::symbol& var);


/**
 * Write `expr` as `numer / denom` with `numer`, `denom` polynomial in `var`.
 * Returns false if `expr` is not a rational function of `var`.
 */
bool as_rational_function(const GiNaC::ex& expr, const GiNaC::symbol& var,
                          GiNaC::ex& numer, GiNaC::ex& denom);


/**
 * Compute polynomial division `numer / denom` with respect to variable
 * `var`. Returns a pair (quotient, remainder).
 */
GiNaC::lst generalized_div(const GiNaC::ex& numer, const GiNaC::ex& denom, const GiNaC::symbol& var);


/**
 * Compute the monic polynomial GCD of `p1` and `p2` with respect to
 * variable `var`.
 */
GiNaC::ex generalized_gcd(const GiNaC::ex& p1, const GiNaC::ex& p2, const GiNaC::symbol& var);


/**
 * Compute polynomial LCM of `p1` and `p2` with respect to variable `var`.
 */
GiNaC::ex generalized_lcm(const GiNaC::ex& p1, const GiNaC::ex& p2, const GiNaC::symbol& var);


/**
 * Extended Euclidean algorithm. Returns the monic `g = gcd(a, b)` and sets
 * `s`, `t` such that `s*a + t*b = g`.
 */
GiNaC::ex generalized_gcdex(const GiNaC::ex& a, const GiNaC::ex& b, const GiNaC::symbol& var,
                            GiNaC::ex& s, GiNaC::ex& t);


/**
 * Solve `s*a + t*b = c` for polynomials `s`, `t` with `deg(s) < deg(b)`.
 * Returns false if `gcd(a, b)` does not divide `c`.
 */
bool solve_diophantine(const GiNaC::ex& a, const GiNaC::ex& b, const GiNaC::ex& c,
                       const GiNaC::symbol& var, GiNaC::ex& s, GiNaC::ex& t);


/**
 * Square-free decomposition (Yun). The factors are monic and pairwise
 * coprime, and `poly = lcoeff(poly) * prod(factor^multiplicity)`. Factors
 * of degree zero are omitted.
 */
std::vector<sqrfree_factor> square_free_decomposition(const GiNaC::ex& poly, const GiNaC::symbol& var);


/**
 * Resultant of `p1` and `p2` with respect to `var`. The coefficients may
 * be rational in other symbols and contain non-polynomial constants.
 */
GiNaC::ex generalized_resultant(const GiNaC::ex& p1, const GiNaC::ex& p2, const GiNaC::symbol& var);


#endif // POLYNOMIAL_HPP
