#ifndef RATIONAL_HPP
#define RATIONAL_HPP


/**
 * rational.hpp - Integration of rational functions.
 *
 * Long division, Hermite reduction of the repeated factors, and partial
 * fractions of the square-free remainder. Linear factors give logarithms,
 * irreducible quadratics give a logarithm and an arctangent or a second
 * logarithm, and higher factors go through the Rothstein-Trager solver.
 */


#include "options.hpp"
#include <ginac/ginac.h>


/**
 * Integrate `expr`, a rational function of `var`. Returns false if `expr`
 * is not rational in `var`, or if a part of the result cannot be written
 * without algebraic numbers or an undecidable sign.
 */
bool integrate_rational_function(const GiNaC::ex& expr, const GiNaC::symbol& var, GiNaC::ex& antiderivative);


/**
 * Antiderivative of `(A*x + B) / (a*x^2 + b*x + c)` for an irreducible
 * quadratic. Returns false when the sign of the discriminant is unknown.
 */
bool integrate_quadratic_term(const GiNaC::ex& numer, const GiNaC::ex& denom, const GiNaC::symbol& var,
                              GiNaC::ex& antiderivative);


/**
 * Rational technique for the dispatcher.
 */
bool try_rational(const GiNaC::ex& expr, const GiNaC::symbol& var,
                  integration_context& ctx, integration_result& result);


#endif // RATIONAL_HPP
