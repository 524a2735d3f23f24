#ifndef APART_HPP
#define APART_HPP


/**
 * apart.hpp - Partial fraction expansion.
 */


#include <ginac/ginac.h>
#include <vector>


/**
 * One partial fraction `numer / denom^npower`, where `denom` is an
 * irreducible factor over Q and `deg(numer) < deg(denom)`.
 */
struct parfrac {
    GiNaC::ex   numer;
    GiNaC::ex   denom;
    int         npower;
};


/**
 * Expand `frac` into partial fractions, with respect to variable `var`.
 * The polynomial part of `frac` is stored in `polypart`.
 *
 * @param frac a rational function of `var` with rational coefficients
 * @param var variable to expand over
 * @param polypart receives the quotient of the long division
 */
std::vector<parfrac> parfrac_expansion(const GiNaC::ex& frac, const GiNaC::symbol& var, GiNaC::ex& polypart);


#endif // APART_HPP
