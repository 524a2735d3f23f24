#ifndef TRIGONOMETRIC_HPP
#define TRIGONOMETRIC_HPP


/**
 * trigonometric.hpp - Products `sin(L)^k * cos(L)^n` with `L = a*x + b`.
 *
 * Odd `k > 0` substitutes `u = cos(L)`, odd `n > 0` substitutes
 * `u = sin(L)`; when both are odd the smaller power is peeled off. Even
 * nonnegative powers are lowered with the half-angle identities and the
 * result is dispatched again. A product of a sine or cosine of one linear
 * argument with a sine or cosine of another is turned into a sum.
 */


#include "options.hpp"
#include <ginac/ginac.h>


struct trig_monomial {
    GiNaC::ex   argument;       /* L */
    int         sin_power;      /* k */
    int         cos_power;      /* n */
};


/**
 * Recognize `expr` as `sin(L)^k * cos(L)^n`, `L` linear in `var`.
 */
bool match_trig_monomial(const GiNaC::ex& expr, const GiNaC::symbol& var, trig_monomial& monomial);


/**
 * Rewrite `sin(A)*cos(B)`, `sin(A)*sin(B)` or `cos(A)*cos(B)`, with
 * distinct `A` and `B` linear in `var`, as a sum of sines or cosines.
 */
bool product_to_sum(const GiNaC::ex& expr, const GiNaC::symbol& var, GiNaC::ex& sum);


/**
 * Trigonometric technique for the dispatcher.
 */
bool try_trigonometric(const GiNaC::ex& expr, const GiNaC::symbol& var,
                       integration_context& ctx, integration_result& result);


#endif // TRIGONOMETRIC_HPP
