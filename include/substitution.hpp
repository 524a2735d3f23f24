#ifndef SUBSTITUTION_HPP
#define SUBSTITUTION_HPP


/**
 * substitution.hpp - u-substitution.
 *
 * For each composite subexpression `g(x)` of the integrand, try to write
 * the integrand as `f(g(x)) * g'(x)`, integrate `f(u)` and substitute
 * back.
 */


#include "options.hpp"
#include <ginac/ginac.h>


/**
 * Rewrite `expr` as `f(u)` with `expr = f(g) * g'`. Returns false if `x`
 * cannot be eliminated. A linear `g` is substituted only when every
 * function argument of `f(u)` becomes the bare `u`.
 */
bool substitute_composite(const GiNaC::ex& expr, const GiNaC::symbol& var, const GiNaC::ex& g,
                          const GiNaC::symbol& u, GiNaC::ex& reduced);


/**
 * Substitution technique for the dispatcher.
 */
bool try_substitution(const GiNaC::ex& expr, const GiNaC::symbol& var,
                      integration_context& ctx, integration_result& result);


#endif // SUBSTITUTION_HPP
