#ifndef RDE_HPP
#define RDE_HPP


/**
 * rde.hpp - Risch differential equation `y' + f*y = g` over Q(x).
 *
 * Only the base field is handled: `f` and `g` are rational functions of
 * `var` (their coefficients may contain parameters and `I`). The solver
 * follows the no-cancellation path: normal denominator, degree bound,
 * then undetermined coefficients.
 */


#include "options.hpp"
#include <ginac/ginac.h>


enum class rde_status {
    SOLVED,             /* y is a rational solution                       */
    NO_SOLUTION,        /* provably no rational solution                  */
    UNSUPPORTED,        /* cancellation case or symbolic degree bound     */
    CANCELLED
};


/**
 * Solve `y' + f*y = g` for a rational function `y` of `var`.
 */
rde_status solve_rde(const GiNaC::ex& f, const GiNaC::ex& g, const GiNaC::symbol& var,
                     GiNaC::ex& y, const cancellation_token* token = nullptr);


#endif // RDE_HPP
