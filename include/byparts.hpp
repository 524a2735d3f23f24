#ifndef BYPARTS_HPP
#define BYPARTS_HPP


/**
 * byparts.hpp - Integration by parts with LIATE factor selection.
 *
 * `u` collects the factors of the highest LIATE priority, `dv` the rest.
 * Repeated steps are carried out locally, and an integrand that comes back
 * as a constant multiple of itself (e.g. `exp(x)*sin(x)`) is solved as a
 * linear equation.
 */


#include "options.hpp"
#include <ginac/ginac.h>


/******   LIATE classes, by decreasing priority   ******/
enum class liate_class {
    LOGARITHMIC,        /* log(f), log(f)^n                  */
    INVERSE_TRIG,       /* asin, acos, atan                  */
    ALGEBRAIC,          /* polynomials, x^c for constant c   */
    TRIGONOMETRIC,      /* sin, cos, tan, sinh, cosh, tanh   */
    EXPONENTIAL,        /* exp(a*x+b), c^(a*x+b)             */
    OTHER
};


liate_class classify_factor(const GiNaC::ex& factor, const GiNaC::symbol& var);


/**
 * Choose `u` and `dv` for `expr = u * dv`. With `swapped`, the roles of
 * the highest-priority group and the rest are exchanged. Returns false if
 * no admissible split exists.
 */
bool split_by_parts(const GiNaC::ex& expr, const GiNaC::symbol& var, bool swapped,
                    GiNaC::ex& u, GiNaC::ex& dv);


/**
 * By-parts technique for the dispatcher.
 */
bool try_by_parts(const GiNaC::ex& expr, const GiNaC::symbol& var,
                  integration_context& ctx, integration_result& result);


#endif // BYPARTS_HPP
