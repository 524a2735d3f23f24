#ifndef ALGEBRA_HPP
#define ALGEBRA_HPP


/**
 * algebra.hpp - Expression-level helpers shared by all integration techniques.
 */


#include <ginac/ginac.h>
#include <vector>


/**
 * Check whether `expr` does not depend on `var`.
 */
bool is_independent(const GiNaC::ex& expr, const GiNaC::symbol& var);


/**
 * Check whether `expr` is an application of the function `name`
 * (e.g. "exp", "log", "sin").
 */
bool is_function(const GiNaC::ex& expr, const char* name);


/**
 * Differentiate `expr` with respect to `var`. `log(abs(u))` is treated as
 * `log(u)`, so that `d/dx log|u| = u'/u`.
 */
GiNaC::ex derivative(const GiNaC::ex& expr, const GiNaC::symbol& var);


/**
 * Remove `abs()` around arguments that are positive definite, e.g.
 * `log(abs(exp(x)+1)) -> log(exp(x)+1)`. Nothing else is rewritten.
 */
GiNaC::ex simplify(const GiNaC::ex& expr);


/**
 * Sign predicates for real-valued expressions. They answer `true` only when
 * the property can be read off the structure; `false` means "unknown".
 */
bool is_positive(const GiNaC::ex& expr);
bool is_nonnegative(const GiNaC::ex& expr);


/**
 * Check whether `lhs` and `rhs` are equal as functions of `var` (and any
 * other symbol they contain). A symbolic zero test is tried first; when it
 * is inconclusive, both sides are evaluated at a handful of sample points.
 */
bool is_equivalent(const GiNaC::ex& lhs, const GiNaC::ex& rhs, const GiNaC::symbol& var);


/**
 * Rewrite sin, cos, tan, sinh, cosh, tanh in terms of `exp`.
 */
GiNaC::ex rewrite_trig_to_exp(const GiNaC::ex& expr);


/**
 * Rewrite `exp(a + I*b)` as `exp(a)*(cos(b) + I*sin(b))`, expand, and
 * return the result. The caller checks whether `I` survived.
 */
GiNaC::ex rewrite_complex_to_trig(const GiNaC::ex& expr);


/**
 * Check whether `expr = slope * var + offset` with `slope != 0` and both
 * independent of `var`.
 */
bool linear_coefficients(const GiNaC::ex& expr, const GiNaC::symbol& var,
                         GiNaC::ex& slope, GiNaC::ex& offset);


/**
 * Split `expr` into `constant * rest`, where `constant` collects every
 * factor independent of `var`.
 */
void split_constant_factor(const GiNaC::ex& expr, const GiNaC::symbol& var,
                           GiNaC::ex& constant, GiNaC::ex& rest);


/**
 * Collect the distinct subexpressions of `expr` that depend on `var`,
 * in preorder. `var` itself and `expr` itself are excluded.
 */
std::vector<GiNaC::ex> collect_subexpressions(const GiNaC::ex& expr, const GiNaC::symbol& var);


/**
 * Count the nodes of `expr`. Used as a rough complexity measure.
 */
int expression_size(const GiNaC::ex& expr);


#endif // ALGEBRA_HPP
