#ifndef INTEGRATE_HPP
#define INTEGRATE_HPP


/**
 * integrate.hpp - Strategy dispatcher, the entry point of the engine.
 *
 * The dispatcher applies linearity (constants, constant factors, sums)
 * and then tries the techniques in a fixed order: table, rational,
 * by-parts, substitution, trigonometric, Risch. The first technique that
 * produces a result wins. Techniques re-enter the dispatcher through
 * `integrate_nested`, which charges the shared recursion budget.
 */


#include "options.hpp"
#include "result.hpp"
#include <ginac/ginac.h>


/**
 * Integrate `expr` with respect to `var`. Never throws for a well-formed
 * expression; anything undetermined comes back as SYMBOLIC_FALLBACK.
 *
 * @param trace optional record of the techniques tried
 */
integration_result integrate(const GiNaC::ex& expr, const GiNaC::symbol& var,
                             const integration_options& options = integration_options(),
                             integration_trace* trace = nullptr);


/**
 * Re-enter the dispatcher from inside a technique. Takes one unit of
 * budget; falls back immediately when the budget is exhausted.
 */
integration_result integrate_nested(const GiNaC::ex& expr, const GiNaC::symbol& var, integration_context& ctx);


#endif // INTEGRATE_HPP
