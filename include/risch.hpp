#ifndef RISCH_HPP
#define RISCH_HPP


/**
 * risch.hpp - Risch decision procedure for transcendental elementary
 * integrands (exponential and logarithmic towers over Q(x)).
 *
 * Stages: build the extension tower, express the integrand as a rational
 * function of the top variable, Hermite-reduce, solve the logarithmic
 * part, integrate the polynomial part (recursing down the tower, and
 * through the Risch differential equation for exponential monomials),
 * back-substitute.
 *
 * Known gaps: the RDE is only solved over the base field Q(x), and
 * residues must be rational; integrands needing more are declined, never
 * reported as non-elementary.
 */


#include "options.hpp"
#include <ginac/ginac.h>
#include <string>


enum class risch_status {
    INTEGRATED,
    NON_ELEMENTARY,
    UNSUPPORTED,
    CANCELLED
};


struct risch_outcome {
    risch_status    status = risch_status::UNSUPPORTED;
    GiNaC::ex       value;      /* antiderivative when INTEGRATED */
    std::string     reason;     /* otherwise                      */
};


/**
 * Run the Risch procedure on `expr`.
 */
risch_outcome risch_integrate(const GiNaC::ex& expr, const GiNaC::symbol& var, integration_context& ctx);


/**
 * Risch technique for the dispatcher. A non-elementary verdict is a
 * result, not a decline.
 */
bool try_risch(const GiNaC::ex& expr, const GiNaC::symbol& var,
               integration_context& ctx, integration_result& result);


#endif // RISCH_HPP
