#ifndef LOGPART_HPP
#define LOGPART_HPP


/**
 * logpart.hpp - Logarithmic part of a reduced integrand (Rothstein-Trager).
 */


#include "hermite.hpp"
#include <ginac/ginac.h>
#include <string>
#include <vector>


enum class log_part_status {
    SOLVED,             /* terms hold the full logarithmic part          */
    NON_ELEMENTARY,     /* the resultant has a non-constant root         */
    UNSUPPORTED         /* residues lie in an algebraic extension        */
};


/**
 * One summand `coefficient * log(argument)`.
 */
struct log_part_term {
    GiNaC::ex   coefficient;
    GiNaC::ex   argument;
};


/**
 * Find the logarithmic part of `numer/denom`, with `denom` square-free and
 * normal and `deg(numer) < deg(denom)` in `t`. The residues are the roots
 * of `R(z) = res_t(denom, numer - z*D(denom))`; each root `c` contributes
 * `c * log(gcd(numer - c*D(denom), denom))`.
 *
 * @param is_constant decides whether an expression is a constant of `D`
 * @param reason receives a short explanation unless SOLVED
 */
log_part_status solve_log_part(const GiNaC::ex& numer, const GiNaC::ex& denom,
                               const GiNaC::symbol& t, const derivation& D,
                               const std::function<bool(const GiNaC::ex&)>& is_constant,
                               std::vector<log_part_term>& terms, std::string& reason);


#endif // LOGPART_HPP
