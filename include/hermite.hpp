#ifndef HERMITE_HPP
#define HERMITE_HPP


/**
 * hermite.hpp - Hermite reduction over a differential field.
 *
 * The field is k(t) for a distinguished variable `t`, with a derivation
 * `D` on k[t]. For plain rational functions `t` is the integration
 * variable and `D = d/dt`; inside a Risch tower `D` is the total
 * derivation of the tower.
 */


#include <ginac/ginac.h>
#include <functional>


using derivation = std::function<GiNaC::ex(const GiNaC::ex&)>;


/**
 * `numer/denom = D(rational_part) + simple_numer/simple_denom`, where
 * `simple_denom` is square-free.
 */
struct hermite_result {
    GiNaC::ex   rational_part;
    GiNaC::ex   simple_numer;
    GiNaC::ex   simple_denom;
};


/**
 * Hermite reduction (quadratic version) of `numer/denom` with respect to
 * `t`. `deg(numer) < deg(denom)` is expected, and every square-free factor
 * of `denom` must be coprime to its derivative under `D`.
 *
 * Throws std::runtime_error when a factor is not normal.
 */
hermite_result hermite_reduce(const GiNaC::ex& numer, const GiNaC::ex& denom,
                              const GiNaC::symbol& t, const derivation& D);


#endif // HERMITE_HPP
