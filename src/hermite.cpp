#include "hermite.hpp"
#include "polynomial.hpp"
#include <stdexcept>


hermite_result hermite_reduce(const GiNaC::ex& numer, const GiNaC::ex& denom,
                              const GiNaC::symbol& t, const derivation& D) {
    GiNaC::ex g = 0;
    GiNaC::ex a = canonical_poly(numer, t),
              d = canonical_poly(denom, t);

    for (auto& sqrfree: square_free_decomposition(d, t)) {
        if (sqrfree.multiplicity < 2)
            continue;

        GiNaC::ex v = sqrfree.factor;
        GiNaC::ex u = generalized_div(d, GiNaC::pow(v, sqrfree.multiplicity), t).op(0);
        GiNaC::ex udv = canonical_poly(u * D(v), t);

        for (int j = sqrfree.multiplicity - 1; j >= 1; j--) {
            GiNaC::ex b, c;
            if (!solve_diophantine(udv, v, canonical_poly(-a / j, t), t, b, c))
                throw std::runtime_error("hermite_reduce(): denominator factor is not normal");
            g += b / GiNaC::pow(v, j);
            a = canonical_poly(-j * c - u * D(b), t);
        }
        d = canonical_poly(u * v, t);
    }

    return {g, a, d};
}
