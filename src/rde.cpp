#include "rde.hpp"
#include "polynomial.hpp"
#include <algorithm>
#include <string>


static const int max_degree_bound = 64;


static bool is_cancelled(const cancellation_token* token) {
    return token != nullptr && token->cancelled();
}


/**
 * Degree bound for polynomial solutions of `a*q' + b*q = c`. Returns -1
 * when the bound depends on a symbolic quantity.
 */
static int degree_bound(const GiNaC::ex& a, const GiNaC::ex& b, const GiNaC::ex& c, const GiNaC::symbol& var) {
    int da = poly_degree(a, var), db = poly_degree(b, var), dc = poly_degree(c, var);
    int bound = std::max(0, dc - std::max(db, da - 1));

    if (db == da - 1 && db >= 0) {
        GiNaC::ex alpha = (-poly_lcoeff(b, var) / poly_lcoeff(a, var)).normal();
        if (!GiNaC::is_a<GiNaC::numeric>(alpha))
            return -1;
        if (alpha.info(GiNaC::info_flags::nonnegint))
            bound = std::max(bound, GiNaC::ex_to<GiNaC::numeric>(alpha).to_int());
    }
    return bound;
}


rde_status solve_rde(const GiNaC::ex& f, const GiNaC::ex& g, const GiNaC::symbol& var,
                     GiNaC::ex& y, const cancellation_token* token) {
    if (is_cancelled(token))
        return rde_status::CANCELLED;

    GiNaC::ex fn, fd, gn, gd;
    if (!as_rational_function(f, var, fn, fd) || !as_rational_function(g, var, gn, gd))
        return rde_status::UNSUPPORTED;
    if (gn.is_zero()) {
        y = 0;
        return rde_status::SOLVED;
    }

    // normal denominator: y = q/h
    GiNaC::ex dn = canonical_poly(fd, var), en = canonical_poly(gd, var);
    GiNaC::ex p = generalized_gcd(dn, en, var);
    GiNaC::ex h = generalized_div(generalized_gcd(en, en.diff(var), var),
                                  generalized_gcd(p, p.diff(var), var), var).op(0);
    if (!generalized_div(dn * h * h, en, var).op(1).is_zero())
        return rde_status::NO_SOLUTION;

    GiNaC::ex a = canonical_poly(dn * h, var);
    GiNaC::ex b = canonical_poly((dn * h * f - dn * h.diff(var)).normal(), var);
    GiNaC::ex c = (dn * h * h * g).normal();
    if (!c.is_polynomial(var) || !b.is_polynomial(var))
        return rde_status::UNSUPPORTED;
    c = canonical_poly(c, var);

    int bound = degree_bound(a, b, c, var);
    if (bound < 0 || bound > max_degree_bound)
        return rde_status::UNSUPPORTED;

    // undetermined coefficients
    GiNaC::lst unknowns;
    GiNaC::ex q = 0;
    for (int i = 0; i <= bound; i++) {
        GiNaC::symbol qi("q" + std::to_string(i));
        unknowns.append(qi);
        q += qi * GiNaC::pow(var, i);
    }
    GiNaC::ex residual = (a * q.diff(var) + b * q - c).expand();
    GiNaC::lst eqs;
    for (int k = 0; k <= residual.degree(var); k++) {
        GiNaC::ex coeff = residual.coeff(var, k);
        if (!coeff.is_zero())
            eqs.append(coeff == 0);
    }

    if (is_cancelled(token))
        return rde_status::CANCELLED;

    GiNaC::ex solution = eqs.nops() == 0 ? GiNaC::ex(GiNaC::lst{}) : GiNaC::lsolve(eqs, unknowns);
    if (eqs.nops() > 0 && solution.nops() == 0)
        return rde_status::NO_SOLUTION;

    // free coefficients are set to zero
    GiNaC::exmap free;
    for (const auto& qi: unknowns)
        free[qi] = 0;
    GiNaC::ex qsol = q.subs(solution, GiNaC::subs_options::algebraic).subs(free);

    y = (qsol / h).normal();
    if (!(y.diff(var) + f * y - g).normal().is_zero())
        return rde_status::UNSUPPORTED;
    return rde_status::SOLVED;
}
