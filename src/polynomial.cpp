#include "polynomial.hpp"
#include <stdexcept>


GiNaC::ex canonical_poly(const GiNaC::ex& poly, const GiNaC::symbol& var) {
    GiNaC::ex expanded = poly.expand();
    if (expanded.is_zero())
        return 0;

    int hi = expanded.degree(var), lo = expanded.ldegree(var);
    GiNaC::ex result = 0;
    for (int k = lo; k <= hi; k++) {
        GiNaC::ex coeff = expanded.coeff(var, k).normal();
        if (!coeff.is_zero())
            result += coeff * GiNaC::pow(var, k);
    }
    return result;
}


int poly_degree(const GiNaC::ex& poly, const GiNaC::symbol& var) {
    GiNaC::ex canon = canonical_poly(poly, var);
    if (canon.is_zero())
        return -1;
    return canon.degree(var);
}


GiNaC::ex poly_lcoeff(const GiNaC::ex& poly, const GiNaC::symbol& var) {
    GiNaC::ex canon = canonical_poly(poly, var);
    if (canon.is_zero())
        return 0;
    return canon.coeff(var, canon.degree(var));
}


GiNaC::ex make_monic(const GiNaC::ex& poly, const GiNaC::symbol& var) {
    GiNaC::ex lc = poly_lcoeff(poly, var);
    if (lc.is_zero())
        return 0;
    return canonical_poly(poly / lc, var);
}


bool as_rational_function(const GiNaC::ex& expr, const GiNaC::symbol& var,
                          GiNaC::ex& numer, GiNaC::ex& denom) {
    GiNaC::ex numer_denom = expr.normal().numer_denom();
    numer = numer_denom.op(0).expand();
    denom = numer_denom.op(1).expand();
    return numer.is_polynomial(var) && denom.is_polynomial(var);
}


GiNaC::lst generalized_div(const GiNaC::ex& numer, const GiNaC::ex& denom, const GiNaC::symbol& var) {
    GiNaC::ex rem = canonical_poly(numer, var),
              div = canonical_poly(denom, var);
    if (div.is_zero())
        throw std::invalid_argument("generalized_div(): division by zero polynomial");

    int div_deg = div.degree(var);
    GiNaC::ex lc = div.coeff(var, div_deg);
    if (div_deg == 0)
        return GiNaC::lst{canonical_poly(rem / lc, var), 0};

    GiNaC::ex quo = 0;
    while (!rem.is_zero() && rem.degree(var) >= div_deg) {
        int rem_deg = rem.degree(var);
        GiNaC::ex term = (rem.coeff(var, rem_deg) / lc).normal() * GiNaC::pow(var, rem_deg - div_deg);
        quo += term;
        rem = canonical_poly(rem - term * div, var);
    }
    return GiNaC::lst{canonical_poly(quo, var), rem};
}


GiNaC::ex generalized_gcd(const GiNaC::ex& p1, const GiNaC::ex& p2, const GiNaC::symbol& var) {
    GiNaC::ex r0 = canonical_poly(p1, var),
              r1 = canonical_poly(p2, var);
    while (!r1.is_zero()) {
        GiNaC::ex r2 = generalized_div(r0, r1, var).op(1);
        r0 = r1;
        r1 = r2;
    }
    if (r0.is_zero())
        return 0;
    return make_monic(r0, var);
}


GiNaC::ex generalized_lcm(const GiNaC::ex& p1, const GiNaC::ex& p2, const GiNaC::symbol& var) {
    GiNaC::ex gcd = generalized_gcd(p1, p2, var);
    if (gcd.is_zero())
        return 0;
    return make_monic(generalized_div(p1 * p2, gcd, var).op(0), var);
}


GiNaC::ex generalized_gcdex(const GiNaC::ex& a, const GiNaC::ex& b, const GiNaC::symbol& var,
                            GiNaC::ex& s, GiNaC::ex& t) {
    GiNaC::ex r0 = canonical_poly(a, var), r1 = canonical_poly(b, var);
    GiNaC::ex s0 = 1, s1 = 0, t0 = 0, t1 = 1;

    while (!r1.is_zero()) {
        auto quo_rem = generalized_div(r0, r1, var);
        GiNaC::ex quo = quo_rem.op(0);
        GiNaC::ex s2 = canonical_poly(s0 - quo * s1, var),
                  t2 = canonical_poly(t0 - quo * t1, var);
        r0 = r1;
        r1 = quo_rem.op(1);
        s0 = s1;
        s1 = s2;
        t0 = t1;
        t1 = t2;
    }

    if (r0.is_zero()) {
        s = 0;
        t = 0;
        return 0;
    }
    GiNaC::ex lc = r0.coeff(var, r0.degree(var));
    s = canonical_poly(s0 / lc, var);
    t = canonical_poly(t0 / lc, var);
    return canonical_poly(r0 / lc, var);
}


bool solve_diophantine(const GiNaC::ex& a, const GiNaC::ex& b, const GiNaC::ex& c,
                       const GiNaC::symbol& var, GiNaC::ex& s, GiNaC::ex& t) {
    GiNaC::ex b_canon = canonical_poly(b, var);
    if (b_canon.is_zero())
        return false;
    if (b_canon.degree(var) == 0) {
        s = 0;
        t = canonical_poly(c / b_canon, var);
        return true;
    }

    GiNaC::ex s0, t0;
    GiNaC::ex gcd = generalized_gcdex(a, b_canon, var, s0, t0);
    auto scale = generalized_div(c, gcd, var);
    if (!scale.op(1).is_zero())
        return false;

    auto reduced = generalized_div(s0 * scale.op(0), b_canon, var);
    s = reduced.op(1);
    t = canonical_poly(t0 * scale.op(0) + reduced.op(0) * a, var);
    return true;
}


std::vector<sqrfree_factor> square_free_decomposition(const GiNaC::ex& poly, const GiNaC::symbol& var) {
    std::vector<sqrfree_factor> factors;
    GiNaC::ex a = make_monic(poly, var);
    if (a.is_zero() || a.degree(var) == 0)
        return factors;

    GiNaC::ex b = a.diff(var);
    GiNaC::ex c = generalized_gcd(a, b, var);
    GiNaC::ex w = generalized_div(a, c, var).op(0),
              y = generalized_div(b, c, var).op(0);
    GiNaC::ex z = canonical_poly(y - w.diff(var), var);

    int multiplicity = 1;
    while (w.degree(var) > 0) {
        GiNaC::ex g = generalized_gcd(w, z, var);
        if (g.degree(var) > 0)
            factors.push_back({g, multiplicity});
        w = generalized_div(w, g, var).op(0);
        y = generalized_div(z, g, var).op(0);
        z = canonical_poly(y - w.diff(var), var);
        multiplicity++;
    }
    return factors;
}


GiNaC::ex generalized_resultant(const GiNaC::ex& p1, const GiNaC::ex& p2, const GiNaC::symbol& var) {
    GiNaC::ex nd1 = p1.normal().numer_denom(),
              nd2 = p2.normal().numer_denom();
    GiNaC::ex numer1 = nd1.op(0).expand(), numer2 = nd2.op(0).expand();
    int deg1 = numer1.degree(var), deg2 = numer2.degree(var);

    if (deg1 == 0 || deg2 == 0)
        return (GiNaC::pow(p1, deg2) * GiNaC::pow(p2, deg1)).normal();

    GiNaC::exmap repl;
    GiNaC::ex poly1 = numer1.to_polynomial(repl),
              poly2 = numer2.to_polynomial(repl);
    GiNaC::ex res = GiNaC::resultant(poly1, poly2, var).subs(repl);
    return (res / (GiNaC::pow(nd1.op(1), deg2) * GiNaC::pow(nd2.op(1), deg1))).normal();
}
