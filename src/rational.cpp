#include "rational.hpp"
#include "algebra.hpp"
#include "apart.hpp"
#include "hermite.hpp"
#include "logpart.hpp"
#include "polynomial.hpp"


/**
 * Integrate a polynomial in `var` termwise.
 */
static GiNaC::ex integrate_polynomial(const GiNaC::ex& poly, const GiNaC::symbol& var) {
    GiNaC::ex canon = canonical_poly(poly, var);
    if (canon.is_zero())
        return 0;

    GiNaC::ex result = 0;
    for (int k = 0; k <= canon.degree(var); k++)
        result += canon.coeff(var, k) * GiNaC::pow(var, k + 1) / (k + 1);
    return result;
}


bool integrate_quadratic_term(const GiNaC::ex& numer, const GiNaC::ex& denom, const GiNaC::symbol& var,
                              GiNaC::ex& antiderivative) {
    GiNaC::ex q = canonical_poly(denom, var),
              p = canonical_poly(numer, var);
    GiNaC::ex a = q.coeff(var, 2), b = q.coeff(var, 1), c = q.coeff(var, 0);
    GiNaC::ex A = p.coeff(var, 1), B = p.coeff(var, 0);

    GiNaC::ex delta = (b * b - 4 * a * c).normal();
    int sign = 0;
    if (is_positive(delta))
        sign = 1;
    else if (is_positive((-delta).normal()))
        sign = -1;
    if (sign == 0)
        return false;

    GiNaC::ex log_part = 0;
    if (!A.is_zero()) {
        GiNaC::ex arg = (sign < 0 && is_positive(a)) ? q : GiNaC::abs(q);
        log_part = (A / (2 * a)).normal() * GiNaC::log(arg);
    }

    GiNaC::ex K = (B - A * b / (2 * a)).normal();
    GiNaC::ex lin = 2 * a * var + b;
    GiNaC::ex rest = 0;
    if (!K.is_zero()) {
        if (sign < 0) {
            GiNaC::ex root = GiNaC::sqrt(-delta);
            rest = 2 * K / root * GiNaC::atan(lin / root);
        } else {
            GiNaC::ex root = GiNaC::sqrt(delta);
            rest = K / root * GiNaC::log(GiNaC::abs((lin - root) / (lin + root)));
        }
    }

    antiderivative = log_part + rest;
    return true;
}


/**
 * Integrate `numer/denom` with `denom` square-free and `deg numer < deg denom`.
 */
static bool integrate_simple_part(const GiNaC::ex& numer, const GiNaC::ex& denom, const GiNaC::symbol& var,
                                  GiNaC::ex& antiderivative) {
    GiNaC::ex polypart;
    auto fractions = parfrac_expansion(numer / denom, var, polypart);
    antiderivative = integrate_polynomial(polypart, var);

    derivation D = [&var](const GiNaC::ex& e) { return e.diff(var); };
    auto is_constant = [&var](const GiNaC::ex& e) { return is_independent(e, var); };

    for (auto& frac: fractions) {
        if (frac.npower != 1)
            return false;

        GiNaC::ex factor = canonical_poly(frac.denom, var);
        int deg = factor.degree(var);
        if (deg == 1) {
            GiNaC::ex slope = factor.coeff(var, 1);
            antiderivative += (frac.numer / slope).normal() * GiNaC::log(GiNaC::abs(factor));
        } else if (deg == 2) {
            GiNaC::ex term;
            if (!integrate_quadratic_term(frac.numer, factor, var, term))
                return false;
            antiderivative += term;
        } else {
            std::vector<log_part_term> terms;
            std::string reason;
            if (solve_log_part(frac.numer, factor, var, D, is_constant, terms, reason) != log_part_status::SOLVED)
                return false;
            for (auto& term: terms)
                antiderivative += term.coefficient * GiNaC::log(GiNaC::abs(term.argument));
        }
    }
    return true;
}


bool integrate_rational_function(const GiNaC::ex& expr, const GiNaC::symbol& var, GiNaC::ex& antiderivative) {
    GiNaC::ex numer, denom;
    if (!as_rational_function(expr, var, numer, denom))
        return false;

    auto quo_rem = generalized_div(numer, denom, var);
    antiderivative = integrate_polynomial(quo_rem.op(0), var);
    if (quo_rem.op(1).is_zero())
        return true;

    derivation D = [&var](const GiNaC::ex& e) { return e.diff(var); };
    hermite_result reduced = hermite_reduce(quo_rem.op(1), denom, var, D);
    antiderivative += reduced.rational_part;
    if (reduced.simple_numer.is_zero())
        return true;

    GiNaC::ex simple;
    if (!integrate_simple_part(reduced.simple_numer, reduced.simple_denom, var, simple))
        return false;
    antiderivative += simple;
    return true;
}


bool try_rational(const GiNaC::ex& expr, const GiNaC::symbol& var,
                  integration_context& ctx, integration_result& result) {
    GiNaC::ex numer, denom;
    if (!as_rational_function(expr, var, numer, denom))
        return false;

    GiNaC::ex antiderivative;
    if (!integrate_rational_function(expr, var, antiderivative)) {
        ctx.note(technique::RATIONAL, "declined: log part needs algebraic numbers or an undecidable sign");
        return false;
    }
    ctx.note(technique::RATIONAL, "integrated P/Q with deg Q = " + std::to_string(denom.degree(var)));
    result = integration_result::closed_form(antiderivative, technique::RATIONAL);
    return true;
}
