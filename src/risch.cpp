#include "risch.hpp"
#include "algebra.hpp"
#include "hermite.hpp"
#include "logpart.hpp"
#include "polynomial.hpp"
#include "rational.hpp"
#include "rde.hpp"
#include "tower.hpp"
#include <sstream>
#include <vector>


static std::string to_string(const GiNaC::ex& e) {
    std::ostringstream out;
    out << e;
    return out.str();
}


/**
 * Check whether `e` contains a logarithm or an arctangent.
 */
static bool has_log_like(const GiNaC::ex& e) {
    for (auto iter = e.preorder_begin(); iter != e.preorder_end(); ++iter) {
        if (is_function(*iter, "log") || is_function(*iter, "atan"))
            return true;
    }
    return false;
}


/**
 * Append `coefficient == 0` for every monomial coefficient of `poly` in
 * the variables `vars[idx..]`.
 */
static void collect_coefficients(const GiNaC::ex& poly, const std::vector<GiNaC::symbol>& vars,
                                 size_t idx, GiNaC::lst& eqs) {
    if (idx == vars.size()) {
        if (!poly.is_zero())
            eqs.append(poly == 0);
        return;
    }
    const GiNaC::symbol& v = vars[idx];
    for (int d = poly.ldegree(v); d <= poly.degree(v); d++)
        collect_coefficients(poly.coeff(v, d).expand(), vars, idx + 1, eqs);
}


/**
 * Integration of a tower-form integrand, one level at a time. Level 0 is
 * Q(x); level `i` adds the `i`-th tower variable.
 */
class risch_integrator {
public:
    risch_integrator(const extension_tower& tower, integration_context& ctx) : tower(tower), ctx(ctx) {}

    risch_status integrate(const GiNaC::ex& f, int level, GiNaC::ex& result);
    const std::string& reason() const { return why; }

private:
    const extension_tower& tower;
    integration_context& ctx;
    std::string why;

    risch_status fail(risch_status status, const std::string& message) {
        why = message;
        return status;
    }

    risch_status integrate_laurent(const GiNaC::ex& p, int level, GiNaC::ex& result);
    risch_status integrate_primitive(const GiNaC::ex& p, int level, GiNaC::ex& result);
    risch_status limited_integrate(const GiNaC::ex& a, int level, GiNaC::ex& b, GiNaC::ex& c);
    bool in_base_field(const GiNaC::ex& e) const;
};


bool risch_integrator::in_base_field(const GiNaC::ex& e) const {
    for (int i = 0; i < tower.size(); i++) {
        if (e.has(tower[i].var))
            return false;
    }
    return true;
}


risch_status risch_integrator::integrate(const GiNaC::ex& f, int level, GiNaC::ex& result) {
    if (ctx.cancelled())
        return fail(risch_status::CANCELLED, "cancelled");

    const GiNaC::symbol& x = tower.base_variable();
    if (level == 0) {
        if (!integrate_rational_function(f, x, result))
            return fail(risch_status::UNSUPPORTED, "rational part of " + to_string(f) + " needs algebraic numbers");
        return risch_status::INTEGRATED;
    }

    const extension& ext = tower[level - 1];
    const GiNaC::symbol& t = ext.var;
    derivation D = [this](const GiNaC::ex& e) { return tower.derive(e); };

    GiNaC::ex numer, denom;
    if (!as_rational_function(f, t, numer, denom))
        return fail(risch_status::UNSUPPORTED, to_string(f) + " is not rational in " + to_string(t));

    // polynomial (exponential case: Laurent polynomial) part and proper part
    GiNaC::ex poly_part = 0, simple_numer, simple_denom;
    if (ext.kind == extension_kind::EXPONENTIAL) {
        GiNaC::ex d = canonical_poly(denom, t);
        int m = d.ldegree(t);
        GiNaC::ex d0 = canonical_poly(d / GiNaC::pow(t, m), t);
        GiNaC::ex rest = numer;
        if (m > 0) {
            GiNaC::ex s, r;
            if (!solve_diophantine(d0, GiNaC::pow(t, m), numer, t, s, r))
                return fail(risch_status::UNSUPPORTED, "cannot split the Laurent part");
            poly_part = s / GiNaC::pow(t, m);
            rest = r;
        }
        auto quo_rem = generalized_div(rest, d0, t);
        poly_part += quo_rem.op(0);
        simple_numer = quo_rem.op(1);
        simple_denom = d0;
    } else {
        auto quo_rem = generalized_div(numer, denom, t);
        poly_part = quo_rem.op(0);
        simple_numer = quo_rem.op(1);
        simple_denom = denom;
    }

    GiNaC::ex rational_part = 0, log_part = 0;
    if (!simple_numer.is_zero()) {
        hermite_result reduced = hermite_reduce(simple_numer, simple_denom, t, D);
        rational_part = reduced.rational_part;
        ctx.note(technique::RISCH, "HermiteReduce: " + to_string(t) + "-denominator " + to_string(reduced.simple_denom));

        auto quo_rem = generalized_div(reduced.simple_numer, reduced.simple_denom, t);
        poly_part += quo_rem.op(0);
        GiNaC::ex a = quo_rem.op(1), s = reduced.simple_denom;

        if (!a.is_zero()) {
            std::vector<log_part_term> terms;
            std::string reason;
            auto is_constant = [this](const GiNaC::ex& e) { return tower.is_constant(e); };
            switch (solve_log_part(a, s, t, D, is_constant, terms, reason)) {
            case log_part_status::NON_ELEMENTARY:
                return fail(risch_status::NON_ELEMENTARY, reason);
            case log_part_status::UNSUPPORTED:
                return fail(risch_status::UNSUPPORTED, reason);
            case log_part_status::SOLVED:
                break;
            }
            ctx.note(technique::RISCH, "SolveLogarithmicPart: " + std::to_string(terms.size()) + " logarithm(s)");

            GiNaC::ex leftover = a / s;
            for (auto& term: terms) {
                log_part += term.coefficient * GiNaC::log(term.argument);
                leftover -= term.coefficient * D(term.argument) / term.argument;
            }
            GiNaC::ex left_numer, left_denom;
            if (!as_rational_function(leftover, t, left_numer, left_denom))
                return fail(risch_status::UNSUPPORTED, "logarithmic part is incomplete");
            GiNaC::ex canon = canonical_poly(left_denom, t);
            bool reduced_ok = ext.kind == extension_kind::EXPONENTIAL
                ? canon.degree(t) == canon.ldegree(t) : canon.degree(t) == 0;
            if (!reduced_ok)
                return fail(risch_status::UNSUPPORTED, "logarithmic part is incomplete");
            poly_part += left_numer / left_denom;
        }
    }

    GiNaC::ex poly_result;
    risch_status status = ext.kind == extension_kind::EXPONENTIAL
        ? integrate_laurent(poly_part, level, poly_result)
        : integrate_primitive(poly_part, level, poly_result);
    if (status != risch_status::INTEGRATED)
        return status;

    result = rational_part + log_part + poly_result;
    return risch_status::INTEGRATED;
}


risch_status risch_integrator::integrate_laurent(const GiNaC::ex& p, int level, GiNaC::ex& result) {
    const extension& ext = tower[level - 1];
    const GiNaC::symbol& t = ext.var;
    const GiNaC::symbol& x = tower.base_variable();

    result = 0;
    GiNaC::ex laurent = canonical_poly(p, t);
    if (laurent.is_zero())
        return risch_status::INTEGRATED;

    GiNaC::ex eta_prime = tower.derive(ext.argument);
    for (int k = laurent.ldegree(t); k <= laurent.degree(t); k++) {
        GiNaC::ex coeff = laurent.coeff(t, k);
        if (coeff.is_zero())
            continue;

        if (k == 0) {
            GiNaC::ex part;
            risch_status status = integrate(coeff, level - 1, part);
            if (status != risch_status::INTEGRATED)
                return status;
            result += part;
            continue;
        }

        // D(y*t^k) = (y' + k*eta'*y) * t^k
        GiNaC::ex f = k * eta_prime;
        if (!in_base_field(f) || !in_base_field(coeff))
            return fail(risch_status::UNSUPPORTED, "Risch differential equation over a transcendental extension");

        GiNaC::ex y;
        switch (solve_rde(f, coeff, x, y, ctx.token)) {
        case rde_status::SOLVED:
            result += y * GiNaC::pow(t, k);
            break;
        case rde_status::NO_SOLUTION:
            return fail(risch_status::NON_ELEMENTARY,
                        "y' + (" + to_string(f) + ")*y = " + to_string(coeff) + " has no rational solution");
        case rde_status::UNSUPPORTED:
            return fail(risch_status::UNSUPPORTED, "Risch differential equation needs the cancellation case");
        case rde_status::CANCELLED:
            return fail(risch_status::CANCELLED, "cancelled");
        }
    }
    return risch_status::INTEGRATED;
}


risch_status risch_integrator::integrate_primitive(const GiNaC::ex& p, int level, GiNaC::ex& result) {
    const GiNaC::symbol& t = tower[level - 1].var;

    result = 0;
    GiNaC::ex poly = canonical_poly(p, t);
    while (poly_degree(poly, t) >= 1) {
        if (ctx.cancelled())
            return fail(risch_status::CANCELLED, "cancelled");

        int m = poly.degree(t);
        GiNaC::ex b, c;
        risch_status status = limited_integrate(poly.coeff(t, m), level, b, c);
        if (status != risch_status::INTEGRATED)
            return status;

        GiNaC::ex q0 = c * GiNaC::pow(t, m + 1) / (m + 1) + b * GiNaC::pow(t, m);
        result += q0;
        GiNaC::ex next = canonical_poly(poly - tower.derive(q0), t);
        if (poly_degree(next, t) >= m)
            return fail(risch_status::UNSUPPORTED, "leading coefficient did not cancel");
        poly = next;
    }

    if (!poly.is_zero()) {
        GiNaC::ex part;
        risch_status status = integrate(poly, level - 1, part);
        if (status != risch_status::INTEGRATED)
            return status;
        result += part;
    }
    return risch_status::INTEGRATED;
}


/**
 * Find `b` in the level below and a constant `c` with `a = D(b) + c*Dt`,
 * `t` the variable of `level`. The integral of `a` is computed one level
 * down; its logarithms must combine into constant multiples of the
 * logarithmic tower variables up to `t`.
 */
risch_status risch_integrator::limited_integrate(const GiNaC::ex& a, int level, GiNaC::ex& b, GiNaC::ex& c) {
    GiNaC::ex integral;
    risch_status status = integrate(a, level - 1, integral);
    if (status != risch_status::INTEGRATED)
        return status;

    GiNaC::ex expanded = integral.expand();
    GiNaC::lst terms;
    if (GiNaC::is_exactly_a<GiNaC::add>(expanded)) {
        for (const auto& term: expanded)
            terms.append(term);
    } else {
        terms.append(expanded);
    }

    GiNaC::ex logs = 0, rest = 0;
    for (const auto& term: terms) {
        if (!has_log_like(term)) {
            rest += term;
            continue;
        }
        GiNaC::ex constant, function;
        split_constant_factor(term, tower.base_variable(), constant, function);
        if (!tower.is_constant(constant) || !(is_function(function, "log") || is_function(function, "atan")))
            return fail(risch_status::UNSUPPORTED, "logarithm with a non-constant coefficient");
        logs += term;
    }

    b = rest;
    c = 0;
    if (logs.is_zero())
        return risch_status::INTEGRATED;

    // logs = sum(k_j * t_j) + constant, t_j logarithmic with j <= level
    GiNaC::lst unknowns;
    std::vector<GiNaC::symbol> vars = {tower.base_variable()};
    GiNaC::ex combination = 0;
    for (int i = 0; i < tower.size(); i++) {
        vars.push_back(tower[i].var);
        if (i >= level || tower[i].kind != extension_kind::LOGARITHMIC)
            continue;
        GiNaC::symbol k("k" + std::to_string(i + 1));
        unknowns.append(k);
        combination += k * tower[i].var;
    }

    GiNaC::ex residual = (tower.derive(logs) - tower.derive(combination)).normal().numer().expand();
    for (auto& v: vars) {
        if (!residual.is_polynomial(v))
            return fail(risch_status::UNSUPPORTED, "logarithmic part is not rational");
    }
    GiNaC::lst eqs;
    collect_coefficients(residual, vars, 0, eqs);

    GiNaC::ex solution = GiNaC::lst{};
    if (eqs.nops() > 0) {
        if (unknowns.nops() == 0)
            return fail(risch_status::NON_ELEMENTARY, "integral of " + to_string(a) + " needs a new logarithm");
        solution = GiNaC::lsolve(eqs, unknowns);
        if (solution.nops() == 0)
            return fail(risch_status::NON_ELEMENTARY, "integral of " + to_string(a) + " needs a new logarithm");
    }

    GiNaC::exmap free;
    for (const auto& k: unknowns)
        free[k] = 0;
    GiNaC::ex resolved = combination.subs(solution, GiNaC::subs_options::algebraic).subs(free);

    const GiNaC::symbol& t = tower[level - 1].var;
    c = resolved.coeff(t, 1);
    b = rest + resolved.coeff(t, 0);
    return risch_status::INTEGRATED;
}


risch_outcome risch_integrate(const GiNaC::ex& expr, const GiNaC::symbol& var, integration_context& ctx) {
    risch_outcome outcome;
    if (ctx.cancelled()) {
        outcome.status = risch_status::CANCELLED;
        outcome.reason = "cancelled";
        return outcome;
    }

    extension_tower tower(var);
    GiNaC::ex tower_form;
    if (!tower.build(expr, tower_form, outcome.reason)) {
        ctx.note(technique::RISCH, "BuildTower: " + outcome.reason);
        outcome.status = risch_status::UNSUPPORTED;
        return outcome;
    }
    std::ostringstream description;
    description << tower;
    ctx.note(technique::RISCH, "BuildTower: " + (tower.size() > 0 ? description.str() : "no extensions"));
    ctx.note(technique::RISCH, "ExpressAsRational: " + to_string(tower_form));

    risch_integrator integrator(tower, ctx);
    GiNaC::ex value;
    outcome.status = integrator.integrate(tower_form, tower.size(), value);
    if (outcome.status != risch_status::INTEGRATED) {
        outcome.reason = integrator.reason();
        return outcome;
    }

    GiNaC::ex antiderivative = simplify(tower.back_substitute(value));
    if (tower.uses_complex()) {
        antiderivative = rewrite_complex_to_trig(antiderivative);
        if (antiderivative.has(GiNaC::I))
            antiderivative = antiderivative.normal();
        if (antiderivative.has(GiNaC::I)) {
            outcome.status = risch_status::UNSUPPORTED;
            outcome.reason = "antiderivative needs complex logarithms";
            return outcome;
        }
    }
    ctx.note(technique::RISCH, "BackSubstitute: " + to_string(antiderivative));

    if (!is_equivalent(derivative(antiderivative, var), expr, var)) {
        outcome.status = risch_status::UNSUPPORTED;
        outcome.reason = "antiderivative failed the derivative check";
        return outcome;
    }
    outcome.value = antiderivative;
    return outcome;
}


bool try_risch(const GiNaC::ex& expr, const GiNaC::symbol& var,
               integration_context& ctx, integration_result& result) {
    if (!ctx.options.risch_enabled)
        return false;

    risch_outcome outcome = risch_integrate(expr, var, ctx);
    switch (outcome.status) {
    case risch_status::INTEGRATED:
        result = integration_result::closed_form(outcome.value, technique::RISCH);
        return true;
    case risch_status::NON_ELEMENTARY:
        ctx.note(technique::RISCH, "non-elementary: " + outcome.reason);
        result = integration_result::non_elementary(expr, var, outcome.reason);
        return true;
    case risch_status::CANCELLED:
        ctx.note(technique::RISCH, "cancelled");
        result = integration_result::fallback(expr, var, true);
        return true;
    case risch_status::UNSUPPORTED:
        ctx.note(technique::RISCH, "declined: " + outcome.reason);
        return false;
    }
    return false;
}
