#include "substitution.hpp"
#include "algebra.hpp"
#include "integrate.hpp"
#include <sstream>


static const int max_candidates = 8;


/**
 * Candidates for `g`, outermost first. Reciprocals are skipped, their
 * base is a candidate of its own.
 */
static std::vector<GiNaC::ex> substitution_candidates(const GiNaC::ex& expr, const GiNaC::symbol& var) {
    std::vector<GiNaC::ex> candidates;
    for (auto& sub: collect_subexpressions(expr, var)) {
        if (GiNaC::is_exactly_a<GiNaC::power>(sub) && GiNaC::is_a<GiNaC::numeric>(sub.op(1))
            && sub.op(1).info(GiNaC::info_flags::negative))
            continue;
        candidates.push_back(sub);
        if ((int)candidates.size() == max_candidates)
            break;
    }
    return candidates;
}


/**
 * True if every function argument and every base of a non-integer power
 * that depends on `u` is `u` itself or another such composite.
 */
static bool bare_arguments(const GiNaC::ex& expr, const GiNaC::symbol& u) {
    for (auto iter = expr.preorder_begin(); iter != expr.preorder_end(); ++iter) {
        const GiNaC::ex& sub = *iter;
        GiNaC::lst inner;
        if (GiNaC::is_a<GiNaC::function>(sub)) {
            for (const auto& arg: sub)
                inner.append(arg);
        } else if (GiNaC::is_exactly_a<GiNaC::power>(sub) && !sub.op(1).info(GiNaC::info_flags::integer)) {
            inner.append(sub.op(0));
            inner.append(sub.op(1));
        }
        for (const auto& arg: inner) {
            if (arg.has(u) && (GiNaC::is_exactly_a<GiNaC::add>(arg) || GiNaC::is_exactly_a<GiNaC::mul>(arg)))
                return false;
        }
    }
    return true;
}


bool substitute_composite(const GiNaC::ex& expr, const GiNaC::symbol& var, const GiNaC::ex& g,
                          const GiNaC::symbol& u, GiNaC::ex& reduced) {
    GiNaC::ex dg = derivative(g, var);
    if (dg.is_zero())
        return false;

    GiNaC::ex quotient = expr / dg;
    reduced = quotient.subs(g == u, GiNaC::subs_options::algebraic);
    if (reduced.has(var))
        reduced = quotient.normal().subs(g == u, GiNaC::subs_options::algebraic);
    if (reduced.has(var)) {
        GiNaC::ex slope, offset;
        if (!linear_coefficients(g, var, slope, offset))
            return false;
        reduced = quotient.subs(var == (u - offset) / slope);
        // every composite argument must become the bare u
        if (!bare_arguments(reduced, u))
            return false;
    }
    return !reduced.has(var);
}


bool try_substitution(const GiNaC::ex& expr, const GiNaC::symbol& var,
                      integration_context& ctx, integration_result& result) {
    GiNaC::ex constant, rest;
    split_constant_factor(expr, var, constant, rest);

    GiNaC::realsymbol u("u");
    GiNaC::ex renamed = rest.subs(var == u);
    for (auto& g: substitution_candidates(rest, var)) {
        if (ctx.budget.exhausted() || ctx.cancelled())
            return false;

        GiNaC::ex reduced;
        if (!substitute_composite(rest, var, g, u, reduced) || reduced.is_equal(renamed))
            continue;

        std::ostringstream message;
        message << "u = " << g << ", integrand " << reduced;
        ctx.note(technique::SUBSTITUTION, message.str());

        integration_result inner = integrate_nested(reduced, u, ctx);
        if (!inner.is_closed_form())
            continue;
        GiNaC::ex antiderivative = simplify(inner.value.subs(u == g));
        result = integration_result::closed_form(constant * antiderivative, technique::SUBSTITUTION);
        return true;
    }
    return false;
}
