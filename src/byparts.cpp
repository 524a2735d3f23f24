#include "byparts.hpp"
#include "algebra.hpp"
#include "integrate.hpp"
#include <sstream>
#include <vector>


static const int max_local_steps = 6;


static bool has_linear_argument(const GiNaC::ex& func, const GiNaC::symbol& var) {
    GiNaC::ex slope, offset;
    return linear_coefficients(func.op(0), var, slope, offset);
}


/**
 * `var^c` with a constant exponent that is not a nonnegative integer.
 */
static bool is_variable_power(const GiNaC::ex& factor, const GiNaC::symbol& var) {
    return GiNaC::is_exactly_a<GiNaC::power>(factor) && factor.op(0).is_equal(var)
        && is_independent(factor.op(1), var) && !factor.op(1).info(GiNaC::info_flags::nonnegint);
}


liate_class classify_factor(const GiNaC::ex& factor, const GiNaC::symbol& var) {
    GiNaC::ex base = factor;
    bool positive_power = true;
    if (GiNaC::is_exactly_a<GiNaC::power>(factor) && is_independent(factor.op(1), var)) {
        base = factor.op(0);
        positive_power = factor.op(1).info(GiNaC::info_flags::posint);
    }

    if (factor.is_polynomial(var) || is_variable_power(factor, var))
        return liate_class::ALGEBRAIC;
    if (is_function(base, "log") && positive_power)
        return liate_class::LOGARITHMIC;
    if ((is_function(base, "asin") || is_function(base, "acos") || is_function(base, "atan"))
        && base.is_equal(factor))
        return liate_class::INVERSE_TRIG;

    static const char* trig_names[] = {"sin", "cos", "tan", "sinh", "cosh", "tanh"};
    for (auto name: trig_names) {
        if (is_function(base, name) && positive_power && has_linear_argument(base, var))
            return liate_class::TRIGONOMETRIC;
    }

    if (is_function(factor, "exp") && has_linear_argument(factor, var))
        return liate_class::EXPONENTIAL;
    if (GiNaC::is_exactly_a<GiNaC::power>(factor) && is_independent(factor.op(0), var)) {
        GiNaC::ex slope, offset;
        if (linear_coefficients(factor.op(1), var, slope, offset))
            return liate_class::EXPONENTIAL;
    }
    return liate_class::OTHER;
}


bool split_by_parts(const GiNaC::ex& expr, const GiNaC::symbol& var, bool swapped,
                    GiNaC::ex& u, GiNaC::ex& dv) {
    if (!GiNaC::is_exactly_a<GiNaC::mul>(expr)) {
        liate_class single = classify_factor(expr, var);
        if (swapped || (single != liate_class::LOGARITHMIC && single != liate_class::INVERSE_TRIG))
            return false;
        u  = expr;
        dv = 1;
        return true;
    }

    std::vector<GiNaC::ex> factors;
    std::vector<liate_class> classes;
    liate_class best = liate_class::OTHER;
    bool variable_power = false;
    for (const auto& factor: expr) {
        liate_class cls = classify_factor(factor, var);
        if (cls == liate_class::OTHER)
            return false;
        variable_power = variable_power || is_variable_power(factor, var);
        factors.push_back(factor);
        classes.push_back(cls);
        if (cls < best)
            best = cls;
    }

    GiNaC::ex top = 1, rest = 1;
    int nfactors = factors.size();
    for (int i = 0; i < nfactors; i++) {
        if (classes[i] == best)
            top *= factors[i];
        else
            rest *= factors[i];
    }
    if (rest.is_equal(1))
        return false;
    // x^c is admitted only in dv, under a logarithmic or inverse trigonometric u
    if (variable_power && (swapped || best == liate_class::ALGEBRAIC))
        return false;

    u  = swapped ? rest : top;
    dv = swapped ? top : rest;
    return true;
}


/**
 * Antiderivative of `dv`; false unless a closed form is found.
 */
static bool integrate_part(const GiNaC::ex& dv, const GiNaC::symbol& var,
                           integration_context& ctx, GiNaC::ex& v) {
    if (dv.is_equal(1)) {
        v = var;
        return true;
    }
    integration_result part = integrate_nested(dv, var, ctx);
    if (!part.is_closed_form())
        return false;
    v = part.value;
    return true;
}


/**
 * One by-parts attempt. The integral is kept as `accumulated +
 * scale * Integral(current)`.
 */
static bool by_parts_attempt(const GiNaC::ex& expr, const GiNaC::symbol& var, bool swapped,
                             integration_context& ctx, GiNaC::ex& antiderivative) {
    GiNaC::ex accumulated = 0, scale = 1, current = expr;

    for (int step = 0; step < max_local_steps; step++) {
        GiNaC::ex u, dv;
        if (!split_by_parts(current, var, swapped && step == 0, u, dv))
            break;
        if (ctx.budget.exhausted() || ctx.cancelled())
            return false;
        budget_scope scope(ctx.budget);

        GiNaC::ex v;
        if (!integrate_part(dv, var, ctx, v))
            return false;
        GiNaC::ex w = (v * derivative(u, var)).expand();

        std::ostringstream message;
        message << "u = " << u << ", dv = " << dv;
        ctx.note(technique::BY_PARTS, message.str());

        accumulated += scale * u * v;
        scale = -scale;
        if (w.is_zero()) {
            antiderivative = accumulated;
            return true;
        }

        // cyclic: Integral(w) = k * Integral(expr)
        GiNaC::ex k = (w / expr).normal();
        if (is_independent(k, var)) {
            GiNaC::ex denom = (1 - scale * k).normal();
            if (!denom.is_zero()) {
                ctx.note(technique::BY_PARTS, "solved cyclic integral");
                antiderivative = accumulated / denom;
                return true;
            }
            return false;
        }

        GiNaC::ex constant, rest;
        split_constant_factor(w, var, constant, rest);
        scale *= constant;
        current = rest;
    }

    if (current.is_equal(expr))
        return false;

    integration_result remaining = integrate_nested(current, var, ctx);
    if (!remaining.is_closed_form())
        return false;
    antiderivative = accumulated + scale * remaining.value;
    return true;
}


bool try_by_parts(const GiNaC::ex& expr, const GiNaC::symbol& var,
                  integration_context& ctx, integration_result& result) {
    GiNaC::ex constant, rest;
    split_constant_factor(expr, var, constant, rest);

    GiNaC::ex u, dv;
    for (bool swapped: {false, true}) {
        if (!split_by_parts(rest, var, swapped, u, dv))
            continue;
        GiNaC::ex antiderivative;
        if (by_parts_attempt(rest, var, swapped, ctx, antiderivative)) {
            result = integration_result::closed_form(constant * antiderivative, technique::BY_PARTS);
            return true;
        }
    }
    return false;
}
