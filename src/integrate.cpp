#include "integrate.hpp"
#include "algebra.hpp"
#include "byparts.hpp"
#include "rational.hpp"
#include "risch.hpp"
#include "substitution.hpp"
#include "table.hpp"
#include "trigonometric.hpp"
#include "utils.hpp"


using technique_function = bool (*)(const GiNaC::ex&, const GiNaC::symbol&,
                                    integration_context&, integration_result&);


struct technique_entry {
    technique           method;
    technique_function  function;
};


static const technique_entry technique_chain[] = {
    {technique::TABLE,          try_table},
    {technique::RATIONAL,       try_rational},
    {technique::BY_PARTS,       try_by_parts},
    {technique::SUBSTITUTION,   try_substitution},
    {technique::TRIGONOMETRIC,  try_trigonometric},
    {technique::RISCH,          try_risch}
};


static integration_result dispatch(const GiNaC::ex& expr, const GiNaC::symbol& var, integration_context& ctx);


/**
 * Integrate a sum termwise. Succeeds only if every term has a closed form.
 */
static bool integrate_termwise(const GiNaC::ex& sum, const GiNaC::symbol& var,
                               integration_context& ctx, integration_result& result) {
    GiNaC::ex total = 0;
    for (const auto& term: sum) {
        integration_result part = dispatch(term, var, ctx);
        if (part.cancelled) {
            result = part;
            return true;
        }
        if (!part.is_closed_form())
            return false;
        total += part.value;
    }
    ctx.note(technique::LINEARITY, "sum of " + std::to_string(sum.nops()) + " terms");
    result = integration_result::closed_form(total, technique::LINEARITY);
    return true;
}


static integration_result dispatch(const GiNaC::ex& expr, const GiNaC::symbol& var, integration_context& ctx) {
    if (ctx.cancelled())
        return integration_result::fallback(expr, var, true);
    if (ctx.budget.exhausted()) {
        ctx.note(technique::NONE, "budget exhausted");
        return integration_result::fallback(expr, var);
    }

    if (is_independent(expr, var)) {
        ctx.note(technique::LINEARITY, "constant integrand");
        return integration_result::closed_form(expr * var, technique::LINEARITY);
    }

    GiNaC::ex sum = expr;
    if (!GiNaC::is_exactly_a<GiNaC::add>(sum))
        sum = expr.expand();
    if (GiNaC::is_exactly_a<GiNaC::add>(sum)) {
        integration_result result;
        if (integrate_termwise(sum, var, ctx, result)) {
            if (result.cancelled)
                return integration_result::fallback(expr, var, true);
            return result;
        }
    }

    GiNaC::ex constant, rest;
    split_constant_factor(expr, var, constant, rest);
    if (!constant.is_equal(1)) {
        integration_result inner = dispatch(rest, var, ctx);
        if (inner.is_closed_form())
            return integration_result::closed_form(constant * inner.value, inner.method);
        if (inner.is_non_elementary())
            return integration_result::non_elementary(expr, var, inner.reason);
        return integration_result::fallback(expr, var, inner.cancelled);
    }

    for (auto& entry: technique_chain) {
        if (entry.method == technique::RISCH && !ctx.options.risch_enabled)
            continue;
        if (ctx.cancelled())
            return integration_result::fallback(expr, var, true);
        if (ctx.budget.exhausted())
            break;

        integration_result result;
        try {
            if (entry.function(expr, var, ctx, result))
                return result;
        } catch (const std::exception& err) {
            VERBOSE_LOG(ctx.options, "Dispatcher: " << technique_name(entry.method) << " failed on "
                                     << expr << ": " << err.what());
        }
    }

    ctx.note(technique::NONE, "no technique applies");
    return integration_result::fallback(expr, var);
}


integration_result integrate_nested(const GiNaC::ex& expr, const GiNaC::symbol& var, integration_context& ctx) {
    if (ctx.budget.exhausted())
        return integration_result::fallback(expr, var);
    budget_scope scope(ctx.budget);
    return dispatch(expr, var, ctx);
}


integration_result integrate(const GiNaC::ex& expr, const GiNaC::symbol& var,
                             const integration_options& options, integration_trace* trace) {
    std::shared_ptr<cancellation_token> token = options.token;
    if (!token && options.deadline_ms > 0)
        token = std::make_shared<cancellation_token>(std::chrono::milliseconds(options.deadline_ms));

    recursion_budget budget(options.max_depth, options.max_dispatches);
    integration_context ctx{options, budget, trace, token.get()};
    VERBOSE_LOG(options, "Dispatcher: integrating " << expr << " d" << var);

    integration_result result;
    try {
        result = dispatch(expr, var, ctx);
    } catch (const std::exception& err) {
        VERBOSE_LOG(options, "Dispatcher: " << err.what());
        result = integration_result::fallback(expr, var);
    }

    if (result.is_closed_form()) {
        result.value = simplify(result.value);
        if (options.verify && !is_equivalent(derivative(result.value, var), expr, var)) {
            VERBOSE_LOG(options, "Dispatcher: " << result.value << " failed verification");
            result = integration_result::fallback(expr, var);
        }
    }
    VERBOSE_LOG(options, "Dispatcher: " << result);
    return result;
}
