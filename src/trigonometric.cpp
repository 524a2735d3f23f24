#include "trigonometric.hpp"
#include "algebra.hpp"
#include "integrate.hpp"
#include <utility>


bool match_trig_monomial(const GiNaC::ex& expr, const GiNaC::symbol& var, trig_monomial& monomial) {
    GiNaC::lst factors;
    if (GiNaC::is_exactly_a<GiNaC::mul>(expr)) {
        for (const auto& factor: expr)
            factors.append(factor);
    } else {
        factors.append(expr);
    }

    monomial = {0, 0, 0};
    bool found = false;
    for (const auto& factor: factors) {
        GiNaC::ex base = factor;
        int power = 1;
        if (GiNaC::is_exactly_a<GiNaC::power>(factor)) {
            if (!factor.op(1).info(GiNaC::info_flags::integer))
                return false;
            base  = factor.op(0);
            power = GiNaC::ex_to<GiNaC::numeric>(factor.op(1)).to_int();
        }

        bool is_sin = is_function(base, "sin");
        if (!is_sin && !is_function(base, "cos"))
            return false;
        if (found && !base.op(0).is_equal(monomial.argument))
            return false;
        monomial.argument = base.op(0);
        found = true;
        (is_sin ? monomial.sin_power : monomial.cos_power) += power;
    }

    GiNaC::ex slope, offset;
    return found && linear_coefficients(monomial.argument, var, slope, offset);
}


bool product_to_sum(const GiNaC::ex& expr, const GiNaC::symbol& var, GiNaC::ex& sum) {
    if (!GiNaC::is_exactly_a<GiNaC::mul>(expr) || expr.nops() != 2)
        return false;
    GiNaC::ex first = expr.op(0), second = expr.op(1);
    for (auto& factor: {first, second}) {
        if (!is_function(factor, "sin") && !is_function(factor, "cos"))
            return false;
        GiNaC::ex slope, offset;
        if (!linear_coefficients(factor.op(0), var, slope, offset))
            return false;
    }
    if (first.op(0).is_equal(second.op(0)))
        return false;
    if (is_function(first, "cos"))
        std::swap(first, second);

    GiNaC::ex A = first.op(0), B = second.op(0);
    bool sin_first = is_function(first, "sin"), sin_second = is_function(second, "sin");
    if (sin_first && !sin_second)
        sum = (GiNaC::sin(A + B) + GiNaC::sin(A - B)) / 2;
    else if (sin_first)
        sum = (GiNaC::cos(A - B) - GiNaC::cos(A + B)) / 2;
    else
        sum = (GiNaC::cos(A - B) + GiNaC::cos(A + B)) / 2;
    sum = sum.expand();
    return true;
}


/**
 * Integrate a Laurent polynomial in `u` termwise.
 */
static GiNaC::ex integrate_laurent_polynomial(const GiNaC::ex& poly, const GiNaC::symbol& u) {
    GiNaC::ex expanded = poly.expand();
    GiNaC::ex result = 0;
    for (int k = expanded.ldegree(u); k <= expanded.degree(u); k++) {
        GiNaC::ex coeff = expanded.coeff(u, k);
        if (coeff.is_zero())
            continue;
        if (k == -1)
            result += coeff * GiNaC::log(GiNaC::abs(u));
        else
            result += coeff * GiNaC::pow(u, k + 1) / (k + 1);
    }
    return result;
}


bool try_trigonometric(const GiNaC::ex& expr, const GiNaC::symbol& var,
                       integration_context& ctx, integration_result& result) {
    GiNaC::ex constant, rest;
    split_constant_factor(expr, var, constant, rest);

    trig_monomial m;
    if (!match_trig_monomial(rest, var, m)) {
        GiNaC::ex sum;
        if (!product_to_sum(rest, var, sum))
            return false;
        ctx.note(technique::TRIGONOMETRIC, "different arguments, product to sum");
        integration_result inner = integrate_nested(sum, var, ctx);
        if (!inner.is_closed_form())
            return false;
        result = integration_result::closed_form(constant * inner.value, technique::TRIGONOMETRIC);
        return true;
    }
    int k = m.sin_power, n = m.cos_power;
    GiNaC::ex slope, offset;
    linear_coefficients(m.argument, var, slope, offset);

    bool odd_sin = k > 0 && k % 2 == 1;
    bool odd_cos = n > 0 && n % 2 == 1;
    GiNaC::realsymbol u("u");

    if (odd_cos && (!odd_sin || n <= k)) {
        // sin^k cos^(n-1) cos dL, cos^2 = 1 - u^2
        GiNaC::ex integrand = GiNaC::pow(u, k) * GiNaC::pow(1 - GiNaC::pow(u, 2), (n - 1) / 2);
        GiNaC::ex antiderivative = integrate_laurent_polynomial(integrand, u).subs(u == GiNaC::sin(m.argument)) / slope;
        ctx.note(technique::TRIGONOMETRIC, "odd cosine power, u = sin");
        result = integration_result::closed_form(constant * antiderivative, technique::TRIGONOMETRIC);
        return true;
    }

    if (odd_sin) {
        // sin^(k-1) cos^n sin dL, sin^2 = 1 - u^2, du = -sin dL
        GiNaC::ex integrand = -GiNaC::pow(u, n) * GiNaC::pow(1 - GiNaC::pow(u, 2), (k - 1) / 2);
        GiNaC::ex antiderivative = integrate_laurent_polynomial(integrand, u).subs(u == GiNaC::cos(m.argument)) / slope;
        ctx.note(technique::TRIGONOMETRIC, "odd sine power, u = cos");
        result = integration_result::closed_form(constant * antiderivative, technique::TRIGONOMETRIC);
        return true;
    }

    if (k >= 0 && n >= 0 && k % 2 == 0 && n % 2 == 0 && k + n > 0) {
        GiNaC::ex double_angle = GiNaC::cos(2 * m.argument);
        GiNaC::ex lowered = (GiNaC::pow((1 - double_angle) / 2, k / 2)
                           * GiNaC::pow((1 + double_angle) / 2, n / 2)).expand();
        ctx.note(technique::TRIGONOMETRIC, "even powers, half-angle reduction");
        integration_result inner = integrate_nested(lowered, var, ctx);
        if (!inner.is_closed_form())
            return false;
        result = integration_result::closed_form(constant * inner.value, technique::TRIGONOMETRIC);
        return true;
    }
    return false;
}
