#include "table.hpp"
#include "algebra.hpp"


const GiNaC::symbol& table_variable() {
    static thread_local GiNaC::realsymbol placeholder("X");
    return placeholder;
}


static std::vector<integration_rule> build_table() {
    using GiNaC::pow;
    using GiNaC::numeric;
    const GiNaC::symbol& X = table_variable();
    const GiNaC::ex w0 = GiNaC::wild(0), w1 = GiNaC::wild(1), a = GiNaC::wild(10);
    const rule_condition linear0 = {condition_kind::LINEAR, 0};
    const GiNaC::ex half = numeric(1, 2);

    std::vector<integration_rule> rules = {
        // constants and powers
        {"constant", w0, {{condition_kind::CONSTANT, 0}},
            w0 * X, 3},
        {"identity", X, {},
            pow(X, 2) / 2, X},
        {"power", pow(X, w0), {{condition_kind::NOT_MINUS_ONE, 0}},
            pow(X, w0 + 1) / (w0 + 1), pow(X, 3)},
        {"reciprocal", pow(X, -1), {},
            GiNaC::log(GiNaC::abs(X)), pow(X, -1)},
        {"linear power", pow(w0, w1), {linear0, {condition_kind::NOT_MINUS_ONE, 1}},
            pow(w0, w1 + 1) / ((w1 + 1) * a), pow(2 * X + 1, 4)},
        {"linear reciprocal", pow(w0, -1), {linear0},
            GiNaC::log(GiNaC::abs(w0)) / a, pow(3 * X - 2, -1)},

        // exponentials and logarithms
        {"exponential", GiNaC::exp(w0), {linear0},
            GiNaC::exp(w0) / a, GiNaC::exp(2 * X)},
        {"exponential base", pow(w1, w0), {{condition_kind::POSITIVE, 1}, linear0},
            pow(w1, w0) / (a * GiNaC::log(w1)), pow(2, X)},
        {"logarithm", GiNaC::log(w0), {linear0},
            (w0 * GiNaC::log(w0) - w0) / a, GiNaC::log(X)},

        // trigonometric functions
        {"sine", GiNaC::sin(w0), {linear0},
            -GiNaC::cos(w0) / a, GiNaC::sin(3 * X)},
        {"cosine", GiNaC::cos(w0), {linear0},
            GiNaC::sin(w0) / a, GiNaC::cos(X)},
        {"tangent", GiNaC::tan(w0), {linear0},
            -GiNaC::log(GiNaC::abs(GiNaC::cos(w0))) / a, GiNaC::tan(X)},
        {"cotangent", pow(GiNaC::tan(w0), -1), {linear0},
            GiNaC::log(GiNaC::abs(GiNaC::sin(w0))) / a, pow(GiNaC::tan(X), -1)},
        {"cotangent quotient", GiNaC::cos(w0) * pow(GiNaC::sin(w0), -1), {linear0},
            GiNaC::log(GiNaC::abs(GiNaC::sin(w0))) / a, GiNaC::cos(2 * X) / GiNaC::sin(2 * X)},
        {"tangent quotient", GiNaC::sin(w0) * pow(GiNaC::cos(w0), -1), {linear0},
            -GiNaC::log(GiNaC::abs(GiNaC::cos(w0))) / a, GiNaC::sin(X) / GiNaC::cos(X)},
        {"secant", pow(GiNaC::cos(w0), -1), {linear0},
            GiNaC::log(GiNaC::abs((1 + GiNaC::sin(w0)) / GiNaC::cos(w0))) / a, pow(GiNaC::cos(X), -1)},
        {"cosecant", pow(GiNaC::sin(w0), -1), {linear0},
            GiNaC::log(GiNaC::abs((1 - GiNaC::cos(w0)) / GiNaC::sin(w0))) / a, pow(GiNaC::sin(X), -1)},
        {"secant squared", pow(GiNaC::cos(w0), -2), {linear0},
            GiNaC::tan(w0) / a, pow(GiNaC::cos(X), -2)},
        {"cosecant squared", pow(GiNaC::sin(w0), -2), {linear0},
            -GiNaC::cos(w0) * pow(GiNaC::sin(w0), -1) / a, pow(GiNaC::sin(X), -2)},
        {"sine squared", pow(GiNaC::sin(w0), 2), {linear0},
            (w0 / 2 - GiNaC::sin(2 * w0) / 4) / a, pow(GiNaC::sin(X), 2)},
        {"cosine squared", pow(GiNaC::cos(w0), 2), {linear0},
            (w0 / 2 + GiNaC::sin(2 * w0) / 4) / a, pow(GiNaC::cos(X), 2)},
        {"tangent squared", pow(GiNaC::tan(w0), 2), {linear0},
            (GiNaC::tan(w0) - w0) / a, pow(GiNaC::tan(X), 2)},
        {"secant tangent", GiNaC::sin(w0) * pow(GiNaC::cos(w0), -2), {linear0},
            pow(GiNaC::cos(w0), -1) / a, GiNaC::sin(X) * pow(GiNaC::cos(X), -2)},
        {"cosecant cotangent", GiNaC::cos(w0) * pow(GiNaC::sin(w0), -2), {linear0},
            -pow(GiNaC::sin(w0), -1) / a, GiNaC::cos(X) * pow(GiNaC::sin(X), -2)},

        // hyperbolic functions
        {"hyperbolic sine", GiNaC::sinh(w0), {linear0},
            GiNaC::cosh(w0) / a, GiNaC::sinh(X)},
        {"hyperbolic cosine", GiNaC::cosh(w0), {linear0},
            GiNaC::sinh(w0) / a, GiNaC::cosh(2 * X)},
        {"hyperbolic tangent", GiNaC::tanh(w0), {linear0},
            GiNaC::log(GiNaC::cosh(w0)) / a, GiNaC::tanh(X)},

        // inverse trigonometric forms
        {"arctangent form", pow(pow(X, 2) + w0, -1), {{condition_kind::POSITIVE, 0}},
            GiNaC::atan(X / GiNaC::sqrt(w0)) / GiNaC::sqrt(w0), pow(pow(X, 2) + 4, -1)},
        {"area tangent form", pow(w0 - pow(X, 2), -1), {{condition_kind::POSITIVE, 0}},
            GiNaC::log(GiNaC::abs((GiNaC::sqrt(w0) + X) / (GiNaC::sqrt(w0) - X))) / (2 * GiNaC::sqrt(w0)),
            pow(1 - pow(X, 2), -1)},
        {"arcsine form", pow(w0 - pow(X, 2), -half), {{condition_kind::POSITIVE, 0}},
            GiNaC::asin(X / GiNaC::sqrt(w0)), pow(4 - pow(X, 2), -half)},
        {"area sine form", pow(pow(X, 2) + w0, -half), {{condition_kind::NONZERO, 0}},
            GiNaC::log(GiNaC::abs(X + GiNaC::sqrt(pow(X, 2) + w0))), pow(pow(X, 2) + 1, -half)},

        // inverse trigonometric functions
        {"arctangent", GiNaC::atan(w0), {linear0},
            (w0 * GiNaC::atan(w0) - GiNaC::log(1 + pow(w0, 2)) / 2) / a, GiNaC::atan(X)},
        {"arcsine", GiNaC::asin(w0), {linear0},
            (w0 * GiNaC::asin(w0) + GiNaC::sqrt(1 - pow(w0, 2))) / a, GiNaC::asin(X / 2)},
        {"arccosine", GiNaC::acos(w0), {linear0},
            (w0 * GiNaC::acos(w0) - GiNaC::sqrt(1 - pow(w0, 2))) / a, GiNaC::acos(X)},

        // common products
        {"variable times exponential", X * GiNaC::exp(X), {},
            GiNaC::exp(X) * (X - 1), X * GiNaC::exp(X)},
        {"square times exponential", pow(X, 2) * GiNaC::exp(X), {},
            GiNaC::exp(X) * (pow(X, 2) - 2 * X + 2), pow(X, 2) * GiNaC::exp(X)},
        {"variable times logarithm", X * GiNaC::log(X), {},
            pow(X, 2) * GiNaC::log(X) / 2 - pow(X, 2) / 4, X * GiNaC::log(X)},
        {"logarithm over variable", GiNaC::log(X) * pow(X, -1), {},
            pow(GiNaC::log(X), 2) / 2, GiNaC::log(X) / X},
        {"reciprocal of variable times logarithm", pow(X, -1) * pow(GiNaC::log(X), -1), {},
            GiNaC::log(GiNaC::abs(GiNaC::log(X))), 1 / (X * GiNaC::log(X))},
    };
    return rules;
}


const std::vector<integration_rule>& integration_table() {
    static thread_local const std::vector<integration_rule> rules = build_table();
    return rules;
}


static bool check_condition(const rule_condition& cond, GiNaC::exmap& bindings) {
    const GiNaC::symbol& X = table_variable();
    GiNaC::ex value = bindings[GiNaC::wild(cond.slot)];

    switch (cond.kind) {
    case condition_kind::CONSTANT:
        return !value.has(X);
    case condition_kind::NONZERO:
        return !value.has(X) && !value.is_zero();
    case condition_kind::NOT_MINUS_ONE:
        return !value.has(X) && !(value + 1).is_zero();
    case condition_kind::POSITIVE:
        return !value.has(X) && is_positive(value);
    case condition_kind::LINEAR: {
        GiNaC::ex slope, offset;
        if (!linear_coefficients(value, X, slope, offset))
            return false;
        bindings[GiNaC::wild(10 + cond.slot)] = slope;
        return true;
    }
    }
    return false;
}


bool apply_rule(const integration_rule& rule, const GiNaC::ex& integrand, GiNaC::ex& antiderivative) {
    GiNaC::exmap bindings;
    if (!integrand.match(rule.pattern, bindings))
        return false;

    for (auto& cond: rule.conditions) {
        if (!check_condition(cond, bindings))
            return false;
    }
    antiderivative = rule.result.subs(bindings);
    return true;
}


bool table_lookup(const GiNaC::ex& expr, const GiNaC::symbol& var, GiNaC::ex& antiderivative,
                  std::string* rule_name) {
    GiNaC::ex constant, rest;
    split_constant_factor(expr, var, constant, rest);
    if (rest.is_equal(1)) {
        antiderivative = constant * var;
        if (rule_name != nullptr)
            *rule_name = "constant";
        return true;
    }

    const GiNaC::symbol& X = table_variable();
    GiNaC::ex target = rest.subs(var == X);
    for (auto& rule: integration_table()) {
        GiNaC::ex found;
        if (apply_rule(rule, target, found)) {
            antiderivative = constant * found.subs(X == var);
            if (rule_name != nullptr)
                *rule_name = rule.name;
            return true;
        }
    }
    return false;
}


bool try_table(const GiNaC::ex& expr, const GiNaC::symbol& var,
               integration_context& ctx, integration_result& result) {
    GiNaC::ex antiderivative;
    std::string rule_name;
    if (!table_lookup(expr, var, antiderivative, &rule_name))
        return false;
    ctx.note(technique::TABLE, "matched rule '" + rule_name + "'");
    result = integration_result::closed_form(antiderivative, technique::TABLE);
    return true;
}
