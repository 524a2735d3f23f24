#include "algebra.hpp"
#include <algorithm>
#include <string>


/**
 * Replace `log(abs(u))` by `log(u)`.
 */
struct strip_log_abs : public GiNaC::map_function {
    GiNaC::ex operator()(const GiNaC::ex& e) override {
        if (is_function(e, "log") && is_function(e.op(0), "abs"))
            return GiNaC::log((*this)(e.op(0).op(0)));
        return e.map(*this);
    }
};


/**
 * Replace `abs(u)` by `u` where `u` is known to be nonnegative.
 */
struct strip_positive_abs : public GiNaC::map_function {
    GiNaC::ex operator()(const GiNaC::ex& e) override {
        GiNaC::ex mapped = e.map(*this);
        if (is_function(mapped, "abs") && is_nonnegative(mapped.op(0)))
            return mapped.op(0);
        return mapped;
    }
};


struct trig_to_exp : public GiNaC::map_function {
    GiNaC::ex operator()(const GiNaC::ex& e) override {
        if (!GiNaC::is_a<GiNaC::function>(e))
            return e.map(*this);

        GiNaC::ex mapped = e.map(*this);
        if (mapped.nops() != 1)
            return mapped;
        GiNaC::ex arg = mapped.op(0);
        GiNaC::ex ep = GiNaC::exp(GiNaC::I * arg), em = GiNaC::exp(-GiNaC::I * arg);

        if (is_function(mapped, "sin"))
            return (ep - em) / (2 * GiNaC::I);
        if (is_function(mapped, "cos"))
            return (ep + em) / 2;
        if (is_function(mapped, "tan"))
            return (ep - em) / (GiNaC::I * (ep + em));
        if (is_function(mapped, "sinh"))
            return (GiNaC::exp(arg) - GiNaC::exp(-arg)) / 2;
        if (is_function(mapped, "cosh"))
            return (GiNaC::exp(arg) + GiNaC::exp(-arg)) / 2;
        if (is_function(mapped, "tanh"))
            return (GiNaC::exp(arg) - GiNaC::exp(-arg)) / (GiNaC::exp(arg) + GiNaC::exp(-arg));
        return mapped;
    }
};


struct complex_to_trig : public GiNaC::map_function {
    GiNaC::ex operator()(const GiNaC::ex& e) override {
        GiNaC::ex mapped = e.map(*this);
        if (is_function(mapped, "exp") && mapped.op(0).has(GiNaC::I)) {
            GiNaC::ex arg = mapped.op(0).expand();
            GiNaC::ex re = arg.real_part(), im = arg.imag_part();
            if (!re.has(GiNaC::I) && !im.has(GiNaC::I))
                return GiNaC::exp(re) * (GiNaC::cos(im) + GiNaC::I * GiNaC::sin(im));
        }
        return mapped;
    }
};


bool is_independent(const GiNaC::ex& expr, const GiNaC::symbol& var) {
    return !expr.has(var);
}


bool is_function(const GiNaC::ex& expr, const char* name) {
    return GiNaC::is_a<GiNaC::function>(expr)
        && GiNaC::ex_to<GiNaC::function>(expr).get_name() == name;
}


GiNaC::ex derivative(const GiNaC::ex& expr, const GiNaC::symbol& var) {
    strip_log_abs strip;
    return strip(expr).diff(var);
}


GiNaC::ex simplify(const GiNaC::ex& expr) {
    strip_positive_abs strip;
    return strip(expr);
}


bool is_positive(const GiNaC::ex& expr) {
    if (GiNaC::is_a<GiNaC::numeric>(expr) || GiNaC::is_a<GiNaC::constant>(expr)
        || GiNaC::is_a<GiNaC::symbol>(expr))
        return expr.info(GiNaC::info_flags::positive);

    if (is_function(expr, "exp") || is_function(expr, "cosh"))
        return !expr.op(0).has(GiNaC::I);

    if (GiNaC::is_exactly_a<GiNaC::add>(expr)) {
        bool strict = false;
        for (const auto& term: expr) {
            if (!is_nonnegative(term))
                return false;
            if (is_positive(term))
                strict = true;
        }
        return strict;
    }

    if (GiNaC::is_exactly_a<GiNaC::mul>(expr)) {
        for (const auto& factor: expr) {
            if (!is_positive(factor))
                return false;
        }
        return true;
    }

    if (GiNaC::is_exactly_a<GiNaC::power>(expr))
        return is_positive(expr.op(0)) && !expr.op(1).has(GiNaC::I);

    return false;
}


bool is_nonnegative(const GiNaC::ex& expr) {
    if (is_positive(expr))
        return true;

    if (GiNaC::is_a<GiNaC::numeric>(expr) || GiNaC::is_a<GiNaC::symbol>(expr))
        return expr.info(GiNaC::info_flags::nonnegative);

    if (is_function(expr, "abs"))
        return true;

    if (GiNaC::is_exactly_a<GiNaC::add>(expr) || GiNaC::is_exactly_a<GiNaC::mul>(expr)) {
        for (const auto& op: expr) {
            if (!is_nonnegative(op))
                return false;
        }
        return true;
    }

    if (GiNaC::is_exactly_a<GiNaC::power>(expr)) {
        GiNaC::ex expo = expr.op(1);
        if (expo.info(GiNaC::info_flags::even) && !expr.op(0).has(GiNaC::I))
            return true;
        return is_nonnegative(expr.op(0)) && !expo.has(GiNaC::I);
    }

    return false;
}


/**
 * Collect every symbol occurring in `expr`, except `var`.
 */
static std::vector<GiNaC::ex> collect_parameters(const GiNaC::ex& expr, const GiNaC::symbol& var) {
    std::vector<GiNaC::ex> params;
    for (auto iter = expr.preorder_begin(); iter != expr.preorder_end(); ++iter) {
        if (!GiNaC::is_a<GiNaC::symbol>(*iter) || iter->is_equal(var))
            continue;
        bool seen = false;
        for (auto& param: params)
            seen = seen || param.is_equal(*iter);
        if (!seen)
            params.push_back(*iter);
    }
    return params;
}


static bool numerically_equal(const GiNaC::ex& lhs, const GiNaC::ex& rhs, const GiNaC::symbol& var) {
    static const int samples[][2] = {{7, 10}, {13, 10}, {17, 10}, {21, 10}, {29, 10}, {37, 10}};
    const double tolerance = 1e-8;

    auto params = collect_parameters(lhs - rhs, var);
    int checked = 0;
    for (auto& sample: samples) {
        GiNaC::exmap point;
        point[var] = GiNaC::numeric(sample[0], sample[1]);
        int nparams = params.size();
        for (int i = 0; i < nparams; i++)
            point[params[i]] = GiNaC::numeric(11 + 3 * i, 7);

        GiNaC::ex lval, rval;
        try {
            lval = lhs.subs(point).evalf();
            rval = rhs.subs(point).evalf();
        } catch (const std::exception& err) {
            // singular at this sample point
            continue;
        }
        if (!GiNaC::is_a<GiNaC::numeric>(lval) || !GiNaC::is_a<GiNaC::numeric>(rval))
            continue;

        GiNaC::numeric lnum = GiNaC::ex_to<GiNaC::numeric>(lval),
                       rnum = GiNaC::ex_to<GiNaC::numeric>(rval);
        double scale = std::max(1.0, GiNaC::abs(lnum).to_double());
        if (GiNaC::abs(lnum - rnum).to_double() > tolerance * scale)
            return false;
        checked++;
    }
    return checked >= 2;
}


bool is_equivalent(const GiNaC::ex& lhs, const GiNaC::ex& rhs, const GiNaC::symbol& var) {
    GiNaC::ex difference = simplify(lhs - rhs);
    if (difference.is_zero() || difference.expand().normal().is_zero())
        return true;

    GiNaC::ex rewritten = rewrite_trig_to_exp(difference).expand().normal();
    if (rewritten.is_zero())
        return true;

    return numerically_equal(lhs, rhs, var);
}


GiNaC::ex rewrite_trig_to_exp(const GiNaC::ex& expr) {
    trig_to_exp rewrite;
    return rewrite(expr);
}


GiNaC::ex rewrite_complex_to_trig(const GiNaC::ex& expr) {
    complex_to_trig rewrite;
    return rewrite(expr).expand();
}


bool linear_coefficients(const GiNaC::ex& expr, const GiNaC::symbol& var,
                         GiNaC::ex& slope, GiNaC::ex& offset) {
    GiNaC::ex expanded = expr.expand();
    if (!expanded.is_polynomial(var) || expanded.degree(var) != 1)
        return false;
    slope  = expanded.coeff(var, 1);
    offset = expanded.coeff(var, 0);
    return !slope.is_zero() && is_independent(slope, var) && is_independent(offset, var);
}


void split_constant_factor(const GiNaC::ex& expr, const GiNaC::symbol& var,
                           GiNaC::ex& constant, GiNaC::ex& rest) {
    constant = 1;
    rest     = 1;
    if (GiNaC::is_exactly_a<GiNaC::mul>(expr)) {
        for (const auto& factor: expr) {
            if (is_independent(factor, var))
                constant *= factor;
            else
                rest *= factor;
        }
    } else if (is_independent(expr, var)) {
        constant = expr;
    } else {
        rest = expr;
    }
}


std::vector<GiNaC::ex> collect_subexpressions(const GiNaC::ex& expr, const GiNaC::symbol& var) {
    std::vector<GiNaC::ex> subs;
    for (auto iter = expr.preorder_begin(); iter != expr.preorder_end(); ++iter) {
        const GiNaC::ex& sub = *iter;
        if (sub.is_equal(expr) || sub.is_equal(var) || is_independent(sub, var))
            continue;
        bool seen = false;
        for (auto& known: subs)
            seen = seen || known.is_equal(sub);
        if (!seen)
            subs.push_back(sub);
    }
    return subs;
}


int expression_size(const GiNaC::ex& expr) {
    int size = 0;
    for (auto iter = expr.preorder_begin(); iter != expr.preorder_end(); ++iter)
        size++;
    return size;
}
