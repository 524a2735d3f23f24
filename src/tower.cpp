#include "tower.hpp"
#include "algebra.hpp"
#include <sstream>


static std::string to_string(const GiNaC::ex& e) {
    std::ostringstream out;
    out << e;
    return out.str();
}


/**
 * `log(c)` of a constant; negative rationals give `log(-c)`, matching the
 * `log|u|` convention of the antiderivatives.
 */
static GiNaC::ex constant_log(const GiNaC::ex& c) {
    if (GiNaC::is_a<GiNaC::numeric>(c) && c.info(GiNaC::info_flags::negative))
        return GiNaC::log(-c);
    return GiNaC::log(c);
}


extension_tower::extension_tower(const GiNaC::symbol& x) : x(x) {}


bool extension_tower::build(const GiNaC::ex& expr, GiNaC::ex& tower_form, std::string& reason) {
    extensions.clear();
    GiNaC::ex rewritten = rewrite_trig_to_exp(expr);
    complex = rewritten.has(GiNaC::I);
    return to_tower(rewritten, tower_form, reason);
}


GiNaC::ex extension_tower::derive(const GiNaC::ex& e) const {
    GiNaC::ex result = derivative(e, x);
    for (auto& ext: extensions)
        result += derivative(e, ext.var) * ext.derivative;
    return result;
}


bool extension_tower::is_constant(const GiNaC::ex& e) const {
    if (e.has(x))
        return false;
    for (auto& ext: extensions) {
        if (e.has(ext.var))
            return false;
    }
    return true;
}


GiNaC::ex extension_tower::back_substitute(const GiNaC::ex& e) const {
    GiNaC::exmap resolved;
    for (auto& ext: extensions) {
        GiNaC::ex arg = ext.argument.subs(resolved);
        resolved[ext.var] = ext.kind == extension_kind::EXPONENTIAL ? GiNaC::exp(arg) : GiNaC::log(arg);
    }
    return e.subs(resolved);
}


const extension* extension_tower::find_extension(const GiNaC::ex& t) const {
    for (auto& ext: extensions) {
        if (ext.var.is_equal(t))
            return &ext;
    }
    return nullptr;
}


bool extension_tower::to_tower(const GiNaC::ex& e, GiNaC::ex& out, std::string& reason) {
    if (!e.has(x) || e.is_equal(x)) {
        out = e;
        return true;
    }

    if (GiNaC::is_exactly_a<GiNaC::add>(e) || GiNaC::is_exactly_a<GiNaC::mul>(e)) {
        bool is_sum = GiNaC::is_exactly_a<GiNaC::add>(e);
        GiNaC::ex acc = is_sum ? 0 : 1;
        for (const auto& op: e) {
            GiNaC::ex part;
            if (!to_tower(op, part, reason))
                return false;
            acc = is_sum ? acc + part : acc * part;
        }
        out = acc;
        return true;
    }

    if (GiNaC::is_exactly_a<GiNaC::power>(e)) {
        GiNaC::ex base = e.op(0), expo = e.op(1);
        if (expo.has(x))
            return to_tower(GiNaC::exp(expo * GiNaC::log(base)), out, reason);
        if (!expo.info(GiNaC::info_flags::integer)) {
            reason = "algebraic extension needed for " + to_string(e);
            return false;
        }
        GiNaC::ex base_form;
        if (!to_tower(base, base_form, reason))
            return false;
        out = GiNaC::pow(base_form, expo);
        return true;
    }

    if (is_function(e, "exp")) {
        GiNaC::ex arg;
        if (!to_tower(e.op(0), arg, reason))
            return false;
        return add_exponential(arg, out, reason);
    }

    if (is_function(e, "log")) {
        GiNaC::ex arg = e.op(0);
        if (is_function(arg, "abs"))
            arg = arg.op(0);
        GiNaC::ex arg_form;
        if (!to_tower(arg, arg_form, reason))
            return false;
        return add_logarithmic(arg_form, out, reason);
    }

    reason = "no exponential or logarithmic form for " + to_string(e);
    return false;
}


bool extension_tower::add_exponential(const GiNaC::ex& eta, GiNaC::ex& out, std::string& reason) {
    GiNaC::ex expanded = eta.expand();
    GiNaC::lst terms;
    if (GiNaC::is_exactly_a<GiNaC::add>(expanded)) {
        for (const auto& term: expanded)
            terms.append(term);
    } else {
        terms.append(expanded);
    }

    // exp(c) and exp(k*log(u)) = u^k split off
    GiNaC::ex factor = 1, rest = 0;
    for (const auto& term: terms) {
        if (is_constant(term)) {
            factor *= GiNaC::exp(term);
            continue;
        }
        bool absorbed = false;
        for (auto& ext: extensions) {
            if (ext.kind != extension_kind::LOGARITHMIC)
                continue;
            GiNaC::ex ratio = (term / ext.var).normal();
            if (!ratio.info(GiNaC::info_flags::rational))
                continue;
            if (!ratio.info(GiNaC::info_flags::integer)) {
                reason = "algebraic extension needed for exp(" + to_string(term) + ")";
                return false;
            }
            factor *= GiNaC::pow(ext.argument, ratio);
            absorbed = true;
            break;
        }
        if (!absorbed)
            rest += term;
    }
    if (rest.is_zero()) {
        out = factor;
        return true;
    }

    for (auto& ext: extensions) {
        if (ext.kind != extension_kind::EXPONENTIAL)
            continue;
        GiNaC::ex ratio = (rest / ext.argument).normal();
        if (!ratio.info(GiNaC::info_flags::rational))
            continue;
        if (!ratio.info(GiNaC::info_flags::integer)) {
            reason = "exp(" + to_string(rest) + ") is a fractional power of " + to_string(ext.var);
            return false;
        }
        out = factor * GiNaC::pow(ext.var, ratio);
        return true;
    }

    GiNaC::symbol t("t" + std::to_string(extensions.size() + 1));
    extensions.push_back({extension_kind::EXPONENTIAL, t, rest, derive(rest) * t});
    out = factor * t;
    return true;
}


bool extension_tower::add_logarithmic(const GiNaC::ex& u, GiNaC::ex& out, std::string& reason) {
    if (is_constant(u)) {
        out = constant_log(u);
        return true;
    }

    if (GiNaC::is_exactly_a<GiNaC::power>(u) && u.op(1).info(GiNaC::info_flags::integer)) {
        GiNaC::ex inner;
        if (!add_logarithmic(u.op(0), inner, reason))
            return false;
        out = u.op(1) * inner;
        return true;
    }

    if (GiNaC::is_exactly_a<GiNaC::mul>(u)) {
        out = 0;
        for (const auto& op: u) {
            GiNaC::ex part;
            if (!add_logarithmic(op, part, reason))
                return false;
            out += part;
        }
        return true;
    }

    const extension* generator = find_extension(u);
    if (generator != nullptr && generator->kind == extension_kind::EXPONENTIAL) {
        out = generator->argument;
        return true;
    }

    for (auto& ext: extensions) {
        if (ext.kind != extension_kind::LOGARITHMIC)
            continue;
        GiNaC::ex ratio = (u / ext.argument).normal();
        if (is_constant(ratio)) {
            out = ext.var + constant_log(ratio);
            return true;
        }
    }

    GiNaC::symbol t("t" + std::to_string(extensions.size() + 1));
    extensions.push_back({extension_kind::LOGARITHMIC, t, u, (derive(u) / u).normal()});
    out = t;
    return true;
}


std::ostream& operator<<(std::ostream& out, const extension_tower& tower) {
    for (int i = 0; i < tower.size(); i++) {
        const extension& ext = tower[i];
        out << (i ? ", " : "") << ext.var << " = "
            << (ext.kind == extension_kind::EXPONENTIAL ? "exp(" : "log(") << ext.argument << ")";
    }
    return out;
}
