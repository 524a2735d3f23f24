#include "apart.hpp"
#include "polynomial.hpp"
#include <stdexcept>
#include <string>


/**
 * Add all factors of `poly` to `lst`.
 */
static void set_factors(const GiNaC::ex& poly, GiNaC::lst& lst) {
    if (!GiNaC::is_exactly_a<GiNaC::mul>(poly)) {
        lst.append(poly);
        return;
    }

    for (auto iter = poly.begin(); iter != poly.end(); ++iter)
        set_factors(*iter, lst);
}


std::vector<parfrac> parfrac_expansion(const GiNaC::ex& frac, const GiNaC::symbol& var, GiNaC::ex& polypart) {
    GiNaC::ex numer, denom;
    if (!as_rational_function(frac, var, numer, denom))
        throw std::invalid_argument("parfrac_expansion(): not a rational function");

    auto quo_rem = generalized_div(numer, denom, var);
    polypart = quo_rem.op(0);
    GiNaC::ex rem = quo_rem.op(1);
    if (rem.is_zero())
        return std::vector<parfrac>();

    auto factorized = GiNaC::factor(denom);
    GiNaC::lst factor_list;
    set_factors(factorized, factor_list);

    // one undetermined numerator per (factor, power)
    GiNaC::lst param_list;
    std::vector<parfrac> ansatz;
    GiNaC::ex try_ex = 0;
    int symcnt = 0;
    for (auto& factor: factor_list) {
        if (factor.is_zero() || !factor.has(var))
            continue;

        GiNaC::ex base = factor;
        int exp = 1;
        if (GiNaC::is_exactly_a<GiNaC::power>(factor)) {
            base = factor.op(0);
            exp  = GiNaC::ex_to<GiNaC::numeric>(factor.op(1)).to_int();
        }

        int deg = base.expand().degree(var);
        for (int i = 1; i <= exp; i++) {
            GiNaC::ex numer_form = 0;
            for (int j = 0; j < deg; j++) {
                GiNaC::symbol cj("c" + std::to_string(symcnt++));
                numer_form += cj * GiNaC::pow(var, j);
                param_list.append(cj);
            }
            ansatz.push_back({numer_form, base, i});
            try_ex += numer_form * (factorized / GiNaC::pow(base, i)).normal();
        }
    }

    try_ex = try_ex.expand().collect(var);
    int deg = denom.degree(var);
    GiNaC::lst eqs;
    for (int i = 0; i < deg; i++)
        eqs.append(try_ex.coeff(var, i) == rem.coeff(var, i));
    auto result = GiNaC::lsolve(eqs, param_list);
    if (result.nops() != param_list.nops())
        throw std::runtime_error("parfrac_expansion(): inconsistent coefficient system");

    std::vector<parfrac> final_result;
    for (auto& par: ansatz) {
        GiNaC::ex value = canonical_poly(par.numer.subs(result, GiNaC::subs_options::algebraic), var);
        if (value.is_zero())
            continue;
        final_result.push_back({value, par.denom, par.npower});
    }
    return final_result;
}
