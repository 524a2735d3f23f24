#include "logpart.hpp"
#include "polynomial.hpp"


/**
 * Split a factorized expression into its distinct non-constant factors.
 */
static std::vector<GiNaC::ex> factor_list(const GiNaC::ex& factorized, const GiNaC::symbol& z) {
    std::vector<GiNaC::ex> factors;
    GiNaC::lst ops;
    if (GiNaC::is_exactly_a<GiNaC::mul>(factorized)) {
        for (const auto& op: factorized)
            ops.append(op);
    } else {
        ops.append(factorized);
    }

    for (const auto& op: ops) {
        GiNaC::ex base = op;
        if (GiNaC::is_exactly_a<GiNaC::power>(op) && op.op(1).info(GiNaC::info_flags::posint))
            base = op.op(0);
        if (base.has(z))
            factors.push_back(base);
    }
    return factors;
}


log_part_status solve_log_part(const GiNaC::ex& numer, const GiNaC::ex& denom,
                               const GiNaC::symbol& t, const derivation& D,
                               const std::function<bool(const GiNaC::ex&)>& is_constant,
                               std::vector<log_part_term>& terms, std::string& reason) {
    terms.clear();
    GiNaC::symbol z("z");
    GiNaC::ex Dd = canonical_poly(D(denom), t);

    GiNaC::ex res = generalized_resultant(denom, numer - z * Dd, t);
    GiNaC::ex res_numer = canonical_poly(res.normal().numer(), z);
    if (res_numer.is_zero() || !res_numer.has(z)) {
        reason = "degenerate resultant";
        return log_part_status::UNSUPPORTED;
    }

    GiNaC::ex monic = make_monic(res_numer, z);
    for (int k = 0; k <= monic.degree(z); k++) {
        if (!is_constant(monic.coeff(z, k))) {
            reason = "residues of the logarithmic part are not constant";
            return log_part_status::NON_ELEMENTARY;
        }
    }

    // factor over Q, with transcendental constants treated as symbols
    GiNaC::exmap repl;
    GiNaC::ex poly = monic.normal().numer().to_polynomial(repl);
    GiNaC::ex factorized = GiNaC::factor(poly).subs(repl);

    for (auto& factor: factor_list(factorized, z)) {
        GiNaC::ex canon = canonical_poly(factor, z);
        if (canon.degree(z) != 1) {
            reason = "residues are algebraic numbers";
            return log_part_status::UNSUPPORTED;
        }
        GiNaC::ex root = (-canon.coeff(z, 0) / canon.coeff(z, 1)).normal();
        GiNaC::ex argument = generalized_gcd(denom, canonical_poly(numer - root * Dd, t), t);
        if (argument.degree(t) > 0)
            terms.push_back({root, argument});
    }
    return log_part_status::SOLVED;
}
