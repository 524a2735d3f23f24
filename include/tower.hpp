#ifndef TOWER_HPP
#define TOWER_HPP


/**
 * tower.hpp - Differential extension tower Q(x, t1, ..., tn).
 *
 * Each `ti` is a fresh symbol standing for `exp(argument)` or
 * `log(argument)`, where `argument` is written in terms of `x` and the
 * lower tower variables. Expressions "in tower form" use the symbols
 * instead of the functions.
 */


#include <ginac/ginac.h>
#include <string>
#include <vector>


enum class extension_kind {
    EXPONENTIAL,        /* Dt = D(argument) * t */
    LOGARITHMIC         /* Dt = D(argument) / argument */
};


struct extension {
    extension_kind  kind;
    GiNaC::symbol   var;
    GiNaC::ex       argument;       /* in tower form */
    GiNaC::ex       derivative;     /* Dt, in tower form */
};


class extension_tower {
public:
    explicit extension_tower(const GiNaC::symbol& x);

    /**
     * Build the tower for `expr` and rewrite `expr` in tower form.
     * Trigonometric and hyperbolic functions are rewritten into complex
     * exponentials first. Returns false with `reason` set when `expr`
     * needs an algebraic extension or a function outside exp/log.
     */
    bool build(const GiNaC::ex& expr, GiNaC::ex& tower_form, std::string& reason);

    /**
     * Total derivation `d/dx + sum(Dti * d/dti)`.
     */
    GiNaC::ex derive(const GiNaC::ex& e) const;

    /**
     * Check whether `e` is a constant of the derivation, i.e. it contains
     * neither `x` nor any tower variable.
     */
    bool is_constant(const GiNaC::ex& e) const;

    /**
     * Replace the tower variables by the functions they stand for,
     * innermost first.
     */
    GiNaC::ex back_substitute(const GiNaC::ex& e) const;

    int size() const { return extensions.size(); }
    const extension& operator[](int i) const { return extensions[i]; }
    const GiNaC::symbol& base_variable() const { return x; }
    bool uses_complex() const { return complex; }

private:
    GiNaC::symbol x;
    std::vector<extension> extensions;
    bool complex = false;

    bool to_tower(const GiNaC::ex& e, GiNaC::ex& out, std::string& reason);
    bool add_exponential(const GiNaC::ex& eta, GiNaC::ex& out, std::string& reason);
    bool add_logarithmic(const GiNaC::ex& u, GiNaC::ex& out, std::string& reason);
    const extension* find_extension(const GiNaC::ex& t) const;
};


std::ostream& operator<<(std::ostream& out, const extension_tower& tower);


#endif // TOWER_HPP
