#ifndef TABLE_HPP
#define TABLE_HPP


/**
 * table.hpp - Table of canonical antiderivatives.
 *
 * Rules are written in terms of a private placeholder variable `X` (see
 * `table_variable()`) and GiNaC wildcards. Wildcards 0..9 are bound by the
 * pattern; a `LINEAR` condition on wildcard `i` additionally binds wildcard
 * `10 + i` to the slope of the (linear) subexpression, for use in the
 * result template.
 *
 * The rules are built once per thread and never modified. GiNaC reference
 * counts are not atomic, so expressions are not shared across threads.
 */


#include "options.hpp"
#include <ginac/ginac.h>
#include <string>
#include <vector>


enum class condition_kind {
    CONSTANT,           /* wildcard is independent of X          */
    NONZERO,            /* constant and not zero                 */
    NOT_MINUS_ONE,      /* constant and not -1                   */
    POSITIVE,           /* constant and provably positive        */
    LINEAR              /* slope*X + offset, binds wildcard 10+i */
};


struct rule_condition {
    condition_kind  kind;
    int             slot;
};


struct integration_rule {
    std::string                 name;
    GiNaC::ex                   pattern;
    std::vector<rule_condition> conditions;
    GiNaC::ex                   result;
    GiNaC::ex                   example;    /* an integrand in X the rule applies to */
};


/**
 * The placeholder variable of the rule patterns.
 */
const GiNaC::symbol& table_variable();


/**
 * All rules, in the order they are tried.
 */
const std::vector<integration_rule>& integration_table();


/**
 * Try `rule` on `integrand`, an expression in `table_variable()`. On a
 * match that satisfies all conditions, store the instantiated result.
 */
bool apply_rule(const integration_rule& rule, const GiNaC::ex& integrand, GiNaC::ex& antiderivative);


/**
 * Look up `expr` in the table. Constant factors are split off first. The
 * name of the matching rule is stored in `rule_name` if given.
 */
bool table_lookup(const GiNaC::ex& expr, const GiNaC::symbol& var, GiNaC::ex& antiderivative,
                  std::string* rule_name = nullptr);


/**
 * Table technique for the dispatcher.
 */
bool try_table(const GiNaC::ex& expr, const GiNaC::symbol& var,
               integration_context& ctx, integration_result& result);


#endif // TABLE_HPP
