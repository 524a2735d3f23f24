#include "table.hpp"
#include "test_helpers.hpp"


TEST(TableTest, EveryRuleMatchesItsExample) {
    const GiNaC::symbol& X = table_variable();
    for (auto& rule: integration_table()) {
        GiNaC::ex antiderivative;
        ASSERT_TRUE(apply_rule(rule, rule.example, antiderivative)) << "rule '" << rule.name << "'";
        EXPECT_ANTIDERIVATIVE(antiderivative, rule.example, X) << " in rule '" << rule.name << "'";
    }
}


TEST(TableTest, RuleNamesAreUnique) {
    auto& rules = integration_table();
    for (size_t i = 0; i < rules.size(); i++) {
        for (size_t j = i + 1; j < rules.size(); j++)
            EXPECT_NE(rules[i].name, rules[j].name);
    }
}


TEST(TableTest, LookupSplitsConstantFactor) {
    GiNaC::realsymbol x("x");
    GiNaC::ex antiderivative;
    std::string name;
    ASSERT_TRUE(table_lookup(5 * GiNaC::pow(x, 2), x, antiderivative, &name));
    EXPECT_EQ(name, "power");
    EXPECT_TRUE((antiderivative - 5 * GiNaC::pow(x, 3) / 3).expand().is_zero()) << antiderivative;
}


TEST(TableTest, LookupReciprocal) {
    GiNaC::realsymbol x("x");
    GiNaC::ex antiderivative;
    std::string name;
    ASSERT_TRUE(table_lookup(1 / x, x, antiderivative, &name));
    EXPECT_EQ(name, "reciprocal");
    EXPECT_TRUE(antiderivative.is_equal(GiNaC::log(GiNaC::abs(x))));
}


TEST(TableTest, LookupLinearArgument) {
    GiNaC::realsymbol x("x");
    GiNaC::ex integrand = GiNaC::cos(3 * x + 1), antiderivative;
    ASSERT_TRUE(table_lookup(integrand, x, antiderivative));
    EXPECT_ANTIDERIVATIVE(antiderivative, integrand, x);
}


TEST(TableTest, LookupWithParameter) {
    GiNaC::realsymbol x("x"), a("a");
    GiNaC::ex integrand = a * GiNaC::exp(a * x), antiderivative;
    ASSERT_TRUE(table_lookup(integrand, x, antiderivative));
    EXPECT_ANTIDERIVATIVE(antiderivative, integrand, x);
}


TEST(TableTest, ConstantIntegrand) {
    GiNaC::realsymbol x("x"), a("a");
    GiNaC::ex antiderivative;
    std::string name;
    ASSERT_TRUE(table_lookup(3 * a, x, antiderivative, &name));
    EXPECT_EQ(name, "constant");
    EXPECT_TRUE((antiderivative - 3 * a * x).is_zero());
}


TEST(TableTest, NonLinearArgumentIsNotMatched) {
    GiNaC::realsymbol x("x");
    GiNaC::ex antiderivative;
    EXPECT_FALSE(table_lookup(GiNaC::exp(GiNaC::pow(x, 2)), x, antiderivative));
    EXPECT_FALSE(table_lookup(GiNaC::sin(GiNaC::pow(x, 2)), x, antiderivative));
}


TEST_F(technique_test, TryTableRecordsRule) {
    integration_result result;
    ASSERT_TRUE(try_table(x * GiNaC::exp(x), x, ctx, result));
    EXPECT_TRUE(result.is_closed_form());
    EXPECT_EQ(result.method, technique::TABLE);
    EXPECT_TRUE(trace_mentions("variable times exponential"));
}
