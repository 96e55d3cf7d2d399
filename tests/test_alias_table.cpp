#include <gtest/gtest.h>

#include "operator_aliases.hpp"

#include <set>

using linecalc::canonicalOf;
using linecalc::isCanonicalOperator;
using linecalc::operatorAliases;

TEST(AliasTableTest, ResolvesAliasesCaseInsensitively) {
    EXPECT_EQ(canonicalOf("plus"), "+");
    EXPECT_EQ(canonicalOf("Subtract"), "-");
    EXPECT_EQ(canonicalOf("TIMES"), "*");
    EXPECT_EQ(canonicalOf("division"), "/");
    EXPECT_EQ(canonicalOf("Mod"), "%");
    EXPECT_EQ(canonicalOf("exponent"), "^");
}

TEST(AliasTableTest, CanonicalSymbolsResolveToThemselves) {
    for (const auto& entry : operatorAliases()) {
        EXPECT_EQ(canonicalOf(entry.canonical), entry.canonical);
        EXPECT_TRUE(isCanonicalOperator(entry.canonical));
    }
}

TEST(AliasTableTest, UnknownTokensHaveNoCanonicalForm) {
    EXPECT_FALSE(canonicalOf("foo").has_value());
    EXPECT_FALSE(canonicalOf("").has_value());
    EXPECT_FALSE(canonicalOf("pluss").has_value());
    EXPECT_FALSE(isCanonicalOperator("plus"));
}

TEST(AliasTableTest, AliasSetsArePairwiseDisjoint) {
    std::set<std::string> seen;
    std::size_t total = 0;
    for (const auto& entry : operatorAliases()) {
        for (const auto& alias : entry.aliases) {
            seen.insert(alias);
            ++total;
        }
    }
    EXPECT_EQ(seen.size(), total);
    EXPECT_EQ(operatorAliases().size(), 6u);
}
