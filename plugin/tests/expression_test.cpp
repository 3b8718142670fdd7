#include <gtest/gtest.h>
#include "expression.hpp"

static bool Matches(const std::string &Text, const PveObject &Object)
{
	auto Parsed{ParseExpression(Text)};
	EXPECT_TRUE(Parsed.has_value()) << Text;
	return Parsed.has_value() && Parsed->Matches(Object);
}

TEST(ExpressionMatcher, GlobMatchesPrefix)
{
	PveObject Object{{"key", "node/5"}};
	EXPECT_TRUE(Matches("key=node/*", Object));
	EXPECT_FALSE(Matches("key!=node/*", Object));
}

TEST(ExpressionMatcher, LiteralPatternNeedsExactValue)
{
	PveObject Object{{"id", "qemu/100"}};
	EXPECT_TRUE(Matches("id=qemu/100", Object));
	EXPECT_FALSE(Matches("id=qemu/10", Object));
	EXPECT_TRUE(Matches("id=qemu/10?", Object));
	EXPECT_TRUE(Matches("id=qemu/[0-9]00", Object));
}

TEST(ExpressionMatcher, EmptyExpressionMatchesEverything)
{
	EXPECT_TRUE(Matches("", PveObject{}));
	EXPECT_TRUE(Matches("   ", PveObject{{"type", "node"}}));
}

TEST(ExpressionMatcher, AllClausesMustMatch)
{
	PveObject Object{{"a", 1.0}, {"b", 2.0}};
	EXPECT_TRUE(Matches("a=1 b=2", Object));
	EXPECT_FALSE(Matches("a=1 b=3", Object));
	EXPECT_FALSE(Matches("a=1 b=2 c=*?", Object));
}

TEST(ExpressionMatcher, AbsentKeyIsEmptyString)
{
	EXPECT_TRUE(Matches("x=", PveObject{}));
	EXPECT_TRUE(Matches("x=*", PveObject{}));
	EXPECT_FALSE(Matches("x!=", PveObject{}));
}

TEST(ExpressionMatcher, NumbersMatchTheirTextForm)
{
	PveObject Object{{"vmid", 101.0}, {"cpu", 0.25}};
	EXPECT_TRUE(Matches("vmid=101", Object));
	EXPECT_TRUE(Matches("cpu=0.25", Object));
}

TEST(ExpressionParser, RejectsMalformedClauses)
{
	EXPECT_FALSE(ParseExpression("type").has_value());
	EXPECT_FALSE(ParseExpression("=qemu").has_value());
	EXPECT_FALSE(ParseExpression("!=qemu").has_value());
	EXPECT_FALSE(ParseExpression("type=qemu name").has_value());
	EXPECT_FALSE(ParseExpression("ty!pe=qemu").has_value());
}

TEST(ExpressionParser, KeepsClausesInOrder)
{
	auto Parsed{ParseExpression("type=qemu  node!=pve2")};
	ASSERT_TRUE(Parsed.has_value());
	ASSERT_EQ(Parsed->GetClauses().size(), 2u);
	EXPECT_EQ(Parsed->GetClauses()[0].Key, "type");
	EXPECT_FALSE(Parsed->GetClauses()[0].Negated);
	EXPECT_EQ(Parsed->GetClauses()[1].Key, "node");
	EXPECT_EQ(Parsed->GetClauses()[1].Pattern, "pve2");
	EXPECT_TRUE(Parsed->GetClauses()[1].Negated);
}

TEST(ExpressionParser, TabsSeparateClauses)
{
	auto Parsed{ParseExpression("type=qemu\tnode=pve1")};
	ASSERT_TRUE(Parsed.has_value());
	ASSERT_EQ(Parsed->GetClauses().size(), 2u);
	EXPECT_EQ(Parsed->GetClauses()[0].Pattern, "qemu");
	EXPECT_EQ(Parsed->GetClauses()[1].Key, "node");
	EXPECT_TRUE(Matches("type=qemu\tnode=pve1", PveObject{{"type", "qemu"}, {"node", "pve1"}}));
}

TEST(ExpressionParser, PatternMayContainEquals)
{
	auto Parsed{ParseExpression("tags=a=b")};
	ASSERT_TRUE(Parsed.has_value());
	EXPECT_EQ(Parsed->GetClauses()[0].Key, "tags");
	EXPECT_EQ(Parsed->GetClauses()[0].Pattern, "a=b");
}

TEST(ObjectFilter, PreservesOrder)
{
	PveObjectList Objects{
		 PveObject{{"type", "qemu"}, {"name", "a"}},
		 PveObject{{"type", "lxc"}, {"name", "b"}},
		 PveObject{{"type", "qemu"}, {"name", "c"}}};
	auto Filter{ParseExpression("type=qemu")};
	ASSERT_TRUE(Filter.has_value());

	auto Matching{FilterObjects(Filter.value(), Objects)};
	ASSERT_EQ(Matching.size(), 2u);
	EXPECT_EQ(Matching[0].GetText("name"), "a");
	EXPECT_EQ(Matching[1].GetText("name"), "c");
}

TEST(ObjectFilter, NoMatchesGivesEmptyList)
{
	PveObjectList Objects{PveObject{{"type", "node"}}};
	auto Filter{ParseExpression("type=storage")};
	ASSERT_TRUE(Filter.has_value());
	EXPECT_TRUE(FilterObjects(Filter.value(), Objects).empty());
}

TEST(RuleTripleParser, SplitsOnCaret)
{
	auto Rule{ParseRuleTriple("id=qemu/*^stopped^guest is stopped")};
	ASSERT_TRUE(Rule.has_value());
	EXPECT_EQ(Rule->Pattern.GetText(), "id=qemu/*");
	EXPECT_EQ(Rule->Field, "stopped");
	EXPECT_EQ(Rule->Value, "guest is stopped");
}

TEST(RuleTripleParser, AllowsEmptyLabel)
{
	auto Rule{ParseRuleTriple("status=stopped^^stopped")};
	ASSERT_TRUE(Rule.has_value());
	EXPECT_TRUE(Rule->Field.empty());
}

TEST(RuleTripleParser, RequiresExactlyThreeParts)
{
	EXPECT_FALSE(ParseRuleTriple("id=qemu/*^label").has_value());
	EXPECT_FALSE(ParseRuleTriple("id=qemu/*^a^b^c").has_value());
	EXPECT_FALSE(ParseRuleTriple("qemu^a^b").has_value());
}

TEST(OverrideParser, RequiresUnsignedDecimal)
{
	EXPECT_TRUE(ParseOverride("id=storage/x^critdisk^100").has_value());
	EXPECT_TRUE(ParseOverride("id=storage/x^critdisk^12.5").has_value());
	EXPECT_TRUE(ParseOverride("id=storage/x^critdisk^").has_value());
	EXPECT_FALSE(ParseOverride("id=storage/x^critdisk^-1").has_value());
	EXPECT_FALSE(ParseOverride("id=storage/x^critdisk^10G").has_value());
	EXPECT_FALSE(ParseOverride("id=storage/x^critdisk^1.2.3").has_value());
}
