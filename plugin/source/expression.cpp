#include <algorithm>
#include <fnmatch.h>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "expression.hpp"
#include "utility.hpp"

static std::optional<ExpressionClause> ParseClause(const std::string &ClauseText)
{
	auto EqualsPosition{ClauseText.find('=')};
	if (EqualsPosition == std::string::npos || EqualsPosition == 0)
	{
		return std::nullopt;
	}

	ExpressionClause Clause{};
	Clause.Key = ClauseText.substr(0, EqualsPosition);
	if (Clause.Key.back() == '!')
	{
		Clause.Negated = true;
		Clause.Key.pop_back();
	}
	if (Clause.Key.empty() || Clause.Key.find('!') != std::string::npos)
	{
		return std::nullopt;
	}
	Clause.Pattern = ClauseText.substr(EqualsPosition + 1);
	return Clause;
}

static bool GlobMatches(const std::string &Pattern, const std::string &Value)
{
	return ::fnmatch(Pattern.c_str(), Value.c_str(), 0) == 0;
}

bool Expression::Matches(const PveObject &Object) const
{
	return std::all_of(Clauses.begin(), Clauses.end(), [&Object](const ExpressionClause &Clause)
							 { return GlobMatches(Clause.Pattern, Object.GetText(Clause.Key)) != Clause.Negated; });
}

std::optional<Expression> ParseExpression(const std::string_view &Text)
{
	std::vector<ExpressionClause> Clauses{};
	for (const auto &ClauseText : Utility::SplitWhitespace(Text))
	{
		auto Clause{ParseClause(ClauseText)};
		if (!Clause.has_value())
		{
			return std::nullopt;
		}
		Clauses.emplace_back(std::move(Clause.value()));
	}
	return Expression{std::string{Text}, std::move(Clauses)};
}

std::optional<RuleTriple> ParseRuleTriple(const std::string_view &Text)
{
	auto Parts{Utility::Split(Text, '^')};
	if (Parts.size() != 3)
	{
		return std::nullopt;
	}
	auto Pattern{ParseExpression(Parts[0])};
	if (!Pattern.has_value())
	{
		return std::nullopt;
	}
	return RuleTriple{.Pattern = std::move(Pattern.value()), .Field = std::move(Parts[1]), .Value = std::move(Parts[2])};
}

std::optional<RuleTriple> ParseOverride(const std::string_view &Text)
{
	auto Override{ParseRuleTriple(Text)};
	if (Override.has_value() && !Utility::IsUnsignedDecimal(Override->Value))
	{
		return std::nullopt;
	}
	return Override;
}

PveObjectList FilterObjects(const Expression &Filter, const PveObjectList &Objects)
{
	PveObjectList Matching{};
	std::copy_if(Objects.begin(), Objects.end(), std::back_inserter(Matching), [&Filter](const PveObject &Object)
					 { return Filter.Matches(Object); });
	return Matching;
}
