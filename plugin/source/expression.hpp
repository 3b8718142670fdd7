#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "pveobject.hpp"

struct ExpressionClause
{
	std::string Key{};
	std::string Pattern{};
	bool Negated{false};
};

/// @brief Whitespace separated key=glob / key!=glob clauses, all of which must match. No clauses matches everything.
class Expression
{
private:
	std::string Text{};
	std::vector<ExpressionClause> Clauses{};

public:
	Expression() = default;
	Expression(std::string Text, std::vector<ExpressionClause> Clauses) : Text{std::move(Text)}, Clauses{std::move(Clauses)} {}

	const std::string &GetText() const { return Text; }
	const std::vector<ExpressionClause> &GetClauses() const { return Clauses; }
	bool Matches(const PveObject &Object) const;
};

/// @brief pattern^field^value, used by --override, --warnstr and --critstr
struct RuleTriple
{
	Expression Pattern{};
	std::string Field{};
	std::string Value{};
};

/// @return std::nullopt when any clause is not of the form key=glob or key!=glob
std::optional<Expression> ParseExpression(const std::string_view &Text);

/// @return std::nullopt unless Text splits on ^ into exactly three parts and the first part is a valid expression
std::optional<RuleTriple> ParseRuleTriple(const std::string_view &Text);

/// @brief ParseRuleTriple, additionally requiring the value to match ^[0-9]*(\.[0-9]*)?$
std::optional<RuleTriple> ParseOverride(const std::string_view &Text);

/// @return The objects Filter matches, in their original order
PveObjectList FilterObjects(const Expression &Filter, const PveObjectList &Objects);
