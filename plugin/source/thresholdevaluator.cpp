#include <string>
#include <string_view>
#include <vector>
#include "thresholdevaluator.hpp"
#include "utility.hpp"

constexpr const std::string_view OverrideApplied{"Override applied"};
constexpr const std::string_view PercentComputed{"Percent computed"};
constexpr const std::string_view ThresholdExceeded{"Threshold exceeded"};
constexpr const std::string_view StringRuleMatched{"String rule matched"};

constexpr const std::string_view PercentSuffix{"percent"};
constexpr const std::string_view PercentUnit{"%"};

static void SetIfFalsy(PveObject &Object, const std::string &Key, const std::string &DefaultValue)
{
	if (!Object.IsTruthy(Key))
	{
		Object.Set(Key, DefaultValue);
	}
}

static std::string FormatPerfToken(const std::string &ObjectName, const std::string &FieldName, const std::string &Value, const std::string &Unit,
											  const std::string &Warn, const std::string &Crit, const std::string &Min, const std::string &Max)
{
	std::string Token{ObjectName};
	Token.append(1, '.').append(FieldName).append(1, '=').append(Value).append(Unit);
	Token.append(1, ';').append(Warn).append(1, ';').append(Crit).append(1, ';').append(Min).append(1, ';').append(Max);
	return Token;
}

void ThresholdEvaluator::CheckThreshold(const Severity Level, const std::string &ObjectName, const std::string &FieldName, const std::string &Unit, const double Value, const std::string &Threshold)
{
	if (Threshold.empty() || Utility::ToNumber(Threshold) > Value)
	{
		return;
	}
	std::string Short{ObjectName};
	Short.append(1, ' ').append(FieldName).append(1, '>').append(Threshold).append(Unit);
	std::string Long{GetSeverityName(Level)};
	Long.append(": ").append(ObjectName).append(": ").append(FieldName).append(" is ").append(Utility::FormatNumber(Value)).append(Unit);
	Long.append(", threshold ").append(Threshold).append(Unit);
	Log.WriteDebugAnnotated(ThresholdExceeded, ObjectName, Short);
	Result.Emit(Level, Short, Long);
}

void ThresholdEvaluator::CheckField(const PveObject &Object, const std::string &ObjectName, const std::string &FieldName, const std::string &Unit, const std::string &Min, const std::string &Max)
{
	const std::string Warn{Object.GetText(std::string{"warn"}.append(FieldName))};
	const std::string Crit{Object.GetText(std::string{"crit"}.append(FieldName))};
	const double Value{Object.GetNumber(FieldName)};

	CheckThreshold(Severity::Warning, ObjectName, FieldName, Unit, Value, Warn);
	CheckThreshold(Severity::Critical, ObjectName, FieldName, Unit, Value, Crit);
	Result.Emit(std::nullopt, std::nullopt, std::nullopt, FormatPerfToken(ObjectName, FieldName, Utility::FormatNumber(Value), Unit, Warn, Crit, Min, Max));
}

void ThresholdEvaluator::ApplyOverrides(const std::vector<RuleTriple> &Overrides, PveObjectList &Objects)
{
	for (const auto &Override : Overrides)
	{
		for (auto &Object : Objects)
		{
			if (Override.Pattern.Matches(Object))
			{
				Object.Set(Override.Field, Override.Value);
				Log.WriteDebugAnnotated(OverrideApplied, Override.Pattern.GetText(), std::string{Override.Field}.append(1, '=').append(Override.Value));
			}
		}
	}
}

void ThresholdEvaluator::AugmentMetrics(const IResourceMode &Mode, PveObjectList &Objects)
{
	for (auto &Object : Objects)
	{
		for (const auto &[FieldName, Unit] : Mode.GetPerfFields())
		{
			const std::string MaxField{std::string{"max"}.append(FieldName)};
			SetIfFalsy(Object, std::string{"warn"}.append(FieldName), "");
			SetIfFalsy(Object, std::string{"crit"}.append(FieldName), "");
			SetIfFalsy(Object, std::string{"min"}.append(FieldName), "0");
			SetIfFalsy(Object, MaxField, "");
			SetIfFalsy(Object, std::string{"warn"}.append(FieldName).append(PercentSuffix), "");
			SetIfFalsy(Object, std::string{"crit"}.append(FieldName).append(PercentSuffix), "");

			const double Max{Object.GetNumber(MaxField)};
			if (Max > 0 && Object.IsTruthy(FieldName))
			{
				const double Percent{Object.GetNumber(FieldName) * 100 / Max};
				Object.Set(std::string{FieldName}.append(PercentSuffix), Percent);
				Log.WriteDebugAnnotated(PercentComputed, Mode.GetObjectName(Object), std::string{FieldName}.append(1, '=').append(Utility::FormatNumber(Percent)));
			}
		}
	}
}

void ThresholdEvaluator::ApplyStringRules(const std::vector<RuleTriple> &Rules, const Severity Level, const PveObjectList &Objects, const ObjectNamer &GetObjectName)
{
	for (const auto &Rule : Rules)
	{
		for (const auto &Object : FilterObjects(Rule.Pattern, Objects))
		{
			const std::string ObjectName{GetObjectName(Object)};
			std::string Short{ObjectName};
			if (!Rule.Field.empty())
			{
				Short.append(1, ' ').append(Rule.Field);
			}
			std::string Long{GetSeverityName(Level)};
			Long.append(": ").append(ObjectName).append(": ").append(Rule.Value);
			Log.WriteDebugAnnotated(StringRuleMatched, Rule.Pattern.GetText(), ObjectName);
			Result.Emit(Level, Short, Long);
		}
	}
}

void ThresholdEvaluator::EvaluateThresholds(const IResourceMode &Mode, const PveObjectList &Objects)
{
	for (const auto &Object : Objects)
	{
		const std::string ObjectName{Mode.GetObjectName(Object)};
		for (const auto &[FieldName, Unit] : Mode.GetPerfFields())
		{
			CheckField(Object, ObjectName, FieldName, Unit, Object.GetText(std::string{"min"}.append(FieldName)), Object.GetText(std::string{"max"}.append(FieldName)));

			const std::string PercentField{std::string{FieldName}.append(PercentSuffix)};
			if (Object.Contains(PercentField))
			{
				CheckField(Object, ObjectName, PercentField, std::string{PercentUnit}, "0", "100");
			}
		}
	}
}
