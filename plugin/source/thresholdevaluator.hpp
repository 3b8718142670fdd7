#pragma once

#include <functional>
#include <string>
#include <vector>
#include "checkresult.hpp"
#include "expression.hpp"
#include "logwriter.hpp"
#include "modes.hpp"
#include "pveobject.hpp"

using ObjectNamer = std::function<std::string(const PveObject &)>;

class ThresholdEvaluator
{
private:
	ILogWriter &Log;
	CheckResult &Result;

	void CheckThreshold(const Severity Level, const std::string &ObjectName, const std::string &FieldName, const std::string &Unit, const double Value, const std::string &Threshold);
	void CheckField(const PveObject &Object, const std::string &ObjectName, const std::string &FieldName, const std::string &Unit, const std::string &Min, const std::string &Max);

public:
	ThresholdEvaluator(ILogWriter &Log, CheckResult &Result) : Log{Log}, Result{Result} {}
	ThresholdEvaluator(const ThresholdEvaluator &) = delete;
	ThresholdEvaluator &operator=(const ThresholdEvaluator &) = delete;
	ThresholdEvaluator(ThresholdEvaluator &&) = delete;
	ThresholdEvaluator &operator=(ThresholdEvaluator &&) = delete;
	~ThresholdEvaluator() = default;

	/// @brief Sets Field to Value on every object matching the pattern, in rule order. Later rules win.
	void ApplyOverrides(const std::vector<RuleTriple> &Overrides, PveObjectList &Objects);

	/// @brief Fills in the warn/crit/min/max threshold fields and computes <field>percent when max<field> is positive.
	/// Must run after ApplyOverrides.
	void AugmentMetrics(const IResourceMode &Mode, PveObjectList &Objects);

	/// @brief Emits a finding at Level for every object matching a rule's pattern, regardless of its values
	void ApplyStringRules(const std::vector<RuleTriple> &Rules, const Severity Level, const PveObjectList &Objects, const ObjectNamer &GetObjectName);

	/// @brief Compares every performance field and its percent variant against their thresholds and emits the perfdata tokens
	void EvaluateThresholds(const IResourceMode &Mode, const PveObjectList &Objects);
};
