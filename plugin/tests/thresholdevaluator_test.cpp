#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "checkresult.hpp"
#include "expression.hpp"
#include "logwriter.hpp"
#include "modes.hpp"
#include "thresholdevaluator.hpp"

namespace {

RuleTriple MakeOverride(const std::string &Text)
{
	auto Override{ParseOverride(Text)};
	EXPECT_TRUE(Override.has_value()) << Text;
	return Override.value_or(RuleTriple{});
}

RuleTriple MakeRule(const std::string &Text)
{
	auto Rule{ParseRuleTriple(Text)};
	EXPECT_TRUE(Rule.has_value()) << Text;
	return Rule.value_or(RuleTriple{});
}

bool Contains(const std::vector<std::string> &Items, const std::string &Item)
{
	return std::find(Items.begin(), Items.end(), Item) != Items.end();
}

class ThresholdEvaluatorTest : public ::testing::Test
{
protected:
	PassiveLogWriter Log{};
	CheckResult Result{};
	ThresholdEvaluator Evaluator{Log, Result};
	StorageMode Storage{};
	QemuMode Qemu{};
};

} // namespace

TEST_F(ThresholdEvaluatorTest, LaterOverrideWins)
{
	PveObjectList Objects{PveObject{{"id", "storage/x"}, {"critdisk", "5"}}};
	Evaluator.ApplyOverrides({MakeOverride("id=storage/x^critdisk^100"), MakeOverride("id=storage/x^critdisk^200")}, Objects);
	EXPECT_EQ(Objects[0].GetText("critdisk"), "200");
}

TEST_F(ThresholdEvaluatorTest, OverrideReplacesApiValue)
{
	PveObjectList Objects{
		 PveObject{{"id", "qemu/100"}, {"maxdisk", 100.0}},
		 PveObject{{"id", "lxc/200"}, {"maxdisk", 100.0}}};
	Evaluator.ApplyOverrides({MakeOverride("id=qemu/*^maxdisk^50")}, Objects);
	EXPECT_EQ(Objects[0].GetNumber("maxdisk"), 50);
	EXPECT_EQ(Objects[1].GetNumber("maxdisk"), 100);
}

TEST_F(ThresholdEvaluatorTest, OverrideMatchingNothingIsHarmless)
{
	PveObjectList Objects{PveObject{{"id", "node/pve1"}}};
	Evaluator.ApplyOverrides({MakeOverride("id=storage/*^critdisk^1")}, Objects);
	EXPECT_FALSE(Objects[0].Contains("critdisk"));
}

TEST_F(ThresholdEvaluatorTest, AugmentFillsDefaults)
{
	PveObjectList Objects{PveObject{{"node", "n1"}, {"storage", "local"}, {"disk", 50.0}, {"warndisk", "0"}}};
	Evaluator.AugmentMetrics(Storage, Objects);

	const auto &Object{Objects[0]};
	EXPECT_EQ(Object.GetText("warndisk"), "");
	EXPECT_EQ(Object.GetText("critdisk"), "");
	EXPECT_EQ(Object.GetText("mindisk"), "0");
	EXPECT_EQ(Object.GetText("maxdisk"), "");
	EXPECT_TRUE(Object.Contains("warndiskpercent"));
	EXPECT_TRUE(Object.Contains("critdiskpercent"));
	EXPECT_FALSE(Object.Contains("diskpercent"));
}

TEST_F(ThresholdEvaluatorTest, AugmentKeepsExistingThresholds)
{
	PveObjectList Objects{PveObject{{"disk", 50.0}, {"warndisk", "40"}, {"mindisk", 10.0}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	EXPECT_EQ(Objects[0].GetText("warndisk"), "40");
	EXPECT_EQ(Objects[0].GetText("mindisk"), "10");
}

TEST_F(ThresholdEvaluatorTest, PercentOfPositiveMax)
{
	PveObjectList Objects{PveObject{{"disk", 50.0}, {"maxdisk", 200.0}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	EXPECT_DOUBLE_EQ(Objects[0].GetNumber("diskpercent"), 25);
}

TEST_F(ThresholdEvaluatorTest, NoPercentWithoutPositiveMax)
{
	PveObjectList Objects{
		 PveObject{{"disk", 50.0}, {"maxdisk", 0.0}},
		 PveObject{{"disk", 50.0}},
		 PveObject{{"disk", 0.0}, {"maxdisk", 200.0}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	for (const auto &Object : Objects)
	{
		EXPECT_FALSE(Object.Contains("diskpercent"));
	}
}

TEST_F(ThresholdEvaluatorTest, PercentUsesOverriddenMax)
{
	PveObjectList Objects{PveObject{{"id", "storage/n1/local"}, {"disk", 50.0}, {"maxdisk", 200.0}}};
	Evaluator.ApplyOverrides({MakeOverride("id=storage/*^maxdisk^100")}, Objects);
	Evaluator.AugmentMetrics(Storage, Objects);
	EXPECT_DOUBLE_EQ(Objects[0].GetNumber("diskpercent"), 50);
}

TEST_F(ThresholdEvaluatorTest, WarningAndCriticalAreIndependent)
{
	PveObjectList Objects{PveObject{{"node", "n1"}, {"storage", "local"}, {"disk", 150.0}, {"warndisk", "10"}, {"critdisk", "100"}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	Evaluator.EvaluateThresholds(Storage, Objects);

	EXPECT_EQ(Result.GetSeverity(), Severity::Critical);
	EXPECT_TRUE(Contains(Result.GetShortMessages(), "n1.local disk>10B"));
	EXPECT_TRUE(Contains(Result.GetShortMessages(), "n1.local disk>100B"));
	EXPECT_TRUE(Contains(Result.GetLongMessages(), "WARNING: n1.local: disk is 150B, threshold 10B"));
	EXPECT_TRUE(Contains(Result.GetLongMessages(), "CRITICAL: n1.local: disk is 150B, threshold 100B"));
}

TEST_F(ThresholdEvaluatorTest, ThresholdEqualToValueTriggers)
{
	PveObjectList Objects{PveObject{{"node", "n1"}, {"storage", "local"}, {"disk", 80.0}, {"warndisk", "80"}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	Evaluator.EvaluateThresholds(Storage, Objects);
	EXPECT_EQ(Result.GetSeverity(), Severity::Warning);
}

TEST_F(ThresholdEvaluatorTest, BelowThresholdOnlyEmitsPerfData)
{
	PveObjectList Objects{PveObject{{"node", "n1"}, {"storage", "local"}, {"disk", 50.0}, {"maxdisk", 200.0}, {"critdisk", "100"}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	Evaluator.EvaluateThresholds(Storage, Objects);

	EXPECT_EQ(Result.GetSeverity(), Severity::Ok);
	EXPECT_TRUE(Result.GetShortMessages().empty());
	ASSERT_EQ(Result.GetPerfData().size(), 2u);
	EXPECT_EQ(Result.GetPerfData()[0], "n1.local.disk=50B;;100;0;200");
	EXPECT_EQ(Result.GetPerfData()[1], "n1.local.diskpercent=25%;;;0;100");
}

TEST_F(ThresholdEvaluatorTest, PercentThresholds)
{
	PveObjectList Objects{PveObject{{"node", "n1"}, {"storage", "local"}, {"disk", 90.0}, {"maxdisk", 100.0}, {"warndiskpercent", "80"}, {"critdiskpercent", "95"}}};
	Evaluator.AugmentMetrics(Storage, Objects);
	Evaluator.EvaluateThresholds(Storage, Objects);

	EXPECT_EQ(Result.GetSeverity(), Severity::Warning);
	EXPECT_TRUE(Contains(Result.GetShortMessages(), "n1.local diskpercent>80%"));
	EXPECT_TRUE(Contains(Result.GetPerfData(), "n1.local.diskpercent=90%;80;95;0;100"));
}

TEST_F(ThresholdEvaluatorTest, PerfDataFollowsFieldOrder)
{
	PveObjectList Objects{PveObject{{"node", "n1"}, {"name", "vm1"}}};
	Evaluator.AugmentMetrics(Qemu, Objects);
	Evaluator.EvaluateThresholds(Qemu, Objects);

	std::vector<std::string> Expected{
		 "n1.vm1.cpu=0;;;0;",
		 "n1.vm1.disk=0B;;;0;",
		 "n1.vm1.diskread=0B;;;0;",
		 "n1.vm1.diskwrite=0B;;;0;",
		 "n1.vm1.mem=0B;;;0;",
		 "n1.vm1.netin=0B;;;0;",
		 "n1.vm1.netout=0B;;;0;",
		 "n1.vm1.uptime=0s;;;0;"};
	EXPECT_EQ(Result.GetPerfData(), Expected);
}

TEST_F(ThresholdEvaluatorTest, StringRulesFireRegardlessOfValues)
{
	PveObjectList Objects{
		 PveObject{{"node", "n1"}, {"name", "vm1"}, {"status", "stopped"}},
		 PveObject{{"node", "n1"}, {"name", "vm2"}, {"status", "running"}}};
	auto GetObjectName{[this](const PveObject &Object)
							 { return Qemu.GetObjectName(Object); }};
	Evaluator.ApplyStringRules({MakeRule("status=stopped^stopped^guest is not running")}, Severity::Warning, Objects, GetObjectName);
	Evaluator.ApplyStringRules({MakeRule("name=vm2^^flagged by operator")}, Severity::Critical, Objects, GetObjectName);

	EXPECT_EQ(Result.GetSeverity(), Severity::Critical);
	std::vector<std::string> ExpectedShort{"n1.vm1 stopped", "n1.vm2"};
	std::vector<std::string> ExpectedLong{"WARNING: n1.vm1: guest is not running", "CRITICAL: n1.vm2: flagged by operator"};
	EXPECT_EQ(Result.GetShortMessages(), ExpectedShort);
	EXPECT_EQ(Result.GetLongMessages(), ExpectedLong);
	EXPECT_TRUE(Result.GetPerfData().empty());
}
