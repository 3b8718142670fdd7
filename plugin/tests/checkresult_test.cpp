#include <gtest/gtest.h>
#include <sstream>
#include "checkresult.hpp"

TEST(CheckResult, StartsOk)
{
	CheckResult Result{};
	std::ostringstream Output{};
	EXPECT_EQ(Result.Finish(Output), 0);
	EXPECT_EQ(Output.str(), "Proxmox OK:  |\n");
}

TEST(CheckResult, KeepsWorstSeverity)
{
	CheckResult Result{};
	Result.Emit(Severity::Warning, "w");
	Result.Emit(Severity::Ok, "o");
	EXPECT_EQ(Result.GetSeverity(), Severity::Warning);
	Result.Emit(Severity::Critical);
	Result.Emit(Severity::Warning);
	Result.Emit(Severity::Ok);
	EXPECT_EQ(Result.GetSeverity(), Severity::Critical);
	Result.Emit(Severity::Unknown);
	Result.Emit(Severity::Critical);
	EXPECT_EQ(Result.GetSeverity(), Severity::Unknown);
}

TEST(CheckResult, SkipsAbsentAndEmptyParts)
{
	CheckResult Result{};
	Result.Emit(std::nullopt, std::nullopt, std::string{}, "a.b=1;;;0;");
	Result.Emit(std::nullopt, "short");
	EXPECT_EQ(Result.GetSeverity(), Severity::Ok);
	EXPECT_EQ(Result.GetShortMessages().size(), 1u);
	EXPECT_TRUE(Result.GetLongMessages().empty());
	EXPECT_EQ(Result.GetPerfData().size(), 1u);
}

TEST(CheckResult, FinishFormatsSummaryAndDetails)
{
	CheckResult Result{};
	Result.Emit(Severity::Warning, "n1.vm1 disk>80B", "WARNING: n1.vm1: disk is 90B, threshold 80B", "n1.vm1.disk=90B;80;;0;100");
	Result.Emit(std::nullopt, std::nullopt, std::nullopt, "n1.vm1.diskpercent=90%;;;0;100");
	std::ostringstream Output{};

	EXPECT_EQ(Result.Finish(Output, Severity::Critical, "DOWN:pve2", "WARNING: pve2: login failed"), 2);
	EXPECT_EQ(Output.str(),
				 "Proxmox CRITICAL: n1.vm1 disk>80B. DOWN:pve2 |n1.vm1.disk=90B;80;;0;100 n1.vm1.diskpercent=90%;;;0;100\n"
				 "WARNING: n1.vm1: disk is 90B, threshold 80B\n"
				 "WARNING: pve2: login failed\n");
}

TEST(CheckResult, FinishPrintsOnlyOnce)
{
	CheckResult Result{};
	std::ostringstream Output{};
	EXPECT_EQ(Result.Finish(Output, Severity::Unknown, "Failed connection", "Failed to find a suitable server to connect to"), 3);
	EXPECT_TRUE(Result.IsFinished());
	EXPECT_EQ(Result.Finish(Output, Severity::Ok, "again"), 3);
	EXPECT_EQ(Output.str(), "Proxmox UNKNOWN: Failed connection |\nFailed to find a suitable server to connect to\n");
}

TEST(CheckResult, SeverityNames)
{
	EXPECT_EQ(GetSeverityName(Severity::Ok), "OK");
	EXPECT_EQ(GetSeverityName(Severity::Warning), "WARNING");
	EXPECT_EQ(GetSeverityName(Severity::Critical), "CRITICAL");
	EXPECT_EQ(GetSeverityName(Severity::Unknown), "UNKNOWN");
}
