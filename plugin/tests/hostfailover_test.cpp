#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "checkresult.hpp"
#include "fakeclusterclient.hpp"
#include "hostfailover.hpp"
#include "logwriter.hpp"

class HostFailoverTest : public ::testing::Test
{
protected:
	PassiveLogWriter Log{};
	CheckResult Result{};
	FakeClusterFactory Factory{};

	std::unique_ptr<IClusterApiClient> whenConnecting(const std::vector<std::string> &Hosts)
	{
		HostFailoverDriver Driver{Log, Result, [this](const std::string &HostName)
										  { return Factory.Create(HostName); }};
		return Driver.Connect(Hosts);
	}
};

TEST_F(HostFailoverTest, SkipsHostThatFailsLogin)
{
	Factory.AddHost("A").LoginSucceeds = false;
	Factory.AddHost("B");

	auto Client{whenConnecting({"A", "B"})};

	ASSERT_NE(Client.get(), nullptr);
	EXPECT_EQ(Client->GetHostName(), "B");
	EXPECT_EQ(Result.GetSeverity(), Severity::Warning);
	ASSERT_EQ(Result.GetShortMessages().size(), 1u);
	EXPECT_EQ(Result.GetShortMessages()[0], "DOWN:A");
	ASSERT_EQ(Result.GetLongMessages().size(), 1u);
	EXPECT_EQ(Result.GetLongMessages()[0], "WARNING: A: login failed");
}

TEST_F(HostFailoverTest, SkipsHostWithInvalidTicket)
{
	Factory.AddHost("A").TicketValid = false;
	Factory.AddHost("B");

	auto Client{whenConnecting({"A", "B"})};

	ASSERT_NE(Client.get(), nullptr);
	EXPECT_EQ(Client->GetHostName(), "B");
	EXPECT_EQ(Result.GetShortMessages(), std::vector<std::string>{"DOWN:A"});
}

TEST_F(HostFailoverTest, StopsAtFirstSuccess)
{
	Factory.AddHost("A");
	Factory.AddHost("B");

	auto Client{whenConnecting({"A", "B"})};

	ASSERT_NE(Client.get(), nullptr);
	EXPECT_EQ(Client->GetHostName(), "A");
	EXPECT_EQ(Factory.CreatedHosts, std::vector<std::string>{"A"});
	EXPECT_EQ(Result.GetSeverity(), Severity::Ok);
	EXPECT_TRUE(Result.GetShortMessages().empty());
}

TEST_F(HostFailoverTest, ConnectsWithoutVersionInformation)
{
	Factory.AddHost("A").Version.reset();
	EXPECT_NE(whenConnecting({"A"}).get(), nullptr);
}

TEST_F(HostFailoverTest, ExhaustedHostsReportedInOrder)
{
	Factory.AddHost("A").LoginSucceeds = false;

	auto Client{whenConnecting({"A", "unreachable", "C"})};

	EXPECT_EQ(Client.get(), nullptr);
	std::vector<std::string> Expected{"DOWN:A", "DOWN:unreachable", "DOWN:C"};
	EXPECT_EQ(Result.GetShortMessages(), Expected);
	EXPECT_EQ(Factory.CreatedHosts, (std::vector<std::string>{"A", "unreachable", "C"}));
}
