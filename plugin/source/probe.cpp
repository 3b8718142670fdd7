#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include "clusterstatus.hpp"
#include "expression.hpp"
#include "probe.hpp"
#include "thresholdevaluator.hpp"

// used as paths in the URL
constexpr const std::string_view ClusterResourcesPath{"/cluster/resources"};
constexpr const std::string_view ClusterStatusPath{"/cluster/status"};

// log messages
constexpr const std::string_view CheckingMode{"Checking mode"};
constexpr const std::string_view ObjectsSelected{"Objects selected"};
constexpr const std::string_view CheckedObject{"Checked object"};

static std::string GetFetchFailure(const std::string_view &Path)
{
	return std::string{"Failed to fetch "}.append(Path);
}

int ProxmoxProbe::CheckResources(const IResourceMode &Mode, const ProbeSettings &Settings, IClusterApiClient &Client, CheckResult &Result, std::ostream &Output)
{
	auto Resources{Client.Get(ClusterResourcesPath)};
	if (!Resources.has_value())
	{
		return Result.Finish(Output, Severity::Unknown, GetFetchFailure(ClusterResourcesPath), std::string{"Unable to read "}.append(ClusterResourcesPath).append(" from ").append(Client.GetHostName()));
	}

	auto Objects{FilterObjects(Settings.Filter, FilterObjects(Mode.GetTypeFilter(), Resources.value()))};
	Log.WriteDebugAnnotated(ObjectsSelected, Mode.GetName(), std::to_string(Objects.size()));

	ThresholdEvaluator Evaluator{Log, Result};
	Evaluator.ApplyOverrides(Settings.Overrides, Objects);
	Evaluator.AugmentMetrics(Mode, Objects);
	auto GetObjectName{[&Mode](const PveObject &Object)
							 { return Mode.GetObjectName(Object); }};
	Evaluator.ApplyStringRules(Settings.WarnRules, Severity::Warning, Objects, GetObjectName);
	Evaluator.ApplyStringRules(Settings.CritRules, Severity::Critical, Objects, GetObjectName);
	Evaluator.EvaluateThresholds(Mode, Objects);

	if (Settings.Verbose)
	{
		for (const auto &Object : Objects)
		{
			Log.WriteInfoAnnotated(CheckedObject, Mode.GetObjectName(Object));
		}
	}
	return Result.Finish(Output);
}

int ProxmoxProbe::CheckClusterStatus(const ProbeSettings &Settings, IClusterApiClient &Client, CheckResult &Result, std::ostream &Output)
{
	auto StatusRecords{Client.Get(ClusterStatusPath)};
	if (!StatusRecords.has_value())
	{
		return Result.Finish(Output, Severity::Unknown, GetFetchFailure(ClusterStatusPath), std::string{"Unable to read "}.append(ClusterStatusPath).append(" from ").append(Client.GetHostName()));
	}

	auto Records{FilterObjects(Settings.Filter, StatusRecords.value())};
	Log.WriteDebugAnnotated(ObjectsSelected, Modes::status, std::to_string(Records.size()));

	ThresholdEvaluator Evaluator{Log, Result};
	Evaluator.ApplyOverrides(Settings.Overrides, Records);
	Evaluator.ApplyStringRules(Settings.WarnRules, Severity::Warning, Records, ClusterStatusEvaluator::GetObjectName);
	Evaluator.ApplyStringRules(Settings.CritRules, Severity::Critical, Records, ClusterStatusEvaluator::GetObjectName);
	ClusterStatusEvaluator{Log, Result}.Evaluate(Records);

	if (Settings.Verbose)
	{
		for (const auto &Record : Records)
		{
			Log.WriteInfoAnnotated(CheckedObject, ClusterStatusEvaluator::GetObjectName(Record));
		}
	}
	return Result.Finish(Output);
}

int ProxmoxProbe::Run(const ProbeSettings &Settings, std::ostream &Output)
{
	CheckResult Result{};
	if (Settings.Mode.empty())
	{
		return Result.Finish(Output, Severity::Unknown, "No mode specified");
	}

	const IResourceMode *Mode{Modes::FindResourceMode(Settings.Mode)};
	if (Mode == nullptr && Settings.Mode != Modes::status)
	{
		return Result.Finish(Output, Severity::Unknown, std::string{"Unknown mode "}.append(Settings.Mode));
	}
	Log.WriteDebugAnnotated(CheckingMode, Settings.Mode);

	HostFailoverDriver Failover{Log, Result, CreateClient};
	auto Client{Failover.Connect(Settings.Hosts)};
	if (Client == nullptr)
	{
		return Result.Finish(Output, Severity::Unknown, "Failed connection", "Failed to find a suitable server to connect to");
	}

	if (Mode == nullptr)
	{
		return CheckClusterStatus(Settings, *Client, Result, Output);
	}
	return CheckResources(*Mode, Settings, *Client, Result, Output);
}
