#include <string>
#include <string_view>
#include "clusterstatus.hpp"
#include "utility.hpp"

constexpr const std::string_view ClusterType{"cluster"};
constexpr const std::string_view NodeType{"node"};
constexpr const std::string_view DefaultClusterName{"cluster"}; // standalone nodes report no cluster record
constexpr const std::string_view NotQuorate{"Cluster not quorate"};
constexpr const std::string_view NodeOffline{"Node offline"};

void ClusterStatusEvaluator::Evaluate(const PveObjectList &StatusRecords)
{
	std::string ClusterName{DefaultClusterName};
	std::string NodeCount{};
	size_t OnlineNodes{0};

	for (const auto &Record : StatusRecords)
	{
		const std::string Name{GetObjectName(Record)};
		const std::string Type{Record.GetText("type")};
		if (Type == ClusterType)
		{
			ClusterName = Name;
			NodeCount = Record.GetText("nodes");
			if (!Record.IsTruthy("quorate"))
			{
				Log.WriteWarnAnnotated(NotQuorate, Name);
				std::string Long{GetSeverityName(Severity::Critical)};
				Long.append(": ").append(Name).append(": cluster is not quorate");
				Result.Emit(Severity::Critical, std::string{Name}.append(" not quorate"), Long);
			}
		}
		else if (Type == NodeType)
		{
			if (Record.IsTruthy("online"))
			{
				OnlineNodes++;
				continue;
			}
			Log.WriteWarnAnnotated(NodeOffline, Name);
			std::string Long{GetSeverityName(Severity::Critical)};
			Long.append(": ").append(Name).append(": node is offline");
			Result.Emit(Severity::Critical, std::string{Name}.append(" offline"), Long);
		}
	}

	if (!NodeCount.empty())
	{
		Result.Emit(std::nullopt, std::nullopt, std::nullopt, std::string{ClusterName}.append(".nodes=").append(NodeCount).append(";;;0;"));
	}
	Result.Emit(std::nullopt, std::nullopt, std::nullopt, std::string{ClusterName}.append(".online=").append(std::to_string(OnlineNodes)).append(";;;0;").append(NodeCount));
}
