#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "checkresult.hpp"
#include "utility.hpp"

static void AppendIfPresent(std::vector<std::string> &Target, const std::optional<std::string> &Value)
{
	if (Value.has_value() && !Value->empty())
	{
		Target.push_back(Value.value());
	}
}

std::string_view GetSeverityName(const Severity Level)
{
	switch (Level)
	{
	case Severity::Ok:
		return "OK";
	case Severity::Warning:
		return "WARNING";
	case Severity::Critical:
		return "CRITICAL";
	default:
		return "UNKNOWN";
	}
}

void CheckResult::Emit(const std::optional<Severity> Level, const std::optional<std::string> &Short, const std::optional<std::string> &Long, const std::optional<std::string> &PerfToken)
{
	if (Level.has_value() && Level.value() > WorstSeverity)
	{
		WorstSeverity = Level.value();
	}
	AppendIfPresent(ShortMessages, Short);
	AppendIfPresent(LongMessages, Long);
	AppendIfPresent(PerfData, PerfToken);
}

int CheckResult::Finish(std::ostream &Output, const std::optional<Severity> Level, const std::optional<std::string> &Short, const std::optional<std::string> &Long)
{
	if (ExitCode.has_value())
	{
		return ExitCode.value();
	}
	Emit(Level, Short, Long);

	std::string Summary{"Proxmox "};
	Summary.append(GetSeverityName(WorstSeverity)).append(": ");
	Summary.append(Utility::Join(ShortMessages, ". ")).append(" |");
	Summary.append(Utility::Join(PerfData, " ")).push_back('\n');
	if (!LongMessages.empty())
	{
		Summary.append(Utility::Join(LongMessages, "\n")).push_back('\n');
	}
	Output << Summary << std::flush;

	ExitCode = static_cast<int>(WorstSeverity);
	return ExitCode.value();
}
