#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// values are the plugin exit codes
enum class Severity
{
	Ok = 0,
	Warning = 1,
	Critical = 2,
	Unknown = 3
};

std::string_view GetSeverityName(const Severity Level);

/// @brief Folds every finding of a run into the worst severity plus the summary, detail and perfdata lists.
/// Finish prints the plugin output once and hands back the exit code.
class CheckResult
{
private:
	Severity WorstSeverity{Severity::Ok};
	std::vector<std::string> ShortMessages{};
	std::vector<std::string> LongMessages{};
	std::vector<std::string> PerfData{};
	std::optional<int> ExitCode{};

public:
	CheckResult() = default;
	~CheckResult() = default;
	CheckResult(const CheckResult &) = delete;
	CheckResult &operator=(const CheckResult &) = delete;
	CheckResult(CheckResult &&) = default;
	CheckResult &operator=(CheckResult &&) = default;

	void Emit(const std::optional<Severity> Level, const std::optional<std::string> &Short = std::nullopt, const std::optional<std::string> &Long = std::nullopt, const std::optional<std::string> &PerfToken = std::nullopt);

	/// @brief Emits the final finding, writes "Proxmox <LEVEL>: <short>. <short> |<perf> <perf>" and the detail lines.
	/// Only the first call writes anything, later calls return the same exit code.
	/// @return Exit code matching the worst severity seen
	int Finish(std::ostream &Output, const std::optional<Severity> Level = std::nullopt, const std::optional<std::string> &Short = std::nullopt, const std::optional<std::string> &Long = std::nullopt);

	bool IsFinished() const { return ExitCode.has_value(); }
	Severity GetSeverity() const { return WorstSeverity; }
	const std::vector<std::string> &GetShortMessages() const { return ShortMessages; }
	const std::vector<std::string> &GetLongMessages() const { return LongMessages; }
	const std::vector<std::string> &GetPerfData() const { return PerfData; }
};
