#include <cstring>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <syslog.h>
#include "config_constants.hpp"
#include "logwriter.hpp"

constexpr const std::string_view FailedWriteFile{"Failed to write file"};

struct SeverityFormat
{
	std::string_view Label;
	int SysLogLevel;
};

static SeverityFormat GetSeverityFormat(const LogLevels Severity)
{
	static const std::map<LogLevels, SeverityFormat> SeverityFormats{
		 {LogLevels::Debug, {"[DEBUG]", LOG_DEBUG}},
		 {LogLevels::Info, {"[INFO]", LOG_INFO}},
		 {LogLevels::Warn, {"[WARN]", LOG_WARNING}},
		 {LogLevels::Error, {"[ERROR]", LOG_ERR}},
		 {LogLevels::Fatal, {"[FATAL]", LOG_CRIT}}};
	auto Format{SeverityFormats.find(Severity)};
	return Format != SeverityFormats.end() ? Format->second : SeverityFormat{"[INFO]", LOG_INFO};
}

static std::string FormatMessage(const std::string_view &Message, const LogLevels Severity)
{
	std::string FormattedMessage{GetSeverityFormat(Severity).Label};
	FormattedMessage.append(1, ' ').append(Message);
	return FormattedMessage;
}

static void WriteToSysLog(const std::string &Message, const LogLevels Severity)
{
	syslog(GetSeverityFormat(Severity).SysLogLevel, "%s", Message.c_str());
}

ActiveLogWriter::ActiveLogWriter(const LogLevels MinimumSeverity, std::ostream &Console, const std::string_view &LogFilePath)
	 : MinimumSeverity(MinimumSeverity),
		Console{Console}
{
	if (!LogFilePath.empty())
	{
		LogFile = std::make_unique<OutputFile>(std::string{LogFilePath});
	}
}

void ActiveLogWriter::WriteEntry(const LogLevels Severity, const std::string_view &Message)
{
	if (!ShouldWrite(Severity))
	{
		return;
	}
	std::string FormattedMessage{FormatMessage(Message, Severity)};
	Console << FormattedMessage << '\n';

	if (LogFile == nullptr)
	{
		return;
	}
	if (UseSyslog)
	{
		WriteToSysLog(FormattedMessage, Severity);
		return;
	}
	int LogFileErrorCode{LogFile->Write(FormattedMessage, true)};
	if (LogFileErrorCode)
	{
		UseSyslog = true;
		openlog(ConfigConstants::appname.data(), LOG_PID, LOG_USER);
		WriteToSysLog(FormatMessage(std::string{FailedWriteFile}.append(" (").append(LogFile->GetFilePath()).append("): ").append(std::strerror(LogFileErrorCode)), LogLevels::Error), LogLevels::Error);
		WriteToSysLog(FormattedMessage, Severity);
	}
}

std::unique_ptr<ILogWriter> LogWriterFactory::CreateLogWriter(const LogLevels MinimumSeverity, std::ostream &Console, const std::string_view &LogFilePath)
{
	if (MinimumSeverity != LogLevels::None)
	{
		return std::make_unique<ActiveLogWriter>(MinimumSeverity, Console, LogFilePath);
	}
	return std::make_unique<PassiveLogWriter>();
}
