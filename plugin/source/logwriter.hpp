#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include "outputfile.hpp"

enum class LogLevels
{
	None,
	Debug,
	Info,
	Warn,
	Error,
	Fatal
};

/// @brief Log sink shared by every component. Entries below the writer's minimum severity are dropped.
class ILogWriter
{
public:
	ILogWriter() = default;
	virtual ~ILogWriter() = default;
	ILogWriter(const ILogWriter &) = delete;
	ILogWriter &operator=(const ILogWriter &) = delete;
	ILogWriter(ILogWriter &&) = default;
	ILogWriter &operator=(ILogWriter &&) = default;
	virtual bool ShouldWrite(const LogLevels Severity) const = 0;
	virtual void WriteEntry(const LogLevels, const std::string_view &Message) = 0;
	void WriteDebug(const std::string_view &Message) { WriteEntry(LogLevels::Debug, Message); }
	void WriteInfo(const std::string_view &Message) { WriteEntry(LogLevels::Info, Message); }
	void WriteWarn(const std::string_view &Message) { WriteEntry(LogLevels::Warn, Message); }
	void WriteFatal(const std::string_view &Message) { WriteEntry(LogLevels::Fatal, Message); }

	/// @brief Writes "Activity (Item)" or "Activity (Item): Detail". The message is only built when Severity is enabled.
	void WriteAnnotatedEntry(const LogLevels Severity, const std::string_view &Activity, const std::string_view &Item, const std::string_view &Detail = "")
	{
		if (!ShouldWrite(Severity))
		{
			return;
		}
		std::string Message{Activity};
		Message.append(" (").append(Item).append(1, ')');
		if (!Detail.empty())
		{
			Message.append(": ").append(Detail);
		}
		WriteEntry(Severity, Message);
	}

	void WriteDebugAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &Detail = "") { WriteAnnotatedEntry(LogLevels::Debug, Activity, Item, Detail); }
	void WriteInfoAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &Detail = "") { WriteAnnotatedEntry(LogLevels::Info, Activity, Item, Detail); }
	void WriteWarnAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &Detail = "") { WriteAnnotatedEntry(LogLevels::Warn, Activity, Item, Detail); }
	void WriteErrorAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &Detail = "") { WriteAnnotatedEntry(LogLevels::Error, Activity, Item, Detail); }
};

/// @brief Writes entries synchronously to a console stream (stderr, never the plugin's stdout) and optionally to a log file.
/// Falls back to syslog for the file once a file write fails.
class ActiveLogWriter : public ILogWriter
{
private:
	LogLevels MinimumSeverity;
	std::ostream &Console;
	std::unique_ptr<OutputFile> LogFile{nullptr};
	bool UseSyslog{false};

public:
	ActiveLogWriter(const LogLevels MinimumSeverity, std::ostream &Console, const std::string_view &LogFilePath);
	virtual ~ActiveLogWriter() = default;
	virtual bool ShouldWrite(const LogLevels Severity) const override { return Severity >= MinimumSeverity; }
	virtual void WriteEntry(const LogLevels, const std::string_view &Message) override;
};

class PassiveLogWriter : public ILogWriter
{
public:
	PassiveLogWriter() = default;
	virtual ~PassiveLogWriter() = default;
	virtual bool ShouldWrite(const LogLevels) const override { return false; }
	virtual void WriteEntry(const LogLevels, const std::string_view &) override {}
};

class LogWriterFactory
{
private:
	LogWriterFactory() = default;

public:
	static std::unique_ptr<ILogWriter> CreateEmptyLogWriter() { return std::make_unique<PassiveLogWriter>(); }
	static std::unique_ptr<ILogWriter> CreateLogWriter(const LogLevels MinimumSeverity, std::ostream &Console, const std::string_view &LogFilePath);
};
