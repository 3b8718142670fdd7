#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <string>
#include "outputfile.hpp"

int OutputFile::PrepareFile()
{
	std::error_code ErrorCode{};
	auto DirectoryName{std::filesystem::path{FilePath}.parent_path()};
	if (!DirectoryName.empty())
	{
		std::filesystem::create_directories(DirectoryName, ErrorCode);
	}
	int ReturnValue{ErrorCode.value()};
	if (ReturnValue == 0)
	{
		File.reset(std::fopen(FilePath.c_str(), "a"));
		if (File == nullptr)
		{
			ReturnValue = errno;
		}
	}
	return ReturnValue;
}

int OutputFile::Write(const std::string &Message, const bool WithStamp)
{
	int FileActionResult{0};
	if (File == nullptr)
	{
		FileActionResult = PrepareFile();
	}

	if (FileActionResult == 0)
	{
		if (WithStamp)
		{
			FileActionResult = std::fputc('[', File.get());
			std::time_t CurrentTime{std::time(nullptr)};
			std::tm *TimeInfo{std::localtime(&CurrentTime)};
			char TimeBuffer[128];
			std::strftime(TimeBuffer, sizeof(TimeBuffer), "%Y-%m-%d %H:%M:%S", TimeInfo);
			FileActionResult = std::fputs(TimeBuffer, File.get());
			FileActionResult = std::fputs("]: ", File.get());
		}
		FileActionResult = std::fputs(Message.c_str(), File.get());
		if (FileActionResult != EOF)
		{
			FileActionResult = std::fputc('\n', File.get());
		}

		if (FileActionResult == EOF)
		{
			FileActionResult = errno ? errno : EIO;
		}
		else
		{
			FileActionResult = std::fflush(File.get()) == 0 ? 0 : errno;
		}
	}
	return FileActionResult;
}
