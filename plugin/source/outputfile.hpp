#pragma once

#include <cstdio>
#include <memory>
#include <string>

/// @brief Append-only text file, opened on first write and closed on destruction
class OutputFile
{
private:
	std::string FilePath;
	std::unique_ptr<FILE, int (*)(FILE *)> File{nullptr, std::fclose};

	int PrepareFile();

public:
	OutputFile(const std::string FilePath) : FilePath{std::move(FilePath)} {}
	~OutputFile() = default;
	OutputFile(const OutputFile &other) = delete;
	OutputFile(OutputFile &&other) = delete;
	OutputFile &operator=(const OutputFile &other) = delete;
	OutputFile &operator=(OutputFile &&other) = delete;

	const std::string &GetFilePath() const { return FilePath; }

	/// @return 0 on success, otherwise an errno value
	int Write(const std::string &Message, const bool WithStamp = false);
};
