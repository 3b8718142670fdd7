#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>
#include "utility.hpp"

class NumberRunner
{
protected:
	virtual bool ShouldContinue(const size_t Position, char Character, const bool IsNumeric) = 0;
	void RunString(const std::string_view &s)
	{
		bool DecimalFound{false};
		bool IsNumeric;
		for (size_t Position{0}; Position < s.size(); ++Position)
		{
			IsNumeric = false;
			switch (s[Position])
			{
			case '+':
				[[fallthrough]];
			case '-':
				if (Position == 0)
				{
					IsNumeric = true;
				}
				break;
			case '.':
				if (!DecimalFound)
				{
					DecimalFound = true;
					IsNumeric = true;
				}
				break;
			default:
				IsNumeric = std::isdigit(static_cast<unsigned char>(s[Position]));
				break;
			}
			if (!ShouldContinue(Position, s[Position], IsNumeric))
			{
				return;
			}
		}
	}

public:
	NumberRunner() = default;
	virtual ~NumberRunner() = default;
};

class FirstNonNumeric : public NumberRunner
{
private:
	size_t NonNumericPosition{0};
	bool FoundNonNumeric{false};

protected:
	bool ShouldContinue(const size_t Position, char, const bool IsNumeric) override
	{
		if (!IsNumeric)
		{
			NonNumericPosition = Position;
			FoundNonNumeric = true;
		}
		return IsNumeric;
	}

public:
	FirstNonNumeric() = default;
	virtual ~FirstNonNumeric() = default;

	size_t GetFirstPosition(const std::string_view &s)
	{
		RunString(s);
		if (FoundNonNumeric)
		{
			return NonNumericPosition;
		}
		else
		{
			return s.size();
		}
	}
};

// simpler to use built-in functions than the custom NumberRunner class
bool Utility::IsDigitsOnly(const std::string_view &s)
{
	return std::all_of(s.begin(), s.end(), [](unsigned char c)
							 { return std::isdigit(c); });
}

bool Utility::IsUnsignedDecimal(const std::string_view &s)
{
	auto DotPosition{s.find('.')};
	if (DotPosition == std::string_view::npos)
	{
		return IsDigitsOnly(s);
	}
	return IsDigitsOnly(s.substr(0, DotPosition)) && IsDigitsOnly(s.substr(DotPosition + 1));
}

double Utility::ToNumber(const std::string_view &s)
{
	auto NumberLength{FirstNonNumeric{}.GetFirstPosition(s)};
	if (NumberLength == 0)
	{
		return 0;
	}
	std::string NumberText{s.substr(0, NumberLength)}; // strtod needs NUL termination
	return std::strtod(NumberText.c_str(), nullptr);
}

std::string Utility::FormatNumber(const double Value)
{
	if (std::isfinite(Value) && Value == std::trunc(Value) && std::fabs(Value) < 1e15)
	{
		return std::to_string(static_cast<long long>(Value));
	}
	char Buffer[64];
	std::snprintf(Buffer, sizeof(Buffer), "%.15g", Value);
	return std::string{Buffer};
}

std::vector<std::string> Utility::Split(const std::string_view &s, const char Delimiter)
{
	std::vector<std::string> Parts{};
	size_t Start{0};
	for (auto End{s.find(Delimiter)}; End != std::string_view::npos; End = s.find(Delimiter, Start))
	{
		Parts.emplace_back(s.substr(Start, End - Start));
		Start = End + 1;
	}
	Parts.emplace_back(s.substr(Start));
	return Parts;
}

std::vector<std::string> Utility::SplitWhitespace(const std::string_view &s)
{
	std::vector<std::string> Parts{};
	auto IsSpace{[](unsigned char c)
					 { return std::isspace(c) != 0; }};
	auto Position{s.begin()};
	while (Position != s.end())
	{
		auto Start{std::find_if_not(Position, s.end(), IsSpace)};
		Position = std::find_if(Start, s.end(), IsSpace);
		if (Start != Position)
		{
			Parts.emplace_back(Start, Position);
		}
	}
	return Parts;
}

std::string Utility::Join(const std::vector<std::string> &Parts, const std::string_view &Separator)
{
	std::string Joined{};
	bool First{true};
	for (const auto &Part : Parts)
	{
		if (First)
		{
			First = !First;
		}
		else
		{
			Joined.append(Separator);
		}
		Joined.append(Part);
	}
	return Joined;
}
