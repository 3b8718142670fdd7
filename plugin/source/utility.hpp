#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Utility
{
	/// @brief Checks if a string is composed only of digits
	/// @param s
	/// @return True if no non-digit characters found, false at the first non-digit character
	bool IsDigitsOnly(const std::string_view &s);

	/// @brief Checks if a string matches ^[0-9]*(\.[0-9]*)?$, which also accepts "" and "."
	bool IsUnsignedDecimal(const std::string_view &s);

	/// @brief Converts the leading decimal number of a string
	/// @return The converted value, or 0 when s does not start with a number
	double ToNumber(const std::string_view &s);

	/// @brief Formats a number with up to 15 significant digits and no trailing zeros
	std::string FormatNumber(const double Value);

	/// @brief Splits on every occurrence of Delimiter, keeping empty parts
	std::vector<std::string> Split(const std::string_view &s, const char Delimiter);

	/// @brief Splits on runs of whitespace (space, tab, newline), dropping empty parts
	std::vector<std::string> SplitWhitespace(const std::string_view &s);

	std::string Join(const std::vector<std::string> &Parts, const std::string_view &Separator);
}
