#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>
#include "pveobject.hpp"
#include "utility.hpp"

PveObject PveObject::FromJson(const nlohmann::json &JsonObject)
{
	PveObject Object{};
	if (!JsonObject.is_object())
	{
		return Object;
	}
	for (const auto &[Key, Value] : JsonObject.items())
	{
		if (Value.is_string())
		{
			Object.Set(Key, Value.get<std::string>());
		}
		else if (Value.is_boolean())
		{
			Object.Set(Key, Value.get<bool>() ? 1.0 : 0.0);
		}
		else if (Value.is_number())
		{
			Object.Set(Key, Value.get<double>());
		}
	}
	return Object;
}

std::string PveObject::GetText(const std::string_view &Key) const
{
	auto FieldSearch{Fields.find(Key)};
	if (FieldSearch == Fields.end())
	{
		return std::string{};
	}
	if (const auto *Text{std::get_if<std::string>(&FieldSearch->second)})
	{
		return *Text;
	}
	return Utility::FormatNumber(std::get<double>(FieldSearch->second));
}

double PveObject::GetNumber(const std::string_view &Key) const
{
	auto FieldSearch{Fields.find(Key)};
	if (FieldSearch == Fields.end())
	{
		return 0;
	}
	if (const auto *Number{std::get_if<double>(&FieldSearch->second)})
	{
		return *Number;
	}
	return Utility::ToNumber(std::get<std::string>(FieldSearch->second));
}

bool PveObject::IsTruthy(const std::string_view &Key) const
{
	auto FieldSearch{Fields.find(Key)};
	if (FieldSearch == Fields.end())
	{
		return false;
	}
	if (const auto *Number{std::get_if<double>(&FieldSearch->second)})
	{
		return *Number != 0;
	}
	const auto &Text{std::get<std::string>(FieldSearch->second)};
	return !Text.empty() && Text != "0";
}
