#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>

using FieldValue = std::variant<std::string, double>;

/// @brief One monitored entity as returned by the cluster API: a node, guest, storage volume or status record.
/// Has no fixed schema. Reading an absent field yields "" or 0.
class PveObject
{
private:
	std::map<std::string, FieldValue, std::less<>> Fields{};

public:
	PveObject() = default;
	PveObject(std::initializer_list<std::pair<const std::string, FieldValue>> InitialFields) : Fields{InitialFields} {}

	/// @brief Builds an object from a JSON object. Strings and numbers are kept, booleans become 1/0, everything else is skipped.
	static PveObject FromJson(const nlohmann::json &JsonObject);

	bool Contains(const std::string_view &Key) const { return Fields.find(Key) != Fields.end(); }
	void Set(const std::string &Key, const std::string &Value) { Fields.insert_or_assign(Key, FieldValue{Value}); }
	void Set(const std::string &Key, const double Value) { Fields.insert_or_assign(Key, FieldValue{Value}); }

	/// @return Text as stored, numbers formatted by Utility::FormatNumber, "" when absent
	std::string GetText(const std::string_view &Key) const;

	/// @return Number as stored, text converted by Utility::ToNumber, 0 when absent
	double GetNumber(const std::string_view &Key) const;

	/// @brief Absent, "", "0" and 0 are false
	bool IsTruthy(const std::string_view &Key) const;

	size_t Size() const { return Fields.size(); }
};

using PveObjectList = std::vector<PveObject>;
