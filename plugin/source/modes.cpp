#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "modes.hpp"

// units follow the Nagios perfdata conventions
constexpr const std::string_view NoUnit{""};
constexpr const std::string_view Bytes{"B"};
constexpr const std::string_view Seconds{"s"};

static const std::map<std::string, std::string> GuestPerfFields{
	 {"cpu", std::string{NoUnit}},
	 {"mem", std::string{Bytes}},
	 {"disk", std::string{Bytes}},
	 {"netin", std::string{Bytes}},
	 {"netout", std::string{Bytes}},
	 {"diskread", std::string{Bytes}},
	 {"diskwrite", std::string{Bytes}},
	 {"uptime", std::string{Seconds}}};

Expression IResourceMode::GetTypeFilter() const
{
	ExpressionClause TypeClause{.Key = "type", .Pattern = std::string{GetName()}};
	return Expression{std::string{"type="}.append(GetName()), {TypeClause}};
}

const std::map<std::string, std::string> &NodeMode::GetPerfFields() const
{
	static const std::map<std::string, std::string> PerfFields{
		 {"cpu", std::string{NoUnit}},
		 {"mem", std::string{Bytes}},
		 {"disk", std::string{Bytes}},
		 {"uptime", std::string{Seconds}}};
	return PerfFields;
}

const std::map<std::string, std::string> &QemuMode::GetPerfFields() const
{
	return GuestPerfFields;
}

std::string QemuMode::GetObjectName(const PveObject &Object) const
{
	return Object.GetText("node").append(1, '.').append(Object.GetText("name"));
}

const std::map<std::string, std::string> &LxcMode::GetPerfFields() const
{
	return GuestPerfFields;
}

const std::map<std::string, std::string> &StorageMode::GetPerfFields() const
{
	static const std::map<std::string, std::string> PerfFields{{"disk", std::string{Bytes}}};
	return PerfFields;
}

std::string StorageMode::GetObjectName(const PveObject &Object) const
{
	return Object.GetText("node").append(1, '.').append(Object.GetText("storage"));
}

static std::vector<std::unique_ptr<IResourceMode>> CreateResourceModes()
{
	std::vector<std::unique_ptr<IResourceMode>> ResourceModes{};
	ResourceModes.emplace_back(std::make_unique<NodeMode>());
	ResourceModes.emplace_back(std::make_unique<QemuMode>());
	ResourceModes.emplace_back(std::make_unique<StorageMode>());
	ResourceModes.emplace_back(std::make_unique<LxcMode>());
	return ResourceModes;
}

const std::vector<std::unique_ptr<IResourceMode>> &Modes::GetResourceModes()
{
	static const std::vector<std::unique_ptr<IResourceMode>> ResourceModes{CreateResourceModes()};
	return ResourceModes;
}

const IResourceMode *Modes::FindResourceMode(const std::string_view &Name)
{
	for (const auto &ResourceMode : GetResourceModes())
	{
		if (ResourceMode->GetName() == Name)
		{
			return ResourceMode.get();
		}
	}
	return nullptr;
}
