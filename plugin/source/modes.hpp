#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "expression.hpp"
#include "pveobject.hpp"

/// @brief Resource mode: which cluster objects are checked, which fields carry performance data and how an object is named in the output.
class IResourceMode
{
public:
	IResourceMode() = default;
	virtual ~IResourceMode() = default;
	IResourceMode(const IResourceMode &) = delete;
	IResourceMode &operator=(const IResourceMode &) = delete;

	virtual std::string_view GetName() const = 0;
	virtual std::string_view GetHelp() const = 0;

	/// @return Performance field name to unit suffix, iterated in field name order
	virtual const std::map<std::string, std::string> &GetPerfFields() const = 0;

	virtual std::string GetObjectName(const PveObject &Object) const = 0;

	/// @return Expression selecting this mode's objects from /cluster/resources
	Expression GetTypeFilter() const;
};

class NodeMode : public IResourceMode
{
public:
	virtual std::string_view GetName() const override { return "node"; }
	virtual std::string_view GetHelp() const override { return "Check cluster nodes: cpu, memory, root disk and uptime"; }
	virtual const std::map<std::string, std::string> &GetPerfFields() const override;
	virtual std::string GetObjectName(const PveObject &Object) const override { return Object.GetText("node"); }
};

class QemuMode : public IResourceMode
{
public:
	virtual std::string_view GetName() const override { return "qemu"; }
	virtual std::string_view GetHelp() const override { return "Check QEMU virtual machines: cpu, memory, disk, network and disk I/O, uptime"; }
	virtual const std::map<std::string, std::string> &GetPerfFields() const override;
	virtual std::string GetObjectName(const PveObject &Object) const override;
};

class LxcMode : public IResourceMode
{
public:
	virtual std::string_view GetName() const override { return "lxc"; }
	virtual std::string_view GetHelp() const override { return "Check LXC containers: cpu, memory, disk, network and disk I/O, uptime"; }
	virtual const std::map<std::string, std::string> &GetPerfFields() const override;
	virtual std::string GetObjectName(const PveObject &Object) const override { return Object.GetText("name"); }
};

class StorageMode : public IResourceMode
{
public:
	virtual std::string_view GetName() const override { return "storage"; }
	virtual std::string_view GetHelp() const override { return "Check storage volumes: disk usage"; }
	virtual const std::map<std::string, std::string> &GetPerfFields() const override;
	virtual std::string GetObjectName(const PveObject &Object) const override;
};

namespace Modes
{
	constexpr const std::string_view status{"status"};
	constexpr const std::string_view statusHelp{"Check cluster quorum and node membership"};

	/// @return The resource mode with this name, nullptr for "status" and unknown names
	const IResourceMode *FindResourceMode(const std::string_view &Name);

	const std::vector<std::unique_ptr<IResourceMode>> &GetResourceModes();
}
