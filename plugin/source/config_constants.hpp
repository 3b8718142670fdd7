#pragma once

#define __CHECKPVE_PACKAGE_NAME__ "check_proxmox"

#include <string>
#include <string_view>

namespace ConfigConstants
{
	constexpr const std::string_view packagename{__CHECKPVE_PACKAGE_NAME__};
	constexpr const std::string_view appname{__CHECKPVE_PACKAGE_NAME__ "\0"}; // used in C APIs, do not assume NUL-termination
	constexpr const std::string_view ConfigFilePath{"/etc/" __CHECKPVE_PACKAGE_NAME__ "/" __CHECKPVE_PACKAGE_NAME__ ".toml"};

	namespace Headers
	{
		constexpr const std::string_view check{"check"};
		constexpr const std::string_view logging{"logging"};
		constexpr const std::string_view api{"api"};
	};

	namespace Fields
	{
		constexpr const std::string_view enabled{"enabled"};
		constexpr const std::string_view level{"level"};
		constexpr const std::string_view file{"file"};
		constexpr const std::string_view timeout{"timeout"};
		constexpr const std::string_view host{"host"};
		constexpr const std::string_view password{"password"};
		constexpr const std::string_view username{"username"};
		constexpr const std::string_view port{"port"};
		constexpr const std::string_view realm{"realm"};
		constexpr const std::string_view mode{"mode"};
		constexpr const std::string_view warnstr{"warnstr"};
		constexpr const std::string_view critstr{"critstr"};
		constexpr const std::string_view override{"override"};
		constexpr const std::string_view filter{"filter"};
		constexpr const std::string_view insecure{"insecure"};
		constexpr const std::string_view verbose{"verbose"};
		constexpr const std::string_view debug{"debug"};
	};

	namespace Values
	{
		constexpr const std::string_view debug{"debug"};
		constexpr const std::string_view info{"info"};
		constexpr const std::string_view warn{"warn"};
		constexpr const std::string_view error{"error"};
		constexpr const std::string_view fatal{"fatal"};
		constexpr const std::string_view protocol{"https"};
	};

	namespace DefaultValues
	{
		constexpr const std::string_view logLevel{Values::error};
		constexpr const std::string_view username{"root"};
		constexpr const long port{8006};
		constexpr const std::string_view realm{"pam"};
		constexpr const long timeoutSeconds{10};
	};

	namespace ExitCodes
	{
		constexpr const int usage{255};
	};
}
