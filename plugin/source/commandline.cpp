#include <getopt.h>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "commandline.hpp"
#include "config_constants.hpp"
#include "modes.hpp"
#include "utility.hpp"

constexpr const std::string_view UnknownOption{"Unknown option: "};
constexpr const std::string_view MissingArgument{"Missing argument for option: "};
constexpr const std::string_view PortNotNumeric{"Port must be a number: "};
constexpr const std::string_view UnexpectedArgument{"Unexpected argument: "};

// long-only options
enum LongOptionIds
{
	WarnStrOption = 1000,
	CritStrOption,
	OverrideOption
};

static const option LongOptions[]{
	 {"host", required_argument, nullptr, 'H'},
	 {"password", required_argument, nullptr, 'p'},
	 {"username", required_argument, nullptr, 'u'},
	 {"port", required_argument, nullptr, 'P'},
	 {"realm", required_argument, nullptr, 'r'},
	 {"mode", required_argument, nullptr, 'm'},
	 {"warnstr", required_argument, nullptr, WarnStrOption},
	 {"critstr", required_argument, nullptr, CritStrOption},
	 {"override", required_argument, nullptr, OverrideOption},
	 {"filter", required_argument, nullptr, 'f'},
	 {"config", required_argument, nullptr, 'c'},
	 {"insecure", no_argument, nullptr, 'k'},
	 {"help", no_argument, nullptr, 'h'},
	 {"debug", no_argument, nullptr, 'd'},
	 {"verbose", no_argument, nullptr, 'v'},
	 {nullptr, 0, nullptr, 0}};

constexpr const char ShortOptions[]{":H:p:u:P:r:m:f:c:khdv"};

static std::string DescribeOption(int argc, char *argv[], const int OptionCharacter)
{
	if (OptionCharacter != 0 && OptionCharacter < WarnStrOption)
	{
		return std::string{"-"}.append(1, static_cast<char>(OptionCharacter));
	}
	return (optind > 0 && optind <= argc) ? std::string{argv[optind - 1]} : std::string{};
}

std::optional<CheckOptions> CommandLine::Parse(int argc, char *argv[], std::string &ErrorMessage)
{
	CheckOptions Options{};
	optind = 0; // glibc reinitializes its scanner so Parse can run more than once
	opterr = 0;
	int OptionCharacter;
	while ((OptionCharacter = getopt_long(argc, argv, ShortOptions, LongOptions, nullptr)) != -1)
	{
		switch (OptionCharacter)
		{
		case 'H':
			Options.Hosts.emplace_back(optarg);
			break;
		case 'p':
			Options.Password = optarg;
			break;
		case 'u':
			Options.UserName = optarg;
			break;
		case 'P':
			if (std::string_view{optarg}.empty() || !Utility::IsDigitsOnly(optarg) || std::string_view{optarg}.size() > 5)
			{
				ErrorMessage = std::string{PortNotNumeric}.append(optarg);
				return std::nullopt;
			}
			Options.Port = std::stol(optarg);
			break;
		case 'r':
			Options.Realm = optarg;
			break;
		case 'm':
			Options.Mode = optarg;
			break;
		case WarnStrOption:
			Options.WarnStr.emplace_back(optarg);
			break;
		case CritStrOption:
			Options.CritStr.emplace_back(optarg);
			break;
		case OverrideOption:
			Options.Overrides.emplace_back(optarg);
			break;
		case 'f':
			Options.Filter = optarg;
			break;
		case 'c':
			Options.ConfigFile = optarg;
			break;
		case 'k':
			Options.Insecure = true;
			break;
		case 'h':
			Options.Help = true;
			break;
		case 'd':
			Options.Debug = true;
			break;
		case 'v':
			Options.Verbose = true;
			break;
		case ':':
			ErrorMessage = std::string{MissingArgument}.append(DescribeOption(argc, argv, optopt));
			return std::nullopt;
		default:
			ErrorMessage = std::string{UnknownOption}.append(DescribeOption(argc, argv, optopt));
			return std::nullopt;
		}
	}
	if (optind < argc)
	{
		ErrorMessage = std::string{UnexpectedArgument}.append(argv[optind]);
		return std::nullopt;
	}
	return Options;
}

void CommandLine::PrintUsage(std::ostream &Output)
{
	Output << "Usage: " << ConfigConstants::packagename << " -H <host> [-H <host>...] -m <mode> [options]\n"
			 << "\n"
			 << "  -H, --host <host>          Cluster node to query, repeat to fail over to further nodes\n"
			 << "  -u, --username <user>      API user (default " << ConfigConstants::DefaultValues::username << ")\n"
			 << "  -p, --password <password>  API password\n"
			 << "  -r, --realm <realm>        Authentication realm (default " << ConfigConstants::DefaultValues::realm << ")\n"
			 << "  -P, --port <port>          API port (default " << ConfigConstants::DefaultValues::port << ")\n"
			 << "  -m, --mode <mode>          Resource type to check, see below\n"
			 << "  -f, --filter <expression>  Only check objects matching key=glob / key!=glob clauses\n"
			 << "      --warnstr <p^label^message>   Raise WARNING for objects matching p\n"
			 << "      --critstr <p^label^message>   Raise CRITICAL for objects matching p\n"
			 << "      --override <p^field^number>   Set field on objects matching p before evaluation\n"
			 << "  -c, --config <file>        Configuration file (default " << ConfigConstants::ConfigFilePath << ")\n"
			 << "  -k, --insecure             Do not verify the TLS certificate\n"
			 << "  -v, --verbose              Log progress to stderr\n"
			 << "  -d, --debug                Log everything to stderr\n"
			 << "  -h, --help                 Show this help\n"
			 << "\n"
			 << "Modes:\n";
	for (const auto &ResourceMode : Modes::GetResourceModes())
	{
		Output << "  " << ResourceMode->GetName() << ": " << ResourceMode->GetHelp() << '\n';
	}
	Output << "  " << Modes::status << ": " << Modes::statusHelp << '\n';
}
