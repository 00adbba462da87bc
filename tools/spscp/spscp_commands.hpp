#ifndef SP_SCP_TOOLS_SPSCP_COMMANDS_HEADER
#define SP_SCP_TOOLS_SPSCP_COMMANDS_HEADER

#include "scp/core/scp_config.hpp"
#include "tools/common/command_parser.hpp"

namespace securepath::scp {

struct spscp_commands : scp_config, command_parser {
	spscp_commands();

	bool help{};
	bool verbose{};
	bool very_verbose{};
	bool progress{};
	std::string config_file;

	std::string upload;
	std::string download;
	std::string to;
	std::string transport;
	unsigned timeout{};

	/// throws invalid_argument if the options do not describe one transfer
	void validate() const;
};

}

#endif
