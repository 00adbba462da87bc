#include "remote_command.hpp"
#include "scp/common/util.hpp"

namespace securepath::scp {

std::string_view to_string(transfer_direction d) {
	switch(d) {
		case transfer_direction::upload:   return "upload";
		case transfer_direction::download: return "download";
	}
	return "unknown";
}

std::string remote_command(transfer_direction d, scp_config const& config, std::string_view remote_path) {
	std::string cmd = config.remote_binary;
	cmd += d == transfer_direction::upload ? " -qt" : " -qf";
	if(config.preserve_times) {
		cmd += " -p";
	}
	if(config.recursive && d == transfer_direction::upload) {
		cmd += " -r";
	}
	cmd += " ";
	cmd += shell_quote(remote_path.empty() ? "." : remote_path);
	return cmd;
}

}
