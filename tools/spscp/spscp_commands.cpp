#include "spscp_commands.hpp"

namespace securepath::scp {

spscp_commands::spscp_commands()
: command_parser(false)
{
	add(help, "help", "", "show help");
	add(verbose, "verbose", "v", "verbose logging");
	add(very_verbose, "very-verbose", "vv", "very verbose logging");
	add(config_file, "config", "c", "config file");
	add(upload, "upload", "u", "local file or directory to upload");
	add(download, "download", "d", "remote path to download");
	add(to, "to", "t", "destination: remote path for upload, local file or directory for download");
	add(transport, "command", "e", "transport command the remote scp invocation is appended to, e.g. \"ssh user@host\"");
	add(timeout, "timeout", "", "abort the transfer after given seconds (0 = no limit)");
	add(progress, "progress", "", "print transferred bytes");
	add(preserve_times, "preserve", "p", "preserve modification and access times");
	add(recursive, "recursive", "r", "upload directories recursively");
	add(buffer_size, "buffer-size", "", "payload chunk size");
	add(remote_binary, "remote-binary", "", "scp program on the remote side");

	// the tool always talks to a real scp
	expect_ready_byte = true;
}

void spscp_commands::validate() const {
	if(upload.empty() == download.empty()) {
		throw invalid_argument("exactly one of --upload and --download is required");
	}
	if(transport.empty()) {
		throw invalid_argument("--command is required");
	}
	if(!download.empty() && to.empty()) {
		throw invalid_argument("--to is required for download");
	}
	if(!download.empty() && recursive) {
		throw invalid_argument("recursive download is not supported");
	}
	if(buffer_size == 0) {
		throw invalid_argument("--buffer-size must be positive");
	}
}

}
