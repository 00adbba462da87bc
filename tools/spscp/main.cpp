#include "spscp_commands.hpp"
#include "local_files.hpp"
#include "process_stream.hpp"
#include "scp/client/remote_command.hpp"
#include "scp/common/util.hpp"
#include "scp/core/progress_stream.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace securepath::scp {

static void print_report(std::ostream& out, transfer_report const& report) {
	for(auto&& f : report.files) {
		std::string name = f.file.filename.empty() ? printable(f.file.raw_message) : f.file.filename;
		if(f.error) {
			out << name << ": " << f.error << "\n";
		} else {
			out << name << ": " << f.file.size << " bytes\n";
		}
	}
	out << report.files.size() - report.failed_count() << " files transferred, "
		<< report.failed_count() << " failed, " << report.bytes << " bytes\n";
}

static int run(spscp_commands const& cmds) {
	stderr_logger log(log_level_for_verbosity(cmds.very_verbose ? 2 : cmds.verbose ? 1 : 0));

	auto direction = cmds.upload.empty() ? transfer_direction::download : transfer_direction::upload;
	std::string remote_path = direction == transfer_direction::upload ? cmds.to : cmds.download;

	log.log(logger::debug, "starting {} [remote path={}]", to_string(direction), remote_path);

	std::string command = cmds.transport + " " + shell_quote(remote_command(direction, cmds, remote_path));
	process_stream transport(log, command);

	std::unique_ptr<cancel_context> cancel = cmds.timeout
		? std::make_unique<cancel_context>(std::chrono::seconds(cmds.timeout))
		: std::make_unique<cancel_context>();

	progress_observer observer;
	if(cmds.progress) {
		observer = [](std::uint64_t total, std::size_t) {
			std::fprintf(stderr, "\r%llu bytes", static_cast<unsigned long long>(total));
		};
	}

	transfer_logger tlog(log, remote_path);
	scp_client client(transport, transport, tlog, cmds);
	transfer_report report;
	scp_error err;

	if(direction == transfer_direction::upload) {
		progress_out_stream payload(transport, observer);
		err = upload_path(client, cmds.upload, *cancel, report, cmds.progress ? &payload : nullptr);
	} else {
		progress_in_stream payload(transport, observer);
		directory_sink sink(log, cmds.to, cmds.preserve_times);
		err = client.download(sink, *cancel, report, cmds.progress ? &payload : nullptr);
	}

	if(cmds.progress) {
		std::fputc('\n', stderr);
	}

	transport.close_input();
	int exit_code = transport.wait();

	print_report(std::cout, report);

	if(err) {
		log.log(logger::error, "transfer failed: {}", err);
		return 1;
	}
	if(exit_code != 0) {
		log.log(logger::info, "remote side exited with code {}", exit_code);
	}
	return report.failed_count() || exit_code != 0 ? 1 : 0;
}

}

int main(int argc, char* argv[]) {
	try {
		using namespace securepath::scp;
		spscp_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "spscp - scp client over transport command\n";
			spscp_commands().print_help(std::cout);
			return 0;
		}
		if(!p.config_file.empty()) {
			p.parse_file(p.config_file);
		}
		p.validate();

		return run(p);
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 1;
	}
}
