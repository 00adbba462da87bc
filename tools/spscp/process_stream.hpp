#ifndef SP_SCP_TOOLS_PROCESS_STREAM_HEADER
#define SP_SCP_TOOLS_PROCESS_STREAM_HEADER

#include "scp/common/logger.hpp"
#include "scp/core/stream.hpp"

#include <asio.hpp>

#include <chrono>
#include <optional>
#include <sys/types.h>

namespace securepath::scp {

/** \brief Child process started with "/bin/sh -c <command>", its stdin and stdout are the transport
 *
 *  Reads come from the child's stdout, writes go to its stdin. Blocking operations wake up every poll interval
 *  to check the cancel context and abort the pending operation when it triggers.
 */
class process_stream : public in_stream, public out_stream {
public:
	process_stream(logger&, std::string command, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
	~process_stream();

	process_stream(process_stream const&) = delete;
	process_stream& operator=(process_stream const&) = delete;

	io_result read(span s, cancel_context const&) override;
	io_result write(const_span s, cancel_context const&) override;

	/// closes the child's stdin so the remote sees end of stream
	void close_input();

	/// closes the pipes and waits for the child, returns exit code or -1 if it did not exit normally
	int wait();

private:
	template<typename Result>
	void run_until(std::optional<Result>& done, asio::posix::stream_descriptor&, cancel_context const&);

	io_result to_result(asio::error_code const&, std::size_t, bool cancel_requested) const;

private:
	logger& log_;
	std::chrono::milliseconds const poll_interval_;
	asio::io_context io_;
	asio::posix::stream_descriptor to_child_;
	asio::posix::stream_descriptor from_child_;
	pid_t pid_{-1};
	std::optional<int> exit_code_;
};

}

#endif
