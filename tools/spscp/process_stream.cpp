#include "process_stream.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace securepath::scp {

namespace {

struct pipe_pair {
	int fd[2]{-1, -1};

	pipe_pair() {
		if(::pipe2(fd, O_CLOEXEC) < 0) {
			throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
		}
	}

	~pipe_pair() {
		close_read();
		close_write();
	}

	void close_read() {
		if(fd[0] >= 0) {
			::close(fd[0]);
			fd[0] = -1;
		}
	}

	void close_write() {
		if(fd[1] >= 0) {
			::close(fd[1]);
			fd[1] = -1;
		}
	}

	int release_read() { return std::exchange(fd[0], -1); }
	int release_write() { return std::exchange(fd[1], -1); }
};

}

process_stream::process_stream(logger& log, std::string command, std::chrono::milliseconds poll_interval)
: log_(log)
, poll_interval_(poll_interval)
, to_child_(io_)
, from_child_(io_)
{
	pipe_pair in_pipe;  // parent writes, child reads as stdin
	pipe_pair out_pipe; // child writes as stdout, parent reads

	log_.log(logger::debug, "starting transport: {}", command);

	pid_ = ::fork();
	if(pid_ < 0) {
		throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
	}

	if(pid_ == 0) {
		// child, only async-signal-safe calls from here
		if(::dup2(in_pipe.fd[0], STDIN_FILENO) < 0 || ::dup2(out_pipe.fd[1], STDOUT_FILENO) < 0) {
			::_exit(127);
		}
		::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
		::_exit(127);
	}

	to_child_.assign(in_pipe.release_write());
	from_child_.assign(out_pipe.release_read());

	// writing to exited child must not kill us
	::signal(SIGPIPE, SIG_IGN);
}

process_stream::~process_stream() {
	if(pid_ > 0 && !exit_code_) {
		wait();
	}
}

template<typename Result>
void process_stream::run_until(std::optional<Result>& done, asio::posix::stream_descriptor& d, cancel_context const& c) {
	io_.restart();
	bool cancel_requested = false;
	while(!done) {
		if(!cancel_requested && c.is_cancelled()) {
			asio::error_code ec;
			d.cancel(ec);
			cancel_requested = true;
		}
		io_.run_one_for(poll_interval_);
	}
}

io_result process_stream::to_result(asio::error_code const& ec, std::size_t size, bool cancel_requested) const {
	if(!ec) {
		return io_result{io_status::ok, size, {}};
	}
	if(ec == asio::error::eof) {
		return io_result{io_status::end_of_stream, size, {}};
	}
	if(ec == asio::error::operation_aborted || cancel_requested) {
		return io_result{io_status::cancelled, size, "cancelled"};
	}
	return io_result{io_status::error, size, ec.message()};
}

io_result process_stream::read(span s, cancel_context const& c) {
	if(c.is_cancelled()) {
		return io_result{io_status::cancelled, 0, "cancelled"};
	}
	if(!from_child_.is_open()) {
		return io_result{io_status::end_of_stream, 0, {}};
	}

	std::optional<std::pair<asio::error_code, std::size_t>> done;
	from_child_.async_read_some(asio::buffer(s.data(), s.size()),
		[&](asio::error_code ec, std::size_t n) { done.emplace(ec, n); });

	run_until(done, from_child_, c);
	return to_result(done->first, done->second, c.is_cancelled());
}

io_result process_stream::write(const_span s, cancel_context const& c) {
	if(c.is_cancelled()) {
		return io_result{io_status::cancelled, 0, "cancelled"};
	}
	if(!to_child_.is_open()) {
		return io_result{io_status::error, 0, "transport input closed"};
	}

	std::optional<std::pair<asio::error_code, std::size_t>> done;
	to_child_.async_write_some(asio::buffer(s.data(), s.size()),
		[&](asio::error_code ec, std::size_t n) { done.emplace(ec, n); });

	run_until(done, to_child_, c);
	return to_result(done->first, done->second, c.is_cancelled());
}

void process_stream::close_input() {
	if(to_child_.is_open()) {
		asio::error_code ec;
		to_child_.close(ec);
		if(ec) {
			log_.log(logger::debug, "closing transport input failed: {}", ec.message());
		}
	}
}

int process_stream::wait() {
	if(exit_code_) {
		return *exit_code_;
	}

	close_input();
	asio::error_code ec;
	from_child_.close(ec);

	int status{};
	pid_t res{};
	do {
		res = ::waitpid(pid_, &status, 0);
	} while(res < 0 && errno == EINTR);

	if(res < 0) {
		log_.log(logger::error, "waitpid failed: {}", std::strerror(errno));
		exit_code_ = -1;
	} else {
		exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
		log_.log(logger::debug, "transport exited [code={}]", *exit_code_);
	}
	return *exit_code_;
}

}
