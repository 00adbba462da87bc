#ifndef SP_SCP_PROGRESS_STREAM_HEADER
#define SP_SCP_PROGRESS_STREAM_HEADER

#include "stream.hpp"

#include <functional>

namespace securepath::scp {

/// called after each successful operation with the total bytes so far and the bytes of this operation
using progress_observer = std::function<void(std::uint64_t total, std::size_t transferred)>;

/// forwards reads unchanged and reports the byte counts
class progress_in_stream : public in_stream {
public:
	progress_in_stream(in_stream& next, progress_observer observer);

	io_result read(span s, cancel_context const&) override;

	std::uint64_t total() const { return total_; }

private:
	in_stream& next_;
	progress_observer observer_;
	std::uint64_t total_{};
};

/// forwards writes unchanged and reports the byte counts
class progress_out_stream : public out_stream {
public:
	progress_out_stream(out_stream& next, progress_observer observer);

	io_result write(const_span s, cancel_context const&) override;

	std::uint64_t total() const { return total_; }

private:
	out_stream& next_;
	progress_observer observer_;
	std::uint64_t total_{};
};

}

#endif
