#ifndef SP_SCP_STREAM_HEADER
#define SP_SCP_STREAM_HEADER

#include "cancellation.hpp"
#include "errors.hpp"
#include "scp/common/types.hpp"

namespace securepath::scp {

enum class io_status {
	ok,
	end_of_stream,
	error,
	cancelled
};

struct io_result {
	io_status status{io_status::ok};
	std::size_t size{};
	std::string message;

	bool ok() const { return status == io_status::ok; }
};

/** \brief Readable end of an ordered byte stream
 *
 *
 */
class in_stream {
protected:
	~in_stream() = default;
public:
	/** \brief Blocks until at least one byte is available and reads at most s.size() bytes to s.
	 *   Returns end_of_stream if the other side closed, cancelled if the context was triggered while waiting.
	 *   On success size is the number of bytes read, which is non-zero for non-empty s.
	 */
	virtual io_result read(span s, cancel_context const&) = 0;
};

/** \brief Writable end of an ordered byte stream
 *
 *
 */
class out_stream {
protected:
	~out_stream() = default;
public:
	/// Blocks until some of the bytes are written, size tells how many. Partial writes are allowed.
	virtual io_result write(const_span s, cancel_context const&) = 0;
};

/// Loops read until s is filled. Running out of data before that is reported as end_of_stream.
io_result read_exact(in_stream&, span s, cancel_context const&);

/// Loops write until the whole s is written
io_result write_all(out_stream&, const_span s, cancel_context const&);

inline io_result write_all(out_stream& out, std::string_view s, cancel_context const& c) {
	return write_all(out, to_span(s), c);
}

/// Maps failed io_result to scp_error, eof is either session end or transport failure depending on the caller
scp_error to_error(io_result const&, scp_error_code eof_code = scp_error_code::transport_error);

}

#endif
