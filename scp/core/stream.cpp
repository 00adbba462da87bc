#include "stream.hpp"

namespace securepath::scp {

io_result read_exact(in_stream& in, span s, cancel_context const& c) {
	std::size_t done{};
	while(done != s.size()) {
		if(c.is_cancelled()) {
			return io_result{io_status::cancelled, done, "cancelled"};
		}
		auto res = in.read(s.subspan(done), c);
		if(!res.ok()) {
			res.size = done;
			return res;
		}
		if(res.size == 0) {
			return io_result{io_status::end_of_stream, done, "stream returned no data"};
		}
		done += res.size;
	}
	return io_result{io_status::ok, done, {}};
}

io_result write_all(out_stream& out, const_span s, cancel_context const& c) {
	std::size_t done{};
	while(done != s.size()) {
		if(c.is_cancelled()) {
			return io_result{io_status::cancelled, done, "cancelled"};
		}
		auto res = out.write(s.subspan(done), c);
		if(!res.ok()) {
			res.size = done;
			return res;
		}
		if(res.size == 0) {
			return io_result{io_status::error, done, "short write"};
		}
		done += res.size;
	}
	return io_result{io_status::ok, done, {}};
}

scp_error to_error(io_result const& res, scp_error_code eof_code) {
	switch(res.status) {
		case io_status::ok:            return scp_error{};
		case io_status::end_of_stream: return scp_error{eof_code, res.message.empty() ? "unexpected end of stream" : res.message};
		case io_status::cancelled:     return scp_error{scp_error_code::cancelled, res.message};
		case io_status::error:         break;
	}
	return scp_error{scp_error_code::transport_error, res.message};
}

}
