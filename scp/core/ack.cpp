#include "ack.hpp"
#include "scp/common/util.hpp"

namespace securepath::scp {

scp_error send_ack(out_stream& out, cancel_context const& c) {
	std::byte const ack{0};
	auto res = write_all(out, const_span(&ack, 1), c);
	if(!res.ok()) {
		return to_error(res);
	}
	return scp_error{};
}

scp_error send_failure(out_stream& out, cancel_context const& c, response_type type, std::string_view message) {
	SPSCP_ASSERT(type != response_type::ok, "failure must be warning or error");

	std::string line;
	line += char(type);
	line += remove_newlines(message);
	line += '\n';

	auto res = write_all(out, line, c);
	if(!res.ok()) {
		return to_error(res);
	}
	return scp_error{};
}

}
