#include "response.hpp"
#include "scp/common/logger.hpp"
#include "scp/common/util.hpp"

namespace securepath::scp {

std::string_view to_string(response_type t) {
	switch(t) {
		case response_type::ok:      return "ok";
		case response_type::warning: return "warning";
		case response_type::error:   return "error";
	}
	return "unknown";
}

std::string_view to_string(directive_type t) {
	switch(t) {
		case directive_type::permission: return "permission";
		case directive_type::time:       return "time";
		case directive_type::none:       return "none";
	}
	return "unknown";
}

std::string response::text() const {
	return remove_newlines(message_);
}

scp_error response::to_error() const {
	if(is_error()) {
		return scp_error{scp_error_code::remote_error, text()};
	}
	if(is_warning()) {
		return scp_error{scp_error_code::remote_warning, text()};
	}
	return scp_error{};
}

static directive_type as_directive(std::uint8_t c) {
	switch(c) {
		case std::uint8_t(directive_type::permission): return directive_type::permission;
		case std::uint8_t(directive_type::time):       return directive_type::time;
		default: return directive_type::none;
	}
}

// one byte at a time, reading ahead would eat the payload that follows the directive line
static scp_error read_line(in_stream& in, cancel_context const& c, std::string& line, std::size_t max_line_length) {
	std::byte b{};
	do {
		if(line.size() >= max_line_length) {
			return scp_error{scp_error_code::protocol_violation, "response line too long"};
		}
		auto res = read_exact(in, span(&b, 1), c);
		if(!res.ok()) {
			return to_error(res);
		}
		line += char(b);
	} while(b != std::byte{'\n'});

	return scp_error{};
}

scp_error decode_response(in_stream& in, cancel_context const& c, response& out, std::size_t max_line_length) {
	std::byte b{};
	auto res = read_exact(in, span(&b, 1), c);
	if(!res.ok()) {
		return to_error(res, scp_error_code::end_of_stream);
	}

	auto status = std::to_integer<std::uint8_t>(b);
	auto directive = as_directive(status);

	response_type type{};
	if(status <= std::uint8_t(response_type::error)) {
		type = response_type(status);
	} else if(directive == directive_type::none) {
		return scp_error{scp_error_code::protocol_violation, simple_format("unexpected status byte {}", int(status))};
	}

	std::string message;
	if(type != response_type::ok || directive != directive_type::none) {
		if(auto err = read_line(in, c, message, max_line_length)) {
			return err;
		}
	}

	out = response{status, type, directive, std::move(message)};
	return scp_error{};
}

}
