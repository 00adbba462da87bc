#include "errors.hpp"

#include <ostream>

namespace securepath::scp {

std::string_view to_string(scp_error_code c) {
	using enum scp_error_code;
	switch(c) {
		case none:                  return "no error";
		case transport_error:       return "transport error";
		case end_of_stream:         return "end of stream";
		case protocol_violation:    return "protocol violation";
		case remote_error:          return "remote error";
		case cancelled:             return "cancelled";
		case session_closed:        return "session closed";
		case directive_parse_error: return "directive parse error";
		case remote_warning:        return "remote warning";
		case local_io_error:        return "local i/o error";
		case invalid_argument:      return "invalid argument";
	}
	return "unknown error";
}

bool scp_error::is_session_fatal() const {
	using enum scp_error_code;
	switch(code_) {
		case transport_error:
		case end_of_stream:
		case protocol_violation:
		case remote_error:
		case cancelled:
		case session_closed:
			return true;
		default:
			return false;
	}
}

std::ostream& operator<<(std::ostream& out, scp_error const& e) {
	out << to_string(e.code());
	if(!e.message().empty()) {
		out << ": " << e.message();
	}
	return out;
}

}
