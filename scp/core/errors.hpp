#ifndef SP_SCP_ERRORS_HEADER
#define SP_SCP_ERRORS_HEADER

#include "scp/common/types.hpp"

#include <iosfwd>

namespace securepath::scp {

enum class scp_error_code : std::uint32_t {
	none                  = 0,

	// session fatal
	transport_error       = 1,
	end_of_stream         = 2,
	protocol_violation    = 3,
	remote_error          = 4,
	cancelled             = 5,
	session_closed        = 6,

	// current file only
	directive_parse_error = 16,
	remote_warning        = 17,
	local_io_error        = 18,
	invalid_argument      = 19
};

std::string_view to_string(scp_error_code);

class scp_error {
public:
	scp_error() = default;
	scp_error(scp_error_code code, std::string_view msg = {})
	: code_(code)
	, message_(msg)
	{}

	scp_error_code code() const { return code_; }
	std::string_view message() const { return message_; }

	/// the transport can no longer be used for further directives
	bool is_session_fatal() const;

	/// the error came from the remote as warning or error status
	bool is_remote_failure() const {
		return code_ == scp_error_code::remote_warning || code_ == scp_error_code::remote_error;
	}

	/// this is an error if error code is not none
	explicit operator bool() const {
		return code_ != scp_error_code::none;
	}

	bool operator==(scp_error_code c) const { return code_ == c; }

private:
	scp_error_code code_{};
	std::string message_;
};

std::ostream& operator<<(std::ostream&, scp_error const&);

}

#endif
