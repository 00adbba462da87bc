#ifndef SP_SCP_RESPONSE_HEADER
#define SP_SCP_RESPONSE_HEADER

#include "stream.hpp"

namespace securepath::scp {

// numeric meaning of the status byte
enum class response_type : std::uint8_t {
	ok      = 0,
	warning = 1,
	error   = 2
};

// character meaning of the status byte, none is not a directive
enum class directive_type : char {
	none       = ' ',
	permission = 'C',
	time       = 'T'
};

std::string_view to_string(response_type);
std::string_view to_string(directive_type);

/** \brief One decoded reply of the remote
 *
 *  The status byte is classified twice: as response type by its numeric value and as directive by its
 *  character value. A directive letter is a positive reply (ok) that carries the directive line as message.
 */
class response {
public:
	response() = default;
	response(std::uint8_t status, response_type type, directive_type directive, std::string message)
	: status_(status)
	, type_(type)
	, directive_(directive)
	, message_(std::move(message))
	{}

	std::uint8_t status_byte() const { return status_; }
	response_type type() const { return type_; }
	directive_type directive() const { return directive_; }

	/// line following the status byte including the trailing newline, empty if nothing was read
	std::string const& message() const { return message_; }

	bool is_ok() const { return type_ == response_type::ok; }
	bool is_warning() const { return type_ == response_type::warning; }
	bool is_error() const { return type_ == response_type::error; }

	/// remote answered with warning or error
	bool is_failure() const { return is_warning() || is_error(); }

	bool is_permission() const { return directive_ == directive_type::permission; }
	bool is_time() const { return directive_ == directive_type::time; }
	bool no_standard_directive() const { return !is_permission() && !is_time(); }

	/// message without newlines, for logging and errors
	std::string text() const;

	/// file-level error for warning and error responses
	scp_error to_error() const;

private:
	std::uint8_t status_{};
	response_type type_{};
	directive_type directive_{directive_type::none};
	std::string message_;
};

std::size_t const default_max_line_length = 64*1024;

/** \brief Reads one response from the remote
 *
 *  Reads exactly the status byte and, for failures and directives, one line up to and including '\n'.
 *  Nothing past the line is consumed, the payload following a directive stays in the stream.
 *  End of stream before the status byte is reported as end_of_stream, anything else that cuts the reply short as transport_error.
 */
scp_error decode_response(in_stream&, cancel_context const&, response& out, std::size_t max_line_length = default_max_line_length);

}

#endif
