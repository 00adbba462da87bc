#ifndef SP_SCP_ACK_HEADER
#define SP_SCP_ACK_HEADER

#include "response.hpp"

namespace securepath::scp {

/** \brief Writes the single zero byte acknowledgement
 *
 *  Does not wait for the remote, the reply has to be read separately with decode_response when the exchange requires it.
 */
scp_error send_ack(out_stream&, cancel_context const&);

/// writes warning or error status byte followed by the message line, newlines in message are dropped
scp_error send_failure(out_stream&, cancel_context const&, response_type, std::string_view message);

}

#endif
