#ifndef SP_SCP_REMOTE_COMMAND_HEADER
#define SP_SCP_REMOTE_COMMAND_HEADER

#include "scp/core/scp_config.hpp"

namespace securepath::scp {

enum class transfer_direction {
	upload,
	download
};
std::string_view to_string(transfer_direction);

/** \brief Command line to run on the remote side for the transfer
 *
 *  upload:   <remote_binary> -qt [-p] [-r] '<path>'
 *  download: <remote_binary> -qf [-p] '<path>'
 *
 *  The path is single-quoted for the remote shell. Directory directives are not accepted on download,
 *  so recursive is only passed for upload.
 */
std::string remote_command(transfer_direction, scp_config const&, std::string_view remote_path);

}

#endif
