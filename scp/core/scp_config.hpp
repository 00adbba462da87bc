#ifndef SP_SCP_CONFIG_HEADER
#define SP_SCP_CONFIG_HEADER

#include "response.hpp"

namespace securepath::scp {

/** \brief SCP client side configuration
 */
struct scp_config {
	// chunk size used when moving payload between local and remote streams
	std::size_t buffer_size{32*1024};

	// longest accepted response line from the remote, including newline
	std::size_t max_line_length{default_max_line_length};

	// send time directive before each uploaded file and request times on download
	bool preserve_times{};

	// request recursive mode from the remote so directories can be uploaded
	bool recursive{};

	// remote sends ok before the first directive of an upload, as "scp -t" does
	bool expect_ready_byte{};

	// remote program started by the transport
	std::string remote_binary{"scp"};
};

}

#endif
