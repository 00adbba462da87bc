#ifndef SP_SCP_DOWNLOAD_SINK_HEADER
#define SP_SCP_DOWNLOAD_SINK_HEADER

#include "scp/core/file_infos.hpp"
#include "scp/core/stream.hpp"

namespace securepath::scp {

/** \brief Local side of a download, supplied by the caller
 *
 *  The client asks for a stream for each file announced by the remote and reports back when the file is done.
 */
class download_sink {
public:
	virtual ~download_sink() = default;

	/// return stream to write the file content to, or nullptr and set error if the file cannot be stored
	virtual out_stream* open_file(file_infos const&, scp_error& error) = 0;

	/// called for every opened file once the payload is done, result tells if the transfer succeeded.
	/// returned error is reported for the file (e.g. failing to set times)
	virtual scp_error close_file(file_infos const&, scp_error const& result) = 0;
};

}

#endif
