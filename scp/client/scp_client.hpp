#ifndef SP_SCP_CLIENT_HEADER
#define SP_SCP_CLIENT_HEADER

#include "download_sink.hpp"
#include "transfer_report.hpp"
#include "scp/common/logger.hpp"
#include "scp/core/scp_config.hpp"

namespace securepath::scp {

struct upload_item {
	file_infos file;
	in_stream* content{};
};

enum class client_state {
	ready,
	closed
};
std::string_view to_string(client_state);

/** \brief Drives one SCP exchange over a stream pair connected to the remote scp process
 *
 *  The exchange is strictly request/reply: every directive is followed by reading the remote reply before anything else
 *  is sent. The client exclusively owns the streams while in use. After a session fatal error (transport failure,
 *  protocol violation, remote error status or cancellation) the client is closed and the transport should be discarded.
 *
 *  The optional payload stream arguments replace the transport stream for the file contents only,
 *  typically a progress_in_stream/progress_out_stream wrapping the same transport stream.
 */
class scp_client {
public:
	scp_client(in_stream& from_remote, out_stream& to_remote, logger&, scp_config config = {});

	client_state state() const { return state_; }
	scp_config const& config() const { return config_; }

public: // source mode (remote runs scp -t)
	/// send one file, content must provide at least file.size bytes
	scp_error upload_file(file_infos const& file, in_stream& content, cancel_context const&, out_stream* payload = nullptr);

	/// send files in order, stops at the first session fatal error
	scp_error upload(std::vector<upload_item> const& items, cancel_context const&, transfer_report&, out_stream* payload = nullptr);

	/// following files go into sub-directory until exit_directory
	scp_error enter_directory(file_infos const& dir, cancel_context const&);
	scp_error exit_directory(cancel_context const&);

	std::size_t directory_depth() const { return depth_; }

public: // sink mode (remote runs scp -f)
	/// receive files until the remote closes the stream or sends error
	scp_error download(download_sink&, cancel_context const&, transfer_report&, in_stream* payload = nullptr);

protected:
	scp_error check_open() const;
	scp_error fail_session(scp_error);

	scp_error wait_sink_ready(cancel_context const&);
	scp_error send_directive(std::string_view line, cancel_context const&);
	scp_error read_reply(cancel_context const&);
	scp_error send_payload(in_stream& content, out_stream& to, std::uint64_t size, cancel_context const&);

	scp_error receive_file(file_infos const& file, download_sink&, in_stream& from, cancel_context const&, transfer_report&);
	scp_error receive_payload(in_stream& from, out_stream* dest, std::uint64_t size, scp_error& local_error, cancel_context const&);
	scp_error reject_line(file_infos const& file, scp_error err, cancel_context const&, transfer_report&);

protected:
	in_stream& in_;
	out_stream& out_;
	logger& log_;
	scp_config const config_;

	client_state state_{client_state::ready};
	scp_error close_reason_;
	bool sink_ready_{};
	std::size_t depth_{};
	byte_vector buffer_;
};

}

#endif
