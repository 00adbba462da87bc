#ifndef SP_SCP_TOOLS_LOCAL_FILES_HEADER
#define SP_SCP_TOOLS_LOCAL_FILES_HEADER

#include "scp/client/scp_client.hpp"

#include <filesystem>
#include <fstream>
#include <sys/types.h>
#include <memory>

namespace securepath::scp {

class file_in_stream : public in_stream {
public:
	explicit file_in_stream(std::filesystem::path const&);

	bool is_open() const { return file_.is_open(); }

	io_result read(span s, cancel_context const&) override;

private:
	std::ifstream file_;
};

class file_out_stream : public out_stream {
public:
	explicit file_out_stream(std::filesystem::path const&);

	bool is_open() const { return file_.is_open(); }

	/// flushes and closes, returns false if anything failed
	bool close();

	io_result write(const_span s, cancel_context const&) override;

private:
	std::ofstream file_;
};

/// metadata of local file or directory as sent in the directives, empty filename if stat fails
file_infos local_file_infos(std::filesystem::path const&, std::error_code&);

/** \brief Stores downloaded files under local path
 *
 *  If the target is an existing directory, files are created inside it with the announced names.
 *  Otherwise the target is the name of the single file to write and further files are refused.
 *  Without preserving, the mode is masked with the process umask and special bits are dropped.
 */
class directory_sink : public download_sink {
public:
	directory_sink(logger&, std::filesystem::path target, bool preserve_times);

	out_stream* open_file(file_infos const&, scp_error& error) override;
	scp_error close_file(file_infos const&, scp_error const& result) override;

private:
	logger& log_;
	std::filesystem::path const target_;
	bool const preserve_times_;
	::mode_t const umask_;
	bool target_used_{};
	std::filesystem::path current_;
	std::unique_ptr<file_out_stream> file_;
};

/** \brief Uploads local file or directory tree
 *
 *  Directories are sent with enter/exit directory directives and require recursive mode.
 *  Returns the first session fatal error, per-file failures end up in the report.
 */
scp_error upload_path(scp_client&, std::filesystem::path const&, cancel_context const&, transfer_report&, out_stream* payload = nullptr);

}

#endif
