#include "local_files.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

namespace securepath::scp {

namespace fs = std::filesystem;

file_in_stream::file_in_stream(fs::path const& p)
: file_(p, std::ios_base::binary)
{
}

io_result file_in_stream::read(span s, cancel_context const& c) {
	if(c.is_cancelled()) {
		return io_result{io_status::cancelled, 0, "cancelled"};
	}
	if(s.empty()) {
		return io_result{};
	}
	file_.read(reinterpret_cast<char*>(s.data()), std::streamsize(s.size()));
	std::size_t n = std::size_t(file_.gcount());
	if(n) {
		return io_result{io_status::ok, n, {}};
	}
	if(file_.eof()) {
		return io_result{io_status::end_of_stream, 0, {}};
	}
	return io_result{io_status::error, 0, "failed to read local file"};
}

file_out_stream::file_out_stream(fs::path const& p)
: file_(p, std::ios_base::binary | std::ios_base::trunc)
{
}

bool file_out_stream::close() {
	file_.flush();
	bool res = bool(file_);
	file_.close();
	return res && !file_.fail();
}

io_result file_out_stream::write(const_span s, cancel_context const& c) {
	if(c.is_cancelled()) {
		return io_result{io_status::cancelled, 0, "cancelled"};
	}
	if(!file_.write(reinterpret_cast<char const*>(s.data()), std::streamsize(s.size()))) {
		return io_result{io_status::error, 0, "failed to write local file"};
	}
	return io_result{io_status::ok, s.size(), {}};
}

file_infos local_file_infos(fs::path const& p, std::error_code& ec) {
	struct ::stat st{};
	if(::stat(p.c_str(), &st) < 0) {
		ec = std::error_code(errno, std::generic_category());
		return file_infos{};
	}

	file_infos info;
	info.filename = p.filename().string();
	char mode[8]{};
	std::snprintf(mode, sizeof(mode), "%04o", unsigned(st.st_mode & 07777));
	info.permissions = mode;
	info.size = S_ISREG(st.st_mode) ? std::uint64_t(st.st_size) : 0;
	info.access_time = st.st_atime;
	info.modify_time = st.st_mtime;
	return info;
}

directory_sink::directory_sink(logger& log, fs::path target, bool preserve_times)
: log_(log)
, target_(std::move(target))
, preserve_times_(preserve_times)
, umask_(::umask(0))
{
	::umask(umask_);
}

out_stream* directory_sink::open_file(file_infos const& file, scp_error& error) {
	std::error_code ec;
	bool const into_directory = fs::is_directory(target_, ec);
	if(!into_directory && target_used_) {
		error = scp_error{scp_error_code::local_io_error, "target " + target_.string() + " is not a directory, refusing " + file.filename};
		return nullptr;
	}
	current_ = into_directory ? target_ / file.filename : target_;

	log_.log(logger::debug, "writing {}", current_.string());

	file_ = std::make_unique<file_out_stream>(current_);
	if(!file_->is_open()) {
		error = scp_error{scp_error_code::local_io_error, "unable to open " + current_.string() + ": " + std::strerror(errno)};
		file_.reset();
		return nullptr;
	}
	target_used_ = !into_directory;
	return file_.get();
}

scp_error directory_sink::close_file(file_infos const& file, scp_error const& result) {
	bool closed = file_ && file_->close();
	file_.reset();

	if(result) {
		return scp_error{};
	}
	if(!closed) {
		return scp_error{scp_error_code::local_io_error, "failed to write " + current_.string()};
	}

	if(!file.permissions.empty() && !validate_permissions(file.permissions)) {
		unsigned bits{};
		for(char ch : file.permissions) {
			bits = bits * 8 + unsigned(ch - '0');
		}
		std::error_code ec;
		// without preserving the umask applies and special bits are dropped, like scp does
		bits &= preserve_times_ ? 07777 : (0777 & ~unsigned(umask_));
		fs::permissions(current_, fs::perms(bits), fs::perm_options::replace, ec);
		if(ec) {
			log_.log(logger::error, "failed to set permissions of {}: {}", current_.string(), ec.message());
		}
	}

	if(preserve_times_ && file.has_times()) {
		struct ::timespec times[2]{};
		times[0].tv_sec = file.access_time;
		times[1].tv_sec = file.modify_time;
		if(::utimensat(AT_FDCWD, current_.c_str(), times, 0) < 0) {
			return scp_error{scp_error_code::local_io_error,
				"failed to set times of " + current_.string() + ": " + std::strerror(errno)};
		}
	}
	return scp_error{};
}

scp_error upload_path(scp_client& client, fs::path const& path, cancel_context const& c, transfer_report& report, out_stream* payload) {
	std::error_code ec;
	file_infos info = local_file_infos(path, ec);
	if(ec) {
		report.add(file_infos{.filename = path.filename().string()},
			scp_error{scp_error_code::local_io_error, path.string() + ": " + ec.message()});
		return scp_error{};
	}

	if(fs::is_directory(path, ec)) {
		if(!client.config().recursive) {
			report.add(info, scp_error{scp_error_code::invalid_argument, path.string() + " is a directory, recursive mode required"});
			return scp_error{};
		}

		if(auto err = client.enter_directory(info, c)) {
			report.add(info, err);
			return err.is_session_fatal() ? err : scp_error{};
		}

		std::vector<fs::path> entries;
		for(auto const& e : fs::directory_iterator(path, ec)) {
			entries.push_back(e.path());
		}
		if(ec) {
			report.add(info, scp_error{scp_error_code::local_io_error, path.string() + ": " + ec.message()});
		}
		std::sort(entries.begin(), entries.end());

		for(auto&& e : entries) {
			if(auto err = upload_path(client, e, c, report, payload)) {
				return err;
			}
		}

		auto err = client.exit_directory(c);
		if(err) {
			report.add(info, err);
		}
		return err.is_session_fatal() ? err : scp_error{};
	}

	if(!fs::is_regular_file(path, ec)) {
		report.add(info, scp_error{scp_error_code::invalid_argument, path.string() + " is not a regular file"});
		return scp_error{};
	}

	file_in_stream content(path);
	if(!content.is_open()) {
		report.add(info, scp_error{scp_error_code::local_io_error, "unable to open " + path.string()});
		return scp_error{};
	}

	auto err = client.upload_file(info, content, c, payload);
	report.add(info, err);
	return err.is_session_fatal() ? err : scp_error{};
}

}
