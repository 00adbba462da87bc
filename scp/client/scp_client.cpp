#include "scp_client.hpp"
#include "scp/common/util.hpp"
#include "scp/core/ack.hpp"

#include <algorithm>

namespace securepath::scp {

std::string_view to_string(client_state s) {
	switch(s) {
		case client_state::ready:  return "ready";
		case client_state::closed: return "closed";
	}
	return "unknown";
}

scp_client::scp_client(in_stream& from_remote, out_stream& to_remote, logger& log, scp_config config)
: in_(from_remote)
, out_(to_remote)
, log_(log)
, config_(std::move(config))
{
	buffer_.resize(std::max<std::size_t>(config_.buffer_size, 1));
}

scp_error scp_client::check_open() const {
	if(state_ == client_state::closed) {
		return scp_error{scp_error_code::session_closed, close_reason_.message()};
	}
	return scp_error{};
}

scp_error scp_client::fail_session(scp_error err) {
	if(err.is_session_fatal() && state_ != client_state::closed) {
		state_ = client_state::closed;
		log_.log(logger::error, "scp session {}: {}", to_string(state_), err);
		close_reason_ = err;
	}
	return err;
}

scp_error scp_client::read_reply(cancel_context const& c) {
	response r;
	if(auto err = decode_response(in_, c, r, config_.max_line_length)) {
		return fail_session(err == scp_error_code::end_of_stream
			? scp_error{scp_error_code::transport_error, "remote closed the stream while waiting for reply"}
			: err);
	}

	log_.log(logger::debug_trace, "reply [type={}, message={}]", to_string(r.type()), printable(r.message()));

	if(r.is_failure()) {
		log_.log(logger::error, "remote {}: {}", to_string(r.type()), r.text());
		// error status means the remote is going away
		return fail_session(r.to_error());
	}
	if(!r.no_standard_directive()) {
		return fail_session(scp_error{scp_error_code::protocol_violation, "directive received while waiting for reply"});
	}
	return scp_error{};
}

// scp -t starts by sending ok before it expects anything from us
scp_error scp_client::wait_sink_ready(cancel_context const& c) {
	if(config_.expect_ready_byte && !sink_ready_) {
		log_.log(logger::debug_trace, "waiting remote to be ready");
		if(auto err = read_reply(c)) {
			return err;
		}
		sink_ready_ = true;
	}
	return scp_error{};
}

scp_error scp_client::send_directive(std::string_view line, cancel_context const& c) {
	log_.log(logger::debug_trace, "sending directive: {}", printable(line));
	auto res = write_all(out_, line, c);
	if(!res.ok()) {
		return fail_session(to_error(res));
	}
	return read_reply(c);
}

// local read failures are padded with zeros so the remote still receives size bytes
scp_error scp_client::send_payload(in_stream& content, out_stream& to, std::uint64_t size, cancel_context const& c) {
	scp_error local_error;
	std::uint64_t left = size;

	while(left) {
		span chunk = span(buffer_).first(std::size_t(std::min<std::uint64_t>(left, buffer_.size())));

		if(!local_error) {
			auto res = read_exact(content, chunk, c);
			if(res.status == io_status::cancelled) {
				return fail_session(to_error(res));
			}
			if(!res.ok()) {
				local_error = scp_error{scp_error_code::local_io_error,
					res.status == io_status::end_of_stream ? "file is shorter than announced size" : res.message};
				log_.log(logger::error, "local read failed, padding remaining {} bytes: {}", left - res.size, local_error.message());
				std::fill(chunk.begin() + res.size, chunk.end(), std::byte{0});
			}
		} else {
			std::fill(chunk.begin(), chunk.end(), std::byte{0});
		}

		auto res = write_all(to, chunk, c);
		if(!res.ok()) {
			return fail_session(to_error(res));
		}
		left -= chunk.size();
	}

	return local_error;
}

scp_error scp_client::upload_file(file_infos const& file, in_stream& content, cancel_context const& c, out_stream* payload) {
	if(auto err = check_open()) {
		return err;
	}
	if(auto err = validate_filename(file.filename)) {
		return err;
	}
	if(auto err = validate_permissions(file.permissions)) {
		return err;
	}
	if(auto err = wait_sink_ready(c)) {
		return err;
	}

	log_.log(logger::debug, "uploading {} [size={}]", file.filename, file.size);

	if(config_.preserve_times && file.has_times()) {
		if(auto err = send_directive(encode_time_directive(file), c)) {
			return err;
		}
	}

	if(auto err = send_directive(encode_permission_directive(file), c)) {
		return err;
	}

	auto local_error = send_payload(content, payload ? *payload : out_, file.size, c);
	if(local_error.is_session_fatal()) {
		return local_error;
	}

	if(local_error) {
		if(auto err = send_failure(out_, c, response_type::warning, local_error.message())) {
			return fail_session(err);
		}
	} else {
		log_.log(logger::debug_trace, "sending end of payload");
		if(auto err = send_ack(out_, c)) {
			return fail_session(err);
		}
	}

	auto err = read_reply(c);
	if(local_error) {
		// a remote error still has to close the session, otherwise the local failure is what matters
		return err.is_session_fatal() ? err : local_error;
	}

	if(!err) {
		log_.log(logger::debug, "uploaded {}", file.filename);
	}
	return err;
}

scp_error scp_client::upload(std::vector<upload_item> const& items, cancel_context const& c, transfer_report& report, out_stream* payload) {
	for(auto&& item : items) {
		if(!item.content) {
			report.add(item.file, scp_error{scp_error_code::invalid_argument, "no content stream"});
			continue;
		}
		auto err = upload_file(item.file, *item.content, c, payload);
		report.add(item.file, err);
		if(err.is_session_fatal()) {
			return err;
		}
	}
	return scp_error{};
}

scp_error scp_client::enter_directory(file_infos const& dir, cancel_context const& c) {
	if(auto err = check_open()) {
		return err;
	}
	if(auto err = validate_filename(dir.filename)) {
		return err;
	}
	if(auto err = validate_permissions(dir.permissions)) {
		return err;
	}
	if(auto err = wait_sink_ready(c)) {
		return err;
	}

	log_.log(logger::debug, "entering directory {}", dir.filename);

	if(config_.preserve_times && dir.has_times()) {
		if(auto err = send_directive(encode_time_directive(dir), c)) {
			return err;
		}
	}
	auto err = send_directive(encode_enter_directory(dir), c);
	if(!err) {
		++depth_;
	}
	return err;
}

scp_error scp_client::exit_directory(cancel_context const& c) {
	if(auto err = check_open()) {
		return err;
	}
	if(depth_ == 0) {
		return scp_error{scp_error_code::invalid_argument, "not inside directory"};
	}

	auto err = send_directive(exit_directory_directive, c);
	// the remote has left the directory even if it complains
	if(!err.is_session_fatal()) {
		--depth_;
	}
	return err;
}

scp_error scp_client::receive_payload(in_stream& from, out_stream* dest, std::uint64_t size, scp_error& local_error, cancel_context const& c) {
	std::uint64_t left = size;

	while(left) {
		span chunk = span(buffer_).first(std::size_t(std::min<std::uint64_t>(left, buffer_.size())));
		auto res = read_exact(from, chunk, c);
		if(!res.ok()) {
			return fail_session(to_error(res));
		}
		left -= chunk.size();

		// keep consuming after local failure so the stream stays in sync
		if(dest && !local_error) {
			auto wres = write_all(*dest, chunk, c);
			if(wres.status == io_status::cancelled) {
				return fail_session(to_error(wres));
			}
			if(!wres.ok()) {
				local_error = scp_error{scp_error_code::local_io_error, wres.message};
				log_.log(logger::error, "local write failed, discarding rest of the file: {}", wres.message);
			}
		}
	}

	return scp_error{};
}

scp_error scp_client::receive_file(file_infos const& file, download_sink& sink, in_stream& from, cancel_context const& c, transfer_report& report) {
	log_.log(logger::debug, "receiving {} [size={}, mode={}]", file.filename, file.size, file.permissions);

	scp_error local_error;
	out_stream* dest{};
	if(validate_filename(file.filename)) {
		// names with path components would escape the target directory
		local_error = scp_error{scp_error_code::invalid_argument, "invalid filename from remote: " + file.filename};
	} else {
		dest = sink.open_file(file, local_error);
		if(!dest && !local_error) {
			local_error = scp_error{scp_error_code::local_io_error, "unable to open " + file.filename};
		}
	}
	if(local_error) {
		log_.log(logger::error, "cannot store {}: {}", file.filename, local_error.message());
		dest = nullptr;
	}

	if(auto err = send_ack(out_, c)) {
		return fail_session(err);
	}

	if(auto err = receive_payload(from, dest, file.size, local_error, c)) {
		return err;
	}

	// remote reports the end of payload with status byte
	response r;
	if(auto err = decode_response(in_, c, r, config_.max_line_length)) {
		return fail_session(err == scp_error_code::end_of_stream
			? scp_error{scp_error_code::transport_error, "remote closed the stream after payload"}
			: err);
	}
	if(!r.is_failure() && !r.no_standard_directive()) {
		return fail_session(scp_error{scp_error_code::protocol_violation, "directive received instead of end of payload"});
	}

	scp_error result = r.is_failure() ? r.to_error() : local_error;

	if(dest) {
		auto close_err = sink.close_file(file, result);
		if(!result && close_err) {
			result = close_err;
		}
	}

	report.add(file, result);

	if(r.is_error()) {
		return fail_session(result);
	}

	if(result && !result.is_remote_failure()) {
		if(auto err = send_failure(out_, c, response_type::warning, result.message())) {
			return fail_session(err);
		}
	} else {
		if(auto err = send_ack(out_, c)) {
			return fail_session(err);
		}
	}

	if(!result) {
		log_.log(logger::debug, "received {}", file.filename);
	}
	return scp_error{};
}

scp_error scp_client::reject_line(file_infos const& file, scp_error err, cancel_context const& c, transfer_report& report) {
	log_.log(logger::error, "rejecting directive: {}", err);
	report.add(file, err);
	if(auto send_err = send_failure(out_, c, response_type::warning, err.message())) {
		return fail_session(send_err);
	}
	return scp_error{};
}

scp_error scp_client::download(download_sink& sink, cancel_context const& c, transfer_report& report, in_stream* payload) {
	if(auto err = check_open()) {
		return err;
	}

	// tells scp -f to start sending
	if(auto err = send_ack(out_, c)) {
		return fail_session(err);
	}

	file_infos pending;
	for(;;) {
		response r;
		auto err = decode_response(in_, c, r, config_.max_line_length);
		if(err == scp_error_code::end_of_stream) {
			if(pending.has_times()) {
				log_.log(logger::debug, "remote closed after time directive without file");
			}
			log_.log(logger::debug, "remote finished sending");
			break;
		}
		if(err) {
			return fail_session(err);
		}

		log_.log(logger::debug_trace, "received [type={}, directive={}, message={}]",
			to_string(r.type()), to_string(r.directive()), printable(r.message()));

		if(r.is_failure()) {
			log_.log(logger::error, "remote {}: {}", to_string(r.type()), r.text());
			report.add(pending, r.to_error());
			pending = file_infos{};
			if(r.is_error()) {
				return fail_session(r.to_error());
			}
			continue;
		}

		if(r.is_time()) {
			file_infos times;
			if(auto perr = parse_time_directive(r, times)) {
				pending = file_infos{};
				if(auto serr = reject_line(file_infos{.raw_message = r.message()}, perr, c, report)) {
					return serr;
				}
				continue;
			}
			pending = merge(pending, times);
			if(auto serr = send_ack(out_, c)) {
				return fail_session(serr);
			}
			continue;
		}

		if(r.is_permission()) {
			file_infos perms;
			if(auto perr = parse_permission_directive(r, perms)) {
				pending = file_infos{};
				if(auto serr = reject_line(file_infos{.raw_message = r.message()}, perr, c, report)) {
					return serr;
				}
				continue;
			}
			auto file = merge(pending, perms);
			pending = file_infos{};
			if(auto ferr = receive_file(file, sink, payload ? *payload : in_, c, report)) {
				return ferr;
			}
			continue;
		}

		return fail_session(scp_error{scp_error_code::protocol_violation,
			simple_format("unexpected response from remote [status={}]", int(r.status_byte()))});
	}

	return scp_error{};
}

}
