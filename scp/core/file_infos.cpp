#include "file_infos.hpp"
#include "scp/common/util.hpp"

namespace securepath::scp {

file_infos merge(file_infos const& base, file_infos const& update) {
	file_infos res = base;
	if(!update.raw_message.empty()) {
		res.raw_message = update.raw_message;
	}
	if(!update.filename.empty()) {
		res.filename = update.filename;
	}
	if(!update.permissions.empty()) {
		res.permissions = update.permissions;
	}
	if(update.size != 0) {
		res.size = update.size;
	}
	if(update.access_time != 0) {
		res.access_time = update.access_time;
	}
	if(update.modify_time != 0) {
		res.modify_time = update.modify_time;
	}
	return res;
}

void file_infos::update(file_infos const& other) {
	*this = merge(*this, other);
}

static std::string_view strip_letter(std::string_view s, directive_type t) {
	if(!s.empty() && s.front() == char(t)) {
		s.remove_prefix(1);
	}
	return s;
}

scp_error parse_permission_directive(std::string_view message, file_infos& out) {
	std::string line = remove_newlines(message);
	auto parts = split_fields(line);
	if(parts.size() < 3) {
		return scp_error{scp_error_code::directive_parse_error, "unable to parse permission directive"};
	}

	auto size = parse_decimal<std::uint64_t>(parts[1]);
	if(!size) {
		return scp_error{scp_error_code::directive_parse_error, "unable to parse permission directive"};
	}

	out = file_infos{
		.raw_message = std::string(message),
		.filename = std::string(parts[2]),
		.permissions = std::string(strip_letter(parts[0], directive_type::permission)),
		.size = *size};

	return scp_error{};
}

scp_error parse_time_directive(std::string_view message, file_infos& out) {
	std::string line = remove_newlines(message);
	auto parts = split_fields(line);
	if(parts.size() < 3) {
		return scp_error{scp_error_code::directive_parse_error, "unable to parse time directive"};
	}

	auto atime = parse_decimal<unix_time>(strip_letter(parts[0], directive_type::time));
	if(!atime) {
		return scp_error{scp_error_code::directive_parse_error, "unable to parse access time"};
	}
	auto mtime = parse_decimal<unix_time>(parts[2]);
	if(!mtime) {
		return scp_error{scp_error_code::directive_parse_error, "unable to parse modify time"};
	}

	out = file_infos{
		.raw_message = std::string(message),
		.access_time = *atime,
		.modify_time = *mtime};

	return scp_error{};
}

scp_error validate_filename(std::string_view name) {
	if(name.empty()) {
		return scp_error{scp_error_code::invalid_argument, "empty filename"};
	}
	if(name.find_first_of("\n/") != std::string_view::npos) {
		return scp_error{scp_error_code::invalid_argument, "filename contains newline or slash"};
	}
	return scp_error{};
}

scp_error validate_permissions(std::string_view perms) {
	if(perms.empty() || perms.find_first_not_of("01234567") != std::string_view::npos) {
		return scp_error{scp_error_code::invalid_argument, "permissions must be octal digits"};
	}
	return scp_error{};
}

std::string encode_permission_directive(file_infos const& f) {
	return "C" + f.permissions + " " + std::to_string(f.size) + " " + f.filename + "\n";
}

std::string encode_time_directive(file_infos const& f) {
	return "T" + std::to_string(f.access_time) + " 0 " + std::to_string(f.modify_time) + " 0\n";
}

std::string encode_enter_directory(file_infos const& f) {
	return "D" + f.permissions + " 0 " + f.filename + "\n";
}

}
